#include "wheelsmith/version_range.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace wheelsmith {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

// Split string by delimiter, preserving empty parts
std::vector<std::string> split(const std::string& s, const std::string& delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t pos;
    while ((pos = s.find(delim, start)) != std::string::npos) {
        parts.push_back(s.substr(start, pos - start));
        start = pos + delim.length();
    }
    parts.push_back(s.substr(start));
    return parts;
}

bool is_operator(const std::string& s) {
    static const char* ops[] = {"==", "!=", "<=", ">=", "~=", "<", ">", "=", "^", "~"};
    for (const char* op : ops) {
        if (s == op) return true;
    }
    return false;
}

// Split a comparator set into constraint tokens. Commas separate like
// whitespace, and a bare operator is glued to the version after it
// (">= 2.7" reads as ">=2.7").
std::vector<std::string> tokenize(const std::string& s) {
    std::string spaced = s;
    std::replace(spaced.begin(), spaced.end(), ',', ' ');

    std::vector<std::string> raw;
    std::istringstream iss(spaced);
    std::string token;
    while (iss >> token) {
        raw.push_back(token);
    }

    std::vector<std::string> tokens;
    for (size_t i = 0; i < raw.size(); ++i) {
        if (is_operator(raw[i]) && i + 1 < raw.size()) {
            tokens.push_back(raw[i] + raw[i + 1]);
            ++i;
        } else {
            tokens.push_back(raw[i]);
        }
    }
    return tokens;
}

struct PartialVersion {
    Version version;
    size_t components = 0;  // how many of major/minor/patch were written
};

std::optional<PartialVersion> parse_partial(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;

    size_t suffix_pos = s.find_first_of("-+");
    std::string core = s.substr(0, suffix_pos);
    std::string suffix = suffix_pos == std::string::npos ? "" : s.substr(suffix_pos);

    auto parts = split(core, ".");
    if (parts.empty() || parts.size() > 3) return std::nullopt;
    for (const auto& part : parts) {
        if (part.empty()) return std::nullopt;
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        }
    }

    PartialVersion result;
    result.components = parts.size();
    while (parts.size() < 3) {
        parts.push_back("0");
    }

    try {
        result.version = Version::parse(parts[0] + "." + parts[1] + "." + parts[2] + suffix);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
    return result;
}

bool is_wildcard(const std::string& s) {
    return s == "x" || s == "X" || s == "*";
}

// "*", "2.*", "2.7.*", "2.x" -> bounds; nullopt if s is not a wildcard form
std::optional<ComparatorSet> expand_wildcard(const std::string& s) {
    auto parts = split(s, ".");
    size_t wild = parts.size();
    for (size_t i = 0; i < parts.size(); ++i) {
        if (is_wildcard(parts[i])) {
            wild = i;
            break;
        }
    }
    if (wild == parts.size()) return std::nullopt;
    if (wild == 0) return ComparatorSet{};

    uint64_t nums[2] = {0, 0};
    try {
        for (size_t i = 0; i < wild && i < 2; ++i) {
            nums[i] = static_cast<uint64_t>(std::stoull(parts[i]));
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    ComparatorSet set;
    if (wild == 1) {
        set.push_back({Comparator::Ge, Version(nums[0], 0, 0)});
        set.push_back({Comparator::Lt, Version(nums[0] + 1, 0, 0)});
    } else {
        set.push_back({Comparator::Ge, Version(nums[0], nums[1], 0)});
        set.push_back({Comparator::Lt, Version(nums[0], nums[1] + 1, 0)});
    }
    return set;
}

// ^1.2.3 -> >=1.2.3 <2.0.0, ^0.2 -> >=0.2.0 <0.3.0, ^0.0.3 -> =0.0.3
std::optional<ComparatorSet> expand_caret(const std::string& s) {
    auto partial = parse_partial(s);
    if (!partial) return std::nullopt;
    const Version& v = partial->version;

    ComparatorSet set;
    if (v.major() == 0 && v.minor() == 0 && partial->components == 3) {
        set.push_back({Comparator::Eq, v});
        return set;
    }

    set.push_back({Comparator::Ge, v});
    if (v.major() == 0) {
        set.push_back({Comparator::Lt, Version(0, v.minor() + 1, 0)});
    } else {
        set.push_back({Comparator::Lt, Version(v.major() + 1, 0, 0)});
    }
    return set;
}

// ~1.2.3 -> >=1.2.3 <1.3.0, ~1 -> >=1.0.0 <2.0.0
std::optional<ComparatorSet> expand_tilde(const std::string& s) {
    auto partial = parse_partial(s);
    if (!partial) return std::nullopt;
    const Version& v = partial->version;

    ComparatorSet set;
    set.push_back({Comparator::Ge, v});
    if (partial->components == 1) {
        set.push_back({Comparator::Lt, Version(v.major() + 1, 0, 0)});
    } else {
        set.push_back({Comparator::Lt, Version(v.major(), v.minor() + 1, 0)});
    }
    return set;
}

// ~=2.7 -> >=2.7.0 <3.0.0, ~=2.7.1 -> >=2.7.1 <2.8.0
std::optional<ComparatorSet> expand_compatible(const std::string& s) {
    auto partial = parse_partial(s);
    if (!partial || partial->components < 2) return std::nullopt;
    const Version& v = partial->version;

    ComparatorSet set;
    set.push_back({Comparator::Ge, v});
    if (partial->components == 2) {
        set.push_back({Comparator::Lt, Version(v.major() + 1, 0, 0)});
    } else {
        set.push_back({Comparator::Lt, Version(v.major(), v.minor() + 1, 0)});
    }
    return set;
}

// Parse one token into zero or more constraints appended to set
bool parse_token(const std::string& token, ComparatorSet& set) {
    std::string s = trim(token);
    if (s.empty()) return false;

    auto append = [&set](const std::optional<ComparatorSet>& expanded) {
        if (!expanded) return false;
        set.insert(set.end(), expanded->begin(), expanded->end());
        return true;
    };

    if (s.rfind("~=", 0) == 0) return append(expand_compatible(s.substr(2)));
    if (s[0] == '^') return append(expand_caret(s.substr(1)));
    if (s[0] == '~') return append(expand_tilde(s.substr(1)));

    Comparator op = Comparator::Eq;
    std::string version_str;

    if (s.rfind(">=", 0) == 0) {
        op = Comparator::Ge;
        version_str = s.substr(2);
    } else if (s.rfind("<=", 0) == 0) {
        op = Comparator::Le;
        version_str = s.substr(2);
    } else if (s.rfind("==", 0) == 0) {
        op = Comparator::Eq;
        version_str = s.substr(2);
    } else if (s.rfind("!=", 0) == 0) {
        op = Comparator::Ne;
        version_str = s.substr(2);
    } else if (s.rfind(">", 0) == 0) {
        op = Comparator::Gt;
        version_str = s.substr(1);
    } else if (s.rfind("<", 0) == 0) {
        op = Comparator::Lt;
        version_str = s.substr(1);
    } else if (s.rfind("=", 0) == 0) {
        op = Comparator::Eq;
        version_str = s.substr(1);
    } else {
        // No operator means exact match
        version_str = s;
    }

    version_str = trim(version_str);
    if (version_str.empty()) return false;

    auto wildcard = expand_wildcard(version_str);
    if (wildcard) {
        if (op == Comparator::Ne) return true;
        if (op != Comparator::Eq) return false;
        return append(wildcard);
    }

    auto partial = parse_partial(version_str);
    if (!partial) return false;
    set.push_back({op, partial->version});
    return true;
}

std::optional<ComparatorSet> parse_comparator_set(const std::string& str) {
    auto tokens = tokenize(str);
    if (tokens.empty()) return std::nullopt;

    ComparatorSet set;
    for (const auto& token : tokens) {
        if (!parse_token(token, set)) return std::nullopt;
    }
    return set;
}

struct Bound {
    std::optional<Version> version;
    bool inclusive = true;
};

// The combined set admits at least one version
bool non_empty(const ComparatorSet& set) {
    Bound lower;
    Bound upper;

    for (const auto& c : set) {
        bool sets_lower = c.op == Comparator::Ge || c.op == Comparator::Gt || c.op == Comparator::Eq;
        bool sets_upper = c.op == Comparator::Le || c.op == Comparator::Lt || c.op == Comparator::Eq;
        bool inclusive = c.op != Comparator::Gt && c.op != Comparator::Lt;

        if (sets_lower) {
            if (!lower.version || c.version > *lower.version) {
                lower = {c.version, inclusive};
            } else if (c.version == *lower.version && !inclusive) {
                lower.inclusive = false;
            }
        }
        if (sets_upper) {
            if (!upper.version || c.version < *upper.version) {
                upper = {c.version, inclusive};
            } else if (c.version == *upper.version && !inclusive) {
                upper.inclusive = false;
            }
        }
    }

    if (!lower.version || !upper.version) return true;
    if (*lower.version < *upper.version) return true;
    if (*lower.version > *upper.version) return false;
    if (!lower.inclusive || !upper.inclusive) return false;

    // A single admitted point can still be excluded
    for (const auto& c : set) {
        if (c.op == Comparator::Ne && c.version == *lower.version) return false;
    }
    return true;
}

} // namespace

std::optional<Version> parse_version(const std::string& str) {
    auto partial = parse_partial(str);
    if (!partial) return std::nullopt;
    return partial->version;
}

std::optional<VersionRange> parse_range(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;

    // Split by || for OR
    auto or_parts = split(s, "||");

    VersionRange range;
    for (const auto& part : or_parts) {
        auto set = parse_comparator_set(trim(part));
        if (!set) return std::nullopt;
        range.sets.push_back(*set);
    }

    if (range.sets.empty()) return std::nullopt;
    return range;
}

bool satisfies(const Version& version, const Constraint& constraint) {
    switch (constraint.op) {
        case Comparator::Eq:
            return version == constraint.version;
        case Comparator::Lt:
            return version < constraint.version;
        case Comparator::Le:
            return version <= constraint.version;
        case Comparator::Gt:
            return version > constraint.version;
        case Comparator::Ge:
            return version >= constraint.version;
        case Comparator::Ne:
            return version != constraint.version;
    }
    return false;
}

bool satisfies(const Version& version, const ComparatorSet& set) {
    // All constraints in a set must be satisfied (AND)
    for (const auto& constraint : set) {
        if (!satisfies(version, constraint)) {
            return false;
        }
    }
    return true;
}

bool satisfies(const Version& version, const VersionRange& range) {
    // Any set in the range must be satisfied (OR)
    for (const auto& set : range.sets) {
        if (satisfies(version, set)) {
            return true;
        }
    }
    return false;
}

bool intersects(const VersionRange& a, const VersionRange& b) {
    for (const auto& set_a : a.sets) {
        for (const auto& set_b : b.sets) {
            ComparatorSet combined = set_a;
            combined.insert(combined.end(), set_b.begin(), set_b.end());
            if (non_empty(combined)) return true;
        }
    }
    return false;
}

} // namespace wheelsmith
