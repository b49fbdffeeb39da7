#pragma once

#include "wheelsmith/errors.hpp"

#include <optional>
#include <string>

namespace wheelsmith {

// ============================================================================
// Compatibility Tags
// ============================================================================

struct Tag {
    std::string interpreter;    // "py3", "py2.py3", "cp311"
    std::string abi;            // "none", "cp311"
    std::string platform;       // "any", "linux_x86_64"

    std::string str() const { return interpreter + "-" + abi + "-" + platform; }
};

// Parse "interpreter-abi-platform"; nullopt unless there are exactly three
// non-empty parts
std::optional<Tag> parse_tag(const std::string& text);

// Source of the host's most specific supported tag
class HostTagProbe {
public:
    virtual ~HostTagProbe() = default;
    virtual std::optional<Tag> probe() = 0;
};

// Asks a Python interpreter for its first supported tag
// (packaging.tags.sys_tags(), falling back to sysconfig)
class InterpreterTagProbe : public HostTagProbe {
public:
    explicit InterpreterTagProbe(std::string python, int timeout_seconds = 60)
        : python_(std::move(python)), timeout_seconds_(timeout_seconds) {}

    std::optional<Tag> probe() override;

private:
    std::string python_;
    int timeout_seconds_;
};

struct TagResult {
    bool ok = false;
    BuildError kind = BuildError::None;
    std::string error;
    Tag tag;
};

// True if the interpreter range admits any version in >=2.0.0 <3.0.0.
// An unparseable range is treated as admitting everything.
bool supports_python2(const std::string& python_range);

// Native builds use the probe's answer; pure projects get
// py2.py3-none-any or py3-none-any depending on the range.
TagResult resolve_tag(bool requires_native_build, const std::string& python_range,
                      HostTagProbe& probe);

} // namespace wheelsmith
