#include "wheelsmith/tags.hpp"
#include "wheelsmith/process.hpp"
#include "wheelsmith/version_range.hpp"

#include <spdlog/spdlog.h>

namespace wheelsmith {

namespace {

// Prints the interpreter's most specific tag as "interpreter-abi-platform"
const char* TAG_PROBE_SCRIPT = R"PY(import sys
try:
    from packaging.tags import sys_tags
    t = next(iter(sys_tags()))
    print("%s-%s-%s" % (t.interpreter, t.abi, t.platform))
except ImportError:
    import sysconfig
    name = sys.implementation.name
    impl = {"cpython": "cp", "pypy": "pp"}.get(name, name[:2])
    ver = "%d%d" % sys.version_info[:2]
    plat = sysconfig.get_platform().replace("-", "_").replace(".", "_")
    print("%s%s-%s%s-%s" % (impl, ver, impl, ver, plat))
)PY";

const char* PYTHON2_RANGE = ">=2.0.0 <3.0.0";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

std::optional<Tag> parse_tag(const std::string& text) {
    std::string s = trim(text);

    size_t first = s.find('-');
    if (first == std::string::npos) return std::nullopt;
    size_t second = s.find('-', first + 1);
    if (second == std::string::npos || s.find('-', second + 1) != std::string::npos) {
        return std::nullopt;
    }

    Tag tag;
    tag.interpreter = s.substr(0, first);
    tag.abi = s.substr(first + 1, second - first - 1);
    tag.platform = s.substr(second + 1);
    if (tag.interpreter.empty() || tag.abi.empty() || tag.platform.empty()) {
        return std::nullopt;
    }
    return tag;
}

std::optional<Tag> InterpreterTagProbe::probe() {
    ProcessOptions options;
    options.capture_output = true;
    options.timeout_seconds = timeout_seconds_;

    auto proc = run_process({python_, "-c", TAG_PROBE_SCRIPT}, options);
    if (!proc.ok || proc.exit_code != 0) {
        spdlog::debug(" - Tag probe with {} failed: {}", python_,
                      proc.error.empty() ? "exit code " + std::to_string(proc.exit_code)
                                         : proc.error);
        return std::nullopt;
    }

    // First line only; anything after is noise from site hooks
    std::string first_line = proc.output.substr(0, proc.output.find('\n'));
    return parse_tag(first_line);
}

bool supports_python2(const std::string& python_range) {
    auto range = parse_range(python_range);
    auto py2 = parse_range(PYTHON2_RANGE);
    if (!range || !py2) {
        spdlog::debug(" - Unparseable python range '{}', assuming any version", python_range);
        return true;
    }
    return intersects(*range, *py2);
}

TagResult resolve_tag(bool requires_native_build, const std::string& python_range,
                      HostTagProbe& probe) {
    TagResult result;

    if (requires_native_build) {
        auto tag = probe.probe();
        if (!tag) {
            result.kind = BuildError::ConfigurationIncompatible;
            result.error = "unable to determine a platform tag for the native build";
            return result;
        }
        result.tag = *tag;
        result.ok = true;
        return result;
    }

    result.tag.interpreter = supports_python2(python_range) ? "py2.py3" : "py3";
    result.tag.abi = "none";
    result.tag.platform = "any";
    result.ok = true;
    return result;
}

} // namespace wheelsmith
