#include "wheelsmith/log.hpp"

#include <spdlog/spdlog.h>

namespace wheelsmith {

void init_logger(LogLevel level) {
    spdlog::set_pattern("%v");

    switch (level) {
        case LogLevel::Debug:
            spdlog::set_level(spdlog::level::debug);
            break;
        case LogLevel::Info:
            spdlog::set_level(spdlog::level::info);
            break;
        case LogLevel::Warn:
            spdlog::set_level(spdlog::level::warn);
            break;
        case LogLevel::Silent:
            spdlog::set_level(spdlog::level::off);
            break;
    }
}

LogLevel log_level_from_flags(bool verbose, bool quiet) {
    if (verbose) return LogLevel::Debug;
    if (quiet) return LogLevel::Warn;
    return LogLevel::Info;
}

} // namespace wheelsmith
