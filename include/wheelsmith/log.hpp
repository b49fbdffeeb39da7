#pragma once

#include <spdlog/spdlog.h>

namespace wheelsmith {

// Library code logs through spdlog's default logger directly
// (spdlog::info / spdlog::debug). The CLI picks the level once at startup.
enum class LogLevel {
    Debug,
    Info,
    Warn,
    Silent,
};

void init_logger(LogLevel level);

// -v wins over -q when both are given
LogLevel log_level_from_flags(bool verbose, bool quiet);

} // namespace wheelsmith
