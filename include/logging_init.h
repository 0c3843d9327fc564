// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace proton {
namespace logging {

/**
 * @brief Where log output goes in addition to the console
 */
enum class LogTarget {
    Auto,    ///< Journal if available, else syslog; console off Linux
    Journal, ///< systemd journal
    Syslog,  ///< syslog(3)
    File,    ///< Rotating log file
    Console, ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< Empty = default_log_file_path()
};

/**
 * @brief Install the default "proton" logger
 *
 * Replaces spdlog's default logger with one writing to the console and the
 * selected system sink. Safe to call more than once; the last call wins.
 */
void init(const LogConfig& config);

/**
 * @brief The target init() actually uses for @p requested
 *
 * Auto picks the journal when its socket exists and the journal sink is
 * built in, syslog otherwise. Journal without the sink becomes syslog.
 * Never returns Auto.
 */
LogTarget effective_log_target(LogTarget requested);

/// /var/log/proton.log for root, $XDG_STATE_HOME/proton/proton.log otherwise
std::string default_log_file_path();

/// "journal", "syslog", "file", "console"; anything else maps to Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/// warn for 0, info for 1, debug for 2, trace above
spdlog::level::level_enum level_for_verbosity(int verbosity);

} // namespace logging
} // namespace proton
