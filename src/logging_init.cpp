// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <unistd.h>
#include <vector>

#ifdef __linux__
#ifdef PROTON_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace proton {
namespace logging {

namespace {

constexpr const char* IDENT = "proton";

// 5MB per file, 3 rotated files
constexpr size_t LOG_FILE_MAX_SIZE = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;

bool journal_available() {
#if defined(__linux__) && defined(PROTON_HAS_SYSTEMD)
    std::error_code ec;
    return std::filesystem::exists("/run/systemd/journal/socket", ec);
#else
    return false;
#endif
}

/// nullptr for Console
spdlog::sink_ptr make_target_sink(LogTarget target, const std::string& file_path) {
    switch (target) {
    case LogTarget::File: {
        std::string path = file_path.empty() ? default_log_file_path() : file_path;
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, LOG_FILE_MAX_SIZE,
                                                                      LOG_FILE_COUNT);
    }
#if defined(__linux__) && defined(PROTON_HAS_SYSTEMD)
    case LogTarget::Journal:
        return std::make_shared<spdlog::sinks::systemd_sink_mt>(IDENT);
#endif
#ifdef __linux__
    case LogTarget::Syslog:
        return std::make_shared<spdlog::sinks::syslog_sink_mt>(IDENT, LOG_PID, LOG_DAEMON, false);
#endif
    default:
        return nullptr;
    }
}

} // namespace

LogTarget effective_log_target(LogTarget requested) {
#ifdef __linux__
    switch (requested) {
    case LogTarget::Auto:
        return journal_available() ? LogTarget::Journal : LogTarget::Syslog;
    case LogTarget::Journal:
        // syslog ends up in the journal anyway when the sink is not built in
        return journal_available() ? LogTarget::Journal : LogTarget::Syslog;
    default:
        return requested;
    }
#else
    return requested == LogTarget::File ? LogTarget::File : LogTarget::Console;
#endif
}

std::string default_log_file_path() {
    if (::geteuid() == 0) {
        return "/var/log/proton.log";
    }

    std::string state_home;
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg) {
        state_home = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        state_home = std::string(home) + "/.local/state";
    } else {
        state_home = "/tmp";
    }
    return state_home + "/proton/proton.log";
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // stderr, so that command output on stdout stays parseable
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    LogTarget target = effective_log_target(config.target);
    std::string sink_error;
    try {
        if (auto sink = make_target_sink(target, config.file_path)) {
            sinks.push_back(std::move(sink));
        }
    } catch (const spdlog::spdlog_ex& e) {
        sink_error = e.what();
    }

    auto logger = std::make_shared<spdlog::logger>("proton", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    if (!sink_error.empty()) {
        spdlog::error("[Logging] No {} output: {}", log_target_name(target), sink_error);
    }
    spdlog::debug("[Logging] Logging to {}{}", log_target_name(target),
                  config.enable_console ? " and stderr" : "");
}

LogTarget parse_log_target(const std::string& str) {
    for (auto target : {LogTarget::Journal, LogTarget::Syslog, LogTarget::File,
                        LogTarget::Console}) {
        if (str == log_target_name(target)) {
            return target;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Journal:
        return "journal";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

spdlog::level::level_enum level_for_verbosity(int verbosity) {
    if (verbosity <= 0) {
        return spdlog::level::warn;
    }
    switch (verbosity) {
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return spdlog::level::trace;
    }
}

} // namespace logging
} // namespace proton
