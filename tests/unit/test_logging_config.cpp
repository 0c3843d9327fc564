// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>

using namespace proton::logging;

// ============================================================================
// level_for_verbosity()
// ============================================================================

TEST_CASE("level_for_verbosity: maps -v count to a level", "[logging][config]") {
    REQUIRE(level_for_verbosity(0) == spdlog::level::warn);
    REQUIRE(level_for_verbosity(1) == spdlog::level::info);
    REQUIRE(level_for_verbosity(2) == spdlog::level::debug);
    REQUIRE(level_for_verbosity(3) == spdlog::level::trace);
    REQUIRE(level_for_verbosity(7) == spdlog::level::trace);
}

TEST_CASE("level_for_verbosity: negative counts stay at warn", "[logging][config]") {
    REQUIRE(level_for_verbosity(-1) == spdlog::level::warn);
}

// ============================================================================
// parse_log_target() / log_target_name()
// ============================================================================

TEST_CASE("parse_log_target: known names", "[logging][config]") {
    REQUIRE(parse_log_target("journal") == LogTarget::Journal);
    REQUIRE(parse_log_target("syslog") == LogTarget::Syslog);
    REQUIRE(parse_log_target("file") == LogTarget::File);
    REQUIRE(parse_log_target("console") == LogTarget::Console);
    REQUIRE(parse_log_target("auto") == LogTarget::Auto);
}

TEST_CASE("parse_log_target: unknown names fall back to auto", "[logging][config]") {
    REQUIRE(parse_log_target("") == LogTarget::Auto);
    REQUIRE(parse_log_target("Journal") == LogTarget::Auto);
    REQUIRE(parse_log_target("stderr") == LogTarget::Auto);
}

TEST_CASE("log_target_name: round-trips through parse", "[logging][config]") {
    for (auto target : {LogTarget::Journal, LogTarget::Syslog, LogTarget::File,
                        LogTarget::Console, LogTarget::Auto}) {
        REQUIRE(parse_log_target(log_target_name(target)) == target);
    }
}

// ============================================================================
// effective_log_target() / default_log_file_path()
// ============================================================================

TEST_CASE("effective_log_target: never auto", "[logging][config]") {
    for (auto target : {LogTarget::Journal, LogTarget::Syslog, LogTarget::File,
                        LogTarget::Console, LogTarget::Auto}) {
        REQUIRE(effective_log_target(target) != LogTarget::Auto);
    }
    REQUIRE(effective_log_target(LogTarget::File) == LogTarget::File);
    REQUIRE(effective_log_target(LogTarget::Console) == LogTarget::Console);
#ifdef __linux__
    REQUIRE(effective_log_target(LogTarget::Syslog) == LogTarget::Syslog);
    // Same resolution for an explicit journal request and auto
    REQUIRE(effective_log_target(LogTarget::Journal) == effective_log_target(LogTarget::Auto));
#endif
}

TEST_CASE("default_log_file_path: root logs to /var/log, users to XDG state",
          "[logging][config]") {
    const char* saved = std::getenv("XDG_STATE_HOME");
    std::string saved_value = saved ? saved : "";
    setenv("XDG_STATE_HOME", "/tmp/proton-state", 1);

    std::string path = default_log_file_path();
    if (::geteuid() == 0) {
        REQUIRE(path == "/var/log/proton.log");
    } else {
        REQUIRE(path == "/tmp/proton-state/proton/proton.log");
    }

    if (saved) {
        setenv("XDG_STATE_HOME", saved_value.c_str(), 1);
    } else {
        unsetenv("XDG_STATE_HOME");
    }
}

// ============================================================================
// init()
// ============================================================================

TEST_CASE("init: installs the proton logger at the requested level", "[logging][init]") {
    LogConfig config;
    config.level = spdlog::level::debug;
    config.target = LogTarget::Console;
    init(config);

    auto logger = spdlog::default_logger();
    REQUIRE(logger->name() == "proton");
    REQUIRE(logger->level() == spdlog::level::debug);
    REQUIRE(logger->sinks().size() == 1);

    SECTION("console can be disabled") {
        config.enable_console = false;
        init(config);
        REQUIRE(spdlog::default_logger()->sinks().empty());
    }

    SECTION("file target adds a rotating sink") {
        config.target = LogTarget::File;
        config.file_path = "/tmp/proton_test_log_" + std::to_string(::getpid()) + ".log";
        init(config);
        REQUIRE(spdlog::default_logger()->sinks().size() == 2);
        spdlog::default_logger()->flush();
        std::remove(config.file_path.c_str());
    }

    // Leave a quiet logger for the tests that follow
    LogConfig quiet;
    quiet.target = LogTarget::Console;
    init(quiet);
}
