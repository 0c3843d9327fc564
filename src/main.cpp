// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief proton-apctl: command-line front end to the access point controller
 */

#include "ap_controller.h"
#include "cli_args.h"
#include "config.h"
#include "controller_settings.h"
#include "logging_init.h"

#include "spdlog/spdlog.h"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>

using namespace proton;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

volatile sig_atomic_t g_quit = 0;

void signal_handler(int sig) {
    (void)sig;
    g_quit = 1;
}

int report(const char* what, const std::string& handle, const ApError& err) {
    if (err) {
        printf("%s %s: OK\n", handle.c_str(), what);
        return EXIT_OK;
    }
    fprintf(stderr, "%s %s failed: %s\n", handle.c_str(), what, err.to_string().c_str());
    return EXIT_FAILED;
}

void print_snapshot(const AccessPointSnapshot& snap) {
    printf("%s: %s", snap.handle.c_str(), lifecycle_state_name(snap.state));
    if (snap.state == LifecycleState::ERROR) {
        printf(" (%s)", snap.error_reason.c_str());
    }
    printf("\n");

    if (snap.config) {
        const auto& cfg = *snap.config;
        printf("  ssid: %s (%s, %s, channel %s)\n", cfg.ssid.c_str(),
               security_mode_name(cfg.security), band_name(cfg.band),
               cfg.channel == 0 ? "auto" : std::to_string(cfg.channel).c_str());
        printf("  client isolation: %s, mac policy: %s\n", cfg.client_isolation ? "on" : "off",
               mac_policy_mode_name(cfg.mac_policy.mode()));
    }

    printf("  stations: %zu\n", snap.stations.size());
    for (const auto& s : snap.stations) {
        printf("    %s", s.mac.to_string().c_str());
        if (s.signal_dbm) {
            printf("  %d dBm", *s.signal_dbm);
        }
        if (s.connected_seconds) {
            printf("  %us", *s.connected_seconds);
        }
        printf("\n");
    }
}

int run_monitor(AccessPointController& ctl, const CliArgs& args) {
    ObserverId id = ctl.subscribe(args.interface, [](const ApEvent& event) {
        printf("%s\n", event.describe().c_str());
        fflush(stdout);
    });

    ApError err = ctl.attach(args.interface);
    if (!err) {
        ctl.unsubscribe(id);
        return report("monitor", args.interface, err);
    }
    print_snapshot(ctl.snapshot(args.interface));
    fflush(stdout);

    signal(SIGTERM, signal_handler);
    signal(SIGINT, signal_handler);

    auto until = std::chrono::steady_clock::now() + std::chrono::seconds(args.duration_sec);
    while (!g_quit && (args.duration_sec == 0 || std::chrono::steady_clock::now() < until)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    ctl.flush_events(std::chrono::milliseconds(500));
    uint64_t dropped = ctl.dropped_events(id);
    ctl.unsubscribe(id);
    if (dropped > 0) {
        fprintf(stderr, "%llu events dropped\n", static_cast<unsigned long long>(dropped));
    }
    return EXIT_OK;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return EXIT_USAGE;
    }
    if (args.help) {
        print_help(argv[0]);
        return EXIT_OK;
    }

    // Quiet until logging is configured
    spdlog::set_level(spdlog::level::warn);

    Config config;
    config.load(args.config_path);

    // Priority: CLI > config > auto-detect
    {
        logging::LogConfig log_config;
        log_config.level = logging::level_for_verbosity(args.verbosity);

        std::string log_dest = args.log_dest;
        if (log_dest.empty()) {
            log_dest = config.get<std::string>("/log_dest", "console");
        }
        log_config.target = logging::parse_log_target(log_dest);

        log_config.file_path = args.log_file;
        if (log_config.file_path.empty()) {
            log_config.file_path = config.get<std::string>("/log_path", "");
        }

        logging::init(log_config);
    }

    ControllerSettings settings = ControllerSettings::from_config(config);
    apply_cli_overrides(args, settings);

    spdlog::info("[CLI] {} on {}{}", cli_command_name(args.command), args.interface,
                 settings.mock_daemon ? " (simulated hostapd)" : "");

    AccessPointController ctl(BusProxy::create(settings), settings);
    const std::string& handle = args.interface;

    switch (args.command) {
    case CliCommand::CONFIGURE:
    case CliCommand::UP: {
        AccessPointConfig ap_config;
        ApError err = build_access_point_config(args, config, ap_config);
        if (!err) {
            fprintf(stderr, "%s\n", err.to_string().c_str());
            return EXIT_USAGE;
        }
        int rc = report("configure", handle, ctl.configure(handle, ap_config));
        if (rc != EXIT_OK || args.command == CliCommand::CONFIGURE) {
            return rc;
        }
        return report("start", handle, ctl.start(handle));
    }

    case CliCommand::START:
        return report("start", handle, ctl.start(handle));

    case CliCommand::STOP: {
        // Attach first so stop sees the daemon's state, not a fresh cache
        ApError err = ctl.attach(handle);
        if (!err) {
            return report("stop", handle, err);
        }
        return report("stop", handle, ctl.stop(handle));
    }

    case CliCommand::STATUS: {
        ApError err = ctl.refresh(handle);
        if (!err) {
            return report("status", handle, err);
        }
        print_snapshot(ctl.snapshot(handle));
        return EXIT_OK;
    }

    case CliCommand::MONITOR:
        return run_monitor(ctl, args);

    case CliCommand::KICK:
        return report("kick", handle, ctl.deauthenticate(handle, *args.station));

    case CliCommand::NONE:
        break;
    }

    return EXIT_USAGE;
}
