// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for proton-apctl
 */

#include "ap_error.h"
#include "ap_types.h"
#include "config.h"
#include "controller_settings.h"

#include <optional>
#include <string>
#include <vector>

namespace proton {

enum class CliCommand {
    NONE,
    CONFIGURE, ///< Apply configuration, leave the AP down
    START,
    STOP,
    UP,        ///< configure + start
    STATUS,
    MONITOR,   ///< Print events until interrupted or --duration passes
    KICK,      ///< Disconnect the --station client
};

const char* cli_command_name(CliCommand command);
std::optional<CliCommand> parse_cli_command(const char* name);

/**
 * @brief Parsed command-line arguments
 *
 * Access point options are optional so that unset ones fall back to the
 * configuration file.
 */
struct CliArgs {
    CliCommand command = CliCommand::NONE;
    std::string interface = "wlan0";
    std::string config_path = "/etc/proton/proton.json";

    // Access point overrides
    std::optional<std::string> ssid;
    std::optional<SecurityMode> security;
    std::optional<std::string> passphrase;
    std::optional<Band> band;
    std::optional<int> channel;
    std::optional<bool> client_isolation;
    std::vector<MacAddress> allow_macs; ///< --allow: whitelist
    std::vector<MacAddress> deny_macs;  ///< --deny: blacklist

    std::optional<MacAddress> station; ///< kick target

    // Controller overrides
    int timeout_ms = 0; ///< 0 = from config
    std::string control_dir;

    // Monitor
    int duration_sec = 0; ///< 0 = until interrupted

    // Logging
    int verbosity = 0;
    std::string log_dest;
    std::string log_file;

    bool test_mode = false; ///< Simulated daemon
    bool help = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success or when help was requested (args.help), false on a usage error
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

void print_help(const char* program_name);

/// Apply --timeout, --control-dir and --test on top of file settings
void apply_cli_overrides(const CliArgs& args, ControllerSettings& settings);

/**
 * @brief Access point configuration from the config file plus CLI overrides
 *
 * Starts from /access_points/<interface> when the file has it, then applies
 * every option given on the command line.
 *
 * @return INVALID_CONFIG if the file section is malformed or no SSID is known
 */
ApError build_access_point_config(const CliArgs& args, const Config& config,
                                  AccessPointConfig& out);

} // namespace proton
