// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "spdlog/spdlog.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace proton {

const char* cli_command_name(CliCommand command) {
    switch (command) {
    case CliCommand::NONE:
        return "none";
    case CliCommand::CONFIGURE:
        return "configure";
    case CliCommand::START:
        return "start";
    case CliCommand::STOP:
        return "stop";
    case CliCommand::UP:
        return "up";
    case CliCommand::STATUS:
        return "status";
    case CliCommand::MONITOR:
        return "monitor";
    case CliCommand::KICK:
        return "kick";
    }
    return "unknown";
}

std::optional<CliCommand> parse_cli_command(const char* name) {
    if (strcmp(name, "configure") == 0)
        return CliCommand::CONFIGURE;
    if (strcmp(name, "start") == 0)
        return CliCommand::START;
    if (strcmp(name, "stop") == 0)
        return CliCommand::STOP;
    if (strcmp(name, "up") == 0)
        return CliCommand::UP;
    if (strcmp(name, "status") == 0)
        return CliCommand::STATUS;
    if (strcmp(name, "monitor") == 0)
        return CliCommand::MONITOR;
    if (strcmp(name, "kick") == 0)
        return CliCommand::KICK;
    return std::nullopt;
}

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

static bool parse_mac_arg(const char* str, std::vector<MacAddress>& out, const char* name) {
    auto mac = MacAddress::parse(str);
    if (!mac) {
        printf("Error: %s requires a MAC address like 02:00:00:00:00:01, got: %s\n", name, str);
        return false;
    }
    out.push_back(*mac);
    return true;
}

void print_help(const char* program_name) {
    printf("Usage: %s [options] <command>\n", program_name);
    printf("\n");
    printf("Commands:\n");
    printf("  configure            Apply the access point configuration (AP stays down)\n");
    printf("  start                Bring the access point up\n");
    printf("  stop                 Take the access point down\n");
    printf("  up                   configure, then start\n");
    printf("  status               Print state and associated stations\n");
    printf("  monitor              Print events as they happen\n");
    printf("  kick                 Disconnect the client given with --station\n");
    printf("\n");
    printf("Options:\n");
    printf("  -c, --config <path>  Configuration file (default: /etc/proton/proton.json)\n");
    printf("  -i, --interface <if> Wireless interface (default: wlan0)\n");
    printf("  --ssid <name>        Network name (1-32 bytes)\n");
    printf("  --security <mode>    open, wpa2, wpa3 or mixed (default: wpa2)\n");
    printf("  --passphrase <text>  Passphrase (also read from PROTON_PASSPHRASE)\n");
    printf("  --band <2.4|5>       Frequency band (default: 2.4)\n");
    printf("  --channel <n>        Channel, 0 = automatic (default: 0)\n");
    printf("  --isolate            Keep clients from reaching each other\n");
    printf("  --allow <mac>        Admit only listed clients (repeatable)\n");
    printf("  --deny <mac>         Refuse listed clients (repeatable)\n");
    printf("  --station <mac>      Client to disconnect with kick\n");
    printf("  --timeout <ms>       Operation timeout\n");
    printf("  --control-dir <dir>  hostapd control socket directory\n");
    printf("  --duration <sec>     Stop monitoring after this long\n");
    printf("  --log-dest <dest>    auto, journal, syslog, file or console\n");
    printf("  --log-file <path>    Log file for --log-dest file\n");
    printf("  -v, --verbose        More logging (-vv debug, -vvv trace)\n");
    printf("  --test               Use a simulated hostapd\n");
    printf("  -h, --help           Show this help\n");
    printf("\n");
    printf("Exit status: 0 success, 1 operation failed, 2 usage error\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    // Every option below that takes a value goes through this
    auto need_value = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            printf("Error: %s requires an argument\n", name);
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        const char* value = nullptr;

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.help = true;
            return true;
        } else if (strcmp(arg, "-c") == 0 || strcmp(arg, "--config") == 0) {
            if (!(value = need_value(i, "-c/--config")))
                return false;
            args.config_path = value;
        } else if (strcmp(arg, "-i") == 0 || strcmp(arg, "--interface") == 0) {
            if (!(value = need_value(i, "-i/--interface")))
                return false;
            if (*value == '\0' || strchr(value, '/') != nullptr) {
                printf("Error: invalid interface name: %s\n", value);
                return false;
            }
            args.interface = value;
        } else if (strcmp(arg, "--ssid") == 0) {
            if (!(value = need_value(i, "--ssid")))
                return false;
            args.ssid = value;
        } else if (strcmp(arg, "--security") == 0) {
            if (!(value = need_value(i, "--security")))
                return false;
            args.security = parse_security_mode(value);
            if (!args.security) {
                printf("Error: unknown security mode: %s (open, wpa2, wpa3, mixed)\n", value);
                return false;
            }
        } else if (strcmp(arg, "--passphrase") == 0) {
            if (!(value = need_value(i, "--passphrase")))
                return false;
            args.passphrase = value;
        } else if (strcmp(arg, "--band") == 0) {
            if (!(value = need_value(i, "--band")))
                return false;
            args.band = parse_band(value);
        } else if (strcmp(arg, "--channel") == 0) {
            int channel = 0;
            if (!(value = need_value(i, "--channel")) || !parse_int(value, 0, 200, channel, "channel"))
                return false;
            args.channel = channel;
        } else if (strcmp(arg, "--isolate") == 0) {
            args.client_isolation = true;
        } else if (strcmp(arg, "--allow") == 0) {
            if (!(value = need_value(i, "--allow")) || !parse_mac_arg(value, args.allow_macs, "--allow"))
                return false;
        } else if (strcmp(arg, "--deny") == 0) {
            if (!(value = need_value(i, "--deny")) || !parse_mac_arg(value, args.deny_macs, "--deny"))
                return false;
        } else if (strcmp(arg, "--station") == 0) {
            std::vector<MacAddress> station;
            if (!(value = need_value(i, "--station")) || !parse_mac_arg(value, station, "--station"))
                return false;
            args.station = station.front();
        } else if (strcmp(arg, "--timeout") == 0) {
            if (!(value = need_value(i, "--timeout")) ||
                !parse_int(value, 1, 600000, args.timeout_ms, "timeout"))
                return false;
        } else if (strcmp(arg, "--control-dir") == 0) {
            if (!(value = need_value(i, "--control-dir")))
                return false;
            args.control_dir = value;
        } else if (strcmp(arg, "--duration") == 0) {
            if (!(value = need_value(i, "--duration")) ||
                !parse_int(value, 0, 86400, args.duration_sec, "duration"))
                return false;
        } else if (strcmp(arg, "--log-dest") == 0) {
            if (!(value = need_value(i, "--log-dest")))
                return false;
            args.log_dest = value;
        } else if (strcmp(arg, "--log-file") == 0) {
            if (!(value = need_value(i, "--log-file")))
                return false;
            args.log_file = value;
        } else if (strcmp(arg, "--test") == 0) {
            args.test_mode = true;
        } else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        } else if (strcmp(arg, "-vv") == 0) {
            args.verbosity += 2;
        } else if (strcmp(arg, "-vvv") == 0) {
            args.verbosity += 3;
        } else if (arg[0] == '-') {
            printf("Error: unknown option: %s\n", arg);
            printf("Use --help for usage\n");
            return false;
        } else {
            if (args.command != CliCommand::NONE) {
                printf("Error: more than one command given (%s, %s)\n",
                       cli_command_name(args.command), arg);
                return false;
            }
            auto command = parse_cli_command(arg);
            if (!command) {
                printf("Error: unknown command: %s\n", arg);
                printf("Use --help for usage\n");
                return false;
            }
            args.command = *command;
        }
    }

    if (!args.allow_macs.empty() && !args.deny_macs.empty()) {
        printf("Error: --allow and --deny cannot be combined\n");
        return false;
    }

    if (args.command == CliCommand::NONE) {
        printf("Error: no command given\n");
        printf("Use --help for usage\n");
        return false;
    }

    if (args.command == CliCommand::KICK && !args.station) {
        printf("Error: kick requires --station <mac>\n");
        return false;
    }

    return true;
}

void apply_cli_overrides(const CliArgs& args, ControllerSettings& settings) {
    if (args.timeout_ms > 0) {
        settings.operation_timeout = std::chrono::milliseconds(args.timeout_ms);
    }
    if (!args.control_dir.empty()) {
        settings.control_dir = args.control_dir;
    }
    settings.mock_daemon = args.test_mode;
}

ApError build_access_point_config(const CliArgs& args, const Config& config,
                                  AccessPointConfig& out) {
    AccessPointConfig cfg;

    json section = config.get_json("/access_points/" + args.interface);
    if (!section.is_null()) {
        ApError err = parse_access_point_config(section, cfg);
        if (!err) {
            err.message = "access_points/" + args.interface + ": " + err.message;
            return err;
        }
        spdlog::debug("[CLI] Loaded access point settings for {} from {}", args.interface,
                      config.get_path());
    }

    if (args.ssid)
        cfg.ssid = *args.ssid;
    if (args.security)
        cfg.security = *args.security;
    if (args.passphrase) {
        cfg.passphrase = *args.passphrase;
    } else if (const char* env = std::getenv("PROTON_PASSPHRASE")) {
        cfg.passphrase = env;
    }
    if (args.band)
        cfg.band = *args.band;
    if (args.channel)
        cfg.channel = *args.channel;
    if (args.client_isolation)
        cfg.client_isolation = *args.client_isolation;

    if (!args.allow_macs.empty()) {
        cfg.mac_policy = MacPolicy::make_whitelist();
        for (const auto& mac : args.allow_macs) {
            cfg.mac_policy.allow(mac);
        }
    } else if (!args.deny_macs.empty()) {
        cfg.mac_policy = MacPolicy::make_blacklist();
        for (const auto& mac : args.deny_macs) {
            cfg.mac_policy.deny(mac);
        }
    }

    if (cfg.ssid.empty()) {
        return ApError::invalid_config("no SSID for " + args.interface +
                                       " (use --ssid or the config file)");
    }

    out = std::move(cfg);
    return ApError::ok();
}

} // namespace proton
