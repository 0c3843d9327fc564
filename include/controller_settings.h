// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ap_error.h"
#include "ap_types.h"
#include "config.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace proton {

/**
 * @brief Tunables of the lifecycle controller and its bus proxy
 *
 * JSON layout read by from_config():
 * @code
 *   {
 *     "controller": {
 *       "operation_timeout_ms": 5000,
 *       "retry_attempts": 3,
 *       "retry_backoff_ms": 100,
 *       "retry_backoff_max_ms": 1000,
 *       "observer_queue_capacity": 64
 *     },
 *     "hostapd": { "control_dir": "/var/run/hostapd" }
 *   }
 * @endcode
 */
struct ControllerSettings {
    /// Bound on configure/start/stop, including the wait for the confirming signal
    std::chrono::milliseconds operation_timeout{5000};

    /// Attempts per bus call when the failure is transient (1 = no retry)
    int retry_attempts = 3;

    /// First retry delay; doubles per attempt up to retry_backoff_max
    std::chrono::milliseconds retry_backoff{100};
    std::chrono::milliseconds retry_backoff_max{1000};

    /// Events buffered per observer before drops start
    size_t observer_queue_capacity = 64;

    /// Directory holding hostapd's per-interface control sockets
    std::string control_dir = "/var/run/hostapd";

    /// Use the simulated daemon instead of hostapd (--test)
    bool mock_daemon = false;

    static ControllerSettings from_config(const Config& config);
};

/**
 * @brief Build an AccessPointConfig from a JSON object
 *
 * @code
 *   { "ssid": "workshop", "security": "wpa2", "passphrase": "...",
 *     "band": "2.4", "channel": 6, "client_isolation": false,
 *     "mac_policy": { "mode": "blacklist", "addresses": ["02:00:00:00:00:01"] } }
 * @endcode
 *
 * Only checks that fields have the right shape; range checks are left to
 * validate_config() so that both code paths report the same errors.
 *
 * @param obj JSON object (e.g. config.get_json("/access_points/wlan0"))
 * @param[out] out Parsed configuration
 * @return INVALID_CONFIG describing the first malformed field, or success
 */
ApError parse_access_point_config(const json& obj, AccessPointConfig& out);

} // namespace proton
