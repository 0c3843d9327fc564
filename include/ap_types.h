// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ap_error.h"
#include "mac_address.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace proton {

/// Maximum SSID length in bytes (IEEE 802.11)
constexpr size_t MAX_SSID_LENGTH = 32;

enum class SecurityMode {
    OPEN,
    WPA2_PERSONAL,
    WPA3_PERSONAL,
    WPA2_WPA3_MIXED,
};

enum class Band {
    BAND_2_4GHZ,
    BAND_5GHZ,
};

/**
 * @brief Desired access point configuration
 *
 * Value object: the controller keeps its own copy of the last configuration
 * acknowledged by the daemon, and a later configure() replaces it wholesale.
 * The SSID is a byte string and may contain any octet.
 */
struct AccessPointConfig {
    std::string ssid;
    SecurityMode security = SecurityMode::WPA2_PERSONAL;
    std::string passphrase; ///< Empty for OPEN
    Band band = Band::BAND_2_4GHZ;
    int channel = 0; ///< 0 = automatic channel selection
    bool client_isolation = false;
    MacPolicy mac_policy;

    bool operator==(const AccessPointConfig& o) const {
        return ssid == o.ssid && security == o.security && passphrase == o.passphrase &&
               band == o.band && channel == o.channel && client_isolation == o.client_isolation &&
               mac_policy == o.mac_policy;
    }
    bool operator!=(const AccessPointConfig& o) const {
        return !(*this == o);
    }
};

/**
 * @brief Validate a configuration without contacting the daemon
 *
 * Checks SSID length, passphrase presence and length for the security mode,
 * and that the channel exists in the selected band.
 *
 * @return ApError of type INVALID_CONFIG describing the first violation, or success
 */
ApError validate_config(const AccessPointConfig& config);

/// True if @p security needs a passphrase
bool security_requires_passphrase(SecurityMode security);

/// True if @p channel is valid for @p band (0 is always valid)
bool is_valid_channel(Band band, int channel);

const char* security_mode_name(SecurityMode mode);
const char* band_name(Band band);

/// Parse "open", "wpa2", "wpa3" or "mixed"
std::optional<SecurityMode> parse_security_mode(const std::string& str);

/// Parse a band: "5" selects 5 GHz, anything else defaults to 2.4 GHz
Band parse_band(const std::string& str);

/**
 * @brief Client device associated with an access point
 */
struct Station {
    MacAddress mac;
    std::chrono::system_clock::time_point associated_at{};
    std::optional<int> signal_dbm;             ///< Last received signal strength
    std::optional<uint32_t> connected_seconds; ///< Time associated, as reported by the daemon
};

enum class LifecycleState {
    DOWN,
    CONFIGURING,
    STARTING,
    UP,
    STOPPING,
    ERROR,
};

const char* lifecycle_state_name(LifecycleState state);

/**
 * @brief Immutable copy of an access point's state handed to callers
 */
struct AccessPointSnapshot {
    std::string handle;
    std::optional<AccessPointConfig> config; ///< Last configuration acknowledged by the daemon
    LifecycleState state = LifecycleState::DOWN;
    std::string error_reason; ///< Non-empty iff state == ERROR
    std::vector<Station> stations; ///< Sorted by MAC address
    bool needs_reconcile = false;

    bool has_station(const MacAddress& mac) const;
};

} // namespace proton
