// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace proton {

/**
 * @brief Hardware (MAC) address consisting of six octets
 *
 * Formats as lowercase colon-separated hex ("02:00:5e:10:00:01"), which is
 * also the form hostapd uses in its control interface replies and events.
 */
class MacAddress {
  public:
    MacAddress() : octets_{} {}
    explicit MacAddress(const std::array<uint8_t, 6>& octets) : octets_(octets) {}
    MacAddress(uint8_t a, uint8_t b, uint8_t c, uint8_t d, uint8_t e, uint8_t f)
        : octets_{a, b, c, d, e, f} {}

    /**
     * @brief Parse "aa:bb:cc:dd:ee:ff" (':' or '-' separators, any case)
     *
     * @return Parsed address, or std::nullopt if the text is not a MAC address
     */
    static std::optional<MacAddress> parse(const std::string& text);

    std::string to_string() const;

    const std::array<uint8_t, 6>& octets() const {
        return octets_;
    }

    bool is_zero() const;
    bool is_broadcast() const;

    bool operator==(const MacAddress& o) const {
        return octets_ == o.octets_;
    }
    bool operator!=(const MacAddress& o) const {
        return octets_ != o.octets_;
    }
    bool operator<(const MacAddress& o) const {
        return octets_ < o.octets_;
    }

  private:
    std::array<uint8_t, 6> octets_;
};

/**
 * @brief MAC address admission policy for an access point
 *
 * Defines which stations are permitted to associate:
 * - PUBLIC: every address may join
 * - WHITELIST: only listed addresses may join
 * - BLACKLIST: every address except the listed ones may join
 */
class MacPolicy {
  public:
    enum class Mode { PUBLIC, WHITELIST, BLACKLIST };

    MacPolicy() = default;

    static MacPolicy make_public() {
        return MacPolicy(Mode::PUBLIC);
    }
    static MacPolicy make_whitelist() {
        return MacPolicy(Mode::WHITELIST);
    }
    static MacPolicy make_blacklist() {
        return MacPolicy(Mode::BLACKLIST);
    }

    /**
     * @brief Add an address to the whitelist
     *
     * @return false if this is not a whitelist policy (address not added)
     */
    bool allow(const MacAddress& mac);

    /**
     * @brief Add an address to the blacklist
     *
     * @return false if this is not a blacklist policy (address not added)
     */
    bool deny(const MacAddress& mac);

    /// True if the policy admits @p mac
    bool check(const MacAddress& mac) const;

    Mode mode() const {
        return mode_;
    }
    const std::vector<MacAddress>& addresses() const {
        return addresses_;
    }

    bool operator==(const MacPolicy& o) const {
        return mode_ == o.mode_ && addresses_ == o.addresses_;
    }
    bool operator!=(const MacPolicy& o) const {
        return !(*this == o);
    }

  private:
    explicit MacPolicy(Mode mode) : mode_(mode) {}

    bool contains(const MacAddress& mac) const;

    Mode mode_ = Mode::PUBLIC;
    std::vector<MacAddress> addresses_;
};

const char* mac_policy_mode_name(MacPolicy::Mode mode);

/// Parse "public", "whitelist" or "blacklist"; std::nullopt otherwise
std::optional<MacPolicy::Mode> parse_mac_policy_mode(const std::string& str);

} // namespace proton
