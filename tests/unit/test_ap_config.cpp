// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ap_types.h"
#include "controller_settings.h"

#include <catch2/catch_test_macros.hpp>

using namespace proton;

namespace {

AccessPointConfig valid_wpa2() {
    AccessPointConfig cfg;
    cfg.ssid = "workshop";
    cfg.security = SecurityMode::WPA2_PERSONAL;
    cfg.passphrase = "correct horse";
    return cfg;
}

} // namespace

// ============================================================================
// validate_config()
// ============================================================================

TEST_CASE("validate_config: accepts a plain WPA2 configuration", "[ap][validate]") {
    REQUIRE(validate_config(valid_wpa2()).success());
}

TEST_CASE("validate_config: SSID length bounds", "[ap][validate]") {
    AccessPointConfig cfg = valid_wpa2();

    SECTION("empty SSID") {
        cfg.ssid.clear();
        ApError err = validate_config(cfg);
        REQUIRE(err.type == ApErrorType::INVALID_CONFIG);
        REQUIRE(err.is_config_error());
    }

    SECTION("32 bytes is the maximum") {
        cfg.ssid = std::string(32, 'x');
        REQUIRE(validate_config(cfg).success());
    }

    SECTION("33 bytes is too long") {
        cfg.ssid = std::string(33, 'x');
        REQUIRE(validate_config(cfg).type == ApErrorType::INVALID_CONFIG);
    }

    SECTION("arbitrary octets are allowed") {
        cfg.ssid = std::string("caf\xc3\xa9\x00\x01", 7);
        REQUIRE(validate_config(cfg).success());
    }
}

TEST_CASE("validate_config: passphrase rules per security mode", "[ap][validate]") {
    AccessPointConfig cfg = valid_wpa2();

    SECTION("WPA2 passphrase too short") {
        cfg.passphrase = "short";
        REQUIRE(validate_config(cfg).type == ApErrorType::INVALID_CONFIG);
    }

    SECTION("WPA2 passphrase of 63 characters") {
        cfg.passphrase = std::string(63, 'a');
        REQUIRE(validate_config(cfg).success());
    }

    SECTION("WPA2 raw PSK of 64 hex digits") {
        cfg.passphrase = std::string(64, 'f');
        REQUIRE(validate_config(cfg).success());
    }

    SECTION("WPA2 64 characters that are not hex") {
        cfg.passphrase = std::string(64, 'z');
        REQUIRE(validate_config(cfg).type == ApErrorType::INVALID_CONFIG);
    }

    SECTION("WPA3 allows long passwords") {
        cfg.security = SecurityMode::WPA3_PERSONAL;
        cfg.passphrase = std::string(100, 'p');
        REQUIRE(validate_config(cfg).success());
    }

    SECTION("mixed mode needs a real passphrase") {
        cfg.security = SecurityMode::WPA2_WPA3_MIXED;
        cfg.passphrase = std::string(64, 'f');
        REQUIRE(validate_config(cfg).type == ApErrorType::INVALID_CONFIG);
    }

    SECTION("open network without passphrase") {
        cfg.security = SecurityMode::OPEN;
        cfg.passphrase.clear();
        REQUIRE(validate_config(cfg).success());
    }

    SECTION("open network with passphrase") {
        cfg.security = SecurityMode::OPEN;
        REQUIRE(validate_config(cfg).type == ApErrorType::INVALID_CONFIG);
    }

    SECTION("control characters in passphrase") {
        cfg.passphrase = "correct\nhorse";
        REQUIRE(validate_config(cfg).type == ApErrorType::INVALID_CONFIG);
    }
}

TEST_CASE("validate_config: channel must exist in the band", "[ap][validate]") {
    AccessPointConfig cfg = valid_wpa2();

    SECTION("automatic channel") {
        cfg.channel = 0;
        REQUIRE(validate_config(cfg).success());
    }

    SECTION("2.4 GHz channel 6") {
        cfg.channel = 6;
        REQUIRE(validate_config(cfg).success());
    }

    SECTION("5 GHz channel on 2.4 GHz band") {
        cfg.channel = 36;
        REQUIRE(validate_config(cfg).type == ApErrorType::INVALID_CONFIG);
    }

    SECTION("5 GHz band channel 149") {
        cfg.band = Band::BAND_5GHZ;
        cfg.channel = 149;
        REQUIRE(validate_config(cfg).success());
    }

    SECTION("5 GHz band channel 6") {
        cfg.band = Band::BAND_5GHZ;
        cfg.channel = 6;
        REQUIRE(validate_config(cfg).type == ApErrorType::INVALID_CONFIG);
    }
}

TEST_CASE("validate_config: empty whitelist admits nobody", "[ap][validate]") {
    AccessPointConfig cfg = valid_wpa2();
    cfg.mac_policy = MacPolicy::make_whitelist();
    REQUIRE(validate_config(cfg).type == ApErrorType::INVALID_CONFIG);

    cfg.mac_policy.allow(MacAddress(2, 0, 0, 0, 0, 1));
    REQUIRE(validate_config(cfg).success());
}

TEST_CASE("is_valid_channel: band tables", "[ap]") {
    REQUIRE(is_valid_channel(Band::BAND_2_4GHZ, 1));
    REQUIRE(is_valid_channel(Band::BAND_2_4GHZ, 14));
    REQUIRE_FALSE(is_valid_channel(Band::BAND_2_4GHZ, 15));
    REQUIRE(is_valid_channel(Band::BAND_5GHZ, 36));
    REQUIRE_FALSE(is_valid_channel(Band::BAND_5GHZ, 38));
    REQUIRE(is_valid_channel(Band::BAND_5GHZ, 165));
    REQUIRE_FALSE(is_valid_channel(Band::BAND_5GHZ, 169));
}

// ============================================================================
// parse_access_point_config()
// ============================================================================

TEST_CASE("parse_access_point_config: full object", "[ap][json]") {
    json obj = {{"ssid", "workshop"},
                {"security", "wpa3"},
                {"passphrase", "correct horse"},
                {"band", "5"},
                {"channel", 36},
                {"client_isolation", true},
                {"mac_policy",
                 {{"mode", "blacklist"}, {"addresses", {"02:00:00:00:00:01", "02:00:00:00:00:02"}}}}};

    AccessPointConfig cfg;
    REQUIRE(parse_access_point_config(obj, cfg).success());
    REQUIRE(cfg.ssid == "workshop");
    REQUIRE(cfg.security == SecurityMode::WPA3_PERSONAL);
    REQUIRE(cfg.band == Band::BAND_5GHZ);
    REQUIRE(cfg.channel == 36);
    REQUIRE(cfg.client_isolation);
    REQUIRE(cfg.mac_policy.mode() == MacPolicy::Mode::BLACKLIST);
    REQUIRE(cfg.mac_policy.addresses().size() == 2);
    REQUIRE(validate_config(cfg).success());
}

TEST_CASE("parse_access_point_config: numeric band", "[ap][json]") {
    AccessPointConfig cfg;
    REQUIRE(parse_access_point_config({{"ssid", "x"}, {"band", 5}}, cfg).success());
    REQUIRE(cfg.band == Band::BAND_5GHZ);
    REQUIRE(parse_access_point_config({{"ssid", "x"}, {"band", 2.4}}, cfg).success());
    REQUIRE(cfg.band == Band::BAND_2_4GHZ);
}

TEST_CASE("parse_access_point_config: malformed fields", "[ap][json]") {
    AccessPointConfig cfg;
    cfg.ssid = "untouched";

    SECTION("not an object") {
        REQUIRE(parse_access_point_config(json::array(), cfg).type ==
                ApErrorType::INVALID_CONFIG);
    }

    SECTION("missing ssid") {
        REQUIRE_FALSE(parse_access_point_config({{"channel", 6}}, cfg));
    }

    SECTION("unknown security mode") {
        REQUIRE_FALSE(parse_access_point_config({{"ssid", "x"}, {"security", "wep"}}, cfg));
    }

    SECTION("channel given as string") {
        REQUIRE_FALSE(parse_access_point_config({{"ssid", "x"}, {"channel", "6"}}, cfg));
    }

    SECTION("invalid MAC in policy") {
        json obj = {{"ssid", "x"},
                    {"mac_policy", {{"mode", "whitelist"}, {"addresses", {"not-a-mac"}}}}};
        REQUIRE_FALSE(parse_access_point_config(obj, cfg));
    }

    SECTION("addresses on a public policy") {
        json obj = {{"ssid", "x"},
                    {"mac_policy", {{"mode", "public"}, {"addresses", {"02:00:00:00:00:01"}}}}};
        REQUIRE_FALSE(parse_access_point_config(obj, cfg));
    }

    // Output untouched on failure
    REQUIRE(cfg.ssid == "untouched");
}

TEST_CASE("AccessPointConfig: equality covers every field", "[ap]") {
    AccessPointConfig a = valid_wpa2();
    AccessPointConfig b = valid_wpa2();
    REQUIRE(a == b);

    b.client_isolation = true;
    REQUIRE(a != b);

    b = valid_wpa2();
    b.mac_policy = MacPolicy::make_blacklist();
    REQUIRE(a != b);
}

TEST_CASE("ApError: classification helpers", "[ap][error]") {
    REQUIRE(ApError::busy("wlan0", "start").is_retryable());
    REQUIRE(ApError::busy("wlan0", "start").is_config_error());
    REQUIRE_FALSE(ApError::rejected("wlan0", "start", "FAIL").is_retryable());
    REQUIRE(ApError::timeout("wlan0", "start", "x").is_retryable());
    REQUIRE(ApError::ok().to_string() == "OK");
    REQUIRE(ApError::rejected("wlan0", "start", "FAIL").to_string() == "REJECTED: FAIL");
}
