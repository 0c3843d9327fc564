// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ap_error.h"
#include "ap_types.h"
#include "bus_proxy.h"

#include <optional>
#include <string>
#include <vector>

namespace proton {

/**
 * @brief One typed request, ready to hand to BusProxy::call()
 */
struct BusCall {
    std::string object_path;
    std::string interface;
    std::string method;
    json args = json::array();
    std::string description; ///< Loggable form (secrets redacted)
    bool sensitive = false;  ///< args carry a passphrase

    BusReply invoke(BusProxy& bus) const {
        return bus.call(object_path, interface, method, args);
    }
};

/// Coarse daemon-side AP state as reported by STATUS or a state signal
enum class DaemonApState {
    ENABLED,
    DISABLED,
    TRANSITIONAL, ///< ACS, DFS, HT_SCAN, COUNTRY_UPDATE...
    FAULT,
};

struct DaemonStatus {
    DaemonApState state = DaemonApState::DISABLED;
    std::string raw_state; ///< As reported, e.g. "ENABLED" or "ACS"
    std::string ssid;
    int channel = 0;
    int station_count = 0;
};

struct DaemonSignal {
    enum class Kind {
        STATE_CHANGED,
        STATION_ADDED,
        STATION_REMOVED,
        IGNORED, ///< Known event with no lifecycle meaning
    };

    Kind kind = Kind::IGNORED;
    std::string handle;
    std::string name;
    DaemonApState state = DaemonApState::DISABLED; ///< STATE_CHANGED only
    std::string reason;                            ///< FAULT only
    std::optional<Station> station;                ///< STATION_ADDED / STATION_REMOVED

    /// The daemon's event stream for this AP ended; subscriptions must be renewed
    bool stream_ended = false;
};

/**
 * @brief Typed view of the hostapd control interface
 *
 * The only code that knows hostapd command names, configuration field names,
 * control socket locations and event names. Everything it builds or decodes
 * is plain data; no I/O happens here.
 *
 * Object path of an access point: `<control_dir>/<ifname>`.
 */
class DaemonObjectModel {
  public:
    static constexpr const char* INTERFACE = "hostapd";

    explicit DaemonObjectModel(std::string control_dir = "/var/run/hostapd");

    std::string object_path(const std::string& handle) const;

    /// Inverse of object_path(); nullopt for paths outside control_dir
    std::optional<std::string> handle_for_path(const std::string& object_path) const;

    const std::string& control_dir() const {
        return control_dir_;
    }

    // ========================================================================
    // Requests
    // ========================================================================

    /**
     * @brief Calls applying @p config, in order
     *
     * SET calls for SSID, security, radio and isolation, then the MAC ACL
     * calls. Each call is acknowledged separately.
     */
    std::vector<BusCall> set_configuration(const std::string& handle,
                                           const AccessPointConfig& config) const;

    BusCall start_ap(const std::string& handle) const;
    BusCall stop_ap(const std::string& handle) const;
    BusCall query_state(const std::string& handle) const;
    BusCall first_station(const std::string& handle) const;
    BusCall next_station(const std::string& handle, const MacAddress& previous) const;

    /// Disconnect @p station; the daemon reports it with AP-STA-DISCONNECTED
    BusCall deauthenticate(const std::string& handle, const MacAddress& station) const;

    /// Signals the controller subscribes to
    static const std::vector<std::string>& signal_names();

    // ========================================================================
    // Replies and signals
    // ========================================================================

    /// Success iff @p body is a plain "OK" acknowledgment
    static ApError decode_ack(const json& body);

    static ApError decode_status(const json& body, DaemonStatus& out);

    /**
     * @brief Decode a STA-FIRST / STA-NEXT reply
     *
     * @param[out] out Station, or nullopt at the end of the list
     */
    static ApError decode_station(const json& body, std::optional<Station>& out);

    ApError decode_signal(const SignalPayload& payload, DaemonSignal& out) const;

    static DaemonApState parse_daemon_state(const std::string& raw);

  private:
    BusCall make_call(const std::string& handle, const std::string& method,
                      std::vector<std::string> args, bool sensitive = false) const;

    std::string control_dir_;
};

const char* daemon_ap_state_name(DaemonApState state);

} // namespace proton
