// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bus_proxy.h"

#include "bus_proxy_hostapd.h"
#include "bus_proxy_mock.h"
#include "controller_settings.h"

#include "spdlog/spdlog.h"

namespace proton {

const char* bus_error_name(BusErrorType type) {
    switch (type) {
    case BusErrorType::NONE:
        return "NONE";
    case BusErrorType::TIMEOUT:
        return "TIMEOUT";
    case BusErrorType::UNAVAILABLE:
        return "UNAVAILABLE";
    case BusErrorType::REMOTE_ERROR:
        return "REMOTE_ERROR";
    case BusErrorType::PROTOCOL_ERROR:
        return "PROTOCOL_ERROR";
    }
    return "UNKNOWN";
}

std::unique_ptr<BusProxy> BusProxy::create(const ControllerSettings& settings) {
    if (settings.mock_daemon) {
        spdlog::debug("[BusProxy] Test mode: using simulated hostapd");
        return std::make_unique<BusProxyMock>();
    }

    spdlog::debug("[BusProxy] Using hostapd control interface in {}", settings.control_dir);
    return std::make_unique<HostapdBusProxy>();
}

} // namespace proton
