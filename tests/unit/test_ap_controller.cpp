// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_ap_controller.cpp
 * @brief AccessPointController against the simulated hostapd
 *
 * Every test drives the real controller through BusProxyMock, which answers
 * like hostapd and emits its confirmations from a worker thread.
 */

#include "ap_controller.h"
#include "bus_proxy_mock.h"

#include <algorithm>
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <functional>
#include <mutex>
#include <thread>

using namespace proton;
using namespace std::chrono_literals;

namespace {

const std::string WLAN0 = "wlan0";
const std::string WLAN0_PATH = "/var/run/hostapd/wlan0";

const MacAddress STA1(2, 0, 0, 0, 0, 1);
const MacAddress STA2(2, 0, 0, 0, 0, 2);

bool wait_for(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

AccessPointConfig wpa2_config(const std::string& ssid = "workshop") {
    AccessPointConfig cfg;
    cfg.ssid = ssid;
    cfg.security = SecurityMode::WPA2_PERSONAL;
    cfg.passphrase = "correct horse";
    cfg.channel = 6;
    return cfg;
}

/// Thread-safe record of delivered events
class EventLog {
  public:
    void add(const ApEvent& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(e);
    }

    std::vector<ApEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t count(ApEventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
                                                 [type](const ApEvent& e) { return e.type == type; }));
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

  private:
    mutable std::mutex mutex_;
    std::vector<ApEvent> events_;
};

} // namespace

// ============================================================================
// Fixture
// ============================================================================

class ControllerFixture {
  public:
    ControllerFixture() {
        bus->set_confirm_delay(5ms);
        settings.operation_timeout = 1000ms;
        settings.retry_attempts = 3;
        settings.retry_backoff = 5ms;
        settings.retry_backoff_max = 20ms;
    }

  protected:
    AccessPointController& controller() {
        if (!ctl) {
            ctl = std::make_unique<AccessPointController>(bus, settings);
            observer = ctl->subscribe("", [this](const ApEvent& e) { log.add(e); });
        }
        return *ctl;
    }

    /// Wait until the daemon's signals and the resulting events were delivered
    void settle() {
        REQUIRE(bus->flush(2000ms));
        REQUIRE(controller().flush_events(2000ms));
    }

    void bring_up() {
        REQUIRE(controller().configure(WLAN0, wpa2_config()).success());
        REQUIRE(controller().start(WLAN0).success());
        settle();
    }

    void associate(const MacAddress& mac) {
        bus->emit_signal(WLAN0_PATH, "AP-STA-CONNECTED", {mac.to_string()});
        settle();
    }

    std::shared_ptr<BusProxyMock> bus = std::make_shared<BusProxyMock>();
    ControllerSettings settings;
    EventLog log;
    ObserverId observer = INVALID_OBSERVER_ID;
    std::unique_ptr<AccessPointController> ctl;
};

// ============================================================================
// configure()
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "Controller: invalid config never reaches the daemon",
                 "[controller][configure]") {
    AccessPointConfig cfg = wpa2_config("");
    ApError err = controller().configure(WLAN0, cfg);

    REQUIRE(err.type == ApErrorType::INVALID_CONFIG);
    REQUIRE(err.handle == WLAN0);
    REQUIRE(bus->call_count() == 0);
    REQUIRE(bus->subscription_count() == 0);
    REQUIRE(controller().snapshot(WLAN0).state == LifecycleState::DOWN);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: configure applies settings and stays down",
                 "[controller][configure]") {
    REQUIRE(controller().configure(WLAN0, wpa2_config()).success());
    settle();

    auto snap = controller().snapshot(WLAN0);
    REQUIRE(snap.state == LifecycleState::DOWN);
    REQUIRE(snap.config.has_value());
    REQUIRE(*snap.config == wpa2_config());
    REQUIRE_FALSE(snap.needs_reconcile);

    REQUIRE(bus->daemon_field(WLAN0_PATH, "channel") == "6");
    REQUIRE(bus->daemon_field(WLAN0_PATH, "wpa_passphrase") == "correct horse");
    REQUIRE(bus->daemon_state(WLAN0_PATH) == "DISABLED");

    auto events = log.events();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].new_state == LifecycleState::CONFIGURING);
    REQUIRE(events[1].new_state == LifecycleState::DOWN);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: configuration visible only once acknowledged",
                 "[controller][configure]") {
    settings.operation_timeout = 5000ms;
    controller();
    bus->set_call_delay(20ms);

    ApError result;
    std::thread worker([&] { result = controller().configure(WLAN0, wpa2_config()); });

    REQUIRE(wait_for(
        [&] { return controller().snapshot(WLAN0).state == LifecycleState::CONFIGURING; }));
    REQUIRE_FALSE(controller().snapshot(WLAN0).config.has_value());

    worker.join();
    REQUIRE(result.success());
    REQUIRE(controller().snapshot(WLAN0).config.has_value());
}

TEST_CASE_METHOD(ControllerFixture, "Controller: rejected configuration leaves an error",
                 "[controller][configure]") {
    bus->reject_command("SET channel", "FAIL-CHANNEL");

    ApError err = controller().configure(WLAN0, wpa2_config());
    settle();

    REQUIRE(err.type == ApErrorType::REJECTED);
    REQUIRE(err.message.find("FAIL-CHANNEL") != std::string::npos);
    // Semantic rejection is never retried
    auto log_calls = bus->call_log();
    REQUIRE(std::count(log_calls.begin(), log_calls.end(), "SET channel 6") == 1);

    auto snap = controller().snapshot(WLAN0);
    REQUIRE(snap.state == LifecycleState::ERROR);
    REQUIRE_FALSE(snap.error_reason.empty());
    REQUIRE_FALSE(snap.config.has_value());
    REQUIRE_FALSE(snap.needs_reconcile);
    REQUIRE(log.count(ApEventType::CONFIGURATION_FAILED) == 1);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: fault while configuring fails the configuration",
                 "[controller][configure][signal]") {
    settings.operation_timeout = 5000ms;
    controller();
    bus->set_call_delay(20ms);

    ApError result;
    std::thread worker([&] { result = controller().configure(WLAN0, wpa2_config()); });

    REQUIRE(wait_for(
        [&] { return controller().snapshot(WLAN0).state == LifecycleState::CONFIGURING; }));
    bus->emit_signal(WLAN0_PATH, "INTERFACE-DISABLED");

    worker.join();
    bus->set_call_delay(0ms);
    settle();

    REQUIRE(result.type == ApErrorType::REJECTED);
    REQUIRE(result.message.find("INTERFACE-DISABLED") != std::string::npos);
    REQUIRE(log.count(ApEventType::CONFIGURATION_FAILED) == 1);

    auto snap = controller().snapshot(WLAN0);
    REQUIRE(snap.state == LifecycleState::ERROR);
    REQUIRE_FALSE(snap.config.has_value());
    REQUIRE(snap.needs_reconcile);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: reconfigure replaces the configuration",
                 "[controller][configure]") {
    REQUIRE(controller().configure(WLAN0, wpa2_config("first")).success());

    AccessPointConfig second = wpa2_config("second");
    second.mac_policy = MacPolicy::make_blacklist();
    second.mac_policy.deny(STA2);
    REQUIRE(controller().configure(WLAN0, second).success());

    REQUIRE(controller().snapshot(WLAN0).config->ssid == "second");
    REQUIRE(bus->deny_list(WLAN0_PATH) == std::vector<MacAddress>{STA2});
}

TEST_CASE_METHOD(ControllerFixture, "Controller: configure while up is an invalid state",
                 "[controller][configure]") {
    bring_up();
    bus->reset_calls();

    ApError err = controller().configure(WLAN0, wpa2_config("other"));
    REQUIRE(err.type == ApErrorType::INVALID_STATE);
    REQUIRE(bus->call_count("SET") == 0);
    REQUIRE(controller().snapshot(WLAN0).config->ssid == "workshop");
}

// ============================================================================
// start() / stop()
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "Controller: start brings the access point up",
                 "[controller][start]") {
    bring_up();

    REQUIRE(controller().snapshot(WLAN0).state == LifecycleState::UP);
    REQUIRE(bus->call_count("ENABLE") == 1);

    auto events = log.events();
    REQUIRE(events.size() == 4);
    REQUIRE(events[2].new_state == LifecycleState::STARTING);
    REQUIRE(events[3].old_state == LifecycleState::STARTING);
    REQUIRE(events[3].new_state == LifecycleState::UP);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: start without confirmation times out",
                 "[controller][start][timeout]") {
    settings.operation_timeout = 150ms;
    bus->set_auto_confirm(false);

    auto start = std::chrono::steady_clock::now();
    ApError err = controller().start(WLAN0);

    REQUIRE(err.type == ApErrorType::TIMEOUT);
    REQUIRE(std::chrono::steady_clock::now() - start < 1000ms);

    auto snap = controller().snapshot(WLAN0);
    REQUIRE(snap.state == LifecycleState::ERROR);
    REQUIRE(snap.error_reason == "timeout waiting for start confirmation");
    REQUIRE(snap.needs_reconcile);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: daemon disabling during start is a rejection",
                 "[controller][start]") {
    bus->set_auto_confirm(false);
    controller();

    ApError result;
    std::thread worker([&] { result = controller().start(WLAN0); });

    REQUIRE(wait_for([&] { return controller().snapshot(WLAN0).state == LifecycleState::STARTING; }));
    bus->emit_signal(WLAN0_PATH, "AP-DISABLED");
    worker.join();

    REQUIRE(result.type == ApErrorType::REJECTED);
    REQUIRE(result.message == "daemon disabled the access point while starting");
    REQUIRE(controller().snapshot(WLAN0).state == LifecycleState::ERROR);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: rejected start is not retried",
                 "[controller][start][retry]") {
    bus->reject_command("ENABLE", "FAIL");

    ApError err = controller().start(WLAN0);

    REQUIRE(err.type == ApErrorType::REJECTED);
    REQUIRE(bus->call_count("ENABLE") == 1);
    auto snap = controller().snapshot(WLAN0);
    REQUIRE(snap.state == LifecycleState::ERROR);
    REQUIRE_FALSE(snap.needs_reconcile);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: start while up is an invalid state",
                 "[controller][start]") {
    bring_up();
    REQUIRE(controller().start(WLAN0).type == ApErrorType::INVALID_STATE);
    REQUIRE(bus->call_count("ENABLE") == 1);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: stop takes the access point down",
                 "[controller][stop]") {
    bring_up();
    log.clear();

    REQUIRE(controller().stop(WLAN0).success());
    settle();

    REQUIRE(controller().snapshot(WLAN0).state == LifecycleState::DOWN);
    REQUIRE(bus->daemon_state(WLAN0_PATH) == "DISABLED");

    auto events = log.events();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].new_state == LifecycleState::STOPPING);
    REQUIRE(events[1].new_state == LifecycleState::DOWN);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: stop is idempotent", "[controller][stop]") {
    SECTION("never attached") {
        REQUIRE(controller().stop("wlan5").success());
        REQUIRE(bus->call_count() == 0);
    }

    SECTION("already down") {
        REQUIRE(controller().configure(WLAN0, wpa2_config()).success());
        bus->reset_calls();
        log.clear();

        REQUIRE(controller().stop(WLAN0).success());
        REQUIRE(controller().stop(WLAN0).success());
        settle();
        REQUIRE(bus->call_count() == 0);
        REQUIRE(log.events().empty());
    }
}

TEST_CASE_METHOD(ControllerFixture, "Controller: stop without confirmation times out",
                 "[controller][stop][timeout]") {
    settings.operation_timeout = 300ms;
    bring_up();
    bus->set_auto_confirm(false);

    ApError err = controller().stop(WLAN0);
    REQUIRE(err.type == ApErrorType::TIMEOUT);
    REQUIRE(controller().snapshot(WLAN0).error_reason == "timeout waiting for stop confirmation");
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "Controller: second operation on a busy handle",
                 "[controller][busy]") {
    settings.operation_timeout = 5000ms;
    controller();
    bus->set_call_delay(30ms);

    ApError first;
    std::thread worker([&] { first = controller().configure(WLAN0, wpa2_config()); });

    REQUIRE(wait_for(
        [&] { return controller().snapshot(WLAN0).state == LifecycleState::CONFIGURING; }));

    ApError busy_start = controller().start(WLAN0);
    ApError busy_configure = controller().configure(WLAN0, wpa2_config("other"));
    REQUIRE(busy_start.type == ApErrorType::BUSY);
    REQUIRE(busy_configure.type == ApErrorType::BUSY);
    REQUIRE(busy_start.is_retryable());

    // Other handles are not blocked
    REQUIRE(controller().configure("wlan1", wpa2_config("guest")).success());

    worker.join();
    REQUIRE(first.success());
    REQUIRE(controller().snapshot(WLAN0).config->ssid == "workshop");
}

TEST_CASE_METHOD(ControllerFixture, "Controller: handles are independent", "[controller]") {
    REQUIRE(controller().configure(WLAN0, wpa2_config()).success());
    REQUIRE(controller().configure("wlan1", wpa2_config("guest")).success());
    REQUIRE(controller().start("wlan1").success());

    REQUIRE(controller().snapshot(WLAN0).state == LifecycleState::DOWN);
    REQUIRE(controller().snapshot("wlan1").state == LifecycleState::UP);
    REQUIRE(controller().handles() == std::vector<std::string>{"wlan0", "wlan1"});
}

// ============================================================================
// Bus retries
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "Controller: transient failures below the bound succeed",
                 "[controller][retry]") {
    REQUIRE(controller().attach(WLAN0).success());
    bus->reset_calls();
    bus->fail_next_calls(2, BusErrorType::TIMEOUT);

    REQUIRE(controller().configure(WLAN0, wpa2_config()).success());

    auto calls = bus->call_log();
    REQUIRE(calls.size() >= 3);
    REQUIRE(calls[0] == calls[1]);
    REQUIRE(calls[1] == calls[2]);
    REQUIRE(controller().snapshot(WLAN0).state == LifecycleState::DOWN);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: exhausted retries report the bus unavailable",
                 "[controller][retry]") {
    REQUIRE(controller().attach(WLAN0).success());
    bus->reset_calls();
    bus->fail_next_calls(3, BusErrorType::UNAVAILABLE);

    ApError err = controller().configure(WLAN0, wpa2_config());
    settle();

    REQUIRE(err.type == ApErrorType::BUS_UNAVAILABLE);
    REQUIRE(bus->call_count() == 3);
    REQUIRE(log.count(ApEventType::CONFIGURATION_FAILED) == 1);

    // Unknown how much of the configuration the daemon took
    auto snap = controller().snapshot(WLAN0);
    REQUIRE(snap.state == LifecycleState::ERROR);
    REQUIRE(snap.needs_reconcile);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: unreachable daemon on attach",
                 "[controller][retry]") {
    bus->fail_next_calls(10, BusErrorType::UNAVAILABLE);

    ApError err = controller().attach(WLAN0);
    REQUIRE(err.type == ApErrorType::BUS_UNAVAILABLE);
    REQUIRE(err.operation == "attach");
}

// ============================================================================
// Signal ingestion
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "Controller: unsolicited enable produces one state change",
                 "[controller][signal]") {
    REQUIRE(controller().attach(WLAN0).success());
    settle();
    log.clear();

    bus->emit_signal(WLAN0_PATH, "AP-ENABLED");
    settle();

    auto events = log.events();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == ApEventType::STATE_CHANGED);
    REQUIRE(events[0].old_state == LifecycleState::DOWN);
    REQUIRE(events[0].new_state == LifecycleState::UP);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: station events fold into the station set",
                 "[controller][stations]") {
    bring_up();
    log.clear();

    associate(STA1);
    associate(STA1); // duplicate association
    bus->emit_signal(WLAN0_PATH, "AP-STA-DISCONNECTED", {STA2.to_string()}); // never joined
    settle();

    REQUIRE(log.count(ApEventType::CLIENT_JOINED) == 1);
    REQUIRE(log.count(ApEventType::CLIENT_LEFT) == 0);

    auto snap = controller().snapshot(WLAN0);
    REQUIRE(snap.stations.size() == 1);
    REQUIRE(snap.has_station(STA1));

    bus->emit_signal(WLAN0_PATH, "AP-STA-DISCONNECTED", {STA1.to_string()});
    settle();
    REQUIRE(log.count(ApEventType::CLIENT_LEFT) == 1);
    REQUIRE(controller().snapshot(WLAN0).stations.empty());
}

TEST_CASE_METHOD(ControllerFixture, "Controller: leaving up clears every station",
                 "[controller][stations]") {
    bring_up();
    associate(STA1);
    associate(STA2);
    log.clear();

    REQUIRE(controller().stop(WLAN0).success());
    settle();

    auto events = log.events();
    REQUIRE(events.size() == 4);
    REQUIRE(events[0].type == ApEventType::CLIENT_LEFT);
    REQUIRE(events[1].type == ApEventType::CLIENT_LEFT);
    REQUIRE(events[2].type == ApEventType::STATE_CHANGED);
    REQUIRE(events[2].old_state == LifecycleState::UP);
    REQUIRE(controller().snapshot(WLAN0).stations.empty());
}

TEST_CASE_METHOD(ControllerFixture, "Controller: malformed signals are counted and dropped",
                 "[controller][signal]") {
    bring_up();
    log.clear();

    bus->emit_signal(WLAN0_PATH, "AP-STA-CONNECTED");
    bus->emit_signal(WLAN0_PATH, "AP-STA-CONNECTED", {"not-a-mac"});
    settle();

    REQUIRE(controller().decode_failures() == 2);
    REQUIRE(log.events().empty());
    REQUIRE(controller().snapshot(WLAN0).state == LifecycleState::UP);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: daemon fault then recovery",
                 "[controller][signal][reconcile]") {
    bring_up();
    associate(STA1);

    bus->emit_signal(WLAN0_PATH, "INTERFACE-DISABLED");
    settle();

    auto snap = controller().snapshot(WLAN0);
    REQUIRE(snap.state == LifecycleState::ERROR);
    REQUIRE(snap.error_reason.find("INTERFACE-DISABLED") != std::string::npos);
    REQUIRE(snap.needs_reconcile);
    REQUIRE(snap.stations.empty());

    // The next operation re-reads the daemon before acting
    log.clear();
    REQUIRE(controller().start(WLAN0).success());
    settle();

    auto events = log.events();
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].old_state == LifecycleState::ERROR);
    REQUIRE(events[0].new_state == LifecycleState::DOWN);
    REQUIRE(events[2].new_state == LifecycleState::UP);
    REQUIRE_FALSE(controller().snapshot(WLAN0).needs_reconcile);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: transitional daemon state on attach",
                 "[controller][reconcile]") {
    bus->set_daemon_state(WLAN0_PATH, "ACS");

    REQUIRE(controller().attach(WLAN0).success());

    auto snap = controller().snapshot(WLAN0);
    REQUIRE(snap.state == LifecycleState::ERROR);
    REQUIRE(snap.error_reason == "daemon reports transitional state ACS");
}

TEST_CASE_METHOD(ControllerFixture, "Controller: refresh reports station differences",
                 "[controller][reconcile]") {
    bring_up();
    associate(STA1);
    log.clear();

    // Daemon gained a station the controller never heard about
    bus->add_station(WLAN0_PATH, STA2, -50);
    REQUIRE(controller().refresh(WLAN0).success());
    settle();

    REQUIRE(log.count(ApEventType::CLIENT_JOINED) == 1);
    auto snap = controller().snapshot(WLAN0);
    REQUIRE(snap.stations.size() == 2);
    REQUIRE(snap.has_station(STA2));

    // Daemon went down behind our back
    log.clear();
    bus->set_daemon_state(WLAN0_PATH, "DISABLED");
    REQUIRE(controller().refresh(WLAN0).success());
    settle();

    REQUIRE(log.count(ApEventType::CLIENT_LEFT) == 2);
    REQUIRE(controller().snapshot(WLAN0).state == LifecycleState::DOWN);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: refresh keeps a station that joined mid-walk",
                 "[controller][reconcile]") {
    bring_up();
    associate(STA2);
    log.clear();

    // Every call takes 50ms; the join lands while STA-NEXT after STA2 is pending
    bus->set_call_delay(50ms);
    bus->emit_signal(WLAN0_PATH, "AP-STA-CONNECTED", {STA1.to_string()}, json(), 120ms);
    REQUIRE(controller().refresh(WLAN0).success());
    bus->set_call_delay(0ms);
    settle();

    auto snap = controller().snapshot(WLAN0);
    REQUIRE(snap.stations.size() == 2);
    REQUIRE(snap.has_station(STA1));
    REQUIRE(snap.has_station(STA2));
    REQUIRE(log.count(ApEventType::CLIENT_JOINED) == 1);
    REQUIRE(log.count(ApEventType::CLIENT_LEFT) == 0);
}

TEST_CASE_METHOD(ControllerFixture,
                 "Controller: refresh does not restore a station that left mid-walk",
                 "[controller][reconcile]") {
    bring_up();
    associate(STA1);
    associate(STA2);
    log.clear();

    // STA-FIRST has returned STA1 when it leaves; STA-NEXT after it is refused
    bus->set_call_delay(50ms);
    bus->emit_signal(WLAN0_PATH, "AP-STA-DISCONNECTED", {STA1.to_string()}, json(), 120ms);
    REQUIRE(controller().refresh(WLAN0).success());
    bus->set_call_delay(0ms);
    settle();

    auto snap = controller().snapshot(WLAN0);
    REQUIRE(snap.stations.size() == 1);
    REQUIRE(snap.has_station(STA2));
    REQUIRE(log.count(ApEventType::CLIENT_LEFT) == 1);
    REQUIRE(log.count(ApEventType::CLIENT_JOINED) == 0);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: subscriptions renewed after the event stream ends",
                 "[controller][signal][reconcile]") {
    bring_up();

    bus->drop_monitor(WLAN0_PATH);
    settle();

    auto snap = controller().snapshot(WLAN0);
    REQUIRE(snap.state == LifecycleState::ERROR);
    REQUIRE(snap.needs_reconcile);
    REQUIRE_FALSE(bus->monitor_open(WLAN0_PATH));

    // AP-ENABLED only arrives if start() subscribed again
    REQUIRE(controller().start(WLAN0).success());
    settle();

    REQUIRE(controller().snapshot(WLAN0).state == LifecycleState::UP);
    REQUIRE(bus->monitor_open(WLAN0_PATH));
    REQUIRE(bus->subscription_count() == DaemonObjectModel::signal_names().size());

    associate(STA1);
    REQUIRE(controller().snapshot(WLAN0).has_station(STA1));
}

// ============================================================================
// deauthenticate()
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "Controller: deauthenticate disconnects one station",
                 "[controller][deauthenticate]") {
    bring_up();
    associate(STA1);
    associate(STA2);
    log.clear();

    REQUIRE(controller().deauthenticate(WLAN0, STA1).success());
    settle();

    auto calls = bus->call_log();
    REQUIRE(std::count(calls.begin(), calls.end(), "DEAUTHENTICATE 02:00:00:00:00:01") == 1);

    auto snap = controller().snapshot(WLAN0);
    REQUIRE_FALSE(snap.has_station(STA1));
    REQUIRE(snap.has_station(STA2));
    REQUIRE(log.count(ApEventType::CLIENT_LEFT) == 1);
    REQUIRE(snap.state == LifecycleState::UP);
}

TEST_CASE_METHOD(ControllerFixture,
                 "Controller: deauthenticated station leaves on the daemon's report",
                 "[controller][deauthenticate]") {
    bring_up();
    associate(STA1);
    bus->set_auto_confirm(false);

    REQUIRE(controller().deauthenticate(WLAN0, STA1).success());
    settle();
    REQUIRE(controller().snapshot(WLAN0).has_station(STA1));

    bus->emit_signal(WLAN0_PATH, "AP-STA-DISCONNECTED", {STA1.to_string()});
    settle();
    REQUIRE_FALSE(controller().snapshot(WLAN0).has_station(STA1));
}

TEST_CASE_METHOD(ControllerFixture, "Controller: deauthenticate edge cases",
                 "[controller][deauthenticate]") {
    SECTION("access point not up") {
        REQUIRE(controller().attach(WLAN0).success());
        ApError err = controller().deauthenticate(WLAN0, STA1);
        REQUIRE(err.type == ApErrorType::INVALID_STATE);
        REQUIRE(bus->call_count("DEAUTHENTICATE") == 0);
    }

    SECTION("station not associated") {
        bring_up();
        REQUIRE(controller().deauthenticate(WLAN0, STA2).success());
        REQUIRE(bus->call_count("DEAUTHENTICATE") == 0);
    }

    SECTION("daemon refuses") {
        bring_up();
        associate(STA1);
        bus->reject_command("DEAUTHENTICATE");

        ApError err = controller().deauthenticate(WLAN0, STA1);
        REQUIRE(err.type == ApErrorType::REJECTED);
        REQUIRE(err.operation == "deauthenticate");
        REQUIRE(controller().snapshot(WLAN0).has_station(STA1));
    }
}

// ============================================================================
// Observers
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "Controller: observer may unsubscribe from its callback",
                 "[controller][observer]") {
    std::atomic<int> calls{0};
    ObserverId id = INVALID_OBSERVER_ID;
    id = controller().subscribe(WLAN0, [&](const ApEvent&) {
        calls++;
        ctl->unsubscribe(id);
    });

    REQUIRE(controller().configure(WLAN0, wpa2_config()).success());
    settle();

    REQUIRE(wait_for([&] { return calls.load() >= 1; }));
    std::this_thread::sleep_for(20ms);
    REQUIRE(calls == 1);
    REQUIRE(log.events().size() == 2);
}

TEST_CASE_METHOD(ControllerFixture,
                 "Controller: observer that unsubscribed itself outlives the controller",
                 "[controller][observer]") {
    struct Shared {
        std::atomic<ObserverId> id{INVALID_OBSERVER_ID};
        std::atomic<bool> unsubscribed{false};
        std::atomic<bool> returned{false};
    };
    auto shared = std::make_shared<Shared>();

    AccessPointController* raw = &controller();
    shared->id = raw->subscribe(WLAN0, [raw, shared](const ApEvent&) {
        raw->unsubscribe(shared->id);
        shared->unsubscribed = true;
        std::this_thread::sleep_for(50ms);
        shared->returned = true;
    });

    REQUIRE(controller().configure(WLAN0, wpa2_config()).success());
    REQUIRE(wait_for([&] { return shared->unsubscribed.load(); }));

    // The callback is still running on its detached thread
    ctl.reset();
    REQUIRE(wait_for([&] { return shared->returned.load(); }));
}

TEST_CASE_METHOD(ControllerFixture, "Controller: stalled observer loses events, others do not",
                 "[controller][observer][backpressure]") {
    std::atomic<bool> release{false};

    ObserverId slow = controller().subscribe(
        "",
        [&](const ApEvent&) {
            while (!release) {
                std::this_thread::sleep_for(1ms);
            }
        },
        1);

    bring_up();
    REQUIRE(controller().stop(WLAN0).success());
    REQUIRE(bus->flush(2000ms));

    // CONFIGURING, DOWN, STARTING, UP, STOPPING, DOWN: at most two held
    REQUIRE(controller().dropped_events(slow) >= 4);
    REQUIRE(controller().dropped_events(observer) == 0);

    release = true;
    REQUIRE(controller().flush_events(2000ms));
    REQUIRE(log.events().size() == 6);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: observer filter by handle",
                 "[controller][observer]") {
    EventLog wlan1_log;
    controller().subscribe("wlan1", [&](const ApEvent& e) { wlan1_log.add(e); });

    REQUIRE(controller().configure(WLAN0, wpa2_config()).success());
    REQUIRE(controller().configure("wlan1", wpa2_config("guest")).success());
    settle();

    auto events = wlan1_log.events();
    REQUIRE(events.size() == 2);
    for (const auto& e : events) {
        REQUIRE(e.handle == "wlan1");
    }
    ctl.reset();
}

TEST_CASE_METHOD(ControllerFixture, "Controller: destruction releases bus subscriptions",
                 "[controller]") {
    REQUIRE(controller().attach(WLAN0).success());
    REQUIRE(bus->subscription_count() == DaemonObjectModel::signal_names().size());

    ctl.reset();
    REQUIRE(bus->subscription_count() == 0);

    // Signals after destruction are harmless
    bus->emit_signal(WLAN0_PATH, "AP-ENABLED");
    REQUIRE(bus->flush(2000ms));
}
