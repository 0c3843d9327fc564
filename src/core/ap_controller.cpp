// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ap_controller.h"

#include "error_reporting.h"

#include <algorithm>
#include <thread>

namespace proton {

namespace {

/// Upper bound on STA-NEXT walks, in case the daemon keeps answering
constexpr int MAX_STATIONS = 2048;

/// Station walks restarted because the station to continue from left
constexpr int MAX_WALK_RESTARTS = 3;

/// Daemon reads repeated because signals kept arriving during them
constexpr int MAX_RECONCILE_PASSES = 3;

bool is_one_of(LifecycleState s, std::initializer_list<LifecycleState> states) {
    return std::find(states.begin(), states.end(), s) != states.end();
}

} // namespace

// ============================================================================
// BusyGuard
// ============================================================================

AccessPointController::BusyGuard::BusyGuard(std::atomic<bool>& flag) : flag_(flag) {
    bool expected = false;
    acquired_ = flag_.compare_exchange_strong(expected, true);
}

AccessPointController::BusyGuard::~BusyGuard() {
    if (acquired_) {
        flag_.store(false);
    }
}

// ============================================================================
// Construction
// ============================================================================

AccessPointController::AccessPointController(std::shared_ptr<BusProxy> bus,
                                             ControllerSettings settings)
    : bus_(std::move(bus)), settings_(std::move(settings)), model_(settings_.control_dir),
      dispatcher_(settings_.observer_queue_capacity),
      cache_([this](const std::vector<ApEvent>& events) { dispatcher_.publish(events); }) {
    settings_.retry_attempts = std::max(1, settings_.retry_attempts);
    spdlog::debug("[Controller] Created (control_dir={}, timeout={}ms)", model_.control_dir(),
                  settings_.operation_timeout.count());
}

AccessPointController::~AccessPointController() {
    {
        // Waits for a signal being handled right now
        std::lock_guard<std::mutex> lock(alive_->mutex);
        alive_->alive = false;
    }

    std::map<std::string, std::shared_ptr<HandleContext>> contexts;
    {
        std::lock_guard<std::mutex> lock(contexts_mutex_);
        contexts.swap(contexts_);
    }
    for (auto& [handle, ctx] : contexts) {
        std::lock_guard<std::mutex> lock(ctx->attach_mutex);
        for (SubscriptionId id : ctx->subscriptions) {
            bus_->unsubscribe(id);
        }
        ctx->subscriptions.clear();
    }

    dispatcher_.shutdown();
    spdlog::trace("[Controller] Destroyed");
}

std::shared_ptr<AccessPointController::HandleContext>
AccessPointController::context(const std::string& handle) {
    std::lock_guard<std::mutex> lock(contexts_mutex_);
    auto& ctx = contexts_[handle];
    if (!ctx) {
        ctx = std::make_shared<HandleContext>();
    }
    return ctx;
}

AccessPointController::Deadline AccessPointController::make_deadline() const {
    return std::chrono::steady_clock::now() + settings_.operation_timeout;
}

// ============================================================================
// Bus calls
// ============================================================================

ApError AccessPointController::call_with_retry(const BusCall& call, const std::string& handle,
                                               const std::string& op, Deadline deadline,
                                               json* body) {
    auto backoff = settings_.retry_backoff;
    BusReply reply;

    for (int attempt = 1; attempt <= settings_.retry_attempts; ++attempt) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return ApError::timeout(handle, op, "deadline reached before " + call.description);
        }

        reply = call.invoke(*bus_);
        if (reply.ok()) {
            if (body) {
                *body = std::move(reply.body);
            }
            return ApError::ok();
        }

        if (reply.error == BusErrorType::REMOTE_ERROR) {
            spdlog::debug("[Controller] {}: daemon rejected {}: {}", handle, call.description,
                          reply.error_message);
            return ApError::rejected(handle, op,
                                     call.description + " rejected: " + reply.error_message);
        }
        if (!reply.is_transient()) {
            return ApError(ApErrorType::DECODE_ERROR,
                           call.description + ": " + reply.error_message, handle, op);
        }

        spdlog::debug("[Controller] {}: {} attempt {}/{} failed: {} ({})", handle,
                      call.description, attempt, settings_.retry_attempts,
                      bus_error_name(reply.error), reply.error_message);

        if (attempt == settings_.retry_attempts) {
            break;
        }
        if (std::chrono::steady_clock::now() + backoff >= deadline) {
            return ApError::timeout(handle, op,
                                    "deadline reached while retrying " + call.description);
        }
        std::this_thread::sleep_for(backoff);
        backoff = std::min(backoff * 2, settings_.retry_backoff_max);
    }

    spdlog::warn("[Controller] {}: {} failed after {} attempts: {}", handle, call.description,
                 settings_.retry_attempts, reply.error_message);
    return ApError::bus_unavailable(handle, op,
                                    call.description + " failed after " +
                                        std::to_string(settings_.retry_attempts) +
                                        " attempts: " + reply.error_message);
}

ApError AccessPointController::call_acknowledged(const BusCall& call, const std::string& handle,
                                                 const std::string& op, Deadline deadline) {
    json body;
    ApError err = call_with_retry(call, handle, op, deadline, &body);
    if (!err) {
        return err;
    }
    if (!DaemonObjectModel::decode_ack(body)) {
        return ApError::rejected(handle, op, "unexpected reply to " + call.description);
    }
    return ApError::ok();
}

// ============================================================================
// Attachment and reconciliation
// ============================================================================

ApError AccessPointController::ensure_attached(const std::string& handle, const std::string& op) {
    auto ctx = context(handle);
    std::lock_guard<std::mutex> lock(ctx->attach_mutex);
    if (ctx->attached && ctx->stream_ended.exchange(false)) {
        spdlog::info("[Controller] {}: daemon event stream ended, subscribing again", handle);
        for (SubscriptionId id : ctx->subscriptions) {
            bus_->unsubscribe(id);
        }
        ctx->subscriptions.clear();
        ctx->attached = false;
    }
    if (ctx->attached) {
        return ApError::ok();
    }

    const std::string path = model_.object_path(handle);
    std::vector<SubscriptionId> ids;
    for (const auto& name : DaemonObjectModel::signal_names()) {
        SubscriptionId id = bus_->subscribe(
            path, DaemonObjectModel::INTERFACE, name,
            [this, guard = alive_](const SignalPayload& payload) {
                std::lock_guard<std::mutex> alive_lock(guard->mutex);
                if (guard->alive) {
                    on_signal(payload);
                }
            });
        if (id == INVALID_SUBSCRIPTION_ID) {
            for (SubscriptionId done : ids) {
                bus_->unsubscribe(done);
            }
            return ApError::bus_unavailable(handle, op, "cannot subscribe to signals of " + path);
        }
        ids.push_back(id);
    }

    ctx->subscriptions = std::move(ids);
    ctx->attached = true;

    // Initial state comes from the daemon, not from assumptions
    cache_.update(handle, [](ApRecord& rec, std::vector<ApEvent>&) { rec.needs_reconcile = true; });

    spdlog::info("[Controller] Attached to {} ({})", handle, path);
    return ApError::ok();
}

ApError AccessPointController::reconcile_if_needed(const std::string& handle,
                                                   const std::string& op, Deadline deadline) {
    if (!cache_.snapshot(handle).needs_reconcile) {
        return ApError::ok();
    }
    return reconcile(handle, op, deadline);
}

ApError AccessPointController::list_stations(const std::string& handle, const std::string& op,
                                             Deadline deadline, std::vector<Station>& out) {
    out.clear();
    BusCall call = model_.first_station(handle);
    int restarts = 0;

    for (int i = 0; i < MAX_STATIONS; ++i) {
        json body;
        ApError err = call_with_retry(call, handle, op, deadline, &body);
        if (!err && err.type == ApErrorType::REJECTED && !out.empty() &&
            restarts < MAX_WALK_RESTARTS) {
            // hostapd cannot continue after a station that has since left
            spdlog::debug("[Controller] {}: {} left during the station walk, restarting",
                          handle, out.back().mac.to_string());
            ++restarts;
            out.clear();
            call = model_.first_station(handle);
            continue;
        }
        if (!err) {
            return err;
        }

        std::optional<Station> station;
        err = DaemonObjectModel::decode_station(body, station);
        if (!err) {
            err.handle = handle;
            err.operation = op;
            return err;
        }
        if (!station) {
            return ApError::ok();
        }

        out.push_back(*station);
        call = model_.next_station(handle, station->mac);
    }

    LOG_WARN_INTERNAL("[Controller] {}: station list truncated at {} entries", handle,
                      MAX_STATIONS);
    return ApError::ok();
}

ApError AccessPointController::reconcile(const std::string& handle, const std::string& op,
                                         Deadline deadline) {
    for (int pass = 1;; ++pass) {
        spdlog::debug("[Controller] {}: reconciling with daemon", handle);
        uint64_t revision = cache_.signal_revision(handle);

        json body;
        ApError err = call_with_retry(model_.query_state(handle), handle, op, deadline, &body);
        if (!err) {
            return err;
        }

        DaemonStatus status;
        err = DaemonObjectModel::decode_status(body, status);
        if (!err) {
            err.handle = handle;
            err.operation = op;
            LOG_WARN_INTERNAL("[Controller] {}: undecodable STATUS reply: {}", handle, err.message);
            return err;
        }

        std::vector<Station> stations;
        if (status.state == DaemonApState::ENABLED) {
            err = list_stations(handle, op, deadline, stations);
            if (!err) {
                return err;
            }
        }

        bool applied = false;
        cache_.update(handle, [&](ApRecord& rec, std::vector<ApEvent>& events) {
            if (rec.signal_revision != revision) {
                // Signals applied meanwhile are newer than this reply
                rec.needs_reconcile = true;
                return;
            }
            switch (status.state) {
            case DaemonApState::ENABLED:
                rec.set_state(LifecycleState::UP, events);
                rec.replace_stations(stations, events);
                break;
            case DaemonApState::DISABLED:
                rec.set_state(LifecycleState::DOWN, events);
                break;
            case DaemonApState::TRANSITIONAL:
                rec.set_state(LifecycleState::ERROR, events,
                              "daemon reports transitional state " + status.raw_state);
                break;
            case DaemonApState::FAULT:
                rec.set_state(LifecycleState::ERROR, events,
                              "daemon reports state " + status.raw_state);
                break;
            }
            rec.needs_reconcile = false;
            applied = true;
        });

        if (applied) {
            spdlog::debug("[Controller] {}: daemon state {} ({} stations)", handle,
                          status.raw_state, stations.size());
            return ApError::ok();
        }
        if (pass == MAX_RECONCILE_PASSES) {
            spdlog::debug("[Controller] {}: signals kept arriving during {} reads, keeping "
                          "the signalled state",
                          handle, pass);
            return ApError::ok();
        }
        spdlog::debug("[Controller] {}: signals arrived while reading the daemon, reading again",
                      handle);
    }
}

// ============================================================================
// Operations
// ============================================================================

ApError AccessPointController::attach(const std::string& handle) {
    auto ctx = context(handle);
    BusyGuard guard(ctx->busy);
    if (!guard.acquired()) {
        return ApError::busy(handle, "attach");
    }

    ApError err = ensure_attached(handle, "attach");
    if (!err) {
        return err;
    }
    return reconcile_if_needed(handle, "attach", make_deadline());
}

ApError AccessPointController::configure(const std::string& handle,
                                         const AccessPointConfig& config) {
    ApError err = validate_config(config);
    if (!err) {
        err.handle = handle;
        spdlog::warn("[Controller] {}: invalid configuration: {}", handle, err.message);
        return err;
    }

    auto ctx = context(handle);
    BusyGuard guard(ctx->busy);
    if (!guard.acquired()) {
        spdlog::debug("[Controller] {}: configure while busy", handle);
        return ApError::busy(handle, "configure");
    }

    Deadline deadline = make_deadline();

    err = ensure_attached(handle, "configure");
    if (!err) {
        return err;
    }
    err = reconcile_if_needed(handle, "configure", deadline);
    if (!err) {
        return err;
    }

    LifecycleState state = cache_.state(handle);
    if (!is_one_of(state, {LifecycleState::DOWN, LifecycleState::ERROR})) {
        return ApError::invalid_state(handle, "configure",
                                      std::string("cannot configure while ") +
                                          lifecycle_state_name(state) + "; stop it first");
    }

    spdlog::info("[Controller] {}: configuring ssid='{}' security={} band={} channel={}", handle,
                 config.ssid, security_mode_name(config.security), band_name(config.band),
                 config.channel);

    cache_.update(handle, [](ApRecord& rec, std::vector<ApEvent>& events) {
        rec.set_state(LifecycleState::CONFIGURING, events);
    });

    auto fail = [&](ApError failure) {
        cache_.update(handle, [&](ApRecord& rec, std::vector<ApEvent>& events) {
            rec.set_state(LifecycleState::ERROR, events, failure.message);
            events.push_back(ApEvent::configuration_failed(handle, rec.error_reason));
            // Some SET calls may have landed before the failure
            rec.needs_reconcile = failure.type != ApErrorType::REJECTED;
        });
        spdlog::warn("[Controller] {}: configure failed: {}", handle, failure.to_string());
        return failure;
    };

    for (const auto& call : model_.set_configuration(handle, config)) {
        err = call_acknowledged(call, handle, "configure", deadline);
        if (!err) {
            return fail(err);
        }
    }

    // A fault signal may have arrived meanwhile; that outcome wins
    ApError outcome;
    cache_.update(handle, [&](ApRecord& rec, std::vector<ApEvent>& events) {
        if (rec.state != LifecycleState::CONFIGURING) {
            outcome = ApError::rejected(handle, "configure", rec.error_reason);
            events.push_back(ApEvent::configuration_failed(handle, outcome.message));
            return;
        }
        rec.config = config;
        rec.set_state(LifecycleState::DOWN, events);
    });

    if (outcome) {
        spdlog::info("[Controller] {}: configuration applied", handle);
    }
    return outcome;
}

ApError AccessPointController::start(const std::string& handle) {
    auto ctx = context(handle);
    BusyGuard guard(ctx->busy);
    if (!guard.acquired()) {
        return ApError::busy(handle, "start");
    }

    Deadline deadline = make_deadline();

    ApError err = ensure_attached(handle, "start");
    if (!err) {
        return err;
    }
    err = reconcile_if_needed(handle, "start", deadline);
    if (!err) {
        return err;
    }

    LifecycleState state = cache_.state(handle);
    if (!is_one_of(state, {LifecycleState::DOWN, LifecycleState::ERROR})) {
        return ApError::invalid_state(handle, "start",
                                      std::string("cannot start while ") +
                                          lifecycle_state_name(state));
    }

    spdlog::info("[Controller] {}: starting", handle);
    cache_.update(handle, [](ApRecord& rec, std::vector<ApEvent>& events) {
        rec.set_state(LifecycleState::STARTING, events);
    });

    err = call_acknowledged(model_.start_ap(handle), handle, "start", deadline);
    if (!err) {
        cache_.update(handle, [&](ApRecord& rec, std::vector<ApEvent>& events) {
            if (rec.state == LifecycleState::STARTING) {
                rec.set_state(LifecycleState::ERROR, events, err.message);
                // The daemon may or may not have acted on a request that got no answer
                rec.needs_reconcile = err.type != ApErrorType::REJECTED;
            }
        });
        spdlog::warn("[Controller] {}: start failed: {}", handle, err.to_string());
        return err;
    }

    cache_.wait_for_state_change(handle, LifecycleState::STARTING, deadline);

    ApError outcome;
    cache_.update(handle, [&](ApRecord& rec, std::vector<ApEvent>& events) {
        switch (rec.state) {
        case LifecycleState::UP:
            break;
        case LifecycleState::STARTING:
            rec.set_state(LifecycleState::ERROR, events, "timeout waiting for start confirmation");
            rec.needs_reconcile = true;
            outcome = ApError::timeout(handle, "start", "timeout waiting for start confirmation");
            break;
        default:
            outcome = ApError::rejected(handle, "start",
                                        rec.error_reason.empty()
                                            ? std::string("daemon reported ") +
                                                  lifecycle_state_name(rec.state)
                                            : rec.error_reason);
            break;
        }
    });

    if (outcome) {
        spdlog::info("[Controller] {}: access point is up", handle);
    } else {
        spdlog::warn("[Controller] {}: start failed: {}", handle, outcome.to_string());
    }
    return outcome;
}

ApError AccessPointController::stop(const std::string& handle) {
    if (!cache_.contains(handle)) {
        spdlog::debug("[Controller] {}: stop on unknown access point, nothing to do", handle);
        return ApError::ok();
    }

    auto ctx = context(handle);
    BusyGuard guard(ctx->busy);
    if (!guard.acquired()) {
        return ApError::busy(handle, "stop");
    }

    if (cache_.state(handle) == LifecycleState::DOWN) {
        spdlog::debug("[Controller] {}: already down", handle);
        return ApError::ok();
    }

    Deadline deadline = make_deadline();

    ApError err = ensure_attached(handle, "stop");
    if (!err) {
        return err;
    }
    err = reconcile_if_needed(handle, "stop", deadline);
    if (!err) {
        return err;
    }

    LifecycleState state = cache_.state(handle);
    if (state == LifecycleState::DOWN) {
        return ApError::ok();
    }
    if (!is_one_of(state, {LifecycleState::UP, LifecycleState::STARTING, LifecycleState::ERROR})) {
        return ApError::invalid_state(handle, "stop",
                                      std::string("cannot stop while ") +
                                          lifecycle_state_name(state));
    }

    spdlog::info("[Controller] {}: stopping", handle);
    cache_.update(handle, [](ApRecord& rec, std::vector<ApEvent>& events) {
        rec.set_state(LifecycleState::STOPPING, events);
    });

    err = call_acknowledged(model_.stop_ap(handle), handle, "stop", deadline);
    if (!err) {
        if (err.type == ApErrorType::REJECTED && state == LifecycleState::ERROR) {
            // hostapd refuses DISABLE on an interface that is already disabled
            cache_.update(handle, [&](ApRecord& rec, std::vector<ApEvent>& events) {
                rec.set_state(LifecycleState::ERROR, events, err.message);
            });
            if (reconcile(handle, "stop", deadline) && cache_.state(handle) == LifecycleState::DOWN) {
                return ApError::ok();
            }
            return err;
        }

        cache_.update(handle, [&](ApRecord& rec, std::vector<ApEvent>& events) {
            if (rec.state == LifecycleState::STOPPING) {
                rec.set_state(LifecycleState::ERROR, events, err.message);
                rec.needs_reconcile = err.type != ApErrorType::REJECTED;
            }
        });
        spdlog::warn("[Controller] {}: stop failed: {}", handle, err.to_string());
        return err;
    }

    cache_.wait_for_state_change(handle, LifecycleState::STOPPING, deadline);

    ApError outcome;
    cache_.update(handle, [&](ApRecord& rec, std::vector<ApEvent>& events) {
        switch (rec.state) {
        case LifecycleState::DOWN:
            break;
        case LifecycleState::STOPPING:
            rec.set_state(LifecycleState::ERROR, events, "timeout waiting for stop confirmation");
            rec.needs_reconcile = true;
            outcome = ApError::timeout(handle, "stop", "timeout waiting for stop confirmation");
            break;
        default:
            outcome = ApError::rejected(handle, "stop",
                                        rec.error_reason.empty()
                                            ? std::string("daemon reported ") +
                                                  lifecycle_state_name(rec.state)
                                            : rec.error_reason);
            break;
        }
    });

    if (outcome) {
        spdlog::info("[Controller] {}: access point is down", handle);
    } else {
        spdlog::warn("[Controller] {}: stop failed: {}", handle, outcome.to_string());
    }
    return outcome;
}

ApError AccessPointController::refresh(const std::string& handle) {
    auto ctx = context(handle);
    BusyGuard guard(ctx->busy);
    if (!guard.acquired()) {
        return ApError::busy(handle, "refresh");
    }

    ApError err = ensure_attached(handle, "refresh");
    if (!err) {
        return err;
    }
    return reconcile(handle, "refresh", make_deadline());
}

ApError AccessPointController::deauthenticate(const std::string& handle,
                                              const MacAddress& station) {
    auto ctx = context(handle);
    BusyGuard guard(ctx->busy);
    if (!guard.acquired()) {
        return ApError::busy(handle, "deauthenticate");
    }

    Deadline deadline = make_deadline();

    ApError err = ensure_attached(handle, "deauthenticate");
    if (!err) {
        return err;
    }
    err = reconcile_if_needed(handle, "deauthenticate", deadline);
    if (!err) {
        return err;
    }

    AccessPointSnapshot snap = cache_.snapshot(handle);
    if (snap.state != LifecycleState::UP) {
        return ApError::invalid_state(handle, "deauthenticate",
                                      std::string("no stations while ") +
                                          lifecycle_state_name(snap.state));
    }
    if (!snap.has_station(station)) {
        spdlog::debug("[Controller] {}: {} is not associated, nothing to do", handle,
                      station.to_string());
        return ApError::ok();
    }

    spdlog::info("[Controller] {}: disconnecting station {}", handle, station.to_string());
    err = call_acknowledged(model_.deauthenticate(handle, station), handle, "deauthenticate",
                            deadline);
    if (!err) {
        spdlog::warn("[Controller] {}: deauthenticate failed: {}", handle, err.to_string());
    }
    return err;
}

AccessPointSnapshot AccessPointController::snapshot(const std::string& handle) const {
    return cache_.snapshot(handle);
}

std::vector<std::string> AccessPointController::handles() const {
    return cache_.handles();
}

ObserverId AccessPointController::subscribe(const std::string& handle_filter,
                                            ApEventCallback callback, size_t queue_capacity) {
    return dispatcher_.add_observer(handle_filter, std::move(callback), queue_capacity);
}

bool AccessPointController::unsubscribe(ObserverId id) {
    return dispatcher_.remove_observer(id);
}

uint64_t AccessPointController::dropped_events(ObserverId id) const {
    return dispatcher_.dropped_count(id);
}

bool AccessPointController::flush_events(std::chrono::milliseconds timeout) {
    return dispatcher_.flush(timeout);
}

// ============================================================================
// Signal ingestion (bus delivery thread)
// ============================================================================

void AccessPointController::on_signal(const SignalPayload& payload) {
    DaemonSignal sig;
    ApError err = model_.decode_signal(payload, sig);
    if (!err) {
        uint64_t total = ++decode_failures_;
        LOG_WARN_INTERNAL("[Controller] Dropping malformed signal {} from {}: {} ({} so far)",
                          payload.name, payload.object_path, err.message, total);
        return;
    }

    switch (sig.kind) {
    case DaemonSignal::Kind::IGNORED:
        spdlog::trace("[Controller] {}: ignoring {}", sig.handle, sig.name);
        return;

    case DaemonSignal::Kind::STATE_CHANGED:
        if (sig.stream_ended) {
            context(sig.handle)->stream_ended = true;
        }
        cache_.update(sig.handle, [&](ApRecord& rec, std::vector<ApEvent>& events) {
            ++rec.signal_revision;
            apply_state_signal(rec, sig, events);
        });
        return;

    case DaemonSignal::Kind::STATION_ADDED:
        cache_.update(sig.handle, [&](ApRecord& rec, std::vector<ApEvent>& events) {
            ++rec.signal_revision;
            if (rec.state != LifecycleState::UP) {
                // Cache and daemon disagree; the next operation re-reads the daemon
                spdlog::debug("[Controller] {}: station {} joined while {}", sig.handle,
                              sig.station->mac.to_string(), lifecycle_state_name(rec.state));
                rec.needs_reconcile = true;
                return;
            }
            if (rec.add_station(*sig.station, events)) {
                spdlog::info("[Controller] {}: station {} joined", sig.handle,
                             sig.station->mac.to_string());
            }
        });
        return;

    case DaemonSignal::Kind::STATION_REMOVED:
        cache_.update(sig.handle, [&](ApRecord& rec, std::vector<ApEvent>& events) {
            ++rec.signal_revision;
            if (rec.remove_station(sig.station->mac, events)) {
                spdlog::info("[Controller] {}: station {} left", sig.handle,
                             sig.station->mac.to_string());
            } else {
                spdlog::debug("[Controller] {}: {} left but was not associated", sig.handle,
                              sig.station->mac.to_string());
            }
        });
        return;
    }
}

void AccessPointController::apply_state_signal(ApRecord& rec, const DaemonSignal& sig,
                                               std::vector<ApEvent>& events) {
    switch (sig.state) {
    case DaemonApState::ENABLED:
        switch (rec.state) {
        case LifecycleState::STARTING:
            rec.set_state(LifecycleState::UP, events);
            break;
        case LifecycleState::DOWN:
        case LifecycleState::ERROR:
            spdlog::info("[Controller] {}: daemon enabled the access point on its own", rec.handle);
            rec.set_state(LifecycleState::UP, events);
            break;
        case LifecycleState::CONFIGURING:
            rec.needs_reconcile = true;
            break;
        case LifecycleState::STOPPING:
            spdlog::debug("[Controller] {}: stale AP-ENABLED while stopping", rec.handle);
            break;
        case LifecycleState::UP:
            break;
        }
        break;

    case DaemonApState::DISABLED:
        switch (rec.state) {
        case LifecycleState::UP:
            spdlog::info("[Controller] {}: daemon disabled the access point", rec.handle);
            rec.set_state(LifecycleState::DOWN, events);
            break;
        case LifecycleState::STOPPING:
            rec.set_state(LifecycleState::DOWN, events);
            break;
        case LifecycleState::STARTING:
            rec.set_state(LifecycleState::ERROR, events,
                          "daemon disabled the access point while starting");
            break;
        case LifecycleState::CONFIGURING:
        case LifecycleState::DOWN:
        case LifecycleState::ERROR:
            break;
        }
        break;

    case DaemonApState::FAULT:
    case DaemonApState::TRANSITIONAL:
        spdlog::warn("[Controller] {}: {}", rec.handle, sig.reason);
        rec.fault(sig.reason, events);
        break;
    }
}

} // namespace proton
