#include "simulation_engine.hpp"
#include "errors.hpp"
#include "performance.hpp"
#include "session_json.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace tradeflow {

namespace {

int64_t wall_now_ns() {
    return utils::ts_to_ns(std::chrono::system_clock::now());
}

bool changes_book(const SessionEvent& ev) {
    return ev.type == SessionEventType::POSITION_OPENED || ev.type == SessionEventType::POSITION_CLOSED;
}

} // namespace

Session::Session(std::string session_id, SessionConfig cfg)
    : id(std::move(session_id))
    , config(std::move(cfg))
    , created_at(std::chrono::system_clock::now()) {}

Session::~Session() {
    if (worker_thread && worker_thread->joinable()) {
        // The worker may hold the last reference after remove().
        if (worker_thread->get_id() == std::this_thread::get_id()) {
            worker_thread->detach();
        } else {
            worker_thread->join();
        }
    }
}

SimulationEngine::SimulationEngine(std::shared_ptr<StreamHub> hub,
                                   std::shared_ptr<SignalProvider> signals,
                                   std::shared_ptr<SessionStore> store,
                                   SimulationConfig sim_cfg,
                                   size_t channel_capacity)
    : hub_(std::move(hub))
    , signals_(std::move(signals))
    , store_(std::move(store))
    , sim_cfg_(std::move(sim_cfg))
    , channel_capacity_(channel_capacity) {}

SimulationEngine::~SimulationEngine() {
    shutdown();
}

void SimulationEngine::set_bar_source(std::shared_ptr<BarSource> bars) {
    std::lock_guard<std::mutex> lock(mutex_);
    bars_ = std::move(bars);
}

void SimulationEngine::register_gateway(const std::string& exchange,
                                        std::shared_ptr<ExecutionGateway> gateway,
                                        RetryPolicy retry,
                                        Sleeper sleep) {
    std::lock_guard<std::mutex> lock(mutex_);
    gateways_[utils::to_lower(exchange)] = GatewayEntry{std::move(gateway), retry, std::move(sleep)};
}

std::optional<LiveRouting> SimulationEngine::routing_for(const SessionConfig& cfg) const {
    if (cfg.mode != SessionMode::LIVE) return std::nullopt;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gateways_.find(utils::to_lower(cfg.exchange));
    if (it == gateways_.end() || !it->second.gateway) {
        throw ValidationError("no execution gateway configured for exchange " + cfg.exchange);
    }
    return LiveRouting{it->second.gateway, it->second.retry, it->second.sleep};
}

std::shared_ptr<const SessionSnapshot> SimulationEngine::create(const SessionConfig& config,
                                                                std::optional<std::string> session_id) {
    validate(config);
    if (config.mode == SessionMode::BACKTEST) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!bars_) throw ValidationError("backtest requires a bar source");
    }
    auto live = routing_for(config);

    std::string id = session_id.value_or(utils::generate_id());
    auto session = std::make_shared<Session>(id, config);
    session->logic = std::make_unique<TradingSession>(id, config, signals_, std::move(live));
    // Held until the worker runs: a stop() that finds the session early waits for ACTIVE.
    std::unique_lock<std::mutex> lifecycle(session->lifecycle_mutex);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_.load()) throw ValidationError("engine is shutting down");
        if (sessions_.count(id)) throw ValidationError("session " + id + " already exists");
        int running = 0;
        for (const auto& kv : sessions_) {
            if (kv.second->status.load() != SessionStatus::STOPPED) ++running;
        }
        if (running >= sim_cfg_.max_sessions) {
            throw ValidationError(fmt::format("session limit reached ({})", sim_cfg_.max_sessions));
        }
        sessions_[id] = session;
    }
    publish_snapshot(session);
    persist(session);
    emit(status_event(session));

    if (config.mode != SessionMode::BACKTEST) {
        try {
            subscribe_session(session);
        } catch (const std::exception& e) {
            unsubscribe_session(session);
            // A stop() queued on the lifecycle lock sees a finished session.
            session->finalized.store(true);
            session->status.store(SessionStatus::STOPPED);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                sessions_.erase(id);
            }
            if (store_ && !store_->remove(id)) {
                spdlog::warn("Session {}: failed to delete persisted record", id);
            }
            throw ValidationError(std::string("cannot subscribe to market data: ") + e.what());
        }
    }
    set_status(session, SessionStatus::ACTIVE);
    start_worker(session);
    lifecycle.unlock();

    spdlog::info("Session {} created: mode={} symbol={} capital={}",
                 id, to_string(config.mode), config.symbol, config.initial_capital.to_string());
    return get(id);
}

void SimulationEngine::subscribe_session(const std::shared_ptr<Session>& session) {
    session->channel = std::make_shared<DeliveryChannel>(channel_capacity_);
    session->subscriptions.push_back(
        hub_->subscribe_into(session->config.symbol, EventKind::TRADE, session->channel));
    if (session->config.funding_policy == FundingPolicy::ACCRUE) {
        session->subscriptions.push_back(
            hub_->subscribe_into(session->config.symbol, EventKind::FUNDING_RATE, session->channel));
    }
}

void SimulationEngine::unsubscribe_session(const std::shared_ptr<Session>& session) {
    if (!hub_) return;
    for (auto id : session->subscriptions) hub_->unsubscribe(id);
}

void SimulationEngine::start_worker(const std::shared_ptr<Session>& session) {
    if (session->config.mode == SessionMode::BACKTEST) {
        session->worker_thread = std::make_unique<std::thread>(
            [this, session]() { run_backtest(session); });
    } else {
        session->worker_thread = std::make_unique<std::thread>(
            [this, session]() { run_stream_loop(session); });
    }
}

std::shared_ptr<Session> SimulationEngine::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) throw NotFoundError("session not found: " + session_id);
    return it->second;
}

void SimulationEngine::pause(const std::string& session_id) {
    auto session = find(session_id);
    std::lock_guard<std::mutex> lock(session->lifecycle_mutex);
    auto st = session->status.load();
    if (st == SessionStatus::STOPPED) throw ValidationError("session " + session_id + " is stopped");
    if (st == SessionStatus::PAUSED) return;
    set_status(session, SessionStatus::PAUSED);
    spdlog::info("Session {} paused", session_id);
}

void SimulationEngine::resume(const std::string& session_id) {
    auto session = find(session_id);
    std::lock_guard<std::mutex> lock(session->lifecycle_mutex);
    auto st = session->status.load();
    if (st == SessionStatus::STOPPED) throw ValidationError("session " + session_id + " is stopped");
    if (st != SessionStatus::PAUSED) return;
    set_status(session, SessionStatus::ACTIVE);
    {
        std::lock_guard<std::mutex> pl(session->pause_mutex);
    }
    session->pause_cv.notify_all();
    spdlog::info("Session {} resumed", session_id);
}

void SimulationEngine::stop(const std::string& session_id) {
    auto session = find(session_id);
    std::lock_guard<std::mutex> lock(session->lifecycle_mutex);
    if (session->finalized.load() && session->status.load() == SessionStatus::STOPPED) {
        spdlog::debug("Session {} already stopped", session_id);
        return;
    }
    session->should_stop.store(true);
    {
        std::lock_guard<std::mutex> pl(session->pause_mutex);
    }
    session->pause_cv.notify_all();
    unsubscribe_session(session);
    if (session->worker_thread && session->worker_thread->joinable() &&
        session->worker_thread->get_id() != std::this_thread::get_id()) {
        session->worker_thread->join();
    }
    finalize(session, ExitReason::MANUAL, "manual");
}

void SimulationEngine::remove(const std::string& session_id, bool only_if_stopped) {
    auto session = find(session_id);
    if (session->status.load() != SessionStatus::STOPPED) {
        if (only_if_stopped) {
            throw ValidationError("session " + session_id + " is not stopped");
        }
        stop(session_id);
    }
    {
        std::lock_guard<std::mutex> lock(session->lifecycle_mutex);
        if (session->worker_thread && session->worker_thread->joinable() &&
            session->worker_thread->get_id() != std::this_thread::get_id()) {
            session->worker_thread->join();
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(session_id);
    }
    if (store_ && !store_->remove(session_id)) {
        spdlog::warn("Session {}: failed to delete persisted record", session_id);
    }
    spdlog::info("Session {} deleted", session_id);
}

std::shared_ptr<const SessionSnapshot> SimulationEngine::get(const std::string& session_id) const {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) return nullptr;
        session = it->second;
    }
    std::lock_guard<std::mutex> lock(session->snapshot_mutex);
    return session->snapshot;
}

std::vector<std::shared_ptr<const SessionSnapshot>> SimulationEngine::list() const {
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.reserve(sessions_.size());
        for (const auto& kv : sessions_) sessions.push_back(kv.second);
    }
    std::vector<std::shared_ptr<const SessionSnapshot>> out;
    out.reserve(sessions.size());
    for (const auto& s : sessions) {
        std::lock_guard<std::mutex> lock(s->snapshot_mutex);
        if (s->snapshot) out.push_back(s->snapshot);
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a->created_at < b->created_at;
    });
    return out;
}

std::optional<std::chrono::milliseconds> SimulationEngine::staleness(const std::string& session_id) const {
    auto session = find(session_id);
    int64_t last = session->last_processed_wall_ns.load(std::memory_order_acquire);
    if (last == 0) return std::nullopt;
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds(wall_now_ns() - last));
}

BacktestReport SimulationEngine::report(const std::string& session_id) const {
    auto session = find(session_id);
    std::shared_ptr<const SessionSnapshot> snap;
    {
        std::lock_guard<std::mutex> lock(session->snapshot_mutex);
        if (session->report) return *session->report;
        snap = session->snapshot;
    }
    if (!snap) return BacktestReport{};
    Decimal equity = snap->current_capital;
    for (const auto& p : snap->open_positions) equity += p.mark_to_market(p.last_mark_price);
    return compute_report(snap->config.initial_capital, equity, snap->closed_trades, snap->equity_curve);
}

void SimulationEngine::add_event_callback(EventCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    event_callbacks_.push_back(std::move(cb));
}

void SimulationEngine::run_stream_loop(std::shared_ptr<Session> session) {
    spdlog::info("Session {} loop starting", session->id);
    while (!session->should_stop.load()) {
        auto ev = session->channel->wait_and_pop();
        if (!ev) {
            spdlog::info("Session {} loop: channel closed", session->id);
            break;
        }
        if (session->should_stop.load()) break;
        if (session->status.load() == SessionStatus::PAUSED) {
            session->events_discarded.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        if (!process_event(session, *ev)) return;
    }
    spdlog::info("Session {} loop ended, processed {} events",
                 session->id, session->events_processed.load());
}

void SimulationEngine::run_backtest(std::shared_ptr<Session> session) {
    const auto& cfg = session->config;
    std::shared_ptr<BarSource> bars_source;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bars_source = bars_;
    }
    std::vector<BarRecord> bars;
    try {
        bars = bars_source->get_bars(cfg.symbol, cfg.bar_interval,
                                     cfg.start_time.value_or(Timestamp{}),
                                     cfg.end_time.value_or(Timestamp::max()));
    } catch (const std::exception& e) {
        handle_failure(session, std::string("bar source failed: ") + e.what(), false);
        return;
    }
    spdlog::info("Session {} backtest starting: {} bars of {} {}",
                 session->id, bars.size(), cfg.symbol, cfg.bar_interval);
    if (bars.empty()) {
        SessionEvent alert;
        alert.session_id = session->id;
        alert.type = SessionEventType::ALERT;
        alert.timestamp = std::chrono::system_clock::now();
        alert.payload = {{"level", "warning"},
                         {"message", fmt::format("no {} bars for {} in the requested range",
                                                 cfg.bar_interval, cfg.symbol)}};
        emit(alert);
    }

    for (const auto& bar : bars) {
        {
            std::unique_lock<std::mutex> lk(session->pause_mutex);
            session->pause_cv.wait(lk, [&]() {
                return session->status.load() != SessionStatus::PAUSED || session->should_stop.load();
            });
        }
        if (session->should_stop.load()) return;
        if (!process_event(session, to_bar_close_event(bar))) return;
    }
    if (!session->should_stop.load()) {
        finalize(session, ExitReason::END_OF_DATA, "end_of_data");
    }
}

bool SimulationEngine::process_event(const std::shared_ptr<Session>& session, const MarketEvent& ev) {
    std::vector<SessionEvent> out;
    try {
        uint64_t discarded_before = session->logic->discarded();
        out = session->logic->on_event(ev);
        uint64_t discarded_now = session->logic->discarded() - discarded_before;
        if (discarded_now > 0) {
            session->events_discarded.fetch_add(discarded_now, std::memory_order_relaxed);
        }
    } catch (const InvariantViolation& e) {
        handle_failure(session, e.what(), true);
        return false;
    } catch (const std::exception& e) {
        handle_failure(session, e.what(), false);
        return false;
    }
    uint64_t processed = session->events_processed.fetch_add(1, std::memory_order_relaxed) + 1;
    session->last_processed_wall_ns.store(wall_now_ns(), std::memory_order_release);
    if (processed == 1 || processed % 10000 == 0) {
        spdlog::info("Session {} processed {} events", session->id, processed);
    }

    emit_all(out);
    bool book_changed = std::any_of(out.begin(), out.end(), changes_book);
    bool idle = session->channel && session->channel->size() == 0;
    if (!out.empty() || idle || processed % 1000 == 0) {
        publish_snapshot(session);
    }
    if (book_changed) persist(session);
    return true;
}

void SimulationEngine::handle_failure(const std::shared_ptr<Session>& session, const std::string& what,
                                      bool invariant) {
    bool expected = false;
    if (!session->finalized.compare_exchange_strong(expected, true)) return;
    session->should_stop.store(true);

    SessionSnapshot state;
    state.id = session->id;
    state.config = session->config;
    state.status = session->status.load();
    session->logic->fill_snapshot(state);
    if (invariant) {
        spdlog::critical("Session {} invariant violation: {}; state={}",
                         session->id, what, snapshot_to_record(state).dump());
    } else {
        spdlog::error("Session {} failed: {}; state={}",
                      session->id, what, snapshot_to_record(state).dump());
    }

    unsubscribe_session(session);
    {
        std::lock_guard<std::mutex> lock(session->snapshot_mutex);
        session->stopped_at = std::chrono::system_clock::now();
        session->stop_reason = (invariant ? "invariant_violation: " : "error: ") + what;
    }
    SessionEvent alert;
    alert.session_id = session->id;
    alert.type = SessionEventType::ALERT;
    alert.timestamp = std::chrono::system_clock::now();
    alert.payload = {{"level", "critical"}, {"message", what}};
    emit(alert);

    session->status.store(SessionStatus::STOPPED);
    publish_snapshot(session);
    persist(session);
    emit(status_event(session));
}

void SimulationEngine::finalize(const std::shared_ptr<Session>& session, ExitReason reason,
                                const std::string& stop_reason) {
    bool expected = false;
    if (!session->finalized.compare_exchange_strong(expected, true)) return;

    auto now = std::chrono::system_clock::now();
    std::string final_reason = stop_reason;
    std::vector<SessionEvent> out;
    try {
        out = session->logic->close_all(reason, now);
    } catch (const InvariantViolation& e) {
        spdlog::critical("Session {} invariant violation while closing: {}", session->id, e.what());
        final_reason = std::string("invariant_violation: ") + e.what();
    }
    emit_all(out);

    {
        std::lock_guard<std::mutex> lock(session->snapshot_mutex);
        session->stopped_at = now;
        session->stop_reason = final_reason;
        if (session->config.mode == SessionMode::BACKTEST) {
            const auto& book = session->logic->book();
            session->report = compute_report(book.initial_capital(),
                                             book.equity_at_last_mark(),
                                             book.closed_trades(),
                                             session->logic->equity_curve().points());
        }
    }
    session->status.store(SessionStatus::STOPPED);
    publish_snapshot(session);
    persist(session);
    emit(status_event(session));

    const auto& book = session->logic->book();
    spdlog::info("Session {} stopped ({}): capital={} trades={} realized={}",
                 session->id, final_reason, book.current_capital().to_string(),
                 book.closed_trades().size(), book.realized_pnl().to_string());
}

void SimulationEngine::set_status(const std::shared_ptr<Session>& session, SessionStatus status) {
    session->status.store(status);
    restamp_snapshot(session);
    persist(session);
    emit(status_event(session));
}

void SimulationEngine::publish_snapshot(const std::shared_ptr<Session>& session) {
    SessionSnapshot snap;
    snap.id = session->id;
    snap.config = session->config;
    snap.created_at = session->created_at;
    session->logic->fill_snapshot(snap);
    store_snapshot(session, std::move(snap));
}

void SimulationEngine::restamp_snapshot(const std::shared_ptr<Session>& session) {
    SessionSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(session->snapshot_mutex);
        if (session->snapshot) snap = *session->snapshot;
    }
    snap.id = session->id;
    snap.config = session->config;
    snap.created_at = session->created_at;
    store_snapshot(session, std::move(snap));
}

void SimulationEngine::store_snapshot(const std::shared_ptr<Session>& session, SessionSnapshot snap) {
    std::lock_guard<std::mutex> lock(session->snapshot_mutex);
    // Status and counters are read under the lock so a concurrent transition is never lost.
    snap.status = session->status.load();
    snap.events_processed = session->events_processed.load();
    snap.events_discarded = session->events_discarded.load();
    snap.stopped_at = session->stopped_at;
    snap.stop_reason = session->stop_reason;
    snap.report = session->report;
    session->snapshot = std::make_shared<const SessionSnapshot>(std::move(snap));
}

void SimulationEngine::persist(const std::shared_ptr<Session>& session) {
    if (!store_) return;
    std::shared_ptr<const SessionSnapshot> snap;
    {
        std::lock_guard<std::mutex> lock(session->snapshot_mutex);
        snap = session->snapshot;
    }
    if (snap && !store_->save(*snap)) {
        spdlog::warn("Session {}: failed to persist record", session->id);
    }
}

void SimulationEngine::emit(const SessionEvent& ev) {
    std::vector<EventCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = event_callbacks_;
    }
    for (const auto& cb : callbacks) {
        try {
            cb(ev);
        } catch (const std::exception& e) {
            spdlog::warn("Session {}: event callback failed: {}", ev.session_id, e.what());
        }
    }
}

void SimulationEngine::emit_all(const std::vector<SessionEvent>& events) {
    for (const auto& ev : events) emit(ev);
}

SessionEvent SimulationEngine::status_event(const std::shared_ptr<Session>& session) const {
    SessionEvent ev;
    ev.session_id = session->id;
    ev.type = SessionEventType::STATUS_CHANGED;
    ev.timestamp = std::chrono::system_clock::now();
    ev.payload = {{"status", to_string(session->status.load())}};
    std::lock_guard<std::mutex> lock(session->snapshot_mutex);
    if (!session->stop_reason.empty()) ev.payload["stop_reason"] = session->stop_reason;
    return ev;
}

size_t SimulationEngine::restore_from_store() {
    if (!store_) return 0;
    size_t restored = 0;
    for (auto& rec : store_->load_all()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (sessions_.count(rec.id)) continue;
        }
        auto session = std::make_shared<Session>(rec.id, rec.config);
        session->created_at = rec.created_at;
        session->events_processed.store(rec.events_processed);
        session->events_discarded.store(rec.events_discarded);
        session->stopped_at = rec.stopped_at;
        session->stop_reason = rec.stop_reason;
        session->report = rec.report;

        bool resumable = rec.status != SessionStatus::STOPPED && rec.config.mode != SessionMode::BACKTEST;
        std::optional<LiveRouting> live;
        if (resumable) {
            try {
                live = routing_for(rec.config);
            } catch (const ValidationError& e) {
                spdlog::warn("Session {} cannot resume: {}", rec.id, e.what());
                resumable = false;
                session->stop_reason = e.what();
            }
        }
        session->logic = std::make_unique<TradingSession>(rec.id, rec.config, signals_, std::move(live));
        try {
            session->logic->restore(rec);
        } catch (const InvariantViolation& e) {
            spdlog::critical("Session {} persisted record is inconsistent: {}", rec.id, e.what());
            resumable = false;
            session->stop_reason = std::string("invariant_violation: ") + e.what();
        }

        if (!resumable) {
            if (rec.status != SessionStatus::STOPPED) {
                session->stopped_at = std::chrono::system_clock::now();
                if (session->stop_reason.empty()) session->stop_reason = "interrupted";
            }
            session->finalized.store(true);
            session->status.store(SessionStatus::STOPPED);
        } else {
            session->status.store(rec.status == SessionStatus::PAUSED ? SessionStatus::PAUSED
                                                                      : SessionStatus::ACTIVE);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_[rec.id] = session;
        }
        publish_snapshot(session);

        if (resumable) {
            try {
                subscribe_session(session);
                start_worker(session);
            } catch (const std::exception& e) {
                spdlog::error("Session {} failed to resubscribe: {}", rec.id, e.what());
                unsubscribe_session(session);
                {
                    std::lock_guard<std::mutex> lock(session->snapshot_mutex);
                    session->stopped_at = std::chrono::system_clock::now();
                    session->stop_reason = std::string("error: ") + e.what();
                }
                session->finalized.store(true);
                session->status.store(SessionStatus::STOPPED);
                restamp_snapshot(session);
            }
        }
        persist(session);
        ++restored;
        spdlog::info("Session {} restored as {}", rec.id, to_string(session->status.load()));
    }
    return restored;
}

void SimulationEngine::shutdown() {
    if (shut_down_.exchange(true)) return;
    spdlog::info("Simulation engine shutting down");
    if (hub_) hub_->shutdown();

    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : sessions_) ids.push_back(kv.first);
    }
    for (const auto& id : ids) {
        try {
            stop(id);
        } catch (const std::exception& e) {
            spdlog::error("Session {} failed to stop cleanly: {}", id, e.what());
        }
    }
}

} // namespace tradeflow
