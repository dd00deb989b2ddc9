#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "bar_source.hpp"
#include "config.hpp"
#include "delivery_channel.hpp"
#include "execution_gateway.hpp"
#include "session_store.hpp"
#include "session_types.hpp"
#include "signal_provider.hpp"
#include "stream_hub.hpp"
#include "trading_session.hpp"

namespace tradeflow {

struct Session {
    std::string id;
    SessionConfig config;
    Timestamp created_at;
    std::unique_ptr<TradingSession> logic;  // worker-owned; stop() touches it only after the join

    std::atomic<SessionStatus> status{SessionStatus::CREATED};
    std::atomic<bool> should_stop{false};
    std::atomic<bool> finalized{false};
    std::atomic<uint64_t> events_processed{0};
    std::atomic<uint64_t> events_discarded{0};   // malformed, foreign or arrived while paused
    std::atomic<int64_t> last_processed_wall_ns{0};

    std::shared_ptr<DeliveryChannel> channel;
    std::vector<SubscriptionId> subscriptions;
    std::unique_ptr<std::thread> worker_thread;
    std::mutex lifecycle_mutex;                  // pause/resume/stop serialization

    // Backtest replay waits here while paused.
    std::mutex pause_mutex;
    std::condition_variable pause_cv;

    mutable std::mutex snapshot_mutex;
    std::shared_ptr<const SessionSnapshot> snapshot;
    std::optional<Timestamp> stopped_at;         // guarded by snapshot_mutex
    std::string stop_reason;                     // guarded by snapshot_mutex
    std::optional<BacktestReport> report;        // guarded by snapshot_mutex

    Session(std::string session_id, SessionConfig cfg);
    ~Session();
};

/**
 * Runs trading sessions against live hub streams or recorded bars.
 *
 * Each session has one worker thread that applies events strictly in order;
 * readers only ever see immutable snapshots. An InvariantViolation stops the
 * offending session and nothing else.
 */
class SimulationEngine {
public:
    using EventCallback = std::function<void(const SessionEvent&)>;

    SimulationEngine(std::shared_ptr<StreamHub> hub,
                     std::shared_ptr<SignalProvider> signals,
                     std::shared_ptr<SessionStore> store = nullptr,
                     SimulationConfig sim_cfg = {},
                     size_t channel_capacity = 256);
    ~SimulationEngine();

    SimulationEngine(const SimulationEngine&) = delete;
    SimulationEngine& operator=(const SimulationEngine&) = delete;

    void set_bar_source(std::shared_ptr<BarSource> bars);
    void register_gateway(const std::string& exchange,
                          std::shared_ptr<ExecutionGateway> gateway,
                          RetryPolicy retry = {},
                          Sleeper sleep = {});

    // Throws ValidationError for a bad config or when the session limit is reached.
    std::shared_ptr<const SessionSnapshot> create(const SessionConfig& config,
                                                  std::optional<std::string> session_id = std::nullopt);

    // Lifecycle commands throw NotFoundError for unknown ids.
    void pause(const std::string& session_id);
    void resume(const std::string& session_id);
    void stop(const std::string& session_id);
    void remove(const std::string& session_id, bool only_if_stopped = true);

    std::shared_ptr<const SessionSnapshot> get(const std::string& session_id) const;
    std::vector<std::shared_ptr<const SessionSnapshot>> list() const;

    // Wall time since the session last applied an event; nullopt before the first one.
    std::optional<std::chrono::milliseconds> staleness(const std::string& session_id) const;

    // Report for a stopped backtest, or computed from the current book otherwise.
    BacktestReport report(const std::string& session_id) const;

    void add_event_callback(EventCallback cb);

    // Reload persisted sessions. Stopped ones are read-only; paper and live ones resubscribe.
    size_t restore_from_store();

    SessionConfig default_config() const { return default_session_config(sim_cfg_); }

    // Stops the hub, then every session. Idempotent.
    void shutdown();

private:
    std::shared_ptr<Session> find(const std::string& session_id) const;
    std::optional<LiveRouting> routing_for(const SessionConfig& cfg) const;
    void subscribe_session(const std::shared_ptr<Session>& session);
    void unsubscribe_session(const std::shared_ptr<Session>& session);
    void start_worker(const std::shared_ptr<Session>& session);

    void run_stream_loop(std::shared_ptr<Session> session);
    void run_backtest(std::shared_ptr<Session> session);
    // Returns false when the session was stopped by a failure.
    bool process_event(const std::shared_ptr<Session>& session, const MarketEvent& ev);
    void handle_failure(const std::shared_ptr<Session>& session, const std::string& what, bool invariant);
    void finalize(const std::shared_ptr<Session>& session, ExitReason reason, const std::string& stop_reason);

    void set_status(const std::shared_ptr<Session>& session, SessionStatus status);
    // Full rebuild from the book; only the thread that owns the session's logic may call it.
    void publish_snapshot(const std::shared_ptr<Session>& session);
    // Copy of the last snapshot with current status and counters.
    void restamp_snapshot(const std::shared_ptr<Session>& session);
    void store_snapshot(const std::shared_ptr<Session>& session, SessionSnapshot snap);
    void persist(const std::shared_ptr<Session>& session);
    void emit(const SessionEvent& ev);
    void emit_all(const std::vector<SessionEvent>& events);
    SessionEvent status_event(const std::shared_ptr<Session>& session) const;

    std::shared_ptr<StreamHub> hub_;
    std::shared_ptr<SignalProvider> signals_;
    std::shared_ptr<SessionStore> store_;
    std::shared_ptr<BarSource> bars_;
    SimulationConfig sim_cfg_;
    size_t channel_capacity_;

    struct GatewayEntry {
        std::shared_ptr<ExecutionGateway> gateway;
        RetryPolicy retry;
        Sleeper sleep;
    };
    std::unordered_map<std::string, GatewayEntry> gateways_;

    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    mutable std::mutex mutex_;
    std::vector<EventCallback> event_callbacks_;
    std::mutex callbacks_mutex_;
    std::atomic<bool> shut_down_{false};
};

} // namespace tradeflow
