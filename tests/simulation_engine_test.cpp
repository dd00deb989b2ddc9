#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "../src/core/errors.hpp"
#include "../src/core/simulation_engine.hpp"

using namespace tradeflow;

namespace {

class FakeAdapter : public FeedAdapter {
public:
    FakeAdapter(StreamKey key, FeedContext ctx, std::atomic<int>& closes)
        : key_(std::move(key)), ctx_(std::move(ctx)), closes_(closes) {}

    ConnectResult connect() override {
        connected_ = true;
        return FeedHandle{"fake-" + key_.to_string(), key_};
    }
    void close() override {
        if (connected_.exchange(false)) closes_.fetch_add(1);
    }
    const StreamKey& key() const override { return key_; }
    bool connected() const override { return connected_.load(); }

    void emit(const MarketEvent& ev) { ctx_.sink(ev); }

private:
    StreamKey key_;
    FeedContext ctx_;
    std::atomic<int>& closes_;
    std::atomic<bool> connected_{false};
};

struct FakeFeeds {
    std::atomic<int> created{0};
    std::atomic<int> closes{0};
    std::mutex mutex;
    std::vector<FakeAdapter*> adapters;

    AdapterFactory make() {
        return [this](const StreamKey& key, FeedContext ctx) -> std::unique_ptr<FeedAdapter> {
            created.fetch_add(1);
            auto a = std::make_unique<FakeAdapter>(key, std::move(ctx), closes);
            std::lock_guard<std::mutex> lock(mutex);
            adapters.push_back(a.get());
            return a;
        };
    }

    FakeAdapter* last() {
        std::lock_guard<std::mutex> lock(mutex);
        return adapters.empty() ? nullptr : adapters.back();
    }
};

// BUY on the first query, NEUTRAL afterwards.
class FirstBuySignals : public SignalProvider {
public:
    Signal get_signal(const std::string&, const std::string&) override {
        return calls.fetch_add(1) == 0 ? Signal::BUY : Signal::NEUTRAL;
    }
    std::atomic<int> calls{0};
};

class FakeBars : public BarSource {
public:
    std::vector<BarRecord> get_bars(const std::string& symbol, const std::string&,
                                    Timestamp, Timestamp) override {
        if (symbol == "BADUSDT") throw std::runtime_error("archive offline");
        std::vector<BarRecord> out;
        int64_t t = 1700000000000LL;
        for (const char* px : {"100", "105", "110"}) {
            BarRecord bar;
            bar.symbol = symbol;
            bar.open_time = utils::ms_to_ts(t);
            bar.close_time = utils::ms_to_ts(t + 59999);
            bar.open = bar.high = bar.low = bar.close = *Decimal::parse(px);
            bar.volume = Decimal::from_int(1);
            out.push_back(bar);
            t += 60000;
        }
        return out;
    }
};

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

SessionConfig paper_config(const std::string& symbol = "BTCUSDT") {
    SessionConfig cfg;
    cfg.name = "paper";
    cfg.symbol = symbol;
    cfg.initial_capital = Decimal::from_int(10000);
    return cfg;
}

SessionConfig backtest_config(const std::string& symbol = "BTCUSDT") {
    auto cfg = paper_config(symbol);
    cfg.name = "backtest";
    cfg.mode = SessionMode::BACKTEST;
    return cfg;
}

MarketEvent trade(uint64_t seq, const char* price) {
    MarketEvent ev;
    ev.symbol = "BTCUSDT";
    ev.kind = EventKind::TRADE;
    ev.sequence = seq;
    ev.price = *Decimal::parse(price);
    ev.quantity = Decimal::from_int(1);
    ev.timestamp = utils::ms_to_ts(1700000000000LL + static_cast<int64_t>(seq) * 1000);
    return ev;
}

class SimulationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        hub_ = std::make_shared<StreamHub>(feeds_.make());
        signals_ = std::make_shared<SignalBoard>();
        store_ = std::make_shared<MemorySessionStore>();
    }

    std::shared_ptr<SimulationEngine> make_engine(SimulationConfig sim = {},
                                                  std::shared_ptr<SignalProvider> signals = nullptr) {
        auto engine = std::make_shared<SimulationEngine>(
            hub_, signals ? signals : signals_, store_, sim, 64);
        engine->set_bar_source(std::make_shared<FakeBars>());
        return engine;
    }

    bool reaches(SimulationEngine& engine, const std::string& id, SessionStatus status) {
        return wait_until([&]() {
            auto snap = engine.get(id);
            return snap && snap->status == status;
        });
    }

    FakeFeeds feeds_;
    std::shared_ptr<StreamHub> hub_;
    std::shared_ptr<SignalBoard> signals_;
    std::shared_ptr<MemorySessionStore> store_;
};

} // namespace

TEST_F(SimulationEngineTest, CreateRejectsInvalidConfigs) {
    auto engine = make_engine();
    auto cfg = paper_config();
    cfg.initial_capital = Decimal{};
    EXPECT_THROW(engine->create(cfg), ValidationError);

    cfg = paper_config();
    cfg.symbol.clear();
    EXPECT_THROW(engine->create(cfg), ValidationError);

    cfg = paper_config();
    cfg.mode = SessionMode::LIVE;
    EXPECT_THROW(engine->create(cfg), ValidationError);

    SimulationEngine no_bars(hub_, signals_);
    EXPECT_THROW(no_bars.create(backtest_config()), ValidationError);
    EXPECT_TRUE(engine->list().empty());
}

TEST_F(SimulationEngineTest, BacktestRunsToEndOfDataAndReports) {
    auto engine = make_engine({}, std::make_shared<FirstBuySignals>());
    std::mutex events_mutex;
    std::vector<SessionEventType> types;
    engine->add_event_callback([&](const SessionEvent& ev) {
        std::lock_guard<std::mutex> lock(events_mutex);
        types.push_back(ev.type);
    });

    auto snap = engine->create(backtest_config(), std::string("bt-1"));
    ASSERT_NE(snap, nullptr);
    EXPECT_EQ(snap->id, "bt-1");
    ASSERT_TRUE(reaches(*engine, "bt-1", SessionStatus::STOPPED));

    auto done = engine->get("bt-1");
    EXPECT_EQ(done->stop_reason, "end_of_data");
    EXPECT_EQ(done->events_processed, 3u);
    EXPECT_TRUE(done->open_positions.empty());
    ASSERT_EQ(done->closed_trades.size(), 1u);
    EXPECT_EQ(done->closed_trades[0].exit_reason, ExitReason::END_OF_DATA);
    EXPECT_EQ(done->closed_trades[0].realized_pnl, Decimal::from_int(979));
    EXPECT_EQ(done->current_capital, Decimal::from_int(10979));

    auto report = engine->report("bt-1");
    EXPECT_EQ(report.total_trades, 1);
    EXPECT_EQ(report.final_capital, Decimal::from_int(10979));
    EXPECT_EQ(report.exit_reasons["end_of_data"], 1);
    ASSERT_TRUE(done->report.has_value());

    std::lock_guard<std::mutex> lock(events_mutex);
    EXPECT_NE(std::find(types.begin(), types.end(), SessionEventType::POSITION_OPENED), types.end());
    EXPECT_NE(std::find(types.begin(), types.end(), SessionEventType::POSITION_CLOSED), types.end());
    EXPECT_NE(std::find(types.begin(), types.end(), SessionEventType::STATUS_CHANGED), types.end());
}

TEST_F(SimulationEngineTest, PaperSessionTradesHubEvents) {
    auto engine = make_engine();
    signals_->set("BTCUSDT", "1m", Signal::BUY);
    auto id = engine->create(paper_config())->id;
    EXPECT_EQ(engine->get(id)->status, SessionStatus::ACTIVE);
    EXPECT_EQ(feeds_.created.load(), 1);
    ASSERT_NE(feeds_.last(), nullptr);

    feeds_.last()->emit(trade(1, "100"));
    ASSERT_TRUE(wait_until([&]() { return engine->get(id)->open_positions.size() == 1; }));
    EXPECT_EQ(engine->get(id)->open_positions[0].quantity, Decimal::from_int(100));

    signals_->set("BTCUSDT", "1m", Signal::SELL);
    feeds_.last()->emit(trade(2, "110"));
    ASSERT_TRUE(wait_until([&]() { return engine->get(id)->closed_trades.size() == 1; }));
    EXPECT_EQ(engine->get(id)->closed_trades[0].exit_reason, ExitReason::SIGNAL);
    EXPECT_TRUE(engine->staleness(id).has_value());
    EXPECT_TRUE(store_->load(id).has_value());
}

TEST_F(SimulationEngineTest, StopIsIdempotentAndReleasesTheFeed) {
    auto engine = make_engine();
    signals_->set("BTCUSDT", "1m", Signal::BUY);
    auto id = engine->create(paper_config())->id;
    feeds_.last()->emit(trade(1, "100"));
    ASSERT_TRUE(wait_until([&]() { return engine->get(id)->open_positions.size() == 1; }));

    engine->stop(id);
    auto snap = engine->get(id);
    EXPECT_EQ(snap->status, SessionStatus::STOPPED);
    EXPECT_EQ(snap->stop_reason, "manual");
    ASSERT_EQ(snap->closed_trades.size(), 1u);
    EXPECT_EQ(snap->closed_trades[0].exit_reason, ExitReason::MANUAL);
    EXPECT_TRUE(wait_until([&]() { return feeds_.closes.load() == 1; }));

    EXPECT_NO_THROW(engine->stop(id));
    EXPECT_EQ(engine->get(id)->closed_trades.size(), 1u);
    EXPECT_THROW(engine->pause(id), ValidationError);
    EXPECT_THROW(engine->resume(id), ValidationError);
}

TEST_F(SimulationEngineTest, PauseAndResumeToggleStatus) {
    auto engine = make_engine();
    auto id = engine->create(paper_config())->id;
    engine->pause(id);
    EXPECT_EQ(engine->get(id)->status, SessionStatus::PAUSED);
    EXPECT_NO_THROW(engine->pause(id));
    EXPECT_EQ(store_->load(id)->status, SessionStatus::PAUSED);

    engine->resume(id);
    EXPECT_EQ(engine->get(id)->status, SessionStatus::ACTIVE);

    signals_->set("BTCUSDT", "1m", Signal::BUY);
    feeds_.last()->emit(trade(1, "100"));
    EXPECT_TRUE(wait_until([&]() { return engine->get(id)->open_positions.size() == 1; }));
}

TEST_F(SimulationEngineTest, UnknownSessionsAreNotFound) {
    auto engine = make_engine();
    EXPECT_EQ(engine->get("missing"), nullptr);
    EXPECT_THROW(engine->pause("missing"), NotFoundError);
    EXPECT_THROW(engine->resume("missing"), NotFoundError);
    EXPECT_THROW(engine->stop("missing"), NotFoundError);
    EXPECT_THROW(engine->remove("missing"), NotFoundError);
    EXPECT_THROW(engine->report("missing"), NotFoundError);
    EXPECT_THROW(engine->staleness("missing"), NotFoundError);
}

TEST_F(SimulationEngineTest, RemoveRequiresStoppedUnlessForced) {
    auto engine = make_engine();
    auto id = engine->create(paper_config())->id;
    EXPECT_THROW(engine->remove(id), ValidationError);
    EXPECT_NE(engine->get(id), nullptr);

    engine->remove(id, false);
    EXPECT_EQ(engine->get(id), nullptr);
    EXPECT_FALSE(store_->load(id).has_value());
    EXPECT_TRUE(engine->list().empty());
}

TEST_F(SimulationEngineTest, EnforcesSessionLimitOnRunningSessions) {
    SimulationConfig sim;
    sim.max_sessions = 1;
    auto engine = make_engine(sim);
    auto first = engine->create(paper_config())->id;
    EXPECT_THROW(engine->create(paper_config("ETHUSDT")), ValidationError);

    engine->stop(first);
    EXPECT_NO_THROW(engine->create(paper_config("ETHUSDT")));
    EXPECT_EQ(engine->list().size(), 2u);
}

TEST_F(SimulationEngineTest, DuplicateIdIsRejected) {
    auto engine = make_engine();
    engine->create(paper_config(), std::string("dup"));
    EXPECT_THROW(engine->create(paper_config(), std::string("dup")), ValidationError);
}

TEST_F(SimulationEngineTest, FailingSessionDoesNotDisturbOthers) {
    auto engine = make_engine();
    auto paper = engine->create(paper_config())->id;
    auto bad = engine->create(backtest_config("BADUSDT"))->id;
    ASSERT_TRUE(reaches(*engine, bad, SessionStatus::STOPPED));
    EXPECT_EQ(engine->get(bad)->stop_reason.rfind("error: ", 0), 0u);
    EXPECT_EQ(engine->get(paper)->status, SessionStatus::ACTIVE);

    signals_->set("BTCUSDT", "1m", Signal::BUY);
    feeds_.last()->emit(trade(1, "100"));
    EXPECT_TRUE(wait_until([&]() { return engine->get(paper)->open_positions.size() == 1; }));
}

TEST_F(SimulationEngineTest, RestoresPersistedSessions) {
    SessionSnapshot paper;
    paper.id = "paper-1";
    paper.config = paper_config();
    paper.status = SessionStatus::ACTIVE;
    paper.current_capital = Decimal::from_int(10000);
    paper.created_at = utils::ms_to_ts(1700000000000LL);
    ASSERT_TRUE(store_->save(paper));

    SessionSnapshot bt = paper;
    bt.id = "bt-1";
    bt.config = backtest_config();
    ASSERT_TRUE(store_->save(bt));

    SessionSnapshot done = paper;
    done.id = "done-1";
    done.status = SessionStatus::STOPPED;
    done.stop_reason = "manual";
    done.stopped_at = utils::ms_to_ts(1700000100000LL);
    ASSERT_TRUE(store_->save(done));

    auto engine = make_engine();
    EXPECT_EQ(engine->restore_from_store(), 3u);
    EXPECT_EQ(engine->restore_from_store(), 0u);

    EXPECT_EQ(engine->get("paper-1")->status, SessionStatus::ACTIVE);
    EXPECT_EQ(feeds_.created.load(), 1);
    EXPECT_EQ(engine->get("bt-1")->status, SessionStatus::STOPPED);
    EXPECT_EQ(engine->get("bt-1")->stop_reason, "interrupted");
    EXPECT_EQ(engine->get("done-1")->status, SessionStatus::STOPPED);
    EXPECT_EQ(engine->get("done-1")->stop_reason, "manual");

    signals_->set("BTCUSDT", "1m", Signal::BUY);
    feeds_.last()->emit(trade(1, "100"));
    EXPECT_TRUE(wait_until([&]() { return engine->get("paper-1")->open_positions.size() == 1; }));
}

TEST_F(SimulationEngineTest, ShutdownStopsEverySession) {
    auto engine = make_engine();
    auto a = engine->create(paper_config())->id;
    auto b = engine->create(paper_config("ETHUSDT"))->id;
    engine->shutdown();
    EXPECT_EQ(engine->get(a)->status, SessionStatus::STOPPED);
    EXPECT_EQ(engine->get(b)->status, SessionStatus::STOPPED);
    EXPECT_THROW(engine->create(paper_config()), ValidationError);
    EXPECT_NO_THROW(engine->shutdown());
}

TEST_F(SimulationEngineTest, EventsWhilePausedAreDiscarded) {
    auto engine = make_engine();
    signals_->set("BTCUSDT", "1m", Signal::BUY);
    auto id = engine->create(paper_config())->id;
    engine->pause(id);

    for (uint64_t seq = 1; seq <= 3; ++seq) feeds_.last()->emit(trade(seq, "100"));
    auto drained = [&]() {
        auto stats = hub_->stats();
        for (const auto& s : stats.streams) {
            for (const auto& sub : s.subscribers) {
                if (sub.depth > 0) return false;
            }
        }
        return true;
    };
    ASSERT_TRUE(wait_until(drained));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    engine->resume(id);
    auto snap = engine->get(id);
    EXPECT_EQ(snap->events_discarded, 3u);
    EXPECT_EQ(snap->events_processed, 0u);
    EXPECT_TRUE(snap->open_positions.empty());
}

namespace {

// Connect blocks until released, holding create() inside its subscribe step.
class GatedAdapter : public FeedAdapter {
public:
    GatedAdapter(StreamKey key, std::atomic<bool>& entered, std::atomic<bool>& release)
        : key_(std::move(key)), entered_(entered), release_(release) {}

    ConnectResult connect() override {
        entered_.store(true);
        while (!release_.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        connected_ = true;
        return FeedHandle{"gated-" + key_.to_string(), key_};
    }
    void close() override { connected_ = false; }
    const StreamKey& key() const override { return key_; }
    bool connected() const override { return connected_.load(); }

private:
    StreamKey key_;
    std::atomic<bool>& entered_;
    std::atomic<bool>& release_;
    std::atomic<bool> connected_{false};
};

} // namespace

TEST_F(SimulationEngineTest, StopDuringCreateLeavesSessionStopped) {
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    auto hub = std::make_shared<StreamHub>(
        [&](const StreamKey& key, FeedContext) -> std::unique_ptr<FeedAdapter> {
            return std::make_unique<GatedAdapter>(key, entered, release);
        });
    auto engine = std::make_shared<SimulationEngine>(hub, signals_, store_, SimulationConfig{}, 64);

    std::thread creator([&]() { engine->create(paper_config(), std::string("pending")); });
    bool registered = wait_until([&]() { return entered.load() && engine->get("pending") != nullptr; });
    EXPECT_TRUE(registered);
    if (!registered) {
        release.store(true);
        creator.join();
        engine->shutdown();
        return;
    }

    std::atomic<bool> stopped{false};
    std::thread stopper([&]() {
        engine->stop("pending");
        stopped.store(true);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(stopped.load());
    release.store(true);

    creator.join();
    stopper.join();
    auto snap = engine->get("pending");
    ASSERT_NE(snap, nullptr);
    EXPECT_EQ(snap->status, SessionStatus::STOPPED);
    EXPECT_EQ(snap->stop_reason, "manual");
    EXPECT_EQ(store_->load("pending")->status, SessionStatus::STOPPED);
    EXPECT_TRUE(wait_until([&]() { return hub->live_adapters() == 0; }));
    engine->shutdown();
    hub->shutdown();
}
