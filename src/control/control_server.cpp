#include "control_server.hpp"
#include "../core/errors.hpp"
#include "../core/performance.hpp"
#include "../core/session_json.hpp"
#include "../core/utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

namespace tradeflow {

namespace {

size_t limit_param(const drogon::HttpRequestPtr& req, size_t fallback) {
    auto raw = req->getParameter("limit");
    if (raw.empty()) return fallback;
    try {
        long long v = std::stoll(raw);
        return v > 0 ? static_cast<size_t>(v) : fallback;
    } catch (const std::exception&) {
        throw ValidationError("limit must be a positive integer");
    }
}

bool flag_param(const drogon::HttpRequestPtr& req, const std::string& name, bool fallback) {
    auto raw = utils::to_lower(req->getParameter(name));
    if (raw.empty()) return fallback;
    return raw == "1" || raw == "true" || raw == "yes";
}

// Newest `limit` elements, oldest first.
template <typename T>
json tail(const std::vector<T>& items, size_t limit) {
    json arr = json::array();
    size_t start = items.size() > limit ? items.size() - limit : 0;
    for (size_t i = start; i < items.size(); ++i) arr.push_back(items[i]);
    return arr;
}

json metrics_json(const PerformanceMetrics& m) {
    return json{
        {"total_return", m.total_return},
        {"max_drawdown", m.max_drawdown},
        {"sharpe", m.sharpe},
        {"volatility", m.volatility}
    };
}

} // namespace

ControlServer::ControlServer(std::shared_ptr<SimulationEngine> engine,
                             std::shared_ptr<StreamHub> hub,
                             std::shared_ptr<SignalBoard> signals,
                             const Config& cfg)
    : engine_(std::move(engine))
    , hub_(std::move(hub))
    , signals_(std::move(signals))
    , cfg_(cfg) {
    engine_->add_event_callback([this](const SessionEvent& ev) { on_event(ev); });
}

drogon::HttpResponsePtr ControlServer::unauthorized() {
    return json_resp(json{{"error", "unauthorized"}}, 401);
}

drogon::HttpResponsePtr ControlServer::json_resp(json body, int code) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(code));
    resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    resp->setBody(body.dump());
    return resp;
}

bool ControlServer::authorize(const drogon::HttpRequestPtr& req) {
    if (cfg_.auth.token.empty()) return true;
    auto ip = req->getPeerAddr().toIp();
    if (!limiter_.allow(ip)) {
        return false;
    }
    auto auth = req->getHeader("authorization");
    std::string expected = "Bearer " + cfg_.auth.token;
    return auth == expected;
}

void ControlServer::guarded(const char* what, Callback& callback,
                            const std::function<drogon::HttpResponsePtr()>& fn) {
    try {
        callback(fn());
    } catch (const NotFoundError& e) {
        callback(json_resp(json{{"error", e.what()}}, 404));
    } catch (const ValidationError& e) {
        spdlog::warn("{} rejected: {}", what, e.what());
        callback(json_resp(json{{"error", e.what()}}, 400));
    } catch (const json::exception& e) {
        callback(json_resp(json{{"error", std::string("invalid JSON: ") + e.what()}}, 400));
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", what, e.what());
        callback(json_resp(json{{"error", e.what()}}, 500));
    }
}

std::shared_ptr<const SessionSnapshot> ControlServer::require(const std::string& session_id) const {
    auto snap = engine_->get(session_id);
    if (!snap) throw NotFoundError("session not found: " + session_id);
    return snap;
}

void ControlServer::health(const drogon::HttpRequestPtr&, Callback &&callback) {
    callback(json_resp(json{
        {"status", "ok"},
        {"sessions", engine_->list().size()},
        {"live_adapters", hub_->live_adapters()}
    }));
}

void ControlServer::createSession(const drogon::HttpRequestPtr& req, Callback &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    guarded("create_session", callback, [&]() {
        auto body = req->getBody();
        json j = body.empty() ? json::object() : json::parse(body);
        if (!j.is_object()) throw ValidationError("request body must be a JSON object");
        auto cfg = session_config_from_request(j, engine_->default_config());
        std::optional<std::string> requested_id;
        if (j.contains("session_id") && !j["session_id"].is_null()) {
            requested_id = j["session_id"].get<std::string>();
        }
        auto snap = engine_->create(cfg, requested_id);
        return json_resp(snapshot_summary(*snap), 201);
    });
}

void ControlServer::listSessions(const drogon::HttpRequestPtr& req, Callback &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    auto status_filter = utils::to_lower(req->getParameter("status"));
    json arr = json::array();
    for (const auto& s : engine_->list()) {
        if (!status_filter.empty() && status_filter != to_string(s->status)) continue;
        arr.push_back(snapshot_summary(*s));
    }
    callback(json_resp(arr));
}

void ControlServer::getSession(const drogon::HttpRequestPtr& req, Callback &&callback,
                               std::string session_id) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    guarded("get_session", callback, [&]() {
        auto snap = require(session_id);
        json out = snapshot_summary(*snap);
        out["config"] = snap->config;
        out["positions"] = snap->open_positions;
        out["last_price"] = snap->last_price ? json(*snap->last_price) : json(nullptr);
        out["last_event_time"] = snap->last_event_time ? json(utils::ts_to_iso(*snap->last_event_time))
                                                       : json(nullptr);
        out["stopped_at"] = snap->stopped_at ? json(utils::ts_to_iso(*snap->stopped_at)) : json(nullptr);
        out["stop_reason"] = snap->stop_reason;
        return json_resp(out);
    });
}

void ControlServer::deleteSession(const drogon::HttpRequestPtr& req, Callback &&callback,
                                  std::string session_id) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    guarded("delete_session", callback, [&]() {
        engine_->remove(session_id, flag_param(req, "only_if_stopped", true));
        {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.erase(session_id);
        }
        return json_resp(json{{"id", session_id}, {"deleted", true}});
    });
}

void ControlServer::pause(const drogon::HttpRequestPtr& req, Callback &&callback,
                          std::string session_id) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    guarded("pause", callback, [&]() {
        engine_->pause(session_id);
        return json_resp(snapshot_summary(*require(session_id)));
    });
}

void ControlServer::resume(const drogon::HttpRequestPtr& req, Callback &&callback,
                           std::string session_id) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    guarded("resume", callback, [&]() {
        engine_->resume(session_id);
        return json_resp(snapshot_summary(*require(session_id)));
    });
}

void ControlServer::stop(const drogon::HttpRequestPtr& req, Callback &&callback,
                         std::string session_id) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    guarded("stop", callback, [&]() {
        engine_->stop(session_id);
        return json_resp(snapshot_summary(*require(session_id)));
    });
}

void ControlServer::trades(const drogon::HttpRequestPtr& req, Callback &&callback,
                           std::string session_id) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    guarded("trades", callback, [&]() {
        auto snap = require(session_id);
        size_t limit = limit_param(req, snap->closed_trades.size());
        return json_resp(json{
            {"id", session_id},
            {"open", snap->open_positions},
            {"closed", tail(snap->closed_trades, limit)}
        });
    });
}

void ControlServer::equity(const drogon::HttpRequestPtr& req, Callback &&callback,
                           std::string session_id) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    guarded("equity", callback, [&]() {
        auto snap = require(session_id);
        size_t limit = limit_param(req, snap->equity_curve.size());
        return json_resp(json{{"id", session_id}, {"points", tail(snap->equity_curve, limit)}});
    });
}

void ControlServer::stats(const drogon::HttpRequestPtr& req, Callback &&callback,
                          std::string session_id) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    guarded("stats", callback, [&]() {
        auto snap = require(session_id);
        auto stale = engine_->staleness(session_id);
        json out{
            {"id", session_id},
            {"status", to_string(snap->status)},
            {"events_processed", snap->events_processed},
            {"events_discarded", snap->events_discarded},
            {"staleness_ms", stale ? json(stale->count()) : json(nullptr)},
            {"open_positions", snap->open_positions.size()},
            {"closed_trades", snap->closed_trades.size()},
            {"current_capital", snap->current_capital},
            {"metrics", metrics_json(compute_metrics(snap->equity_curve))}
        };
        return json_resp(out);
    });
}

void ControlServer::report(const drogon::HttpRequestPtr& req, Callback &&callback,
                           std::string session_id) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    guarded("report", callback, [&]() {
        json out = engine_->report(session_id);
        out["id"] = session_id;
        return json_resp(out);
    });
}

void ControlServer::events(const drogon::HttpRequestPtr& req, Callback &&callback,
                           std::string session_id) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    guarded("events", callback, [&]() {
        require(session_id);
        size_t limit = limit_param(req, 100);
        json arr = json::array();
        std::lock_guard<std::mutex> lock(events_mutex_);
        auto it = events_.find(session_id);
        if (it != events_.end()) {
            const auto& dq = it->second;
            size_t start = dq.size() > limit ? dq.size() - limit : 0;
            for (size_t i = start; i < dq.size(); ++i) arr.push_back(dq[i]);
        }
        return json_resp(arr);
    });
}

void ControlServer::hubStats(const drogon::HttpRequestPtr& req, Callback &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    auto s = hub_->stats();
    json streams = json::array();
    for (const auto& st : s.streams) {
        json subs = json::array();
        for (const auto& sub : st.subscribers) {
            subs.push_back({{"id", sub.id}, {"depth", sub.depth}, {"dropped", sub.dropped}});
        }
        streams.push_back({
            {"symbol", st.key.symbol},
            {"kind", to_string(st.key.kind)},
            {"adapter_live", st.adapter_live},
            {"connected", st.adapter_connected},
            {"reconnects", st.reconnects},
            {"events_published", st.events_published},
            {"last_error", st.last_error},
            {"subscribers", subs}
        });
    }
    callback(json_resp(json{
        {"live_adapters", s.live_adapters},
        {"subscriptions", s.subscriptions},
        {"streams", streams}
    }));
}

void ControlServer::setSignal(const drogon::HttpRequestPtr& req, Callback &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    guarded("set_signal", callback, [&]() {
        json j = json::parse(req->getBody());
        auto symbol = j.value("symbol", "");
        if (symbol.empty()) throw ValidationError("symbol is required");
        auto timeframe = j.value("timeframe", cfg_.simulation.signal_timeframe);
        auto signal = parse_signal(j.value("signal", ""));
        if (!signal) throw ValidationError("signal must be BUY, SELL or NEUTRAL");
        std::optional<std::chrono::seconds> ttl;
        if (j.contains("ttl_sec") && !j["ttl_sec"].is_null()) {
            int64_t secs = j["ttl_sec"].get<int64_t>();
            if (secs <= 0) throw ValidationError("ttl_sec must be positive");
            ttl = std::chrono::seconds(secs);
        }
        signals_->set(symbol, timeframe, *signal, ttl);
        spdlog::debug("Signal {} {} -> {}", utils::to_upper(symbol), timeframe, to_string(*signal));
        return json_resp(json{
            {"symbol", utils::to_upper(symbol)},
            {"timeframe", timeframe},
            {"signal", to_string(*signal)}
        });
    });
}

void ControlServer::listSignals(const drogon::HttpRequestPtr& req, Callback &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    json arr = json::array();
    for (const auto& e : signals_->entries()) {
        arr.push_back({
            {"symbol", e.symbol},
            {"timeframe", e.timeframe},
            {"signal", to_string(e.signal)},
            {"updated_at", utils::ts_to_iso(e.updated_at)},
            {"expires_at", e.expires_at ? json(utils::ts_to_iso(*e.expires_at)) : json(nullptr)}
        });
    }
    callback(json_resp(arr));
}

void ControlServer::on_event(const SessionEvent& ev) {
    if (ev.type == SessionEventType::EQUITY_SAMPLE) return;
    json j = ev;
    std::lock_guard<std::mutex> lock(events_mutex_);
    auto& dq = events_[ev.session_id];
    dq.push_back(std::move(j));
    if (dq.size() > max_events_per_session_) dq.pop_front();
}

} // namespace tradeflow
