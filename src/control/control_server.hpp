#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <drogon/HttpController.h>
#include <nlohmann/json.hpp>
#include "../core/config.hpp"
#include "../core/rate_limiter.hpp"
#include "../core/signal_provider.hpp"
#include "../core/simulation_engine.hpp"
#include "../core/stream_hub.hpp"

namespace tradeflow {

class ControlServer : public drogon::HttpController<ControlServer> {
public:
    static const bool isAutoCreation = false;
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(ControlServer::health, "/health", drogon::Get);
    ADD_METHOD_TO(ControlServer::createSession, "/sessions", drogon::Post);
    ADD_METHOD_TO(ControlServer::listSessions, "/sessions", drogon::Get);
    ADD_METHOD_TO(ControlServer::getSession, "/sessions/{1}", drogon::Get);
    ADD_METHOD_TO(ControlServer::deleteSession, "/sessions/{1}", drogon::Delete);
    ADD_METHOD_TO(ControlServer::pause, "/sessions/{1}/pause", drogon::Post);
    ADD_METHOD_TO(ControlServer::resume, "/sessions/{1}/resume", drogon::Post);
    ADD_METHOD_TO(ControlServer::stop, "/sessions/{1}/stop", drogon::Post);
    ADD_METHOD_TO(ControlServer::trades, "/sessions/{1}/trades", drogon::Get);
    ADD_METHOD_TO(ControlServer::equity, "/sessions/{1}/equity", drogon::Get);
    ADD_METHOD_TO(ControlServer::stats, "/sessions/{1}/stats", drogon::Get);
    ADD_METHOD_TO(ControlServer::report, "/sessions/{1}/report", drogon::Get);
    ADD_METHOD_TO(ControlServer::events, "/sessions/{1}/events", drogon::Get);
    ADD_METHOD_TO(ControlServer::hubStats, "/hub/stats", drogon::Get);
    ADD_METHOD_TO(ControlServer::setSignal, "/signals", drogon::Post);
    ADD_METHOD_TO(ControlServer::listSignals, "/signals", drogon::Get);
    METHOD_LIST_END

    using Callback = std::function<void (const drogon::HttpResponsePtr &)>;

    ControlServer(std::shared_ptr<SimulationEngine> engine,
                  std::shared_ptr<StreamHub> hub,
                  std::shared_ptr<SignalBoard> signals,
                  const Config& cfg);

    void health(const drogon::HttpRequestPtr& req, Callback &&callback);
    void createSession(const drogon::HttpRequestPtr& req, Callback &&callback);
    void listSessions(const drogon::HttpRequestPtr& req, Callback &&callback);
    void getSession(const drogon::HttpRequestPtr& req, Callback &&callback, std::string session_id);
    void deleteSession(const drogon::HttpRequestPtr& req, Callback &&callback, std::string session_id);
    void pause(const drogon::HttpRequestPtr& req, Callback &&callback, std::string session_id);
    void resume(const drogon::HttpRequestPtr& req, Callback &&callback, std::string session_id);
    void stop(const drogon::HttpRequestPtr& req, Callback &&callback, std::string session_id);
    void trades(const drogon::HttpRequestPtr& req, Callback &&callback, std::string session_id);
    void equity(const drogon::HttpRequestPtr& req, Callback &&callback, std::string session_id);
    void stats(const drogon::HttpRequestPtr& req, Callback &&callback, std::string session_id);
    void report(const drogon::HttpRequestPtr& req, Callback &&callback, std::string session_id);
    void events(const drogon::HttpRequestPtr& req, Callback &&callback, std::string session_id);
    void hubStats(const drogon::HttpRequestPtr& req, Callback &&callback);
    void setSignal(const drogon::HttpRequestPtr& req, Callback &&callback);
    void listSignals(const drogon::HttpRequestPtr& req, Callback &&callback);

    // Keeps the most recent events per session for polling clients.
    void on_event(const SessionEvent& ev);

    static drogon::HttpResponsePtr json_resp(nlohmann::json body, int code = 200);

private:
    bool authorize(const drogon::HttpRequestPtr& req);
    drogon::HttpResponsePtr unauthorized();
    // Runs `fn` and maps engine exceptions to HTTP errors.
    void guarded(const char* what, Callback& callback, const std::function<drogon::HttpResponsePtr()>& fn);
    std::shared_ptr<const SessionSnapshot> require(const std::string& session_id) const;

    std::shared_ptr<SimulationEngine> engine_;
    std::shared_ptr<StreamHub> hub_;
    std::shared_ptr<SignalBoard> signals_;
    Config cfg_;
    RateLimiter limiter_;

    std::mutex events_mutex_;
    std::unordered_map<std::string, std::deque<nlohmann::json>> events_;
    size_t max_events_per_session_{1000};
};

} // namespace tradeflow
