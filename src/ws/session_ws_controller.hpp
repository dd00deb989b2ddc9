#pragma once

#include <drogon/WebSocketController.h>
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "../core/config.hpp"
#include "../core/simulation_engine.hpp"

namespace tradeflow {

/**
 * Pushes session events (positions opened and closed, alerts, equity samples,
 * status changes) to WebSocket clients.
 *
 * Clients connect to /ws/sessions, optionally with ?session_id=<id> to follow
 * one session, and may change the filter later with
 * {"action":"follow","session_id":"..."}. When an auth token is configured it
 * is accepted as a bearer header or a `token` query parameter.
 */
class SessionWsController : public drogon::WebSocketController<SessionWsController> {
public:
    static const bool isAutoCreation = false;

    static void init(std::shared_ptr<SimulationEngine> engine, const AuthConfig& auth);
    static void shutdown();

    // Sends the event to every client whose filter matches.
    static void broadcast(const SessionEvent& ev);

    void handleNewConnection(const drogon::HttpRequestPtr& req,
                             const drogon::WebSocketConnectionPtr& conn) override;
    void handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn) override;
    void handleNewMessage(const drogon::WebSocketConnectionPtr& conn,
                          std::string&& message,
                          const drogon::WebSocketMessageType& type) override;

    WS_PATH_LIST_BEGIN
    WS_PATH_ADD("/ws/sessions");
    WS_PATH_LIST_END

private:
    static bool authorized(const drogon::HttpRequestPtr& req);
    static void send_initial_state(const drogon::WebSocketConnectionPtr& conn, const std::string& filter);

    static std::shared_ptr<SimulationEngine> engine_;
    static std::string token_;
    static std::atomic<bool> accepting_;
    static std::mutex conn_mutex_;
    // Connection -> session filter; empty follows every session.
    static std::map<drogon::WebSocketConnectionPtr, std::string> connections_;
};

} // namespace tradeflow
