#include "session_ws_controller.hpp"
#include "../core/session_json.hpp"
#include "../core/utils.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <vector>

namespace tradeflow {

std::shared_ptr<SimulationEngine> SessionWsController::engine_;
std::string SessionWsController::token_;
std::atomic<bool> SessionWsController::accepting_{false};
std::mutex SessionWsController::conn_mutex_;
std::map<drogon::WebSocketConnectionPtr, std::string> SessionWsController::connections_;

void SessionWsController::init(std::shared_ptr<SimulationEngine> engine, const AuthConfig& auth) {
    engine_ = std::move(engine);
    token_ = auth.token;
    accepting_.store(true);
    engine_->add_event_callback([](const SessionEvent& ev) { broadcast(ev); });
    spdlog::info("SessionWsController initialized");
}

void SessionWsController::shutdown() {
    accepting_.store(false);
    std::map<drogon::WebSocketConnectionPtr, std::string> conns;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        conns.swap(connections_);
    }
    for (const auto& kv : conns) {
        if (kv.first && kv.first->connected()) kv.first->shutdown(drogon::CloseCode::kNormalClosure, "server shutdown");
    }
}

bool SessionWsController::authorized(const drogon::HttpRequestPtr& req) {
    if (token_.empty()) return true;
    if (req->getHeader("authorization") == "Bearer " + token_) return true;
    return req->getParameter("token") == token_;
}

void SessionWsController::handleNewConnection(const drogon::HttpRequestPtr& req,
                                              const drogon::WebSocketConnectionPtr& conn) {
    if (!accepting_.load() || !authorized(req)) {
        spdlog::warn("Session WebSocket rejected from {}", req->getPeerAddr().toIp());
        conn->shutdown(drogon::CloseCode::kViolation, "unauthorized");
        return;
    }
    std::string filter = req->getParameter("session_id");
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        connections_[conn] = filter;
    }
    spdlog::info("Session WebSocket client connected from {}{}", req->getPeerAddr().toIp(),
                 filter.empty() ? "" : " following " + filter);
    try {
        send_initial_state(conn, filter);
    } catch (const std::exception& e) {
        spdlog::error("SessionWsController initial state failed: {}", e.what());
    }
}

void SessionWsController::handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    connections_.erase(conn);
    spdlog::debug("Session WebSocket client disconnected, {} clients remaining", connections_.size());
}

void SessionWsController::handleNewMessage(const drogon::WebSocketConnectionPtr& conn,
                                           std::string&& message,
                                           const drogon::WebSocketMessageType& type) {
    if (type == drogon::WebSocketMessageType::Ping) {
        conn->send(message, drogon::WebSocketMessageType::Pong);
        return;
    }
    if (message.empty()) return;

    try {
        auto msg = nlohmann::json::parse(message);
        std::string action = msg.value("action", "");
        if (action == "ping") {
            nlohmann::json pong;
            pong["type"] = "pong";
            pong["timestamp"] = utils::ts_to_ms(std::chrono::system_clock::now());
            conn->send(pong.dump());
        } else if (action == "follow") {
            std::string filter = msg.value("session_id", "");
            {
                std::lock_guard<std::mutex> lock(conn_mutex_);
                auto it = connections_.find(conn);
                if (it == connections_.end()) return;
                it->second = filter;
            }
            send_initial_state(conn, filter);
        } else if (action == "get_all") {
            std::string filter;
            {
                std::lock_guard<std::mutex> lock(conn_mutex_);
                auto it = connections_.find(conn);
                if (it != connections_.end()) filter = it->second;
            }
            send_initial_state(conn, filter);
        }
    } catch (const std::exception& e) {
        spdlog::warn("SessionWs: failed to handle message: {}", e.what());
    }
}

void SessionWsController::send_initial_state(const drogon::WebSocketConnectionPtr& conn,
                                             const std::string& filter) {
    if (!engine_) return;
    nlohmann::json state;
    state["type"] = "initial_state";
    state["sessions"] = nlohmann::json::array();
    for (const auto& snap : engine_->list()) {
        if (!filter.empty() && snap->id != filter) continue;
        state["sessions"].push_back(snapshot_summary(*snap));
    }
    conn->send(state.dump());
}

void SessionWsController::broadcast(const SessionEvent& ev) {
    nlohmann::json msg{{"type", "session_event"}, {"event", ev}};
    std::string payload = msg.dump();

    std::vector<drogon::WebSocketConnectionPtr> targets;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        for (const auto& kv : connections_) {
            if (kv.second.empty() || kv.second == ev.session_id) targets.push_back(kv.first);
        }
    }

    std::vector<drogon::WebSocketConnectionPtr> stale;
    for (const auto& conn : targets) {
        if (!conn || !conn->connected()) {
            stale.push_back(conn);
            continue;
        }
        try {
            conn->send(payload);
        } catch (const std::exception& e) {
            spdlog::warn("SessionWs: send failed, removing connection: {}", e.what());
            stale.push_back(conn);
        }
    }

    if (!stale.empty()) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        for (const auto& conn : stale) connections_.erase(conn);
    }
}

} // namespace tradeflow
