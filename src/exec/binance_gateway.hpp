#pragma once

#include <memory>
#include <string>
#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>
#include <nlohmann/json.hpp>
#include "../core/config.hpp"
#include "../core/execution_gateway.hpp"
#include "../core/rate_limiter.hpp"

namespace tradeflow {

namespace binance_rest {

// Lowercase hex HMAC-SHA256 of the query string.
std::string sign(const std::string& secret, const std::string& payload);

// Venue error for a non-2xx response. `retry_after` is the Retry-After header, if any.
ExecutionError map_error(int http_status, const std::string& body, const std::string& retry_after);

// Order response (RESULT/FULL) to an ack; the average price comes from the quote quantity.
OrderAck parse_order_ack(const nlohmann::json& j);

std::vector<Balance> parse_balances(const nlohmann::json& account);

} // namespace binance_rest

/**
 * Binance spot REST trading: signed requests sent synchronously from the
 * caller's thread through a Drogon HttpClient running on its own loop.
 * A local per-minute request budget answers RateLimited before the venue does.
 */
class BinanceGateway : public ExecutionGateway {
public:
    BinanceGateway(GatewayConfig cfg, std::string api_key, std::string secret_key);
    ~BinanceGateway() override;

    // Credentials from BINANCE_API_KEY / BINANCE_SECRET_KEY; nullptr when unset or disabled.
    static std::shared_ptr<BinanceGateway> from_env(const GatewayConfig& cfg);

    std::string venue() const override { return "binance"; }
    ExecResult<OrderAck> place_order(const OrderRequest& req) override;
    ExecResult<bool> cancel_order(const std::string& symbol, const std::string& order_id) override;
    ExecResult<std::vector<Balance>> get_balances() override;
    ExecResult<std::vector<VenuePosition>> get_positions() override;

private:
    ExecResult<nlohmann::json> send_signed(drogon::HttpMethod method, const std::string& path, std::string query);

    GatewayConfig cfg_;
    std::string api_key_;
    std::string secret_key_;
    trantor::EventLoopThread loop_thread_;
    drogon::HttpClientPtr client_;
    RateLimiter limiter_;
};

} // namespace tradeflow
