#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "decimal.hpp"
#include "market_event.hpp"

namespace tradeflow {

enum class OrderType { MARKET, LIMIT };

struct OrderRequest {
    std::string symbol;
    Side side{Side::BUY};
    Decimal quantity;
    OrderType type{OrderType::MARKET};
    std::optional<Decimal> limit_price;
    std::string client_order_id;
};

struct OrderAck {
    std::string order_id;
    std::string client_order_id;
    std::string symbol;
    Side side{Side::BUY};
    std::string status;
    Decimal executed_qty;
    std::optional<Decimal> avg_price;
    Timestamp transact_time;
};

struct Balance {
    std::string asset;
    Decimal free;
    Decimal locked;
};

struct VenuePosition {
    std::string symbol;
    Decimal quantity;     // signed: negative is short
    Decimal entry_price;
};

namespace exec_error {
struct RateLimited { std::chrono::milliseconds retry_after{0}; };
struct InsufficientFunds {};
struct RejectedByVenue { std::string reason; };
struct Disconnected {};
struct Unknown { std::string detail; };
} // namespace exec_error

// Closed set of execution failures.
using ExecutionError = std::variant<exec_error::RateLimited,
                                    exec_error::InsufficientFunds,
                                    exec_error::RejectedByVenue,
                                    exec_error::Disconnected,
                                    exec_error::Unknown>;

template <typename T>
using ExecResult = std::variant<T, ExecutionError>;

bool is_retryable(const ExecutionError& err);
std::string describe(const ExecutionError& err);

/**
 * Trading capability of one venue. Implementations own authentication and
 * transport; callers see only this interface.
 */
class ExecutionGateway {
public:
    virtual ~ExecutionGateway() = default;
    virtual std::string venue() const = 0;
    virtual ExecResult<OrderAck> place_order(const OrderRequest& req) = 0;
    virtual ExecResult<bool> cancel_order(const std::string& symbol, const std::string& order_id) = 0;
    virtual ExecResult<std::vector<Balance>> get_balances() = 0;
    virtual ExecResult<std::vector<VenuePosition>> get_positions() = 0;
};

struct RetryPolicy {
    int max_retries{3};
    std::chrono::milliseconds base{500};
    std::chrono::milliseconds cap{8000};
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * Place an order, retrying RateLimited and Disconnected with exponential
 * backoff. RateLimited waits at least the venue's retry-after. Terminal
 * errors are returned on the first occurrence.
 */
ExecResult<OrderAck> place_with_retry(ExecutionGateway& gateway,
                                      const OrderRequest& req,
                                      const RetryPolicy& policy,
                                      const Sleeper& sleep = {});

} // namespace tradeflow
