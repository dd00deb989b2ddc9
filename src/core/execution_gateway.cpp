#include "execution_gateway.hpp"
#include "backoff.hpp"
#include <algorithm>
#include <thread>
#include <spdlog/spdlog.h>

namespace tradeflow {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

bool is_retryable(const ExecutionError& err) {
    return std::holds_alternative<exec_error::RateLimited>(err) ||
           std::holds_alternative<exec_error::Disconnected>(err);
}

std::string describe(const ExecutionError& err) {
    return std::visit(overloaded{
        [](const exec_error::RateLimited& e) {
            return "rate limited (retry after " + std::to_string(e.retry_after.count()) + "ms)";
        },
        [](const exec_error::InsufficientFunds&) { return std::string("insufficient funds"); },
        [](const exec_error::RejectedByVenue& e) { return "rejected by venue: " + e.reason; },
        [](const exec_error::Disconnected&) { return std::string("disconnected"); },
        [](const exec_error::Unknown& e) { return "unknown error: " + e.detail; }
    }, err);
}

ExecResult<OrderAck> place_with_retry(ExecutionGateway& gateway,
                                      const OrderRequest& req,
                                      const RetryPolicy& policy,
                                      const Sleeper& sleep) {
    Backoff backoff(policy.base, policy.cap);
    int attempt = 0;
    while (true) {
        auto result = gateway.place_order(req);
        auto* err = std::get_if<ExecutionError>(&result);
        if (!err) return result;
        if (!is_retryable(*err) || attempt >= policy.max_retries) {
            return result;
        }
        auto delay = backoff.next_delay();
        if (auto* rl = std::get_if<exec_error::RateLimited>(err)) {
            delay = std::max(delay, rl->retry_after);
        }
        ++attempt;
        spdlog::warn("{}: order {} {} {} failed ({}), retry {}/{} in {}ms",
                     gateway.venue(), req.client_order_id, to_string(req.side), req.symbol,
                     describe(*err), attempt, policy.max_retries, delay.count());
        if (sleep) {
            sleep(delay);
        } else {
            std::this_thread::sleep_for(delay);
        }
    }
}

} // namespace tradeflow
