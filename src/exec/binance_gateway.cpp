#include "binance_gateway.hpp"
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include "../core/utils.hpp"

using json = nlohmann::json;

namespace tradeflow {

namespace binance_rest {

std::string sign(const std::string& secret, const std::string& payload) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    HMAC(EVP_sha256(),
         secret.data(), static_cast<int>(secret.size()),
         reinterpret_cast<const unsigned char*>(payload.data()), payload.size(),
         digest, &digest_len);

    std::ostringstream out;
    for (unsigned int i = 0; i < digest_len; ++i) {
        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return out.str();
}

ExecutionError map_error(int http_status, const std::string& body, const std::string& retry_after) {
    if (http_status == 429 || http_status == 418) {
        std::chrono::milliseconds wait(1000);
        if (!retry_after.empty()) {
            try {
                wait = std::chrono::seconds(std::stoll(retry_after));
            } catch (const std::exception&) {
                spdlog::debug("Binance: unparseable Retry-After '{}'", retry_after);
            }
        }
        return exec_error::RateLimited{wait};
    }

    int code = 0;
    std::string msg = body;
    try {
        auto j = json::parse(body);
        code = j.value("code", 0);
        msg = j.value("msg", body);
    } catch (const json::exception&) {
        // Non-JSON error bodies are reported verbatim.
    }
    if (code == -2010 || code == -2018 || code == -2019) {
        return exec_error::InsufficientFunds{};
    }
    if (http_status >= 400 && http_status < 500) {
        return exec_error::RejectedByVenue{fmt::format("{} (code {})", msg, code)};
    }
    // 5xx: execution status unknown at the venue.
    return exec_error::Unknown{fmt::format("HTTP {}: {}", http_status, msg)};
}

OrderAck parse_order_ack(const json& j) {
    OrderAck ack;
    ack.order_id = std::to_string(j.at("orderId").get<int64_t>());
    ack.client_order_id = j.value("clientOrderId", "");
    ack.symbol = j.value("symbol", "");
    ack.side = j.value("side", "BUY") == "SELL" ? Side::SELL : Side::BUY;
    ack.status = j.value("status", "");
    ack.transact_time = utils::ms_to_ts(j.value("transactTime", int64_t{0}));
    ack.executed_qty = j.contains("executedQty") ? j["executedQty"].get<Decimal>() : Decimal{};
    if (ack.executed_qty.is_positive() && j.contains("cummulativeQuoteQty")) {
        Decimal quote = j["cummulativeQuoteQty"].get<Decimal>();
        if (quote.is_positive()) ack.avg_price = quote / ack.executed_qty;
    }
    return ack;
}

std::vector<Balance> parse_balances(const json& account) {
    std::vector<Balance> out;
    for (const auto& b : account.value("balances", json::array())) {
        Balance bal;
        bal.asset = b.value("asset", "");
        bal.free = b.at("free").get<Decimal>();
        bal.locked = b.at("locked").get<Decimal>();
        if (bal.free.is_zero() && bal.locked.is_zero()) continue;
        out.push_back(std::move(bal));
    }
    return out;
}

} // namespace binance_rest

BinanceGateway::BinanceGateway(GatewayConfig cfg, std::string api_key, std::string secret_key)
    : cfg_(std::move(cfg))
    , api_key_(std::move(api_key))
    , secret_key_(std::move(secret_key))
    , loop_thread_("binance-rest")
    , limiter_(cfg_.requests_per_minute, std::chrono::seconds(60)) {
    loop_thread_.run();
    client_ = drogon::HttpClient::newHttpClient(cfg_.rest_url, loop_thread_.getLoop());
}

BinanceGateway::~BinanceGateway() {
    client_.reset();
    loop_thread_.getLoop()->quit();
    loop_thread_.wait();
}

std::shared_ptr<BinanceGateway> BinanceGateway::from_env(const GatewayConfig& cfg) {
    if (!cfg.enabled) return nullptr;
    const char* key = std::getenv("BINANCE_API_KEY");
    const char* secret = std::getenv("BINANCE_SECRET_KEY");
    if (!key || !secret || !*key || !*secret) {
        spdlog::warn("Live trading disabled: BINANCE_API_KEY / BINANCE_SECRET_KEY not set");
        return nullptr;
    }
    spdlog::info("Binance gateway enabled against {}", cfg.rest_url);
    return std::make_shared<BinanceGateway>(cfg, key, secret);
}

ExecResult<json> BinanceGateway::send_signed(drogon::HttpMethod method, const std::string& path,
                                             std::string query) {
    if (!limiter_.allow("binance")) {
        return ExecutionError{exec_error::RateLimited{limiter_.retry_after("binance")}};
    }
    if (!query.empty()) query += "&";
    query += fmt::format("recvWindow={}&timestamp={}", cfg_.recv_window_ms,
                         utils::ts_to_ms(std::chrono::system_clock::now()));
    query += "&signature=" + binance_rest::sign(secret_key_, query);

    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(method);
    req->addHeader("X-MBX-APIKEY", api_key_);
    if (method == drogon::Get) {
        req->setPathEncode(false);
        req->setPath(path + "?" + query);
    } else {
        req->setPath(path);
        req->setContentTypeCode(drogon::CT_APPLICATION_X_FORM);
        req->setBody(query);
    }

    auto [result, resp] = client_->sendRequest(req, cfg_.request_timeout_sec);
    if (result != drogon::ReqResult::Ok || !resp) {
        spdlog::warn("Binance {} {} failed: ReqResult {}", req->methodString(), path, static_cast<int>(result));
        return ExecutionError{exec_error::Disconnected{}};
    }
    int status = static_cast<int>(resp->statusCode());
    std::string body(resp->body());
    if (status < 200 || status >= 300) {
        auto err = binance_rest::map_error(status, body, resp->getHeader("retry-after"));
        spdlog::warn("Binance {} {} -> {}: {}", req->methodString(), path, status, describe(err));
        return err;
    }
    try {
        return json::parse(body);
    } catch (const json::exception& e) {
        return ExecutionError{exec_error::Unknown{std::string("bad response body: ") + e.what()}};
    }
}

ExecResult<OrderAck> BinanceGateway::place_order(const OrderRequest& req) {
    std::string query = fmt::format("symbol={}&side={}&type={}&quantity={}&newOrderRespType=RESULT",
                                    utils::to_upper(req.symbol),
                                    req.side == Side::BUY ? "BUY" : "SELL",
                                    req.type == OrderType::LIMIT ? "LIMIT" : "MARKET",
                                    req.quantity.to_string());
    if (req.type == OrderType::LIMIT) {
        if (!req.limit_price) return ExecutionError{exec_error::RejectedByVenue{"limit order without price"}};
        query += fmt::format("&timeInForce=GTC&price={}", req.limit_price->to_string());
    }
    if (!req.client_order_id.empty()) query += "&newClientOrderId=" + req.client_order_id;

    auto result = send_signed(drogon::Post, "/api/v3/order", std::move(query));
    if (auto* err = std::get_if<ExecutionError>(&result)) return *err;
    try {
        auto ack = binance_rest::parse_order_ack(std::get<json>(result));
        spdlog::info("Binance order {} {} {} {} status={} executed={}",
                     ack.order_id, ack.symbol, to_string(req.side), req.quantity.to_string(),
                     ack.status, ack.executed_qty.to_string());
        return ack;
    } catch (const std::exception& e) {
        return ExecutionError{exec_error::Unknown{std::string("unexpected order response: ") + e.what()}};
    }
}

ExecResult<bool> BinanceGateway::cancel_order(const std::string& symbol, const std::string& order_id) {
    auto result = send_signed(drogon::Delete, "/api/v3/order",
                              fmt::format("symbol={}&orderId={}", utils::to_upper(symbol), order_id));
    if (auto* err = std::get_if<ExecutionError>(&result)) return *err;
    return std::get<json>(result).value("status", "") == "CANCELED";
}

ExecResult<std::vector<Balance>> BinanceGateway::get_balances() {
    auto result = send_signed(drogon::Get, "/api/v3/account", "omitZeroBalances=true");
    if (auto* err = std::get_if<ExecutionError>(&result)) return *err;
    try {
        return binance_rest::parse_balances(std::get<json>(result));
    } catch (const std::exception& e) {
        return ExecutionError{exec_error::Unknown{std::string("unexpected account response: ") + e.what()}};
    }
}

// Spot accounts hold assets, not positions: every non-zero balance is reported as a long.
ExecResult<std::vector<VenuePosition>> BinanceGateway::get_positions() {
    auto balances = get_balances();
    if (auto* err = std::get_if<ExecutionError>(&balances)) return *err;
    std::vector<VenuePosition> out;
    for (const auto& b : std::get<std::vector<Balance>>(balances)) {
        out.push_back(VenuePosition{b.asset, b.free + b.locked, Decimal{}});
    }
    return out;
}

} // namespace tradeflow
