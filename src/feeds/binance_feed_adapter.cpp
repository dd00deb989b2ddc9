#include "binance_feed_adapter.hpp"
#include "binance_format.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace tradeflow {

namespace {

std::atomic<uint64_t> next_adapter_seq{1};

using tls_client_t = websocketpp::client<websocketpp::config::asio_tls_client>;
using plain_client_t = websocketpp::client<websocketpp::config::asio_client>;

void install_transport(tls_client_t& client, const std::string& host, const std::string& stream) {
    namespace ssl = websocketpp::lib::asio::ssl;
    client.set_tls_init_handler([stream](websocketpp::connection_hdl) {
        auto ctx = websocketpp::lib::make_shared<ssl::context>(ssl::context::tlsv12_client);
        try {
            ctx->set_options(ssl::context::default_workarounds |
                             ssl::context::no_sslv2 |
                             ssl::context::no_sslv3 |
                             ssl::context::single_dh_use);
            ctx->set_default_verify_paths();
            ctx->set_verify_mode(ssl::verify_peer);
        } catch (const std::exception& e) {
            spdlog::error("Binance {}: TLS init failed: {}", stream, e.what());
        }
        return ctx;
    });
    client.set_socket_init_handler(
        [host](websocketpp::connection_hdl,
               ssl::stream<websocketpp::lib::asio::ip::tcp::socket>& s) {
            // Binance requires SNI.
            SSL_set_tlsext_host_name(s.native_handle(), host.c_str());
        });
}

void install_transport(plain_client_t&, const std::string&, const std::string&) {}

bool is_plain_ws(const std::string& base) {
    return base.rfind("ws://", 0) == 0;
}

} // namespace

template <typename Config>
BasicBinanceFeedAdapter<Config>::BasicBinanceFeedAdapter(StreamKey key, FeedContext ctx, FeedConfig cfg)
    : key_(std::move(key))
    , ctx_(std::move(ctx))
    , cfg_(std::move(cfg))
    , backoff_(std::chrono::milliseconds(cfg_.reconnect_base_ms),
               std::chrono::milliseconds(cfg_.reconnect_cap_ms)) {
    adapter_id_ = fmt::format("binance-{}-{}", stream(), next_adapter_seq.fetch_add(1));
}

template <typename Config>
BasicBinanceFeedAdapter<Config>::~BasicBinanceFeedAdapter() {
    close();
}

template <typename Config>
std::string BasicBinanceFeedAdapter<Config>::url() const {
    const auto& base = binance_format::is_futures_stream(key_.kind) ? cfg_.futures_ws_url : cfg_.spot_ws_url;
    return base + "/ws";
}

template <typename Config>
std::string BasicBinanceFeedAdapter<Config>::stream() const {
    return binance_format::stream_name(key_, cfg_.kline_interval);
}

AdapterFactory binance_adapter_factory(FeedConfig cfg) {
    return [cfg](const StreamKey& key, FeedContext ctx) -> std::unique_ptr<FeedAdapter> {
        const auto& base = binance_format::is_futures_stream(key.kind) ? cfg.futures_ws_url : cfg.spot_ws_url;
        if (is_plain_ws(base)) {
            return std::make_unique<PlainBinanceFeedAdapter>(key, std::move(ctx), cfg);
        }
        return std::make_unique<BinanceFeedAdapter>(key, std::move(ctx), cfg);
    };
}

template <typename Config>
ConnectResult BasicBinanceFeedAdapter<Config>::connect() {
    if (running_.exchange(true)) return FeedHandle{adapter_id_, key_};

    try {
        websocketpp::uri parsed(url());

        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.clear_error_channels(websocketpp::log::elevel::all);
        client_.init_asio();
        client_.start_perpetual();

        install_transport(client_, parsed.get_host(), stream());
        client_.set_open_handler([this](websocketpp::connection_hdl hdl) { on_open(hdl); });
        client_.set_message_handler(
            [this](websocketpp::connection_hdl hdl, typename client_t::message_ptr msg) { on_message(hdl, msg); });
        client_.set_close_handler([this](websocketpp::connection_hdl hdl) { on_close(hdl); });
        client_.set_fail_handler([this](websocketpp::connection_hdl hdl) { on_fail(hdl); });

        websocketpp::lib::error_code ec;
        auto con = client_.get_connection(url(), ec);
        if (ec) {
            running_.store(false);
            return ConnectionError{fmt::format("{}: {}", url(), ec.message()), false};
        }
        {
            std::lock_guard<std::mutex> lock(hdl_mutex_);
            hdl_ = con->get_handle();
        }
        client_.connect(con);
    } catch (const std::exception& e) {
        running_.store(false);
        return ConnectionError{e.what(), true};
    }

    thread_ = std::make_unique<std::thread>([this]() {
        try {
            client_.run();
        } catch (const std::exception& e) {
            spdlog::error("Binance {}: I/O loop terminated: {}", stream(), e.what());
            connected_.store(false);
        }
    });
    spdlog::info("Binance {}: connecting to {}", stream(), url());
    return FeedHandle{adapter_id_, key_};
}

template <typename Config>
void BasicBinanceFeedAdapter<Config>::close() {
    if (!running_.exchange(false)) return;
    client_.stop_perpetual();
    {
        std::lock_guard<std::mutex> lock(hdl_mutex_);
        websocketpp::lib::error_code ec;
        if (connected_.load()) {
            client_.close(hdl_, websocketpp::close::status::going_away, "unsubscribed", ec);
        }
    }
    client_.stop();
    if (thread_ && thread_->joinable()) thread_->join();
    connected_.store(false);
    spdlog::info("Binance {}: closed after {} reconnects ({} out-of-order events dropped)",
                 stream(), reconnects_.load(), sequencer_.rejected());
}

template <typename Config>
void BasicBinanceFeedAdapter<Config>::open_connection() {
    if (!running_.load()) return;
    websocketpp::lib::error_code ec;
    auto con = client_.get_connection(url(), ec);
    if (ec) {
        schedule_reconnect(ec.message());
        return;
    }
    {
        std::lock_guard<std::mutex> lock(hdl_mutex_);
        hdl_ = con->get_handle();
    }
    client_.connect(con);
}

template <typename Config>
void BasicBinanceFeedAdapter<Config>::schedule_reconnect(const std::string& why) {
    if (!running_.load()) return;
    auto delay = backoff_.next_delay();
    reconnects_.fetch_add(1);
    spdlog::warn("Binance {}: connection lost ({}), reconnect {} in {}ms",
                 stream(), why, backoff_.attempt(), delay.count());
    reconnect_timer_ = client_.set_timer(delay.count(), [this](const websocketpp::lib::error_code& ec) {
        if (ec) return;  // cancelled on close
        open_connection();
    });
}

template <typename Config>
void BasicBinanceFeedAdapter<Config>::on_open(websocketpp::connection_hdl hdl) {
    connected_.store(true);
    bool was_reconnect = backoff_.attempt() > 0;
    backoff_.reset();
    if (!ctx_.has_subscribers || ctx_.has_subscribers(key_)) {
        websocketpp::lib::error_code ec;
        client_.send(hdl, binance_format::subscribe_message({stream()}, ++request_id_),
                     websocketpp::frame::opcode::text, ec);
        if (ec) {
            spdlog::warn("Binance {}: subscribe failed: {}", stream(), ec.message());
        }
    } else {
        spdlog::info("Binance {}: no subscribers left, not resubscribing", stream());
    }
    if (was_reconnect) {
        spdlog::warn("Binance {}: reconnected", stream());
    } else {
        spdlog::info("Binance {}: connected", stream());
    }
}

template <typename Config>
void BasicBinanceFeedAdapter<Config>::on_message(websocketpp::connection_hdl,
                                                 typename client_t::message_ptr msg) {
    auto ev = binance_format::parse_message(msg->get_payload(), key_.kind);
    if (!ev) return;
    if (ev->symbol != key_.symbol) {
        spdlog::debug("Binance {}: dropping event for {}", stream(), ev->symbol);
        return;
    }
    if (!sequencer_.admit(*ev)) {
        spdlog::debug("Binance {}: dropping out-of-order event seq={}", stream(), ev->sequence);
        return;
    }
    if (ctx_.sink) ctx_.sink(*ev);
}

template <typename Config>
void BasicBinanceFeedAdapter<Config>::on_close(websocketpp::connection_hdl hdl) {
    connected_.store(false);
    auto con = client_.get_con_from_hdl(hdl);
    schedule_reconnect(fmt::format("closed: {} {}", con->get_remote_close_code(), con->get_remote_close_reason()));
}

template <typename Config>
void BasicBinanceFeedAdapter<Config>::on_fail(websocketpp::connection_hdl hdl) {
    connected_.store(false);
    auto con = client_.get_con_from_hdl(hdl);
    schedule_reconnect(con->get_ec().message());
}

template class BasicBinanceFeedAdapter<websocketpp::config::asio_tls_client>;
template class BasicBinanceFeedAdapter<websocketpp::config::asio_client>;

} // namespace tradeflow
