#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <websocketpp/config/asio_client.hpp>
#include <websocketpp/client.hpp>
#include "../core/backoff.hpp"
#include "../core/config.hpp"
#include "../core/event_sequencer.hpp"
#include "../core/feed_adapter.hpp"

namespace tradeflow {

/**
 * Binance market stream for one (symbol, kind) over a websocketpp client.
 *
 * Connects to `<base>/ws` and subscribes with the SUBSCRIBE method. Transport
 * failures schedule a reconnect on the client's own timer with jittered
 * exponential backoff; after reconnecting the stream is subscribed again only
 * while the hub still has subscribers for the key.
 *
 * Config is the websocketpp transport: asio_tls_client for wss://,
 * asio_client for plain ws:// (local relays and tests).
 */
template <typename Config>
class BasicBinanceFeedAdapter : public FeedAdapter {
public:
    BasicBinanceFeedAdapter(StreamKey key, FeedContext ctx, FeedConfig cfg);
    ~BasicBinanceFeedAdapter() override;

    ConnectResult connect() override;
    void close() override;
    const StreamKey& key() const override { return key_; }
    bool connected() const override { return connected_.load(); }
    uint64_t reconnects() const override { return reconnects_.load(); }

    std::string url() const;
    std::string stream() const;
    uint64_t rejected() const { return sequencer_.rejected(); }

private:
    using client_t = websocketpp::client<Config>;

    void open_connection();
    void schedule_reconnect(const std::string& why);
    void on_open(websocketpp::connection_hdl hdl);
    void on_message(websocketpp::connection_hdl hdl, typename client_t::message_ptr msg);
    void on_close(websocketpp::connection_hdl hdl);
    void on_fail(websocketpp::connection_hdl hdl);

    StreamKey key_;
    FeedContext ctx_;
    FeedConfig cfg_;
    std::string adapter_id_;

    client_t client_;
    std::unique_ptr<std::thread> thread_;
    std::mutex hdl_mutex_;
    websocketpp::connection_hdl hdl_;               // guarded by hdl_mutex_
    typename client_t::timer_ptr reconnect_timer_;  // I/O thread only

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<uint64_t> reconnects_{0};
    Backoff backoff_;                               // I/O thread only
    EventSequencer sequencer_;
    uint64_t request_id_{0};                        // I/O thread only
};

using BinanceFeedAdapter = BasicBinanceFeedAdapter<websocketpp::config::asio_tls_client>;
using PlainBinanceFeedAdapter = BasicBinanceFeedAdapter<websocketpp::config::asio_client>;

// Builds TLS or plain adapters from the scheme of the configured base URL.
AdapterFactory binance_adapter_factory(FeedConfig cfg);

} // namespace tradeflow
