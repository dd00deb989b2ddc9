#pragma once

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include "errors.hpp"
#include "market_event.hpp"

namespace tradeflow {

struct FeedHandle {
    std::string adapter_id;
    StreamKey key;
};

using ConnectResult = std::variant<FeedHandle, ConnectionError>;

/**
 * What the hub hands an adapter at construction.
 * `sink` receives ordered, deduplicated events. `has_subscribers` tells the
 * adapter whether a key still has at least one active subscription; it is
 * consulted on reconnect to decide what to re-subscribe.
 */
struct FeedContext {
    std::function<void(const MarketEvent&)> sink;
    std::function<bool(const StreamKey&)> has_subscribers;
};

/**
 * One exchange connection for one (symbol, kind).
 *
 * connect() starts the connection and returns once the adapter is running;
 * transport failures after that are retried internally with backoff and are
 * visible downstream only as gaps. close() is idempotent and must not be
 * called from the adapter's own I/O thread.
 */
class FeedAdapter {
public:
    virtual ~FeedAdapter() = default;
    virtual ConnectResult connect() = 0;
    virtual void close() = 0;
    virtual const StreamKey& key() const = 0;
    virtual bool connected() const = 0;
    virtual uint64_t reconnects() const { return 0; }
};

using AdapterFactory = std::function<std::unique_ptr<FeedAdapter>(const StreamKey&, FeedContext)>;

} // namespace tradeflow
