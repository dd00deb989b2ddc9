#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>
#include "config.hpp"
#include "delivery_channel.hpp"
#include "feed_adapter.hpp"

namespace tradeflow {

using SubscriptionId = uint64_t;

struct SubscriberStats {
    SubscriptionId id{0};
    size_t depth{0};
    uint64_t dropped{0};
};

struct StreamStats {
    StreamKey key;
    bool adapter_live{false};
    bool adapter_connected{false};
    uint64_t reconnects{0};
    uint64_t events_published{0};
    std::string last_error;
    std::vector<SubscriberStats> subscribers;
};

struct HubStats {
    size_t live_adapters{0};
    size_t subscriptions{0};
    std::vector<StreamStats> streams;
};

/**
 * Owns every feed adapter and fans their events out to subscribers.
 *
 * One adapter per (symbol, kind), shared by all subscribers of that key and
 * torn down when the last subscriber leaves. Each subscriber gets its own
 * bounded drop-oldest channel, so a slow consumer never stalls the adapter
 * or its siblings.
 */
class StreamHub {
public:
    StreamHub(AdapterFactory factory, HubConfig cfg = {});
    ~StreamHub();

    StreamHub(const StreamHub&) = delete;
    StreamHub& operator=(const StreamHub&) = delete;

    std::pair<SubscriptionId, std::shared_ptr<DeliveryChannel>> subscribe(const std::string& symbol,
                                                                          EventKind kind);

    // Subscribe into a channel the caller already owns (one session merging several kinds).
    SubscriptionId subscribe_into(const std::string& symbol, EventKind kind,
                                  std::shared_ptr<DeliveryChannel> channel);

    // Idempotent; closes the subscriber's channel.
    void unsubscribe(SubscriptionId id);

    HubStats stats() const;
    std::vector<StreamKey> active_keys() const;
    bool has_subscribers(const StreamKey& key) const;
    size_t live_adapters() const { return live_adapters_.load(std::memory_order_acquire); }

    // Closes every adapter and every channel. Further subscribe calls throw.
    void shutdown();

private:
    struct Subscriber {
        SubscriptionId id;
        std::shared_ptr<DeliveryChannel> channel;
    };

    struct KeyEntry {
        StreamKey key;
        // Adapter create/connect/close. The entry stays registered until its
        // adapter is closed, so this lock serializes the key, not just the entry.
        std::mutex lifecycle_mutex;
        std::unique_ptr<FeedAdapter> adapter;
        bool retired{false};                  // set at shutdown; guarded by lifecycle_mutex
        std::string last_error;               // guarded by lifecycle_mutex
        mutable std::mutex subs_mutex;
        std::vector<Subscriber> subscribers;  // guarded by subs_mutex
        std::atomic<uint64_t> published{0};
    };

    std::pair<SubscriptionId, std::shared_ptr<KeyEntry>> add_subscriber(const StreamKey& key,
                                                                        std::shared_ptr<DeliveryChannel> channel);
    void ensure_adapter(const std::shared_ptr<KeyEntry>& entry);
    void publish(const std::shared_ptr<KeyEntry>& entry, const MarketEvent& ev);
    // Removes ids from the registry; returns entries that lost their last subscriber.
    // Emptied entries stay in entries_ until close_adapter() has run for them.
    std::vector<std::shared_ptr<KeyEntry>> remove_subscribers(const std::vector<SubscriptionId>& ids,
                                                              bool close_channels);
    // Closes the adapter unless the key was resubscribed meanwhile, then drops the
    // entry from the registry. `retire` (shutdown) closes unconditionally and keeps
    // the entry from ever starting another adapter.
    void close_adapter(const std::shared_ptr<KeyEntry>& entry, bool retire);
    bool wanted(const std::shared_ptr<KeyEntry>& entry) const;
    void forget_if_unused(const std::shared_ptr<KeyEntry>& entry);
    void reaper_loop();

    AdapterFactory factory_;
    HubConfig cfg_;

    mutable std::mutex registry_mutex_;
    std::unordered_map<StreamKey, std::shared_ptr<KeyEntry>, StreamKeyHash> entries_;
    std::unordered_map<SubscriptionId, StreamKey> sub_keys_;
    SubscriptionId next_id_{1};
    bool shutting_down_{false};

    std::atomic<size_t> live_adapters_{0};

    // Adapters retired from their own I/O thread are closed here instead.
    std::mutex reaper_mutex_;
    std::condition_variable reaper_cv_;
    std::deque<std::shared_ptr<KeyEntry>> reap_queue_;
    bool reaper_stop_{false};
    std::thread reaper_;
};

} // namespace tradeflow
