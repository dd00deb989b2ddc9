#include "stream_hub.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace tradeflow {

StreamHub::StreamHub(AdapterFactory factory, HubConfig cfg)
    : factory_(std::move(factory))
    , cfg_(cfg) {
    reaper_ = std::thread([this]() { reaper_loop(); });
}

StreamHub::~StreamHub() {
    shutdown();
}

std::pair<SubscriptionId, std::shared_ptr<DeliveryChannel>> StreamHub::subscribe(const std::string& symbol,
                                                                                  EventKind kind) {
    auto channel = std::make_shared<DeliveryChannel>(cfg_.channel_capacity);
    auto id = subscribe_into(symbol, kind, channel);
    return {id, channel};
}

SubscriptionId StreamHub::subscribe_into(const std::string& symbol, EventKind kind,
                                         std::shared_ptr<DeliveryChannel> channel) {
    if (!channel) throw std::invalid_argument("subscribe_into requires a channel");
    auto key = make_key(symbol, kind);
    auto added = add_subscriber(key, std::move(channel));
    ensure_adapter(added.second);
    spdlog::debug("Hub: subscription {} on {}", added.first, key.to_string());
    return added.first;
}

std::pair<SubscriptionId, std::shared_ptr<StreamHub::KeyEntry>> StreamHub::add_subscriber(
        const StreamKey& key, std::shared_ptr<DeliveryChannel> channel) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (shutting_down_) throw std::runtime_error("stream hub is shut down");
    auto& entry = entries_[key];
    if (!entry) {
        entry = std::make_shared<KeyEntry>();
        entry->key = key;
    }
    SubscriptionId id = next_id_++;
    {
        std::lock_guard<std::mutex> subs_lock(entry->subs_mutex);
        entry->subscribers.push_back(Subscriber{id, std::move(channel)});
    }
    sub_keys_[id] = key;
    return {id, entry};
}

void StreamHub::ensure_adapter(const std::shared_ptr<KeyEntry>& entry) {
    std::lock_guard<std::mutex> lock(entry->lifecycle_mutex);
    if (entry->retired || entry->adapter) return;

    FeedContext ctx;
    std::weak_ptr<KeyEntry> weak = entry;
    ctx.sink = [this, weak](const MarketEvent& ev) {
        if (auto e = weak.lock()) publish(e, ev);
    };
    ctx.has_subscribers = [this](const StreamKey& k) { return has_subscribers(k); };

    std::unique_ptr<FeedAdapter> adapter;
    try {
        adapter = factory_(entry->key, std::move(ctx));
    } catch (const std::exception& e) {
        entry->last_error = e.what();
        spdlog::warn("Hub: adapter factory failed for {}: {}", entry->key.to_string(), e.what());
        return;
    }
    if (!adapter) {
        entry->last_error = "no adapter available";
        spdlog::warn("Hub: no adapter available for {}", entry->key.to_string());
        return;
    }

    auto result = adapter->connect();
    if (auto* err = std::get_if<ConnectionError>(&result)) {
        entry->last_error = err->message;
        spdlog::warn("Hub: adapter for {} failed to connect: {}", entry->key.to_string(), err->message);
        adapter->close();
        return;
    }
    entry->last_error.clear();
    entry->adapter = std::move(adapter);
    live_adapters_.fetch_add(1, std::memory_order_acq_rel);
    spdlog::info("Hub: adapter {} started for {}",
                 std::get<FeedHandle>(result).adapter_id, entry->key.to_string());
}

void StreamHub::publish(const std::shared_ptr<KeyEntry>& entry, const MarketEvent& ev) {
    entry->published.fetch_add(1, std::memory_order_relaxed);
    std::vector<SubscriptionId> gone;
    {
        std::lock_guard<std::mutex> lock(entry->subs_mutex);
        for (auto& sub : entry->subscribers) {
            if (!sub.channel->push(ev)) gone.push_back(sub.id);
        }
    }
    if (gone.empty()) return;

    // Consumers that closed their channel are released implicitly. We are on the
    // adapter's thread here, so the adapter itself is closed by the reaper.
    auto emptied = remove_subscribers(gone, false);
    if (emptied.empty()) return;
    {
        std::lock_guard<std::mutex> lock(reaper_mutex_);
        for (auto& e : emptied) reap_queue_.push_back(e);
    }
    reaper_cv_.notify_one();
}

std::vector<std::shared_ptr<StreamHub::KeyEntry>> StreamHub::remove_subscribers(
        const std::vector<SubscriptionId>& ids, bool close_channels) {
    std::vector<std::shared_ptr<KeyEntry>> emptied;
    std::vector<std::shared_ptr<DeliveryChannel>> to_close;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (auto id : ids) {
            auto kit = sub_keys_.find(id);
            if (kit == sub_keys_.end()) continue;
            StreamKey key = kit->second;
            sub_keys_.erase(kit);
            auto eit = entries_.find(key);
            if (eit == entries_.end()) continue;
            auto entry = eit->second;
            bool now_empty = false;
            {
                std::lock_guard<std::mutex> subs_lock(entry->subs_mutex);
                auto& subs = entry->subscribers;
                auto it = std::find_if(subs.begin(), subs.end(),
                                       [id](const Subscriber& s) { return s.id == id; });
                if (it != subs.end()) {
                    if (close_channels) to_close.push_back(it->channel);
                    subs.erase(it);
                }
                now_empty = subs.empty();
            }
            if (now_empty) emptied.push_back(entry);
        }
    }
    for (auto& ch : to_close) ch->close();
    return emptied;
}

void StreamHub::unsubscribe(SubscriptionId id) {
    auto emptied = remove_subscribers({id}, true);
    for (auto& entry : emptied) {
        close_adapter(entry, false);
    }
}

void StreamHub::close_adapter(const std::shared_ptr<KeyEntry>& entry, bool retire) {
    std::lock_guard<std::mutex> lock(entry->lifecycle_mutex);
    if (retire) {
        entry->retired = true;
    } else if (wanted(entry)) {
        spdlog::debug("Hub: {} resubscribed before teardown, keeping adapter", entry->key.to_string());
        return;
    }
    if (entry->adapter) {
        // Closed under the lifecycle lock: a subscriber arriving now waits here
        // and starts the next adapter only after this one is gone.
        entry->adapter->close();
        entry->adapter.reset();
        live_adapters_.fetch_sub(1, std::memory_order_acq_rel);
        spdlog::info("Hub: adapter closed for {} (no subscribers left)", entry->key.to_string());
    }
    if (!retire) forget_if_unused(entry);
}

bool StreamHub::wanted(const std::shared_ptr<KeyEntry>& entry) const {
    std::lock_guard<std::mutex> lock(entry->subs_mutex);
    return !entry->subscribers.empty();
}

void StreamHub::forget_if_unused(const std::shared_ptr<KeyEntry>& entry) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = entries_.find(entry->key);
    if (it == entries_.end() || it->second != entry) return;
    std::lock_guard<std::mutex> subs_lock(entry->subs_mutex);
    if (entry->subscribers.empty()) entries_.erase(it);
}

bool StreamHub::has_subscribers(const StreamKey& key) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    std::lock_guard<std::mutex> subs_lock(it->second->subs_mutex);
    return !it->second->subscribers.empty();
}

std::vector<StreamKey> StreamHub::active_keys() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<StreamKey> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) {
        std::lock_guard<std::mutex> subs_lock(kv.second->subs_mutex);
        if (!kv.second->subscribers.empty()) out.push_back(kv.first);
    }
    return out;
}

HubStats StreamHub::stats() const {
    std::vector<std::shared_ptr<KeyEntry>> entries;
    HubStats out;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        entries.reserve(entries_.size());
        for (const auto& kv : entries_) entries.push_back(kv.second);
        out.subscriptions = sub_keys_.size();
    }
    out.live_adapters = live_adapters();
    for (const auto& entry : entries) {
        StreamStats st;
        st.key = entry->key;
        st.events_published = entry->published.load(std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(entry->lifecycle_mutex);
            st.adapter_live = entry->adapter != nullptr;
            st.adapter_connected = entry->adapter && entry->adapter->connected();
            st.reconnects = entry->adapter ? entry->adapter->reconnects() : 0;
            st.last_error = entry->last_error;
        }
        {
            std::lock_guard<std::mutex> lock(entry->subs_mutex);
            for (const auto& sub : entry->subscribers) {
                st.subscribers.push_back({sub.id, sub.channel->size(), sub.channel->dropped()});
            }
        }
        out.streams.push_back(std::move(st));
    }
    return out;
}

void StreamHub::shutdown() {
    std::vector<std::shared_ptr<KeyEntry>> entries;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        shutting_down_ = true;
        for (auto& kv : entries_) entries.push_back(kv.second);
        entries_.clear();
        sub_keys_.clear();
    }
    for (auto& entry : entries) {
        {
            std::lock_guard<std::mutex> lock(entry->subs_mutex);
            for (auto& sub : entry->subscribers) sub.channel->close();
            entry->subscribers.clear();
        }
        close_adapter(entry, true);
    }
    {
        std::lock_guard<std::mutex> lock(reaper_mutex_);
        reaper_stop_ = true;
    }
    reaper_cv_.notify_all();
    if (reaper_.joinable() && reaper_.get_id() != std::this_thread::get_id()) {
        reaper_.join();
    }
}

void StreamHub::reaper_loop() {
    while (true) {
        std::shared_ptr<KeyEntry> entry;
        {
            std::unique_lock<std::mutex> lock(reaper_mutex_);
            reaper_cv_.wait(lock, [&]{ return reaper_stop_ || !reap_queue_.empty(); });
            if (reap_queue_.empty()) return;
            entry = std::move(reap_queue_.front());
            reap_queue_.pop_front();
        }
        try {
            close_adapter(entry, false);
        } catch (const std::exception& e) {
            spdlog::error("Hub: closing adapter for {} failed: {}", entry->key.to_string(), e.what());
        }
    }
}

} // namespace tradeflow
