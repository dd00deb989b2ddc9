#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "session_json.hpp"
#include "session_types.hpp"

namespace tradeflow {

/**
 * Durable home of session records. The engine pushes an immutable snapshot
 * after every lifecycle transition and every close; the store never reads
 * live session state.
 */
class SessionStore {
public:
    virtual ~SessionStore() = default;
    virtual bool save(const SessionSnapshot& snapshot) = 0;
    virtual std::optional<SessionSnapshot> load(const std::string& session_id) = 0;
    virtual std::vector<SessionSnapshot> load_all() = 0;
    virtual bool remove(const std::string& session_id) = 0;
};

// Keeps serialized records in memory; the default when Postgres is disabled.
class MemorySessionStore : public SessionStore {
public:
    bool save(const SessionSnapshot& snapshot) override {
        auto record = snapshot_to_record(snapshot);
        std::lock_guard<std::mutex> lock(mutex_);
        records_[snapshot.id] = std::move(record);
        return true;
    }

    std::optional<SessionSnapshot> load(const std::string& session_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(session_id);
        if (it == records_.end()) return std::nullopt;
        return snapshot_from_record(it->second);
    }

    std::vector<SessionSnapshot> load_all() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SessionSnapshot> out;
        out.reserve(records_.size());
        for (const auto& kv : records_) out.push_back(snapshot_from_record(kv.second));
        return out;
    }

    bool remove(const std::string& session_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.erase(session_id) > 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, nlohmann::json> records_;
};

} // namespace tradeflow
