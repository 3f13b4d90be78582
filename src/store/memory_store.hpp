#pragma once
#include "../store.hpp"
#include "../util.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace callguard {

// In-process bounded TTL store.
//
// Entries expire lazily on read and eagerly through a background sweep thread
// that runs every sweep_interval until shutdown(). When an insert would push
// the accounted size past max_memory_bytes, entries are evicted oldest-created
// first (insertion recency, not access recency).
class MemoryStore : public CacheStore {
public:
    // Fixed per-entry bookkeeping estimate (key, timestamps, map node) added
    // to the serialized value size.
    static constexpr uint64_t ENTRY_OVERHEAD = 64;

    explicit MemoryStore(StoreConfig config = {});
    ~MemoryStore() override;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    std::string backend_name() const override { return "memory"; }

    std::optional<nlohmann::json> get(const std::string& key) override;
    bool set(const std::string& key, const nlohmann::json& value,
             std::optional<uint32_t> ttl_seconds = std::nullopt) override;
    bool del(const std::string& key) override;
    bool exists(const std::string& key) override;
    bool expire(const std::string& key, uint32_t ttl_seconds) override;
    std::vector<std::string> keys(const std::string& pattern) override;
    int64_t ttl(const std::string& key) override;
    int64_t incr(const std::string& key) override;
    int64_t decr(const std::string& key) override;
    void clear() override;
    StoreStats stats() const override;
    void shutdown() override;

    // Remove every expired entry now. Returns the number removed.
    size_t sweep();

    uint64_t access_count(const std::string& key) const;

    static uint64_t estimate_size(const nlohmann::json& value);

private:
    struct Entry {
        nlohmann::json value;
        TimePoint expires_at;
        TimePoint created_at;
        uint64_t access_count = 0;
        uint64_t size_bytes = 0;
        uint64_t sequence = 0;  // insertion order, breaks created_at ties
    };

    using EntryMap = std::unordered_map<std::string, Entry>;

    // All *_locked helpers must be called with mutex_ already held.
    void erase_locked(EntryMap::iterator it);
    bool evict_oldest_locked();
    void insert_locked(const std::string& key, nlohmann::json value,
                       TimePoint expires_at);
    int64_t add_locked(const std::string& key, int64_t delta);
    TimePoint deadline_for(std::optional<uint32_t> ttl_seconds) const;

    void sweep_loop();

    StoreConfig config_;
    EntryMap entries_;
    std::map<uint64_t, std::string> by_age_;  // sequence -> key
    uint64_t next_sequence_ = 1;
    uint64_t memory_used_ = 0;
    uint64_t evictions_ = 0;
    uint64_t expirations_ = 0;
    mutable std::mutex mutex_;

    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    std::atomic<bool> running_{false};
    std::thread sweeper_;
};

} // namespace callguard
