#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <chrono>

namespace callguard {

struct StoreConfig {
    uint32_t default_ttl = 3600;                  // seconds, used when set() gets none
    uint64_t max_memory_bytes = 100ULL * 1024 * 1024;
    std::chrono::milliseconds sweep_interval{60000};  // 0 = no background sweep
};

struct StoreStats {
    uint64_t entries = 0;
    uint64_t memory_bytes = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
};

// Abstract key/value backend behind CacheLayer.
// Any method may throw; CacheLayer treats a throw as a store failure.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::string backend_name() const = 0;

    // Value for key, or nullopt when absent or expired. Bumps the access count.
    virtual std::optional<nlohmann::json> get(const std::string& key) = 0;

    // Insert or replace. An absent or zero ttl uses the default TTL.
    virtual bool set(const std::string& key, const nlohmann::json& value,
                     std::optional<uint32_t> ttl_seconds = std::nullopt) = 0;

    // Returns true if the key was present.
    virtual bool del(const std::string& key) = 0;

    virtual bool exists(const std::string& key) = 0;

    // Reset the expiry of an existing key. Returns false if absent.
    virtual bool expire(const std::string& key, uint32_t ttl_seconds) = 0;

    // Keys matching a glob pattern ('*' and '?'), anchored at both ends.
    virtual std::vector<std::string> keys(const std::string& pattern) = 0;

    // Seconds until expiry; -2 if absent, -1 if expired but not yet swept.
    virtual int64_t ttl(const std::string& key) = 0;

    // Integer increment/decrement; a missing key counts as 0. Throws
    // std::out_of_range instead of overflowing.
    virtual int64_t incr(const std::string& key) = 0;
    virtual int64_t decr(const std::string& key) = 0;

    virtual void clear() = 0;

    virtual StoreStats stats() const = 0;

    // Stop background work. Idempotent.
    virtual void shutdown() {}
};

} // namespace callguard
