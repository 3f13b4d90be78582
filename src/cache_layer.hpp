#pragma once
#include "config.hpp"
#include "circuit_breaker.hpp"
#include "store.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace callguard {

class EventBus;

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t errors = 0;
    uint64_t operations = 0;
    double hit_rate = 0.0;
    bool circuit_breaker_open = false;
    size_t pending_requests = 0;
};

void to_json(nlohmann::json& j, const CacheStats& s);

using FetchFn = std::function<nlohmann::json()>;

// Best-effort cache in front of a CacheStore.
//
// Store failures never reach callers: reads degrade to misses and writes to
// no-ops, and each failure counts toward the circuit breaker. The only error
// that propagates is a failing fetch function inside get_or_set().
// Keys are namespaced with config.key_prefix before reaching the store.
class CacheLayer {
public:
    explicit CacheLayer(CacheConfig config = {}, EventBus* events = nullptr);

    // Use a caller-supplied store instead of the registry.
    CacheLayer(CacheConfig config, std::unique_ptr<CacheStore> store,
               EventBus* events = nullptr);

    ~CacheLayer();

    CacheLayer(const CacheLayer&) = delete;
    CacheLayer& operator=(const CacheLayer&) = delete;

    std::optional<nlohmann::json> get(const std::string& key);

    bool set(const std::string& key, const nlohmann::json& value,
             std::optional<uint32_t> ttl_seconds = std::nullopt);

    // Return the cached value or run fetch once per key across concurrent
    // callers. Waiters receive the same value or the same exception.
    nlohmann::json get_or_set(const std::string& key, const FetchFn& fetch,
                              std::optional<uint32_t> ttl_seconds = std::nullopt);

    bool del(const std::string& key);

    // Delete every key in this layer's namespace matching a glob pattern.
    // Keys are removed one at a time. Returns the number deleted.
    size_t invalidate_pattern(const std::string& pattern);

    void clear();

    CacheStats stats() const;

    // Stop the store's background work. Idempotent.
    void shutdown();

    CircuitBreaker& breaker() { return breaker_; }
    const CircuitBreaker& breaker() const { return breaker_; }
    CacheStore& store() { return *store_; }
    const CacheConfig& config() const { return config_; }

    std::string full_key(const std::string& key) const { return config_.key_prefix + key; }

private:
    struct PendingRequest {
        std::string key;
        std::shared_future<nlohmann::json> result;
        TimePoint started_at;
    };

    // Store read for get_or_set's owner. Failures count; hits and misses do not.
    std::optional<nlohmann::json> read_through(const std::string& key);
    void record_store_failure(const char* operation, const std::string& key,
                              const std::string& error);
    void finish_pending(const std::string& pending_key);
    void wire_breaker_events();

    CacheConfig config_;
    std::unique_ptr<CacheStore> store_;
    CircuitBreaker breaker_;
    EventBus* events_;

    std::unordered_map<std::string, PendingRequest> pending_;
    mutable std::mutex pending_mutex_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> errors_{0};
    std::atomic<uint64_t> operations_{0};
    std::atomic<bool> shut_down_{false};
};

// Wrap a callable so each call is served through layer.get_or_set().
// key_fn maps the call arguments to a logical cache key; the result type must
// be convertible to and from nlohmann::json.
//
//   auto lookup = cached(cache, [](const std::string& q) { return "search:" + q; },
//                        [&](const std::string& q) { return run_search(q); }, 600);
//   auto hits = lookup("solar panels");
template<typename KeyFn, typename Fn>
auto cached(CacheLayer& layer, KeyFn key_fn, Fn fn,
            std::optional<uint32_t> ttl_seconds = std::nullopt) {
    return [&layer, key_fn = std::move(key_fn), fn = std::move(fn), ttl_seconds](
               const auto&... args) mutable {
        using Result = std::decay_t<decltype(fn(args...))>;
        nlohmann::json value = layer.get_or_set(
            key_fn(args...),
            [&]() { return nlohmann::json(fn(args...)); },
            ttl_seconds);
        return value.template get<Result>();
    };
}

} // namespace callguard
