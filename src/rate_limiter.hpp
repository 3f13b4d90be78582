#pragma once
#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace callguard {

class EventBus;

// Per-call options. Retry fields default to RetryPolicy's values.
struct RateLimitOptions : RetryPolicy {
    std::string provider;
    std::string endpoint;
};

// Snapshot of one pooled API key.
struct KeyUsage {
    size_t index = 0;
    std::string provider;
    std::string key;
    uint64_t request_count = 0;
    uint64_t last_used_at = 0;   // epoch ms, 0 if never used
    bool blocked = false;
};

// Serializes with the key masked to its last four characters.
void to_json(nlohmann::json& j, const KeyUsage& k);

using SleepFn = std::function<void(std::chrono::milliseconds)>;
using RandomFn = std::function<double()>;   // uniform in [0, 1)

// Runs calls against rate-limited providers: spaces requests per endpoint,
// rotates through a pool of API keys per provider, and retries with backoff.
//
// A 429 or 403 ApiError blocks the key that caused it for KEY_COOLDOWN and the
// call is retried at once with the least recently used unblocked key. When
// every key is blocked the call backs off exponentially (optionally with
// jitter) and the blocks are lifted after the current delay. Other errors are
// retried after a fixed initial_delay_ms unless fail_fast is set.
class RateLimitManager {
public:
    static constexpr std::chrono::minutes KEY_COOLDOWN{5};

    explicit RateLimitManager(EventBus* events = nullptr);

    // Replace the provider's key pool. An empty list is ignored with a warning.
    void register_api_keys(const std::string& provider, const std::vector<std::string>& keys);

    // Throws std::invalid_argument if requests_per_interval is 0.
    void configure_endpoint(const std::string& endpoint, uint32_t requests_per_interval,
                            uint64_t interval_ms);

    // Register every provider pool and endpoint limit from config, and
    // remember its retry policy for options_for().
    void apply(const RateLimitConfig& config);

    // Options for a call, seeded from the applied retry policy.
    RateLimitOptions options_for(const std::string& provider, const std::string& endpoint) const;

    // Invoke fn(api_key) under the provider's key pool and the endpoint's
    // throttle. Returns whatever fn returns.
    template<typename Fn>
    auto execute(Fn&& fn, const RateLimitOptions& options)
        -> std::invoke_result_t<Fn&, const std::string&> {
        using Result = std::invoke_result_t<Fn&, const std::string&>;
        if constexpr (std::is_void_v<Result>) {
            execute_impl([&](const std::string& key) { fn(key); }, options);
        } else {
            std::optional<Result> result;
            execute_impl([&](const std::string& key) { result.emplace(fn(key)); }, options);
            return std::move(*result);
        }
    }

    std::vector<KeyUsage> key_usage(const std::string& provider) const;

    // Lift every block on the provider's keys.
    void reset_blocked_keys(const std::string& provider);

    bool has_keys(const std::string& provider) const;

    // Replace the wait used for throttling and backoff (tests).
    void set_sleep_function(SleepFn fn);

    // Replace the jitter source (tests).
    void set_random_source(RandomFn fn);

private:
    struct ApiKey {
        std::string key;
        uint64_t request_count = 0;
        TimePoint last_used{};
        uint64_t last_used_epoch_ms = 0;
        std::optional<TimePoint> blocked_until;
    };

    struct KeyPool {
        std::vector<ApiKey> keys;
        std::optional<TimePoint> reset_at;   // scheduled lift of all blocks
    };

    struct Throttle {
        uint32_t requests_per_interval = 0;
        double min_interval_ms = 0;
        TimePoint interval_start;
        std::optional<TimePoint> last_request;
        uint32_t request_count = 0;
    };

    void execute_impl(const std::function<void(const std::string&)>& fn,
                      const RateLimitOptions& options);

    // Reserve the endpoint's next admission slot and wait for it.
    void apply_throttling(const std::string& endpoint);

    // Least recently used unblocked key, or nullopt when all are blocked.
    std::optional<size_t> next_key_index(const std::string& provider);
    std::string track_request(const std::string& provider, size_t index);
    void block_key(const std::string& provider, size_t index);
    void schedule_reset(const std::string& provider, std::chrono::milliseconds after);

    void sleep_for(std::chrono::milliseconds delay);
    double jitter_factor();

    EventBus* events_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, KeyPool> pools_;
    std::unordered_map<std::string, Throttle> throttles_;
    RetryPolicy default_retry_;
    SleepFn sleep_;
    RandomFn random_;
};

} // namespace callguard
