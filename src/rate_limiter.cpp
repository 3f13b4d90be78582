#include "rate_limiter.hpp"
#include "event_bus.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace callguard {

void to_json(nlohmann::json& j, const KeyUsage& k) {
    std::string masked = k.key.size() > 4 ? "****" + k.key.substr(k.key.size() - 4) : "****";
    j = {
        {"index", k.index},
        {"provider", k.provider},
        {"key", masked},
        {"request_count", k.request_count},
        {"last_used_at", k.last_used_at},
        {"blocked", k.blocked}
    };
}

RateLimitManager::RateLimitManager(EventBus* events)
    : events_(events),
      sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }),
      random_([] { return random_uniform(0.0, 1.0); }) {}

void RateLimitManager::register_api_keys(const std::string& provider,
                                         const std::vector<std::string>& keys) {
    if (keys.empty()) {
        std::cerr << "[ratelimit] No API keys provided for " << provider << "\n";
        return;
    }
    KeyPool pool;
    for (const auto& k : keys) {
        ApiKey entry;
        entry.key = k;
        pool.keys.push_back(std::move(entry));
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pools_[provider] = std::move(pool);
    }
    std::cerr << "[ratelimit] Registered " << keys.size() << " API keys for " << provider << "\n";
}

void RateLimitManager::configure_endpoint(const std::string& endpoint,
                                          uint32_t requests_per_interval,
                                          uint64_t interval_ms) {
    if (requests_per_interval == 0) {
        throw std::invalid_argument("requests_per_interval must be positive for " + endpoint);
    }
    Throttle t;
    t.requests_per_interval = requests_per_interval;
    t.min_interval_ms = static_cast<double>(interval_ms) / requests_per_interval;
    t.interval_start = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    throttles_[endpoint] = t;
}

void RateLimitManager::apply(const RateLimitConfig& config) {
    for (const auto& [provider, keys] : config.api_keys) {
        if (!keys.empty()) register_api_keys(provider, keys);
    }
    for (const auto& [endpoint, limit] : config.endpoints) {
        configure_endpoint(endpoint, limit.requests_per_interval, limit.interval_ms);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    default_retry_ = config.retry;
}

RateLimitOptions RateLimitManager::options_for(const std::string& provider,
                                               const std::string& endpoint) const {
    RateLimitOptions opts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        static_cast<RetryPolicy&>(opts) = default_retry_;
    }
    opts.provider = provider;
    opts.endpoint = endpoint;
    return opts;
}

void RateLimitManager::execute_impl(const std::function<void(const std::string&)>& fn,
                                    const RateLimitOptions& options) {
    const std::string& provider = options.provider;
    const std::string& endpoint = options.endpoint;

    if (!has_keys(provider)) {
        throw NoCredentialsError(provider, endpoint);
    }

    apply_throttling(endpoint);

    uint32_t attempts = 0;
    uint64_t current_delay = options.initial_delay_ms;
    std::string last_error;
    auto start = Clock::now();

    auto first = next_key_index(provider);
    if (!first) {
        std::cerr << "[ratelimit] All API keys for " << provider
                  << " are blocked, waiting " << current_delay << "ms\n";
        sleep_for(std::chrono::milliseconds(current_delay));
        reset_blocked_keys(provider);
        first = next_key_index(provider);
    }
    size_t current = first.value_or(0);

    while (attempts < options.max_retries) {
        if (elapsed_ms(start, Clock::now()) > options.timeout_ms) {
            throw RequestTimeoutError(endpoint, options.timeout_ms);
        }

        std::string key = track_request(provider, current);
        try {
            fn(key);
            return;
        } catch (const std::exception& e) {
            attempts++;
            last_error = e.what();

            const auto* api = dynamic_cast<const ApiError*>(&e);
            if (!api || !is_rate_limited(api->status())) {
                if (options.fail_fast) throw;

                std::cerr << "[ratelimit] Error during request to " << endpoint
                          << " (attempt " << attempts << "/" << options.max_retries
                          << "): " << last_error << "\n";
                RequestRetryEvent ev;
                ev.provider = provider;
                ev.endpoint = endpoint;
                ev.attempt = attempts;
                ev.delay_ms = options.initial_delay_ms;
                ev.error = last_error;
                publish_to(events_, ev);

                sleep_for(std::chrono::milliseconds(options.initial_delay_ms));
                continue;
            }

            std::cerr << "[ratelimit] Rate limit hit for " << provider << " on " << endpoint
                      << ", attempt " << attempts << "/" << options.max_retries << "\n";
            RateLimitHitEvent hit;
            hit.provider = provider;
            hit.endpoint = endpoint;
            hit.attempt = attempts;
            hit.status = api->status();
            publish_to(events_, hit);

            if (options.rotate_keys_on_rate_limit) {
                block_key(provider, current);
                if (auto next = next_key_index(provider)) {
                    current = *next;
                    continue;
                }
                std::cerr << "[ratelimit] All API keys for " << provider
                          << " are blocked, waiting for backoff\n";
                schedule_reset(provider, std::chrono::milliseconds(current_delay));
            }

            uint64_t wait = current_delay;
            if (options.use_jitter) {
                wait = static_cast<uint64_t>(static_cast<double>(current_delay) * jitter_factor());
            }

            RequestRetryEvent ev;
            ev.provider = provider;
            ev.endpoint = endpoint;
            ev.attempt = attempts;
            ev.delay_ms = wait;
            ev.error = last_error;
            publish_to(events_, ev);

            sleep_for(std::chrono::milliseconds(wait));
            current_delay = std::min(current_delay * 2, options.max_delay_ms);

            // Pick again once the backoff ends; the last key is only reused
            // while every key is still blocked.
            if (options.rotate_keys_on_rate_limit) {
                if (auto next = next_key_index(provider)) current = *next;
            }
        }
    }

    throw RetriesExhaustedError(endpoint, attempts, last_error);
}

void RateLimitManager::apply_throttling(const std::string& endpoint) {
    auto now = Clock::now();
    TimePoint admit_at = now;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = throttles_.find(endpoint);
        if (it == throttles_.end()) return;
        auto& t = it->second;
        auto spacing = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double, std::milli>(t.min_interval_ms));
        auto window = spacing * t.requests_per_interval;

        if (now - t.interval_start >= window) {
            t.interval_start = now;
            t.request_count = 0;
        }

        if (t.request_count >= t.requests_per_interval) {
            admit_at = t.interval_start + window;
            t.interval_start = admit_at;
            t.request_count = 0;
        } else if (t.last_request) {
            admit_at = std::max(now, *t.last_request + spacing);
        }

        // Reserve the slot before sleeping so concurrent callers queue
        // behind it.
        t.last_request = admit_at;
        t.request_count++;
    }

    if (admit_at > now) {
        sleep_for(std::chrono::ceil<std::chrono::milliseconds>(admit_at - now));
    }
}

std::optional<size_t> RateLimitManager::next_key_index(const std::string& provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(provider);
    if (it == pools_.end()) return std::nullopt;
    auto& pool = it->second;
    auto now = Clock::now();

    if (pool.reset_at && now >= *pool.reset_at) {
        for (auto& k : pool.keys) k.blocked_until.reset();
        pool.reset_at.reset();
    }

    std::optional<size_t> best;
    for (size_t i = 0; i < pool.keys.size(); ++i) {
        auto& k = pool.keys[i];
        if (k.blocked_until) {
            if (now < *k.blocked_until) continue;
            k.blocked_until.reset();
        }
        if (!best || k.last_used < pool.keys[*best].last_used) best = i;
    }
    return best;
}

std::string RateLimitManager::track_request(const std::string& provider, size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& keys = pools_.at(provider).keys;
    // The pool may have been replaced by a shorter one mid-call.
    if (index >= keys.size()) index = 0;
    auto& k = keys[index];
    k.request_count++;
    k.last_used = Clock::now();
    k.last_used_epoch_ms = epoch_millis();
    return k.key;
}

void RateLimitManager::block_key(const std::string& provider, size_t index) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pools_.find(provider);
        if (it == pools_.end() || index >= it->second.keys.size()) return;
        it->second.keys[index].blocked_until = Clock::now() + KEY_COOLDOWN;
    }

    KeyBlockedEvent ev;
    ev.provider = provider;
    ev.key_index = index;
    ev.cooldown_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(KEY_COOLDOWN).count());
    publish_to(events_, ev);
}

void RateLimitManager::schedule_reset(const std::string& provider,
                                      std::chrono::milliseconds after) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(provider);
    if (it == pools_.end()) return;
    it->second.reset_at = Clock::now() + after;
}

void RateLimitManager::reset_blocked_keys(const std::string& provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(provider);
    if (it == pools_.end()) return;
    for (auto& k : it->second.keys) k.blocked_until.reset();
    it->second.reset_at.reset();
}

std::vector<KeyUsage> RateLimitManager::key_usage(const std::string& provider) const {
    std::vector<KeyUsage> out;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(provider);
    if (it == pools_.end()) return out;
    auto now = Clock::now();
    bool reset_due = it->second.reset_at && now >= *it->second.reset_at;

    for (size_t i = 0; i < it->second.keys.size(); ++i) {
        const auto& k = it->second.keys[i];
        KeyUsage u;
        u.index = i;
        u.provider = provider;
        u.key = k.key;
        u.request_count = k.request_count;
        u.last_used_at = k.last_used_epoch_ms;
        u.blocked = !reset_due && k.blocked_until && now < *k.blocked_until;
        out.push_back(std::move(u));
    }
    return out;
}

bool RateLimitManager::has_keys(const std::string& provider) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(provider);
    return it != pools_.end() && !it->second.keys.empty();
}

void RateLimitManager::set_sleep_function(SleepFn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    sleep_ = std::move(fn);
}

void RateLimitManager::set_random_source(RandomFn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    random_ = std::move(fn);
}

void RateLimitManager::sleep_for(std::chrono::milliseconds delay) {
    SleepFn fn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fn = sleep_;
    }
    fn(delay);
}

double RateLimitManager::jitter_factor() {
    RandomFn fn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fn = random_;
    }
    // 50-100% of the delay
    return 0.5 + fn() * 0.5;
}

} // namespace callguard
