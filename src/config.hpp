#pragma once
#include "circuit_breaker.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace callguard {

struct CacheConfig {
    std::string backend = "memory";      // store registry name: "memory" or "external"
    uint32_t default_ttl = 3600;          // seconds
    uint32_t max_memory_mb = 100;
    std::string key_prefix = "analytical:";
    uint32_t sweep_interval = 60;         // seconds, 0 disables the background sweep
    bool fallback_to_memory = true;       // use "memory" if the backend can't be created
    BreakerConfig breaker;
};

struct RetryPolicy {
    uint32_t max_retries = 5;
    uint64_t initial_delay_ms = 1000;
    uint64_t max_delay_ms = 60000;
    uint64_t timeout_ms = 30000;
    bool use_jitter = true;
    bool rotate_keys_on_rate_limit = true;
    bool fail_fast = false;
};

struct EndpointLimit {
    uint32_t requests_per_interval = 0;
    uint64_t interval_ms = 0;
};

struct RateLimitConfig {
    std::unordered_map<std::string, std::vector<std::string>> api_keys;  // provider -> keys
    std::unordered_map<std::string, EndpointLimit> endpoints;
    RetryPolicy retry;
};

struct Config {
    CacheConfig cache;
    RateLimitConfig rate_limit;

    // Load from ~/.callguard/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse an already-merged JSON document. Missing or mistyped fields keep
    // their defaults.
    static Config from_json(const nlohmann::json& j);

    // API keys configured for a provider (empty if none)
    std::vector<std::string> api_keys_for(const std::string& provider) const;
};

} // namespace callguard
