#pragma once
#include "circuit_breaker.hpp"
#include <string>
#include <cstdint>

namespace callguard {

// Tag-based event dispatch without RTTI or dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* CacheHit            = "CacheHit";
    constexpr const char* CacheMiss           = "CacheMiss";
    constexpr const char* CacheError          = "CacheError";
    constexpr const char* CacheInvalidated    = "CacheInvalidated";
    constexpr const char* BreakerStateChanged = "BreakerStateChanged";
    constexpr const char* RateLimitHit        = "RateLimitHit";
    constexpr const char* KeyBlocked          = "KeyBlocked";
    constexpr const char* RequestRetry        = "RequestRetry";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct CacheHitEvent : Event {
    static constexpr const char* TAG = event_tags::CacheHit;
    std::string key;  // logical key, without prefix

    CacheHitEvent() { type_tag = TAG; }
};

struct CacheMissEvent : Event {
    static constexpr const char* TAG = event_tags::CacheMiss;
    std::string key;
    bool short_circuited = false;  // breaker rejected the read

    CacheMissEvent() { type_tag = TAG; }
};

struct CacheErrorEvent : Event {
    static constexpr const char* TAG = event_tags::CacheError;
    std::string operation;  // "get", "set", "del", ...
    std::string key;
    std::string error;

    CacheErrorEvent() { type_tag = TAG; }
};

struct CacheInvalidatedEvent : Event {
    static constexpr const char* TAG = event_tags::CacheInvalidated;
    std::string pattern;
    size_t deleted = 0;

    CacheInvalidatedEvent() { type_tag = TAG; }
};

struct BreakerStateChangedEvent : Event {
    static constexpr const char* TAG = event_tags::BreakerStateChanged;
    BreakerState from = BreakerState::Closed;
    BreakerState to = BreakerState::Closed;

    BreakerStateChangedEvent() { type_tag = TAG; }
};

struct RateLimitHitEvent : Event {
    static constexpr const char* TAG = event_tags::RateLimitHit;
    std::string provider;
    std::string endpoint;
    uint32_t attempt = 0;
    long status = 0;

    RateLimitHitEvent() { type_tag = TAG; }
};

struct KeyBlockedEvent : Event {
    static constexpr const char* TAG = event_tags::KeyBlocked;
    std::string provider;
    size_t key_index = 0;
    uint64_t cooldown_ms = 0;

    KeyBlockedEvent() { type_tag = TAG; }
};

struct RequestRetryEvent : Event {
    static constexpr const char* TAG = event_tags::RequestRetry;
    std::string provider;
    std::string endpoint;
    uint32_t attempt = 0;
    uint64_t delay_ms = 0;
    std::string error;

    RequestRetryEvent() { type_tag = TAG; }
};

} // namespace callguard
