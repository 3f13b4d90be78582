#pragma once
#include "util.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace callguard {

enum class BreakerState { Closed, Open, HalfOpen };

inline const char* breaker_state_to_string(BreakerState state) {
    switch (state) {
        case BreakerState::Closed: return "closed";
        case BreakerState::Open: return "open";
        case BreakerState::HalfOpen: return "half_open";
    }
    return "closed";
}

struct BreakerConfig {
    uint32_t failure_threshold = 5;
    std::chrono::milliseconds reset_timeout{60000};
    uint32_t success_threshold = 3;
};

struct BreakerSnapshot {
    BreakerState state = BreakerState::Closed;
    uint32_t failure_count = 0;
    uint32_t success_count = 0;
    TimePoint last_failure_at{};
    std::optional<TimePoint> half_open_since;
};

// Guards a resource through CLOSED -> OPEN -> HALF_OPEN -> CLOSED.
// All methods are thread-safe; outcomes are applied one at a time under the
// internal mutex. The transition callback runs after the mutex is released.
class CircuitBreaker {
public:
    using TransitionCallback = std::function<void(BreakerState from, BreakerState to)>;

    explicit CircuitBreaker(BreakerConfig config = {});

    // Gate for a new call. While OPEN this returns false until reset_timeout
    // has elapsed since the last failure, then moves to HALF_OPEN and lets
    // the probe through.
    bool allow_request();

    void record_success();
    void record_failure();

    // Force CLOSED with zeroed counters.
    void reset();

    bool is_open() const;
    BreakerState state() const;
    BreakerSnapshot snapshot() const;
    const BreakerConfig& config() const { return config_; }

    void set_transition_callback(TransitionCallback cb);

private:
    void transition_locked(BreakerState to, std::optional<std::pair<BreakerState, BreakerState>>& fired);
    void notify(const std::optional<std::pair<BreakerState, BreakerState>>& fired);

    BreakerConfig config_;
    BreakerSnapshot state_;
    TransitionCallback on_transition_;
    mutable std::mutex mutex_;
};

} // namespace callguard
