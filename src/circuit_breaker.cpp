#include "circuit_breaker.hpp"
#include <iostream>

namespace callguard {

CircuitBreaker::CircuitBreaker(BreakerConfig config)
    : config_(config) {}

bool CircuitBreaker::allow_request() {
    std::optional<std::pair<BreakerState, BreakerState>> fired;
    bool allowed = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.state == BreakerState::Open) {
            auto now = Clock::now();
            if (now - state_.last_failure_at > config_.reset_timeout) {
                state_.success_count = 0;
                state_.half_open_since = now;
                transition_locked(BreakerState::HalfOpen, fired);
            } else {
                allowed = false;
            }
        }
    }
    notify(fired);
    return allowed;
}

void CircuitBreaker::record_success() {
    std::optional<std::pair<BreakerState, BreakerState>> fired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.success_count++;
        if (state_.state == BreakerState::HalfOpen &&
            state_.success_count >= config_.success_threshold) {
            state_.failure_count = 0;
            state_.success_count = 0;
            state_.half_open_since.reset();
            transition_locked(BreakerState::Closed, fired);
        }
    }
    notify(fired);
}

void CircuitBreaker::record_failure() {
    std::optional<std::pair<BreakerState, BreakerState>> fired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.failure_count++;
        state_.last_failure_at = Clock::now();

        if (state_.state == BreakerState::HalfOpen) {
            // A failed probe restarts the reset-timeout clock from now.
            state_.half_open_since.reset();
            state_.success_count = 0;
            transition_locked(BreakerState::Open, fired);
        } else if (state_.state == BreakerState::Closed &&
                   state_.failure_count >= config_.failure_threshold) {
            transition_locked(BreakerState::Open, fired);
        }
    }
    notify(fired);
}

void CircuitBreaker::reset() {
    std::optional<std::pair<BreakerState, BreakerState>> fired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.failure_count = 0;
        state_.success_count = 0;
        state_.half_open_since.reset();
        transition_locked(BreakerState::Closed, fired);
    }
    notify(fired);
}

bool CircuitBreaker::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.state == BreakerState::Open;
}

BreakerState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.state;
}

BreakerSnapshot CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void CircuitBreaker::set_transition_callback(TransitionCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_transition_ = std::move(cb);
}

void CircuitBreaker::transition_locked(BreakerState to,
                                       std::optional<std::pair<BreakerState, BreakerState>>& fired) {
    // Must be called with mutex_ already held.
    if (state_.state == to) return;
    fired = std::make_pair(state_.state, to);
    state_.state = to;
}

void CircuitBreaker::notify(const std::optional<std::pair<BreakerState, BreakerState>>& fired) {
    if (!fired) return;

    TransitionCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cb = on_transition_;
    }
    if (cb) {
        cb(fired->first, fired->second);
        return;
    }
    std::cerr << "[breaker] " << breaker_state_to_string(fired->first)
              << " -> " << breaker_state_to_string(fired->second) << "\n";
}

} // namespace callguard
