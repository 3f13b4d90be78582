#pragma once
#include <stdexcept>
#include <string>
#include <cstdint>

namespace callguard {

// Thrown by a backing store that cannot serve the operation.
class StoreUnavailableError : public std::runtime_error {
public:
    explicit StoreUnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

// Failure of a guarded external call. Request functions throw this with the
// HTTP status of the failed response so the rate limiter can classify it.
class ApiError : public std::runtime_error {
public:
    ApiError(const std::string& message, long status,
             std::string endpoint = "", bool retryable = true)
        : std::runtime_error(message), status_(status),
          endpoint_(std::move(endpoint)), retryable_(retryable) {}

    long status() const { return status_; }
    const std::string& endpoint() const { return endpoint_; }
    bool retryable() const { return retryable_; }

private:
    long status_;
    std::string endpoint_;
    bool retryable_;
};

// No credentials registered for the requested provider.
class NoCredentialsError : public ApiError {
public:
    NoCredentialsError(const std::string& provider, const std::string& endpoint)
        : ApiError("No API keys registered for " + provider, 401, endpoint, false) {}
};

// The retry loop ran out of attempts.
class RetriesExhaustedError : public ApiError {
public:
    RetriesExhaustedError(const std::string& endpoint, uint32_t attempts,
                          const std::string& last_error)
        : ApiError("Rate limit exceeded for " + endpoint + " after " +
                   std::to_string(attempts) + " attempts. Last error: " + last_error,
                   429, endpoint, false),
          attempts_(attempts), last_error_(last_error) {}

    uint32_t attempts() const { return attempts_; }
    const std::string& last_error() const { return last_error_; }

private:
    uint32_t attempts_;
    std::string last_error_;
};

// The retry loop ran past its wall-clock budget.
class RequestTimeoutError : public ApiError {
public:
    RequestTimeoutError(const std::string& endpoint, uint64_t timeout_ms)
        : ApiError("Request timed out after " + std::to_string(timeout_ms) +
                   "ms for " + endpoint,
                   408, endpoint, false) {}
};

// 429 Too Many Requests and 403 Forbidden both mean "this key is throttled".
inline bool is_rate_limited(long status) {
    return status == 429 || status == 403;
}

} // namespace callguard
