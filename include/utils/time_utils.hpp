#pragma once

#include <string>
#include <chrono>
#include <mutex>
#include <thread>
#include "common/types.hpp"

namespace fifo {
namespace time_utils {

/**
 * Convert UTC microseconds to ISO 8601 ("2024-03-01T12:00:00.000000Z").
 */
std::string to_iso8601(Micros t);

/**
 * Parse ISO 8601 to UTC microseconds. Accepts a bare date
 * ("2024-03-01"), an optional fractional part of up to 6 digits, and a
 * trailing "Z" or "+00:00". Throws std::invalid_argument otherwise.
 */
Micros from_iso8601(const std::string& s);

/**
 * Format duration for display.
 */
std::string format_duration_ms(int64_t ms);

/**
 * High resolution timer for run durations.
 */
class LatencyTimer {
public:
    LatencyTimer();

    void start();
    void stop();

    Duration elapsed() const;
    int64_t elapsed_ms() const;

private:
    Timestamp start_;
    Timestamp end_;
    bool running_{false};
};

/**
 * Fixed-window rate limiter for external source calls.
 */
class RateLimiter {
public:
    RateLimiter(int max_requests, int window_seconds);

    // Returns true if request is allowed, false if rate limited
    bool try_acquire();

    // Wait at most `timeout`; false if still limited
    bool acquire_for(std::chrono::milliseconds timeout);

private:
    int max_requests_;
    int window_seconds_;
    std::chrono::steady_clock::time_point window_start_;
    int requests_in_window_{0};
    mutable std::mutex mutex_;
};

} // namespace time_utils
} // namespace fifo
