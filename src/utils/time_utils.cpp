#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <stdexcept>

namespace fifo {
namespace time_utils {

std::string to_iso8601(Micros t) {
    auto seconds = t / 1000000;
    auto us = t % 1000000;
    if (us < 0) {
        us += 1000000;
        seconds -= 1;
    }
    std::time_t time_t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(6) << us << 'Z';

    return ss.str();
}

Micros from_iso8601(const std::string& s) {
    std::tm tm = {};
    std::istringstream ss(s);

    if (s.size() == 10) {
        ss >> std::get_time(&tm, "%Y-%m-%d");
    } else {
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    }
    if (ss.fail()) {
        throw std::invalid_argument("Invalid ISO 8601 timestamp: " + s);
    }

    Micros micros = static_cast<Micros>(timegm(&tm)) * 1000000;

    std::string rest;
    std::getline(ss, rest);
    size_t pos = 0;

    // Fractional seconds, truncated to microseconds
    if (pos < rest.size() && rest[pos] == '.') {
        pos++;
        Micros frac = 0;
        int digits = 0;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            if (digits < 6) {
                frac = frac * 10 + (rest[pos] - '0');
                digits++;
            }
            pos++;
        }
        if (digits == 0) {
            throw std::invalid_argument("Invalid ISO 8601 fraction: " + s);
        }
        while (digits < 6) {
            frac *= 10;
            digits++;
        }
        micros += frac;
    }

    std::string zone = rest.substr(pos);
    if (!zone.empty() && zone != "Z" && zone != "+00:00") {
        throw std::invalid_argument("Only UTC timestamps are supported: " + s);
    }

    return micros;
}

std::string format_duration_ms(int64_t ms) {
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        double sec = ms / 1000.0;
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << sec << "s";
        return ss.str();
    } else {
        int64_t min = ms / 60000;
        int64_t sec = (ms % 60000) / 1000;
        return std::to_string(min) + "m" + std::to_string(sec) + "s";
    }
}

// LatencyTimer implementation

LatencyTimer::LatencyTimer()
    : start_(now())
    , end_(start_)
{
}

void LatencyTimer::start() {
    start_ = now();
    running_ = true;
}

void LatencyTimer::stop() {
    end_ = now();
    running_ = false;
}

Duration LatencyTimer::elapsed() const {
    if (running_) {
        return now() - start_;
    }
    return end_ - start_;
}

int64_t LatencyTimer::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed()).count();
}

// RateLimiter implementation

RateLimiter::RateLimiter(int max_requests, int window_seconds)
    : max_requests_(max_requests)
    , window_seconds_(window_seconds)
    , window_start_(std::chrono::steady_clock::now())
{
}

bool RateLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now_tp = std::chrono::steady_clock::now();
    auto window_duration = std::chrono::seconds(window_seconds_);

    // Reset window if expired
    if (now_tp - window_start_ >= window_duration) {
        window_start_ = now_tp;
        requests_in_window_ = 0;
    }

    if (requests_in_window_ >= max_requests_) {
        return false;
    }

    requests_in_window_++;
    return true;
}

bool RateLimiter::acquire_for(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!try_acquire()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

} // namespace time_utils
} // namespace fifo
