#include "exchange/fill_source.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <future>
#include <functional>
#include <map>
#include <set>
#include <thread>
#include <algorithm>
#include <stdexcept>

namespace fifo {

TradeRecord normalize_fill(const RawFill& fill, TradeSource source) {
    if (fill.order_id.empty()) {
        throw std::invalid_argument("Fill without order id");
    }
    if (fill.product_id.empty()) {
        throw std::invalid_argument("Fill " + fill.order_id + " without product id");
    }
    if (!fill.size.is_positive()) {
        throw std::invalid_argument("Fill " + fill.order_id + " has non-positive size " +
                                    fill.size.to_string());
    }
    if (fill.price.is_negative() || fill.commission.is_negative()) {
        throw std::invalid_argument("Fill " + fill.order_id + " has negative price or commission");
    }

    TradeRecord r;
    r.order_id = fill.order_id;
    r.symbol = fill.product_id;
    r.side = side_from_string(fill.side);
    r.quantity = fill.size;
    r.price = fill.price;
    r.fee = fill.commission;
    r.exchange_time = fill.trade_time;
    r.source = source;
    return r;
}

// ============================================================================
// JSON FILE SOURCE
// ============================================================================

JsonFileFillSource::JsonFileFillSource(std::string path)
    : path_(std::move(path))
{
}

std::vector<RawFill> JsonFileFillSource::load() const {
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open fill history: " + path_);
    }

    nlohmann::json j;
    file >> j;
    if (!j.is_array()) {
        throw std::runtime_error("Fill history must be a JSON array: " + path_);
    }

    // Aggregate partial fills per order: sizes and commissions summed,
    // price weighted by size, earliest trade time kept
    struct Acc {
        RawFill fill;
        Decimal notional;
    };
    std::map<std::string, Acc> by_order;
    std::vector<std::string> order;

    for (const auto& item : j) {
        RawFill f;
        f.order_id = item.at("order_id").get<std::string>();
        f.product_id = item.at("product_id").get<std::string>();
        f.side = item.at("side").get<std::string>();
        f.size = item.at("size").get<Decimal>();
        f.price = item.at("price").get<Decimal>();
        f.commission = item.contains("commission") ? item.at("commission").get<Decimal>() : Decimal();

        const auto& t = item.at("trade_time");
        f.trade_time = t.is_string() ? time_utils::from_iso8601(t.get<std::string>())
                                     : t.get<int64_t>();

        auto it = by_order.find(f.order_id);
        if (it == by_order.end()) {
            by_order[f.order_id] = Acc{f, f.price * f.size};
            order.push_back(f.order_id);
            continue;
        }

        auto& acc = it->second;
        if (acc.fill.product_id != f.product_id || acc.fill.side != f.side) {
            throw std::runtime_error("Fills of order " + f.order_id +
                                     " disagree on product or side");
        }
        acc.fill.size += f.size;
        acc.fill.commission += f.commission;
        acc.notional += f.price * f.size;
        acc.fill.trade_time = std::min(acc.fill.trade_time, f.trade_time);
    }

    std::vector<RawFill> result;
    result.reserve(order.size());
    for (const auto& id : order) {
        auto& acc = by_order[id];
        if (acc.fill.size.is_positive()) {
            acc.fill.price = Decimal::mul_div(acc.notional, Decimal::from_int(1), acc.fill.size);
        }
        result.push_back(acc.fill);
    }
    return result;
}

FillListResponse JsonFileFillSource::list_fills(const std::string& symbol, const TimeWindow& window) {
    FillListResponse response;
    try {
        for (auto& f : load()) {
            if (f.product_id == symbol && window.contains(f.trade_time)) {
                response.fills.push_back(std::move(f));
            }
        }
        response.success = true;
    } catch (const std::exception& e) {
        response.fills.clear();
        response.error = e.what();
    }
    return response;
}

SymbolListResponse JsonFileFillSource::list_symbols(const TimeWindow& window) {
    SymbolListResponse response;
    try {
        std::set<std::string> seen;
        for (const auto& f : load()) {
            if (window.contains(f.trade_time)) {
                seen.insert(f.product_id);
            }
        }
        response.symbols.assign(seen.begin(), seen.end());
        response.success = true;
    } catch (const std::exception& e) {
        response.error = e.what();
    }
    return response;
}

FillLookupResponse JsonFileFillSource::get_fill(const std::string& order_id) {
    FillLookupResponse response;
    try {
        for (auto& f : load()) {
            if (f.order_id == order_id) {
                response.fill = std::move(f);
                break;
            }
        }
        response.success = true;
        response.not_found = !response.fill.has_value();
    } catch (const std::exception& e) {
        response.error = e.what();
    }
    return response;
}

// ============================================================================
// RESILIENT DECORATOR
// ============================================================================

namespace {

// Run fn on a detached worker. Returns nullopt with `error` set on timeout
// or when fn threw a std::exception.
template <typename Response>
std::optional<Response> call_with_timeout(std::function<Response()> fn,
                                          std::chrono::milliseconds timeout,
                                          std::string& error) {
    auto promise = std::make_shared<std::promise<Response>>();
    auto future = promise->get_future();

    std::thread([promise, fn]() {
        try {
            promise->set_value(fn());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        error = "call timed out after " + std::to_string(timeout.count()) + "ms";
        return std::nullopt;
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        error = e.what();
        return std::nullopt;
    }
}

// Bounded retry. `definitive` decides whether a response ends the loop.
template <typename Response>
Response with_retries(const ResilientFillSource::Config& config,
                      time_utils::RateLimiter& limiter,
                      std::atomic<int64_t>& attempts_counter,
                      const std::string& what,
                      std::function<Response()> fn,
                      std::function<std::chrono::milliseconds(int)> backoff) {
    auto timeout = std::chrono::milliseconds(config.call_timeout_ms);
    std::string last_error;

    for (int attempt = 0; attempt <= config.max_retries; ++attempt) {
        if (attempt > 0) {
            auto delay = backoff(attempt - 1);
            spdlog::warn("{}: retry {}/{} in {}ms ({})",
                         what, attempt, config.max_retries, delay.count(), last_error);
            std::this_thread::sleep_for(delay);
        }

        if (!limiter.acquire_for(timeout)) {
            last_error = "rate limited";
            continue;
        }

        attempts_counter++;
        std::string error;
        auto result = call_with_timeout<Response>(fn, timeout, error);
        if (!result) {
            last_error = error;
            continue;
        }
        if (result->success) {
            return *result;
        }
        last_error = result->error;
    }

    spdlog::error("{}: source unavailable after {} attempts: {}",
                  what, config.max_retries + 1, last_error);
    Response failed;
    failed.success = false;
    failed.error = "source unavailable after " + std::to_string(config.max_retries + 1) +
                   " attempts: " + last_error;
    return failed;
}

} // namespace

ResilientFillSource::ResilientFillSource(std::shared_ptr<FillSource> inner, Config config)
    : inner_(std::move(inner))
    , config_(config)
    , limiter_(config.max_requests, config.rate_window_seconds)
{
    if (!inner_) {
        throw std::invalid_argument("ResilientFillSource requires an inner source");
    }
    if (config_.max_retries < 0 || config_.call_timeout_ms <= 0) {
        throw std::invalid_argument("ResilientFillSource: invalid retry or timeout settings");
    }
}

std::chrono::milliseconds ResilientFillSource::backoff_for(int attempt) const {
    int64_t delay = static_cast<int64_t>(config_.initial_backoff_ms) << std::min(attempt, 20);
    return std::chrono::milliseconds(std::min<int64_t>(delay, config_.max_backoff_ms));
}

FillListResponse ResilientFillSource::list_fills(const std::string& symbol, const TimeWindow& window) {
    auto inner = inner_;
    return with_retries<FillListResponse>(
        config_, limiter_, calls_attempted_, "list_fills(" + symbol + ")",
        [inner, symbol, window]() { return inner->list_fills(symbol, window); },
        [this](int attempt) { return backoff_for(attempt); });
}

SymbolListResponse ResilientFillSource::list_symbols(const TimeWindow& window) {
    auto inner = inner_;
    return with_retries<SymbolListResponse>(
        config_, limiter_, calls_attempted_, "list_symbols",
        [inner, window]() { return inner->list_symbols(window); },
        [this](int attempt) { return backoff_for(attempt); });
}

FillLookupResponse ResilientFillSource::get_fill(const std::string& order_id) {
    auto inner = inner_;
    // success covers not_found, so a definitive miss is never retried
    return with_retries<FillLookupResponse>(
        config_, limiter_, calls_attempted_, "get_fill(" + order_id + ")",
        [inner, order_id]() { return inner->get_fill(order_id); },
        [this](int attempt) { return backoff_for(attempt); });
}

} // namespace fifo
