#pragma once

#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <chrono>
#include <atomic>
#include "common/types.hpp"
#include "common/decimal.hpp"
#include "utils/time_utils.hpp"

namespace fifo {

/**
 * One fill as reported by the exchange, before normalization.
 * Fills sharing an order id are already aggregated per order.
 */
struct RawFill {
    std::string order_id;
    std::string product_id;
    std::string side;           // "BUY" / "SELL" as the exchange spells it
    Decimal size;
    Decimal price;
    Decimal commission;
    Micros trade_time{0};
};

struct FillListResponse {
    bool success{false};
    std::vector<RawFill> fills;
    std::string error;
};

struct SymbolListResponse {
    bool success{false};
    std::vector<std::string> symbols;
    std::string error;
};

/**
 * success with not_found set is a definitive answer and is never retried.
 * success == false means the source could not answer.
 */
struct FillLookupResponse {
    bool success{false};
    bool not_found{false};
    std::optional<RawFill> fill;
    std::string error;
};

/**
 * Read-only view of the exchange's authoritative fill history.
 */
class FillSource {
public:
    virtual ~FillSource() = default;

    virtual FillListResponse list_fills(const std::string& symbol, const TimeWindow& window) = 0;

    // Symbols with at least one fill inside the window
    virtual SymbolListResponse list_symbols(const TimeWindow& window) = 0;

    virtual FillLookupResponse get_fill(const std::string& order_id) = 0;
    virtual std::string name() const = 0;
};

/**
 * Map an exchange fill onto the ledger's TradeRecord shape.
 * Throws std::invalid_argument on unknown side, non-positive size or
 * negative price/commission.
 */
TradeRecord normalize_fill(const RawFill& fill, TradeSource source);

/**
 * Exchange fill-history export on disk: a JSON array of objects with
 * order_id, product_id, side, size, price, commission and trade_time
 * (ISO 8601 string or integer microseconds). The file is re-read on
 * every call so a refreshed export is picked up.
 */
class JsonFileFillSource : public FillSource {
public:
    explicit JsonFileFillSource(std::string path);

    FillListResponse list_fills(const std::string& symbol, const TimeWindow& window) override;
    SymbolListResponse list_symbols(const TimeWindow& window) override;
    FillLookupResponse get_fill(const std::string& order_id) override;
    std::string name() const override { return "json-file:" + path_; }

private:
    std::string path_;

    // Parse and aggregate by order id; throws on unreadable input
    std::vector<RawFill> load() const;
};

/**
 * Decorator adding a rate limit, a per-call timeout and bounded retry
 * with exponential backoff. A call that overruns its timeout is left
 * running on its worker thread and reported as unavailable.
 */
class ResilientFillSource : public FillSource {
public:
    struct Config {
        int max_requests{10};
        int rate_window_seconds{1};
        int call_timeout_ms{10000};
        int max_retries{3};
        int initial_backoff_ms{500};
        int max_backoff_ms{8000};
    };

    ResilientFillSource(std::shared_ptr<FillSource> inner, Config config);

    FillListResponse list_fills(const std::string& symbol, const TimeWindow& window) override;
    SymbolListResponse list_symbols(const TimeWindow& window) override;
    FillLookupResponse get_fill(const std::string& order_id) override;
    std::string name() const override { return "resilient:" + inner_->name(); }

    int64_t calls_attempted() const { return calls_attempted_.load(); }

private:
    std::shared_ptr<FillSource> inner_;
    Config config_;
    time_utils::RateLimiter limiter_;
    std::atomic<int64_t> calls_attempted_{0};

    std::chrono::milliseconds backoff_for(int attempt) const;
};

} // namespace fifo
