#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>
#include "common/decimal.hpp"

namespace fifo {

// Time types. Persisted timestamps are UTC microseconds since epoch.
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using Duration = std::chrono::nanoseconds;
using Micros = int64_t;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline Micros now_micros() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

constexpr Micros MICROS_PER_DAY = 86400LL * 1000000LL;

// Random v4 UUID, used for report ids and lease holders
std::string generate_uuid();

// "YYYY-MM-DD HH:MM:SS.uuuuuu" in UTC
std::string format_timestamp(Micros micros);

// Side enum
enum class Side {
    BUY,
    SELL
};

inline std::string side_to_string(Side s) {
    return s == Side::BUY ? "buy" : "sell";
}

Side side_from_string(const std::string& s);

// Where a trade record came from
enum class TradeSource {
    NORMAL,     // Regular ingestion flow
    BACKFILL    // Inserted after reconciliation found it missing
};

inline std::string trade_source_to_string(TradeSource s) {
    return s == TradeSource::NORMAL ? "normal" : "backfill";
}

TradeSource trade_source_from_string(const std::string& s);

/**
 * One executed fill. Unique by (order_id, symbol), immutable once stored.
 */
struct TradeRecord {
    std::string order_id;
    std::string symbol;
    Side side{Side::BUY};
    Decimal quantity;
    Decimal price;
    Decimal fee;
    Micros exchange_time{0};
    Micros ingested_at{0};     // Stamped by the store when zero
    TradeSource source{TradeSource::NORMAL};

    bool operator==(const TradeRecord& other) const;
    bool operator!=(const TradeRecord& other) const { return !(*this == other); }
};

/**
 * Inclusive exchange-time window used for reconciliation scans.
 */
struct TimeWindow {
    Micros start{0};
    Micros end{0};

    bool contains(Micros t) const { return t >= start && t <= end; }
};

// Empty means "all symbols present in the ledger"
using SymbolScope = std::vector<std::string>;

std::string scope_to_string(const SymbolScope& scope);

} // namespace fifo
