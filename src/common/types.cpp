#include "common/types.hpp"
#include <stdexcept>
#include <random>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace fifo {

std::string generate_uuid() {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << ((a >> 32) & 0xFFFFFFFF);
    ss << "-";
    ss << std::setw(4) << ((a >> 16) & 0xFFFF);
    ss << "-";
    ss << std::setw(4) << (((a & 0xFFFF) & 0x0FFF) | 0x4000);
    ss << "-";
    ss << std::setw(4) << (((b >> 48) & 0x3FFF) | 0x8000);
    ss << "-";
    ss << std::setw(12) << (b & 0xFFFFFFFFFFFF);

    return ss.str();
}

std::string format_timestamp(Micros micros) {
    auto seconds = micros / 1000000;
    auto us = micros % 1000000;
    if (us < 0) {
        us += 1000000;
        seconds -= 1;
    }
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(6) << us;
    return ss.str();
}

Side side_from_string(const std::string& s) {
    if (s == "buy" || s == "BUY") return Side::BUY;
    if (s == "sell" || s == "SELL") return Side::SELL;
    throw std::invalid_argument("Unknown side: " + s);
}

TradeSource trade_source_from_string(const std::string& s) {
    if (s == "backfill") return TradeSource::BACKFILL;
    return TradeSource::NORMAL;
}

bool TradeRecord::operator==(const TradeRecord& other) const {
    return order_id == other.order_id &&
           symbol == other.symbol &&
           side == other.side &&
           quantity == other.quantity &&
           price == other.price &&
           fee == other.fee &&
           exchange_time == other.exchange_time &&
           ingested_at == other.ingested_at &&
           source == other.source;
}

std::string scope_to_string(const SymbolScope& scope) {
    if (scope.empty()) return "all";
    std::string out;
    for (const auto& s : scope) {
        if (!out.empty()) out += ",";
        out += s;
    }
    return out;
}

} // namespace fifo
