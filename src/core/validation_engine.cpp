#include "core/validation_engine.hpp"
#include "core/fifo_engine.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <tuple>

namespace fifo {

namespace {

using OrderKey = std::pair<std::string, std::string>;   // (symbol, order_id)

struct Checker {
    ValidationResult& result;
    bool strict;

    void error(const std::string& code, const std::string& symbol,
               const std::string& order_id, const std::string& message) {
        result.issues.push_back(ValidationIssue{
            ValidationIssue::Severity::ERROR, code, symbol, order_id, message});
    }

    void warning(const std::string& code, const std::string& symbol,
                 const std::string& order_id, const std::string& message) {
        auto severity = strict ? ValidationIssue::Severity::ERROR
                               : ValidationIssue::Severity::WARNING;
        result.issues.push_back(ValidationIssue{severity, code, symbol, order_id, message});
    }
};

// Lookup that never inserts
Decimal amount_of(const std::map<OrderKey, Decimal>& totals, const OrderKey& key) {
    auto it = totals.find(key);
    return it == totals.end() ? Decimal() : it->second;
}

struct OpenBuy {
    std::string order_id;
    Decimal remaining;
};

} // namespace

ValidationEngine::ValidationEngine(bool strict)
    : strict_(strict)
{
}

ValidationResult ValidationEngine::validate(const AllocationVersion& version,
                                            const std::vector<TradeRecord>& snapshot,
                                            const std::vector<FifoAllocation>& allocations,
                                            const std::vector<UnmatchedResidue>& residues) const {
    ValidationResult result;
    result.namespace_id = version.namespace_id;
    result.version_number = version.version_number;
    result.total_allocations = static_cast<int>(allocations.size());
    result.total_residues = static_cast<int>(residues.size());

    Checker check{result, strict_};

    std::set<std::string> scope(version.scope.begin(), version.scope.end());
    std::map<OrderKey, const TradeRecord*> records;
    std::map<std::string, std::vector<const TradeRecord*>> by_symbol;

    for (const auto& r : snapshot) {
        if (!scope.empty() && scope.count(r.symbol) == 0) continue;
        if (!r.quantity.is_positive()) continue;
        records[{r.symbol, r.order_id}] = &r;
        by_symbol[r.symbol].push_back(&r);
        if (r.side == Side::BUY) result.total_buys++;
        else result.total_sells++;
    }

    std::map<OrderKey, Decimal> sell_matched;
    std::map<OrderKey, Decimal> sell_fees;
    std::map<OrderKey, Decimal> buy_consumed;
    std::map<OrderKey, Decimal> buy_fees;
    std::map<OrderKey, std::vector<const FifoAllocation*>> by_sell;
    std::set<std::tuple<std::string, std::string, std::string>> seen_pairs;

    // Per-allocation checks
    for (const auto& a : allocations) {
        OrderKey sell_key{a.symbol, a.sell_order_id};
        OrderKey buy_key{a.symbol, a.buy_order_id};

        if (!seen_pairs.insert({a.symbol, a.sell_order_id, a.buy_order_id}).second) {
            check.error("DUPLICATE_ALLOCATION", a.symbol, a.sell_order_id,
                        fmt::format("Sell {} matched against buy {} more than once",
                                    a.sell_order_id, a.buy_order_id));
        }

        if (!a.quantity.is_positive()) {
            check.error("NON_POSITIVE_QUANTITY", a.symbol, a.sell_order_id,
                        fmt::format("Allocation #{} has quantity {}", a.sequence,
                                    a.quantity.to_string()));
        }

        auto sell_it = records.find(sell_key);
        auto buy_it = records.find(buy_key);
        bool sell_ok = sell_it != records.end() && sell_it->second->side == Side::SELL;
        bool buy_ok = buy_it != records.end() && buy_it->second->side == Side::BUY;

        if (!sell_ok) {
            check.error("UNKNOWN_REFERENCE", a.symbol, a.sell_order_id,
                        fmt::format("Allocation #{} references sell {} outside the snapshot",
                                    a.sequence, a.sell_order_id));
        }
        if (!buy_ok) {
            check.error("UNKNOWN_REFERENCE", a.symbol, a.buy_order_id,
                        fmt::format("Allocation #{} references buy {} outside the snapshot",
                                    a.sequence, a.buy_order_id));
        }
        if (!sell_ok || !buy_ok) continue;

        const TradeRecord& sell = *sell_it->second;
        const TradeRecord& buy = *buy_it->second;

        if (a.quantity > sell.quantity || a.quantity > buy.quantity) {
            check.error("ALLOCATION_EXCEEDS_PARENT", a.symbol, a.sell_order_id,
                        fmt::format("Allocation #{} qty {} exceeds sell {} ({}) or buy {} ({})",
                                    a.sequence, a.quantity.to_string(),
                                    sell.order_id, sell.quantity.to_string(),
                                    buy.order_id, buy.quantity.to_string()));
        }

        if (!FifoEngine::processing_order(buy, sell)) {
            check.error("TEMPORAL_VIOLATION", a.symbol, a.sell_order_id,
                        fmt::format("Buy {} is ordered after sell {}", buy.order_id, sell.order_id));
        }

        bool pnl_ok = a.buy_price == buy.price &&
                      a.sell_price == sell.price &&
                      a.cost_basis == a.buy_price * a.quantity + a.buy_fee_share &&
                      a.proceeds == a.sell_price * a.quantity &&
                      a.net_proceeds == a.proceeds - a.sell_fee_share &&
                      a.realized_pnl == a.net_proceeds - a.cost_basis;
        if (!pnl_ok) {
            check.error("PNL_MISMATCH", a.symbol, a.sell_order_id,
                        fmt::format("Allocation #{} figures do not recompute", a.sequence));
        }

        sell_matched[sell_key] += a.quantity;
        sell_fees[sell_key] += a.sell_fee_share;
        buy_consumed[buy_key] += a.quantity;
        buy_fees[buy_key] += a.buy_fee_share;
        by_sell[sell_key].push_back(&a);
    }

    // Residues
    std::map<OrderKey, Decimal> sell_residue;
    for (const auto& r : residues) {
        OrderKey key{r.symbol, r.sell_order_id};
        auto it = records.find(key);
        if (it == records.end() || it->second->side != Side::SELL) {
            check.error("UNKNOWN_REFERENCE", r.symbol, r.sell_order_id,
                        fmt::format("Residue #{} references sell {} outside the snapshot",
                                    r.sequence, r.sell_order_id));
            continue;
        }
        if (sell_residue.count(key)) {
            check.error("DUPLICATE_ALLOCATION", r.symbol, r.sell_order_id,
                        "Sell has more than one residue");
        }
        sell_residue[key] += r.quantity;
        sell_fees[key] += r.sell_fee_share;
        check.warning("UNMATCHED_SELL_RESIDUE", r.symbol, r.sell_order_id,
                      fmt::format("{} units sold without buy history ({})",
                                  r.quantity.to_string(), to_string(r.policy)));
    }

    // Conservation per record
    for (const auto& [key, rec] : records) {
        if (rec->side == Side::SELL) {
            Decimal accounted = amount_of(sell_matched, key) + amount_of(sell_residue, key);
            if (accounted > rec->quantity) {
                check.error("OVER_ALLOCATED_SELL", key.first, key.second,
                            fmt::format("Sell qty {} but {} allocated",
                                        rec->quantity.to_string(), accounted.to_string()));
            } else if (accounted < rec->quantity) {
                check.error("UNDER_ALLOCATED_SELL", key.first, key.second,
                            fmt::format("Sell qty {} but only {} accounted for",
                                        rec->quantity.to_string(), accounted.to_string()));
            } else if (amount_of(sell_fees, key) != rec->fee) {
                check.error("FEE_SHARE_MISMATCH", key.first, key.second,
                            fmt::format("Sell fee {} but shares sum to {}",
                                        rec->fee.to_string(), amount_of(sell_fees, key).to_string()));
            }
        } else {
            Decimal consumed = amount_of(buy_consumed, key);
            Decimal fees = amount_of(buy_fees, key);
            if (consumed > rec->quantity) {
                check.error("BUY_OVERCONSUMED", key.first, key.second,
                            fmt::format("Buy qty {} but {} consumed",
                                        rec->quantity.to_string(), consumed.to_string()));
            } else if ((consumed == rec->quantity && fees != rec->fee) || fees > rec->fee) {
                check.error("FEE_SHARE_MISMATCH", key.first, key.second,
                            fmt::format("Buy fee {} but shares sum to {}",
                                        rec->fee.to_string(), fees.to_string()));
            }
        }
    }

    // FIFO order by replay
    for (auto& [symbol, recs] : by_symbol) {
        std::sort(recs.begin(), recs.end(), [](const TradeRecord* a, const TradeRecord* b) {
            return FifoEngine::processing_order(*a, *b);
        });

        std::deque<OpenBuy> open;
        auto drop_exhausted = [&open]() {
            while (!open.empty() && !open.front().remaining.is_positive()) {
                open.pop_front();
            }
        };

        for (const TradeRecord* rec : recs) {
            if (rec->side == Side::BUY) {
                open.push_back(OpenBuy{rec->order_id, rec->quantity});
                continue;
            }

            OrderKey sell_key{symbol, rec->order_id};
            auto& sell_allocs = by_sell[sell_key];
            std::sort(sell_allocs.begin(), sell_allocs.end(),
                      [](const FifoAllocation* a, const FifoAllocation* b) {
                          return a->sequence < b->sequence;
                      });

            for (const FifoAllocation* a : sell_allocs) {
                drop_exhausted();
                if (!open.empty() && open.front().order_id != a->buy_order_id) {
                    check.error("FIFO_ORDER_VIOLATION", symbol, rec->order_id,
                                fmt::format("Sell {} consumed buy {} while earlier buy {} had {} open",
                                            rec->order_id, a->buy_order_id,
                                            open.front().order_id,
                                            open.front().remaining.to_string()));
                }
                auto lot = std::find_if(open.begin(), open.end(), [a](const OpenBuy& b) {
                    return b.order_id == a->buy_order_id;
                });
                if (lot != open.end()) {
                    lot->remaining -= min(a->quantity, lot->remaining);
                }
            }

            if (sell_residue.count(sell_key)) {
                drop_exhausted();
                if (!open.empty()) {
                    check.error("RESIDUE_WITH_OPEN_LOTS", symbol, rec->order_id,
                                fmt::format("Sell {} left a residue while buy {} had {} open",
                                            rec->order_id, open.front().order_id,
                                            open.front().remaining.to_string()));
                }
            }
        }
    }

    result.is_valid = result.error_count() == 0;

    if (result.is_valid) {
        spdlog::info("{}", result.summary());
    } else {
        spdlog::error("{}", result.summary());
    }
    for (const auto& issue : result.issues) {
        if (issue.severity == ValidationIssue::Severity::ERROR) {
            spdlog::error("  [{}] {} {}: {}", issue.code, issue.symbol, issue.order_id, issue.message);
        } else {
            spdlog::warn("  [{}] {} {}: {}", issue.code, issue.symbol, issue.order_id, issue.message);
        }
    }

    return result;
}

} // namespace fifo
