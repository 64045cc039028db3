#include "core/fifo_engine.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <deque>
#include <set>

namespace fifo {

namespace {

/**
 * Quantity and fee still unassigned on one order.
 */
struct OrderBalance {
    const TradeRecord* record{nullptr};
    Decimal remaining;
    Decimal fee_remaining;

    // Fee share for taking `qty` units off this order
    Decimal take(const Decimal& qty) {
        Decimal share;
        if (qty == remaining) {
            share = fee_remaining;
        } else {
            share = Decimal::mul_div(record->fee, qty, record->quantity);
            share = min(share, fee_remaining);
        }
        remaining -= qty;
        fee_remaining -= share;
        return share;
    }
};

} // namespace

FifoEngine::FifoEngine(ResiduePolicy residue_policy)
    : residue_policy_(residue_policy)
{
}

bool FifoEngine::processing_order(const TradeRecord& a, const TradeRecord& b) {
    if (a.exchange_time != b.exchange_time) return a.exchange_time < b.exchange_time;
    if (a.side != b.side) return a.side == Side::BUY;
    if (a.order_id != b.order_id) return a.order_id < b.order_id;
    return a.symbol < b.symbol;
}

EngineResult FifoEngine::allocate(const std::vector<TradeRecord>& records,
                                  const SymbolScope& scope) const {
    EngineResult result;

    std::set<std::string> wanted(scope.begin(), scope.end());

    // std::map keeps symbols in a fixed order
    std::map<std::string, std::vector<const TradeRecord*>> by_symbol;
    for (const auto& r : records) {
        if (!wanted.empty() && wanted.count(r.symbol) == 0) continue;
        if (!r.quantity.is_positive()) {
            spdlog::warn("Skipping {} {} with non-positive quantity {}",
                         side_to_string(r.side), r.order_id, r.quantity.to_string());
            result.skipped_records++;
            continue;
        }
        by_symbol[r.symbol].push_back(&r);
    }

    int64_t sequence = 0;
    for (auto& [symbol, symbol_records] : by_symbol) {
        allocate_symbol(symbol, symbol_records, result, sequence);
        result.symbols_processed++;
    }

    for (const auto& a : result.allocations) {
        result.total_realized_pnl += a.realized_pnl;
    }
    for (const auto& r : result.residues) {
        if (r.realized_pnl) {
            result.total_realized_pnl += *r.realized_pnl;
        }
    }

    spdlog::info("FIFO pass: {} symbols, {} buys, {} sells -> {} allocations, {} residues, "
                 "{} open lots, realized P&L {}",
                 result.symbols_processed, result.buys, result.sells,
                 result.allocations.size(), result.residues.size(),
                 result.open_lots.size(), result.total_realized_pnl.to_string());
    return result;
}

void FifoEngine::allocate_symbol(const std::string& symbol,
                                 std::vector<const TradeRecord*>& records,
                                 EngineResult& result,
                                 int64_t& sequence) const {
    std::sort(records.begin(), records.end(),
              [](const TradeRecord* a, const TradeRecord* b) { return processing_order(*a, *b); });

    std::deque<OrderBalance> lots;

    for (const TradeRecord* rec : records) {
        if (rec->side == Side::BUY) {
            lots.push_back(OrderBalance{rec, rec->quantity, rec->fee});
            result.buys++;
            continue;
        }

        result.sells++;
        OrderBalance sell{rec, rec->quantity, rec->fee};

        while (sell.remaining.is_positive() && !lots.empty()) {
            OrderBalance& lot = lots.front();
            Decimal qty = min(sell.remaining, lot.remaining);

            FifoAllocation a;
            a.sequence = ++sequence;
            a.symbol = symbol;
            a.sell_order_id = rec->order_id;
            a.buy_order_id = lot.record->order_id;
            a.quantity = qty;
            a.buy_price = lot.record->price;
            a.sell_price = rec->price;
            a.buy_fee_share = lot.take(qty);
            a.sell_fee_share = sell.take(qty);
            a.cost_basis = a.buy_price * qty + a.buy_fee_share;
            a.proceeds = a.sell_price * qty;
            a.net_proceeds = a.proceeds - a.sell_fee_share;
            a.realized_pnl = a.net_proceeds - a.cost_basis;
            a.buy_time = lot.record->exchange_time;
            a.sell_time = rec->exchange_time;

            spdlog::debug("  {} sell {} <- buy {}: {} @ {} / {} pnl {}",
                          symbol, a.sell_order_id, a.buy_order_id, qty.to_string(),
                          a.buy_price.to_string(), a.sell_price.to_string(),
                          a.realized_pnl.to_string());
            result.allocations.push_back(std::move(a));

            if (lot.remaining.is_zero()) {
                lots.pop_front();
            }
        }

        if (sell.remaining.is_positive()) {
            UnmatchedResidue r;
            r.sequence = ++sequence;
            r.symbol = symbol;
            r.sell_order_id = rec->order_id;
            r.quantity = sell.remaining;
            r.sell_price = rec->price;
            r.sell_fee_share = sell.take(sell.remaining);
            r.proceeds = r.sell_price * r.quantity;
            r.net_proceeds = r.proceeds - r.sell_fee_share;
            r.policy = residue_policy_;
            if (residue_policy_ == ResiduePolicy::ZERO_COST_BASIS) {
                r.realized_pnl = r.net_proceeds;
            }
            r.sell_time = rec->exchange_time;
            r.note = fmt::format("No buy history for {} of {} {} units sold",
                                 r.quantity.to_string(), rec->quantity.to_string(), symbol);

            spdlog::warn("Unmatched sell residue: {} {} qty {} ({})",
                         symbol, r.sell_order_id, r.quantity.to_string(), to_string(r.policy));
            result.residues.push_back(std::move(r));
        }
    }

    for (const auto& lot : lots) {
        OpenLot open;
        open.symbol = symbol;
        open.buy_order_id = lot.record->order_id;
        open.remaining = lot.remaining;
        open.original_quantity = lot.record->quantity;
        open.price = lot.record->price;
        open.buy_time = lot.record->exchange_time;
        result.open_lots.push_back(open);
    }
}

std::map<std::string, SymbolPnl> pnl_by_symbol(const std::vector<FifoAllocation>& allocations,
                                               const std::vector<UnmatchedResidue>& residues) {
    std::map<std::string, SymbolPnl> out;
    for (const auto& a : allocations) {
        auto& s = out[a.symbol];
        s.symbol = a.symbol;
        s.allocations++;
        s.matched_quantity += a.quantity;
        s.cost_basis += a.cost_basis;
        s.net_proceeds += a.net_proceeds;
        s.realized_pnl += a.realized_pnl;
        s.fees += a.buy_fee_share + a.sell_fee_share;
    }
    for (const auto& r : residues) {
        auto& s = out[r.symbol];
        s.symbol = r.symbol;
        s.residues++;
        s.residue_quantity += r.quantity;
        s.fees += r.sell_fee_share;
        if (r.realized_pnl) {
            s.net_proceeds += r.net_proceeds;
            s.realized_pnl += *r.realized_pnl;
        }
    }
    return out;
}

} // namespace fifo
