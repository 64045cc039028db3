#pragma once

#include <string>
#include <vector>
#include <map>
#include "common/types.hpp"
#include "common/decimal.hpp"
#include "core/allocation.hpp"

namespace fifo {

/**
 * Everything one engine pass produces. Pure data, no version attached.
 */
struct EngineResult {
    std::vector<FifoAllocation> allocations;
    std::vector<UnmatchedResidue> residues;
    std::vector<OpenLot> open_lots;         // Inventory left after the pass

    int symbols_processed{0};
    int buys{0};
    int sells{0};
    int skipped_records{0};                 // Non-positive quantity
    Decimal total_realized_pnl;

    bool has_residues() const { return !residues.empty(); }
};

/**
 * Realized P&L rolled up per symbol, for reporting.
 */
struct SymbolPnl {
    std::string symbol;
    int allocations{0};
    int residues{0};
    Decimal matched_quantity;
    Decimal residue_quantity;
    Decimal cost_basis;
    Decimal net_proceeds;
    Decimal realized_pnl;
    Decimal fees;
};

std::map<std::string, SymbolPnl> pnl_by_symbol(const std::vector<FifoAllocation>& allocations,
                                               const std::vector<UnmatchedResidue>& residues);

/**
 * FIFO lot matching.
 *
 * Per symbol, records are processed in (exchange_time, buys before sells,
 * order_id) order. Buys join the back of the open-lot queue; each sell
 * consumes from the front until it is filled or the queue is empty. Sell
 * quantity left over becomes an UnmatchedResidue.
 *
 * Fees are shared pro-rata by matched quantity over the order's total
 * quantity; the chunk that exhausts an order takes whatever fee is left so
 * the shares of one order always add up to its fee.
 *
 * The pass reads nothing but its arguments: identical input gives
 * identical output, element for element.
 */
class FifoEngine {
public:
    explicit FifoEngine(ResiduePolicy residue_policy = ResiduePolicy::UNALLOCATED);

    // Empty scope = every symbol present in `records`
    EngineResult allocate(const std::vector<TradeRecord>& records,
                          const SymbolScope& scope = {}) const;

    ResiduePolicy residue_policy() const { return residue_policy_; }

    // Total order used for processing
    static bool processing_order(const TradeRecord& a, const TradeRecord& b);

private:
    ResiduePolicy residue_policy_;

    void allocate_symbol(const std::string& symbol,
                         std::vector<const TradeRecord*>& records,
                         EngineResult& result,
                         int64_t& sequence) const;
};

} // namespace fifo
