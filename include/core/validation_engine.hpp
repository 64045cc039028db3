#pragma once

#include <vector>
#include "common/types.hpp"
#include "core/allocation.hpp"

namespace fifo {

/**
 * Structural checks over one finished allocation version.
 *
 * Errors (version never promoted):
 *   OVER_ALLOCATED_SELL, UNDER_ALLOCATED_SELL, ALLOCATION_EXCEEDS_PARENT,
 *   BUY_OVERCONSUMED, FIFO_ORDER_VIOLATION, RESIDUE_WITH_OPEN_LOTS,
 *   TEMPORAL_VIOLATION, DUPLICATE_ALLOCATION, UNKNOWN_REFERENCE,
 *   NON_POSITIVE_QUANTITY, PNL_MISMATCH, FEE_SHARE_MISMATCH
 * Warnings (flagged for audit, errors in strict mode):
 *   UNMATCHED_SELL_RESIDUE
 */
class ValidationEngine {
public:
    explicit ValidationEngine(bool strict = false);

    // `snapshot` is the ledger scan the version was computed from
    ValidationResult validate(const AllocationVersion& version,
                              const std::vector<TradeRecord>& snapshot,
                              const std::vector<FifoAllocation>& allocations,
                              const std::vector<UnmatchedResidue>& residues) const;

    bool strict() const { return strict_; }

private:
    bool strict_;
};

} // namespace fifo
