#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "common/decimal.hpp"

namespace fifo {

/**
 * Lifecycle of an allocation version. Only COMPUTING moves to VALID or
 * INVALID; only VALID moves to SUPERSEDED.
 */
enum class AllocationStatus {
    COMPUTING,
    VALID,
    INVALID,
    SUPERSEDED
};

std::string to_string(AllocationStatus status);
AllocationStatus allocation_status_from_string(const std::string& s);

/**
 * Numeric treatment of sell quantity with no buy history behind it.
 * Both policies keep the residue flagged for manual review.
 */
enum class ResiduePolicy {
    UNALLOCATED,       // No cost basis, no realized P&L
    ZERO_COST_BASIS    // Cost basis zero, P&L = net proceeds
};

std::string to_string(ResiduePolicy policy);
ResiduePolicy residue_policy_from_string(const std::string& s);

/**
 * Immutable metadata of one computation run.
 */
struct AllocationVersion {
    std::string namespace_id;
    int64_t version_number{0};
    Micros created_at{0};
    Micros ledger_cutoff{0};        // Records with ingested_at <= cutoff were used
    SymbolScope scope;              // Empty = all symbols
    AllocationStatus status{AllocationStatus::COMPUTING};
    Micros status_changed_at{0};
    std::optional<int64_t> supersedes;
    std::optional<int64_t> superseded_by;
    std::string triggered_by;
    std::string status_reason;
};

/**
 * One matched lot: part of a sell consumed from one buy.
 */
struct FifoAllocation {
    int64_t sequence{0};            // Position within the version
    std::string symbol;
    std::string sell_order_id;
    std::string buy_order_id;
    Decimal quantity;
    Decimal buy_price;
    Decimal sell_price;
    Decimal buy_fee_share;
    Decimal sell_fee_share;
    Decimal cost_basis;             // buy_price * qty + buy_fee_share
    Decimal proceeds;               // sell_price * qty
    Decimal net_proceeds;           // proceeds - sell_fee_share
    Decimal realized_pnl;           // net_proceeds - cost_basis
    Micros buy_time{0};
    Micros sell_time{0};

    bool operator==(const FifoAllocation& other) const;
    bool operator!=(const FifoAllocation& other) const { return !(*this == other); }
};

/**
 * Sell quantity for which no open buy lot existed in the scanned history.
 */
struct UnmatchedResidue {
    int64_t sequence{0};
    std::string symbol;
    std::string sell_order_id;
    Decimal quantity;
    Decimal sell_price;
    Decimal sell_fee_share;
    Decimal proceeds;
    Decimal net_proceeds;
    std::optional<Decimal> realized_pnl;   // Only under ZERO_COST_BASIS
    ResiduePolicy policy{ResiduePolicy::UNALLOCATED};
    Micros sell_time{0};
    std::string note;

    bool operator==(const UnmatchedResidue& other) const;
    bool operator!=(const UnmatchedResidue& other) const { return !(*this == other); }
};

/**
 * Buy lot still holding quantity after all sells were processed.
 */
struct OpenLot {
    std::string symbol;
    std::string buy_order_id;
    Decimal remaining;
    Decimal original_quantity;
    Decimal price;
    Micros buy_time{0};

    bool operator==(const OpenLot& other) const;
};

/**
 * Request to compute a new version for a namespace.
 */
struct AllocationRequest {
    std::string namespace_id;
    SymbolScope scope;                  // Empty = all
    std::optional<Micros> cutoff;       // Defaults to the time the run starts
    std::string triggered_by{"manual"};
};

/**
 * Structured finding from the validation engine.
 */
struct ValidationIssue {
    enum class Severity { WARNING, ERROR };

    Severity severity{Severity::ERROR};
    std::string code;        // e.g. OVER_ALLOCATED_SELL, FIFO_ORDER_VIOLATION
    std::string symbol;
    std::string order_id;
    std::string message;
};

std::string to_string(ValidationIssue::Severity s);

struct ValidationResult {
    std::string namespace_id;
    int64_t version_number{0};
    bool is_valid{false};

    int total_allocations{0};
    int total_residues{0};
    int total_sells{0};
    int total_buys{0};

    std::vector<ValidationIssue> issues;

    int error_count() const;
    int warning_count() const;
    bool flagged_for_audit() const { return total_residues > 0 || warning_count() > 0; }
    std::string summary() const;
};

void to_json(nlohmann::json& j, const AllocationVersion& v);
void to_json(nlohmann::json& j, const FifoAllocation& a);
void to_json(nlohmann::json& j, const UnmatchedResidue& r);
void to_json(nlohmann::json& j, const ValidationIssue& i);

} // namespace fifo
