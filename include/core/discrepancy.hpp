#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "common/decimal.hpp"

namespace fifo {

/**
 * Discrepancy kinds found by the reconciliation tiers.
 */
enum class DiscrepancyKind {
    MISSING_TRADE,     // Present on the exchange, absent locally
    EXTRA_TRADE,       // Present locally, absent on the exchange
    AMOUNT_MISMATCH    // Present in both, quantity/price/fee differ
};

std::string to_string(DiscrepancyKind kind);
DiscrepancyKind discrepancy_kind_from_string(const std::string& s);

/**
 * A single discrepancy. For AMOUNT_MISMATCH the field names which value
 * differs and delta = external - local.
 */
struct Discrepancy {
    DiscrepancyKind kind{DiscrepancyKind::MISSING_TRADE};
    std::string symbol;
    std::vector<std::string> order_ids;
    std::optional<Side> side;
    std::string field;
    std::optional<Decimal> local_value;
    std::optional<Decimal> external_value;
    std::optional<Decimal> delta;
    std::string details;

    std::string primary_order_id() const {
        return order_ids.empty() ? std::string() : order_ids.front();
    }
};

enum class ReconciliationTier {
    PRESENCE = 1,   // Tier 1
    VALUE = 2       // Tier 2
};

std::string to_string(ReconciliationTier tier);

/**
 * Immutable result of one reconciliation run.
 */
struct ReconciliationReport {
    std::string report_id;
    std::string namespace_id;
    std::vector<ReconciliationTier> tiers;
    SymbolScope symbols;
    TimeWindow window;
    Micros snapshot_cutoff{0};     // Ledger state the report is relative to
    Micros created_at{0};
    int local_trades{0};
    int external_trades{0};
    std::vector<Discrepancy> discrepancies;

    int count(DiscrepancyKind kind) const;
    std::vector<Discrepancy> of_kind(DiscrepancyKind kind) const;
    bool is_consistent() const { return discrepancies.empty(); }
    std::string summary() const;
};

/**
 * Item in the manual review queue.
 */
struct ReviewItem {
    int64_t id{0};
    std::string order_id;
    std::string symbol;
    std::string issue_type;     // unmatched_sell, extra_trade, amount_mismatch
    std::string severity;       // low, medium, high, critical
    std::string status{"pending"};
    std::string description;
    std::string resolution;
    std::string resolved_by;
    Micros created_at{0};
    Micros updated_at{0};
    Micros resolved_at{0};

    bool is_resolved() const { return status == "resolved" || status == "dismissed"; }
};

void to_json(nlohmann::json& j, const Discrepancy& d);
void from_json(const nlohmann::json& j, Discrepancy& d);
void to_json(nlohmann::json& j, const ReconciliationReport& r);
void to_json(nlohmann::json& j, const ReviewItem& r);

} // namespace fifo
