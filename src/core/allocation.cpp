#include "core/allocation.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace fifo {

std::string to_string(AllocationStatus status) {
    switch (status) {
        case AllocationStatus::COMPUTING: return "computing";
        case AllocationStatus::VALID: return "valid";
        case AllocationStatus::INVALID: return "invalid";
        case AllocationStatus::SUPERSEDED: return "superseded";
    }
    return "unknown";
}

AllocationStatus allocation_status_from_string(const std::string& s) {
    if (s == "computing") return AllocationStatus::COMPUTING;
    if (s == "valid") return AllocationStatus::VALID;
    if (s == "invalid") return AllocationStatus::INVALID;
    if (s == "superseded") return AllocationStatus::SUPERSEDED;
    throw std::invalid_argument("Unknown allocation status: " + s);
}

std::string to_string(ResiduePolicy policy) {
    switch (policy) {
        case ResiduePolicy::UNALLOCATED: return "unallocated";
        case ResiduePolicy::ZERO_COST_BASIS: return "zero_cost_basis";
    }
    return "unknown";
}

ResiduePolicy residue_policy_from_string(const std::string& s) {
    if (s == "unallocated") return ResiduePolicy::UNALLOCATED;
    if (s == "zero_cost_basis") return ResiduePolicy::ZERO_COST_BASIS;
    throw std::invalid_argument("Unknown residue policy: " + s);
}

std::string to_string(ValidationIssue::Severity s) {
    return s == ValidationIssue::Severity::ERROR ? "error" : "warning";
}

bool FifoAllocation::operator==(const FifoAllocation& o) const {
    return sequence == o.sequence &&
           symbol == o.symbol &&
           sell_order_id == o.sell_order_id &&
           buy_order_id == o.buy_order_id &&
           quantity == o.quantity &&
           buy_price == o.buy_price &&
           sell_price == o.sell_price &&
           buy_fee_share == o.buy_fee_share &&
           sell_fee_share == o.sell_fee_share &&
           cost_basis == o.cost_basis &&
           proceeds == o.proceeds &&
           net_proceeds == o.net_proceeds &&
           realized_pnl == o.realized_pnl &&
           buy_time == o.buy_time &&
           sell_time == o.sell_time;
}

bool UnmatchedResidue::operator==(const UnmatchedResidue& o) const {
    return sequence == o.sequence &&
           symbol == o.symbol &&
           sell_order_id == o.sell_order_id &&
           quantity == o.quantity &&
           sell_price == o.sell_price &&
           sell_fee_share == o.sell_fee_share &&
           proceeds == o.proceeds &&
           net_proceeds == o.net_proceeds &&
           realized_pnl == o.realized_pnl &&
           policy == o.policy &&
           sell_time == o.sell_time &&
           note == o.note;
}

bool OpenLot::operator==(const OpenLot& o) const {
    return symbol == o.symbol &&
           buy_order_id == o.buy_order_id &&
           remaining == o.remaining &&
           original_quantity == o.original_quantity &&
           price == o.price &&
           buy_time == o.buy_time;
}

int ValidationResult::error_count() const {
    int n = 0;
    for (const auto& i : issues) {
        if (i.severity == ValidationIssue::Severity::ERROR) n++;
    }
    return n;
}

int ValidationResult::warning_count() const {
    int n = 0;
    for (const auto& i : issues) {
        if (i.severity == ValidationIssue::Severity::WARNING) n++;
    }
    return n;
}

std::string ValidationResult::summary() const {
    std::string s = fmt::format("Validation {} v{}: {}, ",
                                namespace_id, version_number,
                                is_valid ? "VALID" : "INVALID");
    s += fmt::format("{} allocations, {} residues, ", total_allocations, total_residues);
    s += fmt::format("{} sells, {} buys, ", total_sells, total_buys);
    s += fmt::format("{} errors, {} warnings", error_count(), warning_count());
    if (is_valid && flagged_for_audit()) {
        s += " [FLAGGED FOR AUDIT]";
    }
    return s;
}

void to_json(nlohmann::json& j, const AllocationVersion& v) {
    j = nlohmann::json{
        {"namespace", v.namespace_id},
        {"version", v.version_number},
        {"created_at", v.created_at},
        {"ledger_cutoff", v.ledger_cutoff},
        {"scope", v.scope},
        {"status", to_string(v.status)},
        {"status_changed_at", v.status_changed_at},
        {"triggered_by", v.triggered_by},
        {"status_reason", v.status_reason}
    };
    j["supersedes"] = v.supersedes ? nlohmann::json(*v.supersedes) : nlohmann::json(nullptr);
    j["superseded_by"] = v.superseded_by ? nlohmann::json(*v.superseded_by) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const FifoAllocation& a) {
    j = nlohmann::json{
        {"sequence", a.sequence},
        {"symbol", a.symbol},
        {"sell_order_id", a.sell_order_id},
        {"buy_order_id", a.buy_order_id},
        {"quantity", a.quantity},
        {"buy_price", a.buy_price},
        {"sell_price", a.sell_price},
        {"buy_fee_share", a.buy_fee_share},
        {"sell_fee_share", a.sell_fee_share},
        {"cost_basis", a.cost_basis},
        {"proceeds", a.proceeds},
        {"net_proceeds", a.net_proceeds},
        {"realized_pnl", a.realized_pnl},
        {"buy_time", a.buy_time},
        {"sell_time", a.sell_time}
    };
}

void to_json(nlohmann::json& j, const UnmatchedResidue& r) {
    j = nlohmann::json{
        {"sequence", r.sequence},
        {"symbol", r.symbol},
        {"sell_order_id", r.sell_order_id},
        {"quantity", r.quantity},
        {"sell_price", r.sell_price},
        {"sell_fee_share", r.sell_fee_share},
        {"proceeds", r.proceeds},
        {"net_proceeds", r.net_proceeds},
        {"policy", to_string(r.policy)},
        {"sell_time", r.sell_time},
        {"note", r.note}
    };
    j["realized_pnl"] = r.realized_pnl ? nlohmann::json(*r.realized_pnl) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const ValidationIssue& i) {
    j = nlohmann::json{
        {"severity", to_string(i.severity)},
        {"code", i.code},
        {"symbol", i.symbol},
        {"order_id", i.order_id},
        {"message", i.message}
    };
}

} // namespace fifo
