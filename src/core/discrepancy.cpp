#include "core/discrepancy.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace fifo {

std::string to_string(DiscrepancyKind kind) {
    switch (kind) {
        case DiscrepancyKind::MISSING_TRADE: return "MissingTrade";
        case DiscrepancyKind::EXTRA_TRADE: return "ExtraTrade";
        case DiscrepancyKind::AMOUNT_MISMATCH: return "AmountMismatch";
    }
    return "Unknown";
}

DiscrepancyKind discrepancy_kind_from_string(const std::string& s) {
    if (s == "MissingTrade") return DiscrepancyKind::MISSING_TRADE;
    if (s == "ExtraTrade") return DiscrepancyKind::EXTRA_TRADE;
    if (s == "AmountMismatch") return DiscrepancyKind::AMOUNT_MISMATCH;
    throw std::invalid_argument("Unknown discrepancy kind: " + s);
}

std::string to_string(ReconciliationTier tier) {
    return tier == ReconciliationTier::PRESENCE ? "tier1" : "tier2";
}

int ReconciliationReport::count(DiscrepancyKind kind) const {
    int n = 0;
    for (const auto& d : discrepancies) {
        if (d.kind == kind) n++;
    }
    return n;
}

std::vector<Discrepancy> ReconciliationReport::of_kind(DiscrepancyKind kind) const {
    std::vector<Discrepancy> out;
    for (const auto& d : discrepancies) {
        if (d.kind == kind) out.push_back(d);
    }
    return out;
}

std::string ReconciliationReport::summary() const {
    std::string tier_names;
    for (auto t : tiers) {
        if (!tier_names.empty()) tier_names += "+";
        tier_names += to_string(t);
    }
    return fmt::format(
        "Reconciliation {} [{}] {}: local={} external={}, missing={}, extra={}, mismatched={}",
        report_id, tier_names, scope_to_string(symbols),
        local_trades, external_trades,
        count(DiscrepancyKind::MISSING_TRADE),
        count(DiscrepancyKind::EXTRA_TRADE),
        count(DiscrepancyKind::AMOUNT_MISMATCH));
}

namespace {

nlohmann::json optional_decimal(const std::optional<Decimal>& d) {
    return d ? nlohmann::json(*d) : nlohmann::json(nullptr);
}

std::optional<Decimal> read_optional_decimal(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<Decimal>();
}

} // namespace

void to_json(nlohmann::json& j, const Discrepancy& d) {
    j = nlohmann::json{
        {"kind", to_string(d.kind)},
        {"symbol", d.symbol},
        {"order_ids", d.order_ids},
        {"field", d.field},
        {"details", d.details}
    };
    j["side"] = d.side ? nlohmann::json(side_to_string(*d.side)) : nlohmann::json(nullptr);
    j["local_value"] = optional_decimal(d.local_value);
    j["external_value"] = optional_decimal(d.external_value);
    j["delta"] = optional_decimal(d.delta);
}

void from_json(const nlohmann::json& j, Discrepancy& d) {
    d.kind = discrepancy_kind_from_string(j.at("kind").get<std::string>());
    d.symbol = j.value("symbol", "");
    if (j.contains("order_ids")) j.at("order_ids").get_to(d.order_ids);
    d.field = j.value("field", "");
    d.details = j.value("details", "");
    if (j.contains("side") && !j.at("side").is_null()) {
        d.side = side_from_string(j.at("side").get<std::string>());
    }
    d.local_value = read_optional_decimal(j, "local_value");
    d.external_value = read_optional_decimal(j, "external_value");
    d.delta = read_optional_decimal(j, "delta");
}

void to_json(nlohmann::json& j, const ReconciliationReport& r) {
    nlohmann::json tiers = nlohmann::json::array();
    for (auto t : r.tiers) tiers.push_back(to_string(t));

    j = nlohmann::json{
        {"report_id", r.report_id},
        {"namespace", r.namespace_id},
        {"tiers", tiers},
        {"symbols", r.symbols},
        {"window_start", r.window.start},
        {"window_end", r.window.end},
        {"snapshot_cutoff", r.snapshot_cutoff},
        {"created_at", r.created_at},
        {"local_trades", r.local_trades},
        {"external_trades", r.external_trades},
        {"discrepancies", r.discrepancies}
    };
}

void to_json(nlohmann::json& j, const ReviewItem& r) {
    j = nlohmann::json{
        {"id", r.id},
        {"order_id", r.order_id},
        {"symbol", r.symbol},
        {"issue_type", r.issue_type},
        {"severity", r.severity},
        {"status", r.status},
        {"description", r.description},
        {"resolution", r.resolution},
        {"resolved_by", r.resolved_by},
        {"created_at", r.created_at},
        {"updated_at", r.updated_at},
        {"resolved_at", r.resolved_at}
    };
}

} // namespace fifo
