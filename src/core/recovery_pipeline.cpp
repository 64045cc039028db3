#include "core/recovery_pipeline.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <map>
#include <set>

namespace fifo {

std::string RecoveryResult::summary() const {
    std::string s = fmt::format("Recovery {}", success ? "SUCCESS" : "FAILED");
    if (reconciliation.report) {
        s += fmt::format(" | {}", reconciliation.report->summary());
    } else if (!reconciliation.success && !reconciliation.error_message.empty()) {
        s += fmt::format(" | {}", reconciliation.summary());
    }
    if (backfill) {
        s += fmt::format(" | {}", backfill->summary());
    }
    if (allocation) {
        s += fmt::format(" | {}", allocation->summary());
    }
    if (review_items_queued > 0) {
        s += fmt::format(" | {} items queued for review", review_items_queued);
    }
    if (error_kind != ErrorKind::NONE && !error_message.empty()) {
        s += fmt::format(" [{}: {}]", error_kind_to_string(error_kind), error_message);
    }
    return s;
}

RecoveryPipeline::RecoveryPipeline(ReconciliationEngine& reconciler,
                                   BackfillCoordinator& backfiller,
                                   AllocationService& allocator,
                                   VersionManager& versions,
                                   AllocationStore& allocations,
                                   AuditStore& audit)
    : RecoveryPipeline(reconciler, backfiller, allocator, versions, allocations, audit, Config{})
{
}

RecoveryPipeline::RecoveryPipeline(ReconciliationEngine& reconciler,
                                   BackfillCoordinator& backfiller,
                                   AllocationService& allocator,
                                   VersionManager& versions,
                                   AllocationStore& allocations,
                                   AuditStore& audit,
                                   const Config& config)
    : reconciler_(reconciler)
    , backfiller_(backfiller)
    , allocator_(allocator)
    , versions_(versions)
    , allocations_(allocations)
    , audit_(audit)
    , config_(config)
{
}

RecoveryResult RecoveryPipeline::run(const ReconciliationRequest& request) {
    RecoveryResult result;

    SymbolScope symbols = request.symbols;
    TimeWindow window = request.window;

    if (request.from_residues) {
        auto scope = residue_scope(request.namespace_id);
        if (!scope) {
            spdlog::info("No unmatched residues in the current version of {}, nothing to check",
                         request.namespace_id);
            result.success = true;
            result.reconciliation.success = true;
            return result;
        }
        symbols = scope->first;
        window = scope->second;
    }

    // Stage 1: reconcile
    result.reconciliation = reconciler_.run(request.namespace_id, request.tiers, symbols, window);
    if (!result.reconciliation.success) {
        result.error_kind = result.reconciliation.error_kind;
        result.error_message = result.reconciliation.error_message;
        return result;
    }
    const ReconciliationReport& report = *result.reconciliation.report;

    // Stage 2: audit trail
    audit_.save_report(report);
    result.review_items_queued = queue_discrepancies(report);

    result.success = true;
    flag_anomalies(result, result.review_items_queued);

    // Stage 3: backfill
    if (!request.auto_backfill || report.count(DiscrepancyKind::MISSING_TRADE) == 0) {
        spdlog::info("{}", result.summary());
        return result;
    }

    std::optional<SymbolScope> current_scope;
    if (auto current = versions_.get_current(request.namespace_id)) {
        current_scope = current->scope;
    }

    result.backfill = backfiller_.backfill(report, current_scope);
    if (!result.backfill->success) {
        result.success = false;
        result.error_kind = result.backfill->error_kind;
        result.error_message = result.backfill->error_message;
    }

    // Stage 4: recompute over what was committed, even after a partial failure
    if (result.backfill->allocation_request) {
        result.allocation = allocator_.run(*result.backfill->allocation_request);
        if (!result.allocation->success && result.success) {
            result.success = false;
            result.error_kind = result.allocation->error_kind;
            result.error_message = result.allocation->error_message;
        } else if (result.allocation->success) {
            flag_anomalies(result, result.allocation->anomalies);
        }
    }

    if (result.success) {
        spdlog::info("{}", result.summary());
    } else {
        spdlog::error("{}", result.summary());
    }
    return result;
}

void RecoveryPipeline::flag_anomalies(RecoveryResult& result, int count) const {
    if (count <= 0) return;
    result.anomalies += count;
    if (result.success) {
        result.error_kind = ErrorKind::DATA_INTEGRITY_ANOMALY;
        result.error_message = fmt::format("{} anomalies need manual review", result.anomalies);
    }
}

std::optional<std::pair<SymbolScope, TimeWindow>>
RecoveryPipeline::residue_scope(const std::string& namespace_id) {
    auto current = versions_.get_current(namespace_id);
    if (!current) {
        return std::nullopt;
    }

    auto residues = allocations_.get_residues(namespace_id, current->version_number);
    if (residues.empty()) {
        return std::nullopt;
    }

    std::set<std::string> symbols;
    Micros earliest = residues.front().sell_time;
    Micros latest = residues.front().sell_time;
    for (const auto& r : residues) {
        symbols.insert(r.symbol);
        earliest = std::min(earliest, r.sell_time);
        latest = std::max(latest, r.sell_time);
    }

    Micros padding = static_cast<Micros>(config_.residue_window_padding_days) * MICROS_PER_DAY;
    TimeWindow window{earliest - padding, latest + padding};

    SymbolScope scope(symbols.begin(), symbols.end());
    spdlog::info("Residue check for {} v{}: {} residues over [{}], window {} .. {}",
                 namespace_id, current->version_number, residues.size(),
                 scope_to_string(scope),
                 time_utils::to_iso8601(window.start), time_utils::to_iso8601(window.end));

    return std::make_pair(scope, window);
}

int RecoveryPipeline::queue_discrepancies(const ReconciliationReport& report) {
    // One review item per (order, issue); mismatched fields are merged
    std::map<std::pair<std::string, std::string>, ReviewItem> items;

    for (const auto& d : report.discrepancies) {
        if (d.kind == DiscrepancyKind::MISSING_TRADE) continue;

        bool extra = d.kind == DiscrepancyKind::EXTRA_TRADE;
        std::string issue_type = extra ? "extra_trade" : "amount_mismatch";
        auto key = std::make_pair(d.primary_order_id(), issue_type);

        auto it = items.find(key);
        if (it == items.end()) {
            ReviewItem item;
            item.order_id = d.primary_order_id();
            item.symbol = d.symbol;
            item.issue_type = issue_type;
            item.severity = extra ? "high" : "medium";
            item.description = fmt::format("report {}: ", report.report_id);
            it = items.emplace(key, std::move(item)).first;
        } else {
            it->second.description += "; ";
        }
        it->second.description += d.field.empty() ? d.details
                                                  : d.field + " " + d.details;
    }

    for (const auto& [key, item] : items) {
        audit_.enqueue_review(item);
    }
    if (!items.empty()) {
        spdlog::warn("Queued {} reconciliation anomalies for manual review", items.size());
    }
    return static_cast<int>(items.size());
}

} // namespace fifo
