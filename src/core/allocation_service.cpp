#include "core/allocation_service.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <stdexcept>

namespace fifo {

std::string AllocationRunResult::summary() const {
    std::string s;
    s += fmt::format("Allocation {}", success ? "SUCCESS" : "FAILED");
    if (version) {
        s += fmt::format(" v{} ({})", version->version_number, to_string(version->status));
    }
    s += fmt::format(": {} symbols, {} buys, {} sells, ",
                     engine.symbols_processed, engine.buys, engine.sells);
    s += fmt::format("{} allocations, {} residues, ", engine.allocations.size(), engine.residues.size());
    s += fmt::format("realized P&L {}", engine.total_realized_pnl.to_string());
    if (promoted) {
        s += superseded ? fmt::format(", promoted (supersedes v{})", *superseded)
                        : std::string(", promoted");
    }
    if (validation.flagged_for_audit()) {
        s += ", flagged for audit";
    }
    if (!error_message.empty()) {
        s += fmt::format(" [{}: {}]", error_kind_to_string(error_kind), error_message);
    }
    return s;
}

AllocationService::AllocationService(TradeLedgerStore& ledger,
                                     AllocationStore& allocations,
                                     AuditStore& audit,
                                     VersionManager& versions)
    : AllocationService(ledger, allocations, audit, versions, Config{})
{
}

AllocationService::AllocationService(TradeLedgerStore& ledger,
                                     AllocationStore& allocations,
                                     AuditStore& audit,
                                     VersionManager& versions,
                                     const Config& config)
    : ledger_(ledger)
    , allocations_(allocations)
    , audit_(audit)
    , versions_(versions)
    , config_(config)
    , engine_(config.residue_policy)
    , validator_(config.strict_validation)
{
}

AllocationRunResult AllocationService::run(const AllocationRequest& request) {
    AllocationRunResult result;
    time_utils::LatencyTimer timer;
    timer.start();
    Micros started_at = now_micros();

    if (request.namespace_id.empty()) {
        throw std::invalid_argument("Allocation request without namespace");
    }

    spdlog::info("Starting allocation for {}: symbols=[{}], triggered by {}",
                 request.namespace_id, scope_to_string(request.scope), request.triggered_by);

    std::optional<ComputationLease> lease;
    try {
        lease.emplace(versions_.acquire_lease(request.namespace_id));
    } catch (const ComputationInProgressError& e) {
        result.error_kind = ErrorKind::COMPUTATION_IN_PROGRESS;
        result.error_message = e.what();
        spdlog::warn("Allocation for {} not started: {}", request.namespace_id, e.what());
        return result;
    }

    // Snapshot: everything ingested up to the cutoff, nothing after
    Micros cutoff = request.cutoff.value_or(now_micros());
    auto records = ledger_.scan(request.scope, cutoff);
    result.engine = engine_.allocate(records, request.scope);

    AllocationVersion version;
    try {
        version = versions_.create_version(request.namespace_id, cutoff,
                                           request.scope, request.triggered_by);
    } catch (const VersionConflictError& e) {
        result.error_kind = ErrorKind::VERSION_CONFLICT;
        result.error_message = e.what();
        timer.stop();
        result.duration_ms = timer.elapsed_ms();
        log_run(result, request, started_at, "failed");
        spdlog::error("Allocation for {} aborted: {}", request.namespace_id, e.what());
        return result;
    }
    result.version = version;
    int64_t v = version.version_number;

    try {
        allocations_.write_allocations(request.namespace_id, v,
                                       result.engine.allocations, result.engine.residues);

        result.validation = validator_.validate(version, records,
                                                result.engine.allocations, result.engine.residues);
        allocations_.write_validation_issues(request.namespace_id, v, result.validation.issues);

        std::string status = "completed";
        if (result.validation.is_valid) {
            std::string reason;
            if (result.validation.flagged_for_audit()) {
                reason = fmt::format("flagged for audit: {} residues, {} warnings",
                                     result.validation.total_residues,
                                     result.validation.warning_count());
            }
            versions_.mark_valid(request.namespace_id, v, reason);

            try {
                result.superseded = versions_.promote(request.namespace_id, v);
                result.promoted = true;
            } catch (const VersionConflictError& e) {
                result.error_kind = ErrorKind::VERSION_CONFLICT;
                result.error_message = e.what();
                status = "conflict";
                spdlog::error("v{} is valid but was not promoted: {}", v, e.what());
            }
        } else {
            std::string reason = fmt::format("{} validation errors", result.validation.error_count());
            versions_.mark_invalid(request.namespace_id, v, reason);
            result.error_kind = ErrorKind::VALIDATION_FAILURE;
            result.error_message = reason;
            status = "invalid";
        }

        result.review_items_queued = queue_residues(result.engine.residues, v);

        lease->release();

        result.version = versions_.get_by_version(request.namespace_id, v);
        result.success = result.validation.is_valid && result.promoted;

        result.anomalies = static_cast<int>(result.engine.residues.size());
        if (result.anomalies > 0 && result.error_kind == ErrorKind::NONE) {
            result.error_kind = ErrorKind::DATA_INTEGRITY_ANOMALY;
            result.error_message = fmt::format("{} unmatched sell residues queued for review",
                                               result.anomalies);
        }

        timer.stop();
        result.duration_ms = timer.elapsed_ms();
        log_run(result, request, started_at, status);
    } catch (const std::exception& e) {
        spdlog::error("Allocation v{} for {} failed: {}", v, request.namespace_id, e.what());
        try {
            versions_.mark_invalid(request.namespace_id, v, std::string("run failed: ") + e.what());
        } catch (const std::exception& inner) {
            spdlog::error("Could not mark v{} invalid: {}", v, inner.what());
        }
        try {
            result.error_message = e.what();
            timer.stop();
            result.duration_ms = timer.elapsed_ms();
            log_run(result, request, started_at, "failed");
        } catch (const std::exception& inner) {
            spdlog::error("Could not log failed run v{}: {}", v, inner.what());
        }
        throw;
    }

    if (result.success) {
        spdlog::info("{} in {}", result.summary(), time_utils::format_duration_ms(result.duration_ms));
    } else {
        spdlog::error("{}", result.summary());
    }
    return result;
}

ValidationResult AllocationService::revalidate(const std::string& namespace_id,
                                               int64_t version_number) {
    auto version = versions_.get_by_version(namespace_id, version_number);
    if (!version) {
        throw std::invalid_argument(fmt::format("Unknown version {} v{}", namespace_id, version_number));
    }

    auto records = ledger_.scan(version->scope, version->ledger_cutoff);
    auto allocations = allocations_.get_allocations(namespace_id, version_number);
    auto residues = allocations_.get_residues(namespace_id, version_number);

    spdlog::info("Revalidating {} v{} ({}) against {} records",
                 namespace_id, version_number, to_string(version->status), records.size());

    return validator_.validate(*version, records, allocations, residues);
}

int AllocationService::queue_residues(const std::vector<UnmatchedResidue>& residues,
                                      int64_t version_number) {
    int queued = 0;
    for (const auto& r : residues) {
        ReviewItem item;
        item.order_id = r.sell_order_id;
        item.symbol = r.symbol;
        item.issue_type = "unmatched_sell";
        item.severity = "medium";
        item.description = fmt::format("v{}: {} {} sold without buy history ({})",
                                       version_number, r.quantity.to_string(), r.symbol,
                                       to_string(r.policy));
        audit_.enqueue_review(item);
        queued++;
    }
    if (queued > 0) {
        spdlog::warn("Queued {} unmatched sell residues for manual review", queued);
    }
    return queued;
}

void AllocationService::log_run(const AllocationRunResult& result,
                                const AllocationRequest& request,
                                Micros started_at,
                                const std::string& status) {
    ComputationLogEntry entry;
    entry.namespace_id = request.namespace_id;
    entry.version_number = result.version ? result.version->version_number : 0;
    entry.started_at = started_at;
    entry.finished_at = now_micros();
    entry.duration_ms = result.duration_ms;
    entry.symbols_processed = result.engine.symbols_processed;
    entry.buys = result.engine.buys;
    entry.sells = result.engine.sells;
    entry.allocations = static_cast<int>(result.engine.allocations.size());
    entry.residues = static_cast<int>(result.engine.residues.size());
    entry.total_pnl = result.engine.total_realized_pnl;
    entry.triggered_by = request.triggered_by;
    entry.status = status;
    entry.error_message = result.error_message;
    allocations_.log_computation(entry);
}

} // namespace fifo
