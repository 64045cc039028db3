#pragma once

#include <string>
#include <vector>
#include <optional>
#include "common/types.hpp"
#include "common/errors.hpp"
#include "core/discrepancy.hpp"
#include "core/reconciliation_engine.hpp"
#include "core/backfill_coordinator.hpp"
#include "core/allocation_service.hpp"
#include "core/version_manager.hpp"
#include "persistence/stores.hpp"

namespace fifo {

/**
 * A reconciliation run as requested by an operator or a scheduler.
 */
struct ReconciliationRequest {
    std::string namespace_id;
    std::vector<ReconciliationTier> tiers{ReconciliationTier::PRESENCE};
    SymbolScope symbols;                // Empty = all symbols in the ledger or on the exchange
    TimeWindow window;
    bool auto_backfill{false};

    // Derive symbols and window from the current version's residues
    // instead of `symbols` / `window`
    bool from_residues{false};
};

/**
 * Completed runs whose report or recomputation left anomalies for manual
 * review keep success and report DATA_INTEGRITY_ANOMALY.
 */
struct RecoveryResult {
    bool success{false};
    ErrorKind error_kind{ErrorKind::NONE};
    std::string error_message;

    ReconciliationOutcome reconciliation;
    std::optional<BackfillResult> backfill;
    std::optional<AllocationRunResult> allocation;
    int review_items_queued{0};
    int anomalies{0};                   // Extra trades, mismatches and new residues

    std::string summary() const;
};

/**
 * Reconcile -> persist report -> queue anomalies -> backfill ->
 * recompute. Stages only exchange value types; each one can be run and
 * tested on its own.
 */
class RecoveryPipeline {
public:
    struct Config {
        int residue_window_padding_days{30};
    };

    RecoveryPipeline(ReconciliationEngine& reconciler,
                     BackfillCoordinator& backfiller,
                     AllocationService& allocator,
                     VersionManager& versions,
                     AllocationStore& allocations,
                     AuditStore& audit);
    RecoveryPipeline(ReconciliationEngine& reconciler,
                     BackfillCoordinator& backfiller,
                     AllocationService& allocator,
                     VersionManager& versions,
                     AllocationStore& allocations,
                     AuditStore& audit,
                     const Config& config);

    RecoveryResult run(const ReconciliationRequest& request);

    // Symbols and padded window around the current version's residues.
    // nullopt when there is no current version or it has no residues.
    std::optional<std::pair<SymbolScope, TimeWindow>> residue_scope(const std::string& namespace_id);

private:
    ReconciliationEngine& reconciler_;
    BackfillCoordinator& backfiller_;
    AllocationService& allocator_;
    VersionManager& versions_;
    AllocationStore& allocations_;
    AuditStore& audit_;
    Config config_;

    int queue_discrepancies(const ReconciliationReport& report);
    void flag_anomalies(RecoveryResult& result, int count) const;
};

} // namespace fifo
