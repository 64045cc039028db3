#pragma once

#include <string>
#include <optional>
#include "common/types.hpp"
#include "common/errors.hpp"
#include "core/allocation.hpp"
#include "core/fifo_engine.hpp"
#include "core/validation_engine.hpp"
#include "core/version_manager.hpp"
#include "persistence/stores.hpp"

namespace fifo {

/**
 * Outcome of one allocation run. A promoted run with unmatched residues
 * is still a success but reports DATA_INTEGRITY_ANOMALY.
 */
struct AllocationRunResult {
    bool success{false};
    ErrorKind error_kind{ErrorKind::NONE};
    std::string error_message;

    std::optional<AllocationVersion> version;
    EngineResult engine;
    ValidationResult validation;
    bool promoted{false};
    std::optional<int64_t> superseded;
    int review_items_queued{0};
    int anomalies{0};                   // Residues needing manual review
    int64_t duration_ms{0};

    std::string summary() const;
};

/**
 * Runs one computation end to end under the namespace lease:
 * snapshot cutoff, ledger scan, FIFO pass, version rows, validation,
 * status transition, promotion and review queueing.
 *
 * Expected failures (lease held, version conflict, validation failure)
 * come back as results. Storage failures propagate after the version is
 * marked invalid and the run is logged as failed.
 */
class AllocationService {
public:
    struct Config {
        ResiduePolicy residue_policy{ResiduePolicy::UNALLOCATED};
        bool strict_validation{false};
    };

    AllocationService(TradeLedgerStore& ledger,
                      AllocationStore& allocations,
                      AuditStore& audit,
                      VersionManager& versions);
    AllocationService(TradeLedgerStore& ledger,
                      AllocationStore& allocations,
                      AuditStore& audit,
                      VersionManager& versions,
                      const Config& config);

    AllocationRunResult run(const AllocationRequest& request);

    // Re-check a stored version against the ledger snapshot it was
    // computed from. Read-only: no status change.
    ValidationResult revalidate(const std::string& namespace_id, int64_t version_number);

private:
    TradeLedgerStore& ledger_;
    AllocationStore& allocations_;
    AuditStore& audit_;
    VersionManager& versions_;
    Config config_;
    FifoEngine engine_;
    ValidationEngine validator_;

    int queue_residues(const std::vector<UnmatchedResidue>& residues, int64_t version_number);
    void log_run(const AllocationRunResult& result, const AllocationRequest& request,
                 Micros started_at, const std::string& status);
};

} // namespace fifo
