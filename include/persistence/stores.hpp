#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "common/types.hpp"
#include "common/decimal.hpp"
#include "core/allocation.hpp"
#include "core/discrepancy.hpp"

namespace fifo {

// ============================================================================
// STORE CONTRACTS
//
// The core talks to persistence only through these interfaces. The SQLite
// LedgerDatabase implements all three; tests may substitute any of them.
// ============================================================================

/**
 * Append-only ledger of normalized trade records.
 */
class TradeLedgerStore {
public:
    virtual ~TradeLedgerStore() = default;

    // Insert if (order_id, symbol) is new. Returns false when the row
    // already existed (first writer wins).
    virtual bool append(const TradeRecord& record) = 0;

    // Records with ingested_at <= cutoff, ordered by
    // (exchange_time, order_id, symbol). Empty scope = all symbols.
    virtual std::vector<TradeRecord> scan(const SymbolScope& symbols, Micros cutoff) = 0;

    // As scan(), additionally restricted to exchange_time in window
    virtual std::vector<TradeRecord> scan_window(const SymbolScope& symbols,
                                                 const TimeWindow& window,
                                                 Micros cutoff) = 0;

    virtual std::optional<TradeRecord> find(const std::string& order_id,
                                            const std::string& symbol) = 0;
    virtual bool contains_order(const std::string& order_id) = 0;
    virtual std::vector<std::string> list_symbols(Micros cutoff) = 0;
    virtual int64_t count_records() = 0;
};

/**
 * Row of the computation log, one per allocation run.
 */
struct ComputationLogEntry {
    int64_t id{0};
    std::string namespace_id;
    int64_t version_number{0};
    Micros started_at{0};
    Micros finished_at{0};
    int64_t duration_ms{0};
    int symbols_processed{0};
    int buys{0};
    int sells{0};
    int allocations{0};
    int residues{0};
    Decimal total_pnl;
    std::string triggered_by;
    std::string status;            // completed, invalid, failed
    std::string error_message;
};

/**
 * Holder of the per-namespace computation lease.
 */
struct LeaseInfo {
    std::string namespace_id;
    std::string holder;
    Micros acquired_at{0};
    Micros expires_at{0};
};

/**
 * Versions, their allocation rows, the current pointer and the lease.
 */
class AllocationStore {
public:
    virtual ~AllocationStore() = default;

    // Reserve max(version_number)+1 for the namespace and insert the
    // version row in status COMPUTING. Throws VersionConflictError when
    // the number was claimed concurrently.
    virtual AllocationVersion create_version(const std::string& namespace_id,
                                             Micros ledger_cutoff,
                                             const SymbolScope& scope,
                                             const std::string& triggered_by) = 0;

    virtual void write_allocations(const std::string& namespace_id,
                                   int64_t version_number,
                                   const std::vector<FifoAllocation>& allocations,
                                   const std::vector<UnmatchedResidue>& residues) = 0;

    // Throws std::logic_error on a transition the lifecycle does not allow
    virtual void set_status(const std::string& namespace_id,
                            int64_t version_number,
                            AllocationStatus status,
                            const std::string& reason) = 0;

    // Atomically move the current pointer from `expected` (nullopt = no
    // current version) to `version_number`, mark the predecessor
    // SUPERSEDED and record lineage. Returns false on a CAS miss.
    virtual bool swap_current(const std::string& namespace_id,
                              std::optional<int64_t> expected,
                              int64_t version_number) = 0;

    virtual std::optional<AllocationVersion> get_current(const std::string& namespace_id) = 0;
    virtual std::optional<AllocationVersion> get_by_version(const std::string& namespace_id,
                                                            int64_t version_number) = 0;
    // Versions created in [from, to]
    virtual std::vector<AllocationVersion> list_versions(const std::string& namespace_id,
                                                         Micros from, Micros to) = 0;

    virtual std::vector<FifoAllocation> get_allocations(const std::string& namespace_id,
                                                        int64_t version_number) = 0;
    virtual std::vector<UnmatchedResidue> get_residues(const std::string& namespace_id,
                                                       int64_t version_number) = 0;

    virtual void write_validation_issues(const std::string& namespace_id,
                                         int64_t version_number,
                                         const std::vector<ValidationIssue>& issues) = 0;
    virtual std::vector<ValidationIssue> get_validation_issues(const std::string& namespace_id,
                                                               int64_t version_number) = 0;

    virtual void log_computation(const ComputationLogEntry& entry) = 0;
    virtual std::vector<ComputationLogEntry> list_computations(const std::string& namespace_id,
                                                               int limit = 50) = 0;

    // Lease row: insert if free, take over if expired. Returns the
    // previous holder's info when an expired lease was taken over.
    virtual bool try_acquire_lease(const std::string& namespace_id,
                                   const std::string& holder,
                                   int ttl_seconds,
                                   std::optional<LeaseInfo>* taken_over = nullptr) = 0;
    virtual void release_lease(const std::string& namespace_id, const std::string& holder) = 0;
    virtual std::optional<LeaseInfo> get_lease(const std::string& namespace_id) = 0;
};

/**
 * Reconciliation reports and the manual review queue.
 */
class AuditStore {
public:
    virtual ~AuditStore() = default;

    virtual void save_report(const ReconciliationReport& report) = 0;
    virtual std::optional<ReconciliationReport> get_report(const std::string& report_id) = 0;
    // Reports created in [from, to], newest first
    virtual std::vector<ReconciliationReport> list_reports(const std::string& namespace_id,
                                                           Micros from, Micros to) = 0;

    // Upsert keyed by (order_id, issue_type); an existing item keeps its
    // status and gets the new description. Returns the item id.
    virtual int64_t enqueue_review(const ReviewItem& item) = 0;
    // Empty status = all
    virtual std::vector<ReviewItem> list_review_items(const std::string& status = "") = 0;
    virtual bool resolve_review_item(int64_t id,
                                     const std::string& status,
                                     const std::string& resolution,
                                     const std::string& resolved_by) = 0;
};

} // namespace fifo
