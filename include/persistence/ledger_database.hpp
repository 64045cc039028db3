#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <cstdint>
#include "persistence/stores.hpp"

// Forward declare sqlite3
struct sqlite3;
struct sqlite3_stmt;

namespace fifo {

// ============================================================================
// LEDGER DATABASE
//
// Single SQLite file holding the trade ledger, every allocation version
// with its rows, the reconciliation audit trail and the review queue.
//
// 1. trade_records is append-only: no UPDATE or DELETE is ever issued
// 2. Allocation rows are written once per version and never changed
// 3. Decimals are stored as INTEGER raw units (1e-8)
// 4. All timestamps are UTC microseconds
// ============================================================================

class LedgerDatabase : public TradeLedgerStore,
                       public AllocationStore,
                       public AuditStore {
public:
    static constexpr int SCHEMA_VERSION = 1;

    explicit LedgerDatabase(const std::string& db_path);
    ~LedgerDatabase() override;

    // Non-copyable
    LedgerDatabase(const LedgerDatabase&) = delete;
    LedgerDatabase& operator=(const LedgerDatabase&) = delete;

    // Connection management
    bool is_open() const;
    void close();
    const std::string& path() const { return db_path_; }

    // Schema management (idempotent)
    void initialize_schema();
    int get_schema_version();

    // TradeLedgerStore
    bool append(const TradeRecord& record) override;
    std::vector<TradeRecord> scan(const SymbolScope& symbols, Micros cutoff) override;
    std::vector<TradeRecord> scan_window(const SymbolScope& symbols,
                                         const TimeWindow& window,
                                         Micros cutoff) override;
    std::optional<TradeRecord> find(const std::string& order_id,
                                    const std::string& symbol) override;
    bool contains_order(const std::string& order_id) override;
    std::vector<std::string> list_symbols(Micros cutoff) override;
    int64_t count_records() override;

    // AllocationStore
    AllocationVersion create_version(const std::string& namespace_id,
                                     Micros ledger_cutoff,
                                     const SymbolScope& scope,
                                     const std::string& triggered_by) override;
    void write_allocations(const std::string& namespace_id,
                           int64_t version_number,
                           const std::vector<FifoAllocation>& allocations,
                           const std::vector<UnmatchedResidue>& residues) override;
    void set_status(const std::string& namespace_id,
                    int64_t version_number,
                    AllocationStatus status,
                    const std::string& reason) override;
    bool swap_current(const std::string& namespace_id,
                      std::optional<int64_t> expected,
                      int64_t version_number) override;
    std::optional<AllocationVersion> get_current(const std::string& namespace_id) override;
    std::optional<AllocationVersion> get_by_version(const std::string& namespace_id,
                                                    int64_t version_number) override;
    std::vector<AllocationVersion> list_versions(const std::string& namespace_id,
                                                 Micros from, Micros to) override;
    std::vector<FifoAllocation> get_allocations(const std::string& namespace_id,
                                                int64_t version_number) override;
    std::vector<UnmatchedResidue> get_residues(const std::string& namespace_id,
                                               int64_t version_number) override;
    void write_validation_issues(const std::string& namespace_id,
                                 int64_t version_number,
                                 const std::vector<ValidationIssue>& issues) override;
    std::vector<ValidationIssue> get_validation_issues(const std::string& namespace_id,
                                                       int64_t version_number) override;
    void log_computation(const ComputationLogEntry& entry) override;
    std::vector<ComputationLogEntry> list_computations(const std::string& namespace_id,
                                                       int limit = 50) override;
    bool try_acquire_lease(const std::string& namespace_id,
                           const std::string& holder,
                           int ttl_seconds,
                           std::optional<LeaseInfo>* taken_over = nullptr) override;
    void release_lease(const std::string& namespace_id, const std::string& holder) override;
    std::optional<LeaseInfo> get_lease(const std::string& namespace_id) override;

    // AuditStore
    void save_report(const ReconciliationReport& report) override;
    std::optional<ReconciliationReport> get_report(const std::string& report_id) override;
    std::vector<ReconciliationReport> list_reports(const std::string& namespace_id,
                                                   Micros from, Micros to) override;
    int64_t enqueue_review(const ReviewItem& item) override;
    std::vector<ReviewItem> list_review_items(const std::string& status = "") override;
    bool resolve_review_item(int64_t id,
                             const std::string& status,
                             const std::string& resolution,
                             const std::string& resolved_by) override;

    // Utility
    void execute(const std::string& sql);
    void begin_transaction();
    void commit_transaction();
    void rollback_transaction();

    /**
     * Rolls back on scope exit unless commit() was called.
     */
    class Transaction {
    public:
        explicit Transaction(LedgerDatabase& db);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        LedgerDatabase& db_;
        bool done_{false};
    };

private:
    sqlite3* db_{nullptr};
    std::string db_path_;
    bool in_transaction_{false};
    std::recursive_mutex mutex_;

    // Statement preparation helpers
    sqlite3_stmt* prepare(const std::string& sql);
    void bind_text(sqlite3_stmt* stmt, int index, const std::string& value);
    void bind_int64(sqlite3_stmt* stmt, int index, int64_t value);
    void bind_decimal(sqlite3_stmt* stmt, int index, const Decimal& value);
    void bind_optional_int64(sqlite3_stmt* stmt, int index, const std::optional<int64_t>& value);
    void bind_optional_decimal(sqlite3_stmt* stmt, int index, const std::optional<Decimal>& value);
    void bind_scope(sqlite3_stmt* stmt, int first_index, const SymbolScope& symbols);
    void finalize(sqlite3_stmt* stmt);

    // Step a write statement to completion and finalize it.
    // Throws std::runtime_error unless SQLITE_DONE.
    void step_done(sqlite3_stmt* stmt, const std::string& context);

    // Result extraction helpers
    std::string get_text(sqlite3_stmt* stmt, int col);
    int64_t get_int64(sqlite3_stmt* stmt, int col);
    Decimal get_decimal(sqlite3_stmt* stmt, int col);
    std::optional<int64_t> get_optional_int64(sqlite3_stmt* stmt, int col);
    std::optional<Decimal> get_optional_decimal(sqlite3_stmt* stmt, int col);

    TradeRecord read_trade(sqlite3_stmt* stmt);
    AllocationVersion read_version(sqlite3_stmt* stmt);
    ReviewItem read_review_item(sqlite3_stmt* stmt);
    std::vector<TradeRecord> query_trades(const SymbolScope& symbols,
                                          const std::optional<TimeWindow>& window,
                                          Micros cutoff);
    std::optional<std::string> lookup_status(const std::string& namespace_id,
                                             int64_t version_number);

    // Schema creation
    void create_tables();
    void create_indexes();
};

} // namespace fifo
