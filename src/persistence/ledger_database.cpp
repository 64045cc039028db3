#include "persistence/ledger_database.hpp"
#include "common/errors.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace fifo {

namespace {

const char* TRADE_COLUMNS =
    "order_id, symbol, side, quantity, price, fee, exchange_time, ingested_at, source";

const char* VERSION_COLUMNS =
    "namespace, version_number, created_at, ledger_cutoff, scope_json, status, "
    "status_changed_at, supersedes, superseded_by, triggered_by, status_reason";

const char* REVIEW_COLUMNS =
    "id, order_id, symbol, issue_type, severity, status, description, resolution, "
    "resolved_by, created_at, updated_at, resolved_at";

std::string placeholders(size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        out += (i == 0) ? "?" : ", ?";
    }
    return out;
}

std::string tiers_to_text(const std::vector<ReconciliationTier>& tiers) {
    std::string out;
    for (auto t : tiers) {
        if (!out.empty()) out += ",";
        out += to_string(t);
    }
    return out;
}

std::vector<ReconciliationTier> tiers_from_text(const std::string& text) {
    std::vector<ReconciliationTier> out;
    std::istringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item == "tier1") out.push_back(ReconciliationTier::PRESENCE);
        else if (item == "tier2") out.push_back(ReconciliationTier::VALUE);
    }
    return out;
}

bool allowed_transition(AllocationStatus from, AllocationStatus to) {
    switch (from) {
        case AllocationStatus::COMPUTING:
            return to == AllocationStatus::VALID || to == AllocationStatus::INVALID;
        case AllocationStatus::VALID:
            return to == AllocationStatus::SUPERSEDED;
        case AllocationStatus::INVALID:
        case AllocationStatus::SUPERSEDED:
            return false;
    }
    return false;
}

} // namespace

// ============================================================================
// DATABASE IMPLEMENTATION
// ============================================================================

LedgerDatabase::LedgerDatabase(const std::string& db_path)
    : db_path_(db_path)
{
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    // Wait for other processes holding the write lock
    sqlite3_busy_timeout(db_, 5000);

    execute("PRAGMA foreign_keys = ON;");
    execute("PRAGMA journal_mode = WAL;");

    spdlog::debug("LedgerDatabase opened: {}", db_path);
}

LedgerDatabase::~LedgerDatabase() {
    close();
}

bool LedgerDatabase::is_open() const {
    return db_ != nullptr;
}

void LedgerDatabase::close() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        spdlog::debug("LedgerDatabase closed");
    }
}

void LedgerDatabase::execute(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        throw std::runtime_error("SQL error: " + error + " in: " + sql);
    }
}

void LedgerDatabase::begin_transaction() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!in_transaction_) {
        // IMMEDIATE takes the write lock up front so concurrent writers
        // queue on busy_timeout instead of failing at commit
        execute("BEGIN IMMEDIATE;");
        in_transaction_ = true;
    }
}

void LedgerDatabase::commit_transaction() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (in_transaction_) {
        execute("COMMIT;");
        in_transaction_ = false;
    }
}

void LedgerDatabase::rollback_transaction() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (in_transaction_) {
        in_transaction_ = false;
        execute("ROLLBACK;");
    }
}

LedgerDatabase::Transaction::Transaction(LedgerDatabase& db)
    : db_(db)
{
    // Nested guards join the outer transaction
    done_ = db_.in_transaction_;
    if (!done_) {
        db_.begin_transaction();
    }
}

LedgerDatabase::Transaction::~Transaction() {
    if (!done_) {
        try {
            db_.rollback_transaction();
        } catch (const std::exception& e) {
            spdlog::error("Rollback failed: {}", e.what());
        }
    }
}

void LedgerDatabase::Transaction::commit() {
    if (!done_) {
        db_.commit_transaction();
        done_ = true;
    }
}

sqlite3_stmt* LedgerDatabase::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " +
                                 std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void LedgerDatabase::bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void LedgerDatabase::bind_int64(sqlite3_stmt* stmt, int index, int64_t value) {
    sqlite3_bind_int64(stmt, index, value);
}

void LedgerDatabase::bind_decimal(sqlite3_stmt* stmt, int index, const Decimal& value) {
    sqlite3_bind_int64(stmt, index, value.raw());
}

void LedgerDatabase::bind_optional_int64(sqlite3_stmt* stmt, int index,
                                         const std::optional<int64_t>& value) {
    if (value) {
        sqlite3_bind_int64(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void LedgerDatabase::bind_optional_decimal(sqlite3_stmt* stmt, int index,
                                           const std::optional<Decimal>& value) {
    if (value) {
        sqlite3_bind_int64(stmt, index, value->raw());
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void LedgerDatabase::bind_scope(sqlite3_stmt* stmt, int first_index, const SymbolScope& symbols) {
    for (size_t i = 0; i < symbols.size(); ++i) {
        bind_text(stmt, first_index + static_cast<int>(i), symbols[i]);
    }
}

void LedgerDatabase::finalize(sqlite3_stmt* stmt) {
    sqlite3_finalize(stmt);
}

void LedgerDatabase::step_done(sqlite3_stmt* stmt, const std::string& context) {
    int rc = sqlite3_step(stmt);
    finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(context + ": " + std::string(sqlite3_errmsg(db_)));
    }
}

std::string LedgerDatabase::get_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

int64_t LedgerDatabase::get_int64(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int64(stmt, col);
}

Decimal LedgerDatabase::get_decimal(sqlite3_stmt* stmt, int col) {
    return Decimal::from_raw(sqlite3_column_int64(stmt, col));
}

std::optional<int64_t> LedgerDatabase::get_optional_int64(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(stmt, col);
}

std::optional<Decimal> LedgerDatabase::get_optional_decimal(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return Decimal::from_raw(sqlite3_column_int64(stmt, col));
}

// ============================================================================
// SCHEMA
// ============================================================================

void LedgerDatabase::initialize_schema() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    create_tables();
    create_indexes();
    spdlog::info("Database schema initialized (version {})", get_schema_version());
}

void LedgerDatabase::create_tables() {
    // Trade ledger (append-only)
    execute(R"(
        CREATE TABLE IF NOT EXISTS trade_records (
            order_id TEXT NOT NULL,
            symbol TEXT NOT NULL,
            side TEXT NOT NULL CHECK (side IN ('buy', 'sell')),
            quantity INTEGER NOT NULL,
            price INTEGER NOT NULL,
            fee INTEGER NOT NULL,
            exchange_time INTEGER NOT NULL,
            ingested_at INTEGER NOT NULL,
            source TEXT NOT NULL,
            PRIMARY KEY (order_id, symbol)
        );
    )");

    // Allocation versions
    execute(R"(
        CREATE TABLE IF NOT EXISTS allocation_versions (
            namespace TEXT NOT NULL,
            version_number INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            ledger_cutoff INTEGER NOT NULL,
            scope_json TEXT NOT NULL,
            status TEXT NOT NULL,
            status_changed_at INTEGER NOT NULL,
            supersedes INTEGER,
            superseded_by INTEGER,
            triggered_by TEXT,
            status_reason TEXT,
            PRIMARY KEY (namespace, version_number)
        );
    )");

    // Current pointer per namespace
    execute(R"(
        CREATE TABLE IF NOT EXISTS current_versions (
            namespace TEXT PRIMARY KEY,
            version_number INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            FOREIGN KEY (namespace, version_number)
                REFERENCES allocation_versions(namespace, version_number)
        );
    )");

    // Computation lease per namespace
    execute(R"(
        CREATE TABLE IF NOT EXISTS allocation_leases (
            namespace TEXT PRIMARY KEY,
            holder TEXT NOT NULL,
            acquired_at INTEGER NOT NULL,
            expires_at INTEGER NOT NULL
        );
    )");

    // Matched lots and residues (buy columns NULL for residues)
    execute(R"(
        CREATE TABLE IF NOT EXISTS fifo_allocations (
            namespace TEXT NOT NULL,
            version_number INTEGER NOT NULL,
            sequence INTEGER NOT NULL,
            kind TEXT NOT NULL CHECK (kind IN ('match', 'residue')),
            symbol TEXT NOT NULL,
            sell_order_id TEXT NOT NULL,
            buy_order_id TEXT,
            quantity INTEGER NOT NULL,
            buy_price INTEGER,
            sell_price INTEGER NOT NULL,
            buy_fee_share INTEGER,
            sell_fee_share INTEGER NOT NULL,
            cost_basis INTEGER,
            proceeds INTEGER NOT NULL,
            net_proceeds INTEGER NOT NULL,
            realized_pnl INTEGER,
            buy_time INTEGER,
            sell_time INTEGER NOT NULL,
            residue_policy TEXT,
            note TEXT,
            PRIMARY KEY (namespace, version_number, sequence),
            FOREIGN KEY (namespace, version_number)
                REFERENCES allocation_versions(namespace, version_number)
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS validation_issues (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            namespace TEXT NOT NULL,
            version_number INTEGER NOT NULL,
            severity TEXT NOT NULL,
            code TEXT NOT NULL,
            symbol TEXT,
            order_id TEXT,
            message TEXT,
            FOREIGN KEY (namespace, version_number)
                REFERENCES allocation_versions(namespace, version_number)
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS computation_log (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            namespace TEXT NOT NULL,
            version_number INTEGER,
            started_at INTEGER NOT NULL,
            finished_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            symbols_processed INTEGER NOT NULL,
            buys INTEGER NOT NULL,
            sells INTEGER NOT NULL,
            allocations INTEGER NOT NULL,
            residues INTEGER NOT NULL,
            total_pnl INTEGER NOT NULL,
            triggered_by TEXT,
            status TEXT NOT NULL,
            error_message TEXT
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS reconciliation_reports (
            report_id TEXT PRIMARY KEY,
            namespace TEXT NOT NULL,
            tiers TEXT NOT NULL,
            symbols_json TEXT NOT NULL,
            window_start INTEGER NOT NULL,
            window_end INTEGER NOT NULL,
            snapshot_cutoff INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            local_trades INTEGER NOT NULL,
            external_trades INTEGER NOT NULL,
            missing_count INTEGER NOT NULL,
            extra_count INTEGER NOT NULL,
            mismatch_count INTEGER NOT NULL
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS discrepancies (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            report_id TEXT NOT NULL,
            kind TEXT NOT NULL,
            symbol TEXT,
            order_ids_json TEXT NOT NULL,
            side TEXT,
            field TEXT,
            local_value INTEGER,
            external_value INTEGER,
            delta INTEGER,
            details TEXT,
            FOREIGN KEY (report_id) REFERENCES reconciliation_reports(report_id)
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS manual_review_queue (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            order_id TEXT NOT NULL,
            symbol TEXT,
            issue_type TEXT NOT NULL,
            severity TEXT NOT NULL CHECK (severity IN ('low', 'medium', 'high', 'critical')),
            status TEXT NOT NULL DEFAULT 'pending'
                CHECK (status IN ('pending', 'in_progress', 'resolved', 'dismissed')),
            description TEXT,
            resolution TEXT,
            resolved_by TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            resolved_at INTEGER,
            UNIQUE (order_id, issue_type)
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY
        );
    )");

    execute("INSERT OR IGNORE INTO schema_version (version) VALUES (" +
            std::to_string(SCHEMA_VERSION) + ");");
}

void LedgerDatabase::create_indexes() {
    execute("CREATE INDEX IF NOT EXISTS idx_trades_time ON trade_records(exchange_time, order_id);");
    execute("CREATE INDEX IF NOT EXISTS idx_trades_symbol ON trade_records(symbol, exchange_time);");
    execute("CREATE INDEX IF NOT EXISTS idx_trades_order ON trade_records(order_id);");
    execute("CREATE INDEX IF NOT EXISTS idx_versions_created ON allocation_versions(namespace, created_at);");
    execute("CREATE INDEX IF NOT EXISTS idx_allocations_sell ON fifo_allocations(namespace, version_number, sell_order_id);");
    execute("CREATE INDEX IF NOT EXISTS idx_issues_version ON validation_issues(namespace, version_number);");
    execute("CREATE INDEX IF NOT EXISTS idx_reports_time ON reconciliation_reports(namespace, created_at DESC);");
    execute("CREATE INDEX IF NOT EXISTS idx_discrepancies_report ON discrepancies(report_id);");
    execute("CREATE INDEX IF NOT EXISTS idx_review_status ON manual_review_queue(status, created_at DESC);");
}

int LedgerDatabase::get_schema_version() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare("SELECT MAX(version) FROM schema_version;");
    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = static_cast<int>(get_int64(stmt, 0));
    }
    finalize(stmt);
    return version;
}

// ============================================================================
// TRADE LEDGER
// ============================================================================

TradeRecord LedgerDatabase::read_trade(sqlite3_stmt* stmt) {
    TradeRecord r;
    r.order_id = get_text(stmt, 0);
    r.symbol = get_text(stmt, 1);
    r.side = side_from_string(get_text(stmt, 2));
    r.quantity = get_decimal(stmt, 3);
    r.price = get_decimal(stmt, 4);
    r.fee = get_decimal(stmt, 5);
    r.exchange_time = get_int64(stmt, 6);
    r.ingested_at = get_int64(stmt, 7);
    r.source = trade_source_from_string(get_text(stmt, 8));
    return r;
}

bool LedgerDatabase::append(const TradeRecord& record) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto stmt = prepare(R"(
        INSERT INTO trade_records (
            order_id, symbol, side, quantity, price, fee,
            exchange_time, ingested_at, source
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT (order_id, symbol) DO NOTHING;
    )");

    bind_text(stmt, 1, record.order_id);
    bind_text(stmt, 2, record.symbol);
    bind_text(stmt, 3, side_to_string(record.side));
    bind_decimal(stmt, 4, record.quantity);
    bind_decimal(stmt, 5, record.price);
    bind_decimal(stmt, 6, record.fee);
    bind_int64(stmt, 7, record.exchange_time);
    bind_int64(stmt, 8, record.ingested_at ? record.ingested_at : now_micros());
    bind_text(stmt, 9, trade_source_to_string(record.source));

    step_done(stmt, "Failed to append trade " + record.order_id);

    bool inserted = sqlite3_changes(db_) > 0;
    if (!inserted) {
        spdlog::debug("Trade {} ({}) already present, append ignored",
                      record.order_id, record.symbol);
    }
    return inserted;
}

std::vector<TradeRecord> LedgerDatabase::query_trades(const SymbolScope& symbols,
                                                      const std::optional<TimeWindow>& window,
                                                      Micros cutoff) {
    std::string sql = std::string("SELECT ") + TRADE_COLUMNS +
                      " FROM trade_records WHERE ingested_at <= ?";
    if (!symbols.empty()) {
        sql += " AND symbol IN (" + placeholders(symbols.size()) + ")";
    }
    if (window) {
        sql += " AND exchange_time >= ? AND exchange_time <= ?";
    }
    sql += " ORDER BY exchange_time, order_id, symbol;";

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(sql);
    int idx = 1;
    bind_int64(stmt, idx++, cutoff);
    bind_scope(stmt, idx, symbols);
    idx += static_cast<int>(symbols.size());
    if (window) {
        bind_int64(stmt, idx++, window->start);
        bind_int64(stmt, idx++, window->end);
    }

    std::vector<TradeRecord> result;
    try {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            result.push_back(read_trade(stmt));
        }
    } catch (const std::exception&) {
        finalize(stmt);
        throw;
    }

    finalize(stmt);
    return result;
}

std::vector<TradeRecord> LedgerDatabase::scan(const SymbolScope& symbols, Micros cutoff) {
    return query_trades(symbols, std::nullopt, cutoff);
}

std::vector<TradeRecord> LedgerDatabase::scan_window(const SymbolScope& symbols,
                                                     const TimeWindow& window,
                                                     Micros cutoff) {
    return query_trades(symbols, window, cutoff);
}

std::optional<TradeRecord> LedgerDatabase::find(const std::string& order_id,
                                                const std::string& symbol) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(std::string("SELECT ") + TRADE_COLUMNS +
                        " FROM trade_records WHERE order_id = ? AND symbol = ?;");
    bind_text(stmt, 1, order_id);
    bind_text(stmt, 2, symbol);

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        finalize(stmt);
        return std::nullopt;
    }

    auto r = read_trade(stmt);
    finalize(stmt);
    return r;
}

bool LedgerDatabase::contains_order(const std::string& order_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare("SELECT 1 FROM trade_records WHERE order_id = ? LIMIT 1;");
    bind_text(stmt, 1, order_id);
    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    finalize(stmt);
    return found;
}

std::vector<std::string> LedgerDatabase::list_symbols(Micros cutoff) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(
        "SELECT DISTINCT symbol FROM trade_records WHERE ingested_at <= ? ORDER BY symbol;"
    );
    bind_int64(stmt, 1, cutoff);

    std::vector<std::string> result;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.push_back(get_text(stmt, 0));
    }
    finalize(stmt);
    return result;
}

int64_t LedgerDatabase::count_records() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare("SELECT COUNT(*) FROM trade_records;");
    int64_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = get_int64(stmt, 0);
    }
    finalize(stmt);
    return count;
}

// ============================================================================
// ALLOCATION VERSIONS
// ============================================================================

AllocationVersion LedgerDatabase::read_version(sqlite3_stmt* stmt) {
    AllocationVersion v;
    v.namespace_id = get_text(stmt, 0);
    v.version_number = get_int64(stmt, 1);
    v.created_at = get_int64(stmt, 2);
    v.ledger_cutoff = get_int64(stmt, 3);
    v.scope = nlohmann::json::parse(get_text(stmt, 4)).get<SymbolScope>();
    v.status = allocation_status_from_string(get_text(stmt, 5));
    v.status_changed_at = get_int64(stmt, 6);
    v.supersedes = get_optional_int64(stmt, 7);
    v.superseded_by = get_optional_int64(stmt, 8);
    v.triggered_by = get_text(stmt, 9);
    v.status_reason = get_text(stmt, 10);
    return v;
}

AllocationVersion LedgerDatabase::create_version(const std::string& namespace_id,
                                                 Micros ledger_cutoff,
                                                 const SymbolScope& scope,
                                                 const std::string& triggered_by) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Transaction txn(*this);

    auto stmt = prepare(
        "SELECT COALESCE(MAX(version_number), 0) + 1 FROM allocation_versions WHERE namespace = ?;"
    );
    bind_text(stmt, 1, namespace_id);
    int64_t next = 1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        next = get_int64(stmt, 0);
    }
    finalize(stmt);

    AllocationVersion v;
    v.namespace_id = namespace_id;
    v.version_number = next;
    v.created_at = now_micros();
    v.ledger_cutoff = ledger_cutoff;
    v.scope = scope;
    v.status = AllocationStatus::COMPUTING;
    v.status_changed_at = v.created_at;
    v.triggered_by = triggered_by;

    stmt = prepare(std::string("INSERT INTO allocation_versions (") + VERSION_COLUMNS +
                   ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    bind_text(stmt, 1, v.namespace_id);
    bind_int64(stmt, 2, v.version_number);
    bind_int64(stmt, 3, v.created_at);
    bind_int64(stmt, 4, v.ledger_cutoff);
    bind_text(stmt, 5, nlohmann::json(v.scope).dump());
    bind_text(stmt, 6, to_string(v.status));
    bind_int64(stmt, 7, v.status_changed_at);
    bind_optional_int64(stmt, 8, v.supersedes);
    bind_optional_int64(stmt, 9, v.superseded_by);
    bind_text(stmt, 10, v.triggered_by);
    bind_text(stmt, 11, v.status_reason);

    int rc = sqlite3_step(stmt);
    finalize(stmt);
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        throw VersionConflictError(
            "Version " + std::to_string(next) + " of namespace " + namespace_id +
            " was claimed concurrently");
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to create version: " + std::string(sqlite3_errmsg(db_)));
    }

    txn.commit();
    spdlog::info("Created allocation version {} v{} (cutoff {}, scope {})",
                 namespace_id, next, format_timestamp(ledger_cutoff), scope_to_string(scope));
    return v;
}

void LedgerDatabase::write_allocations(const std::string& namespace_id,
                                       int64_t version_number,
                                       const std::vector<FifoAllocation>& allocations,
                                       const std::vector<UnmatchedResidue>& residues) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Transaction txn(*this);

    const std::string sql = R"(
        INSERT INTO fifo_allocations (
            namespace, version_number, sequence, kind, symbol, sell_order_id,
            buy_order_id, quantity, buy_price, sell_price, buy_fee_share,
            sell_fee_share, cost_basis, proceeds, net_proceeds, realized_pnl,
            buy_time, sell_time, residue_policy, note
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    for (const auto& a : allocations) {
        auto stmt = prepare(sql);
        bind_text(stmt, 1, namespace_id);
        bind_int64(stmt, 2, version_number);
        bind_int64(stmt, 3, a.sequence);
        bind_text(stmt, 4, "match");
        bind_text(stmt, 5, a.symbol);
        bind_text(stmt, 6, a.sell_order_id);
        bind_text(stmt, 7, a.buy_order_id);
        bind_decimal(stmt, 8, a.quantity);
        bind_decimal(stmt, 9, a.buy_price);
        bind_decimal(stmt, 10, a.sell_price);
        bind_decimal(stmt, 11, a.buy_fee_share);
        bind_decimal(stmt, 12, a.sell_fee_share);
        bind_decimal(stmt, 13, a.cost_basis);
        bind_decimal(stmt, 14, a.proceeds);
        bind_decimal(stmt, 15, a.net_proceeds);
        bind_decimal(stmt, 16, a.realized_pnl);
        bind_int64(stmt, 17, a.buy_time);
        bind_int64(stmt, 18, a.sell_time);
        sqlite3_bind_null(stmt, 19);
        sqlite3_bind_null(stmt, 20);
        step_done(stmt, "Failed to write allocation");
    }

    for (const auto& r : residues) {
        auto stmt = prepare(sql);
        bind_text(stmt, 1, namespace_id);
        bind_int64(stmt, 2, version_number);
        bind_int64(stmt, 3, r.sequence);
        bind_text(stmt, 4, "residue");
        bind_text(stmt, 5, r.symbol);
        bind_text(stmt, 6, r.sell_order_id);
        sqlite3_bind_null(stmt, 7);
        bind_decimal(stmt, 8, r.quantity);
        sqlite3_bind_null(stmt, 9);
        bind_decimal(stmt, 10, r.sell_price);
        sqlite3_bind_null(stmt, 11);
        bind_decimal(stmt, 12, r.sell_fee_share);
        sqlite3_bind_null(stmt, 13);
        bind_decimal(stmt, 14, r.proceeds);
        bind_decimal(stmt, 15, r.net_proceeds);
        bind_optional_decimal(stmt, 16, r.realized_pnl);
        sqlite3_bind_null(stmt, 17);
        bind_int64(stmt, 18, r.sell_time);
        bind_text(stmt, 19, to_string(r.policy));
        bind_text(stmt, 20, r.note);
        step_done(stmt, "Failed to write residue");
    }

    txn.commit();
    spdlog::debug("Wrote {} allocations and {} residues to {} v{}",
                  allocations.size(), residues.size(), namespace_id, version_number);
}

std::optional<std::string> LedgerDatabase::lookup_status(const std::string& namespace_id,
                                                         int64_t version_number) {
    auto stmt = prepare(
        "SELECT status FROM allocation_versions WHERE namespace = ? AND version_number = ?;"
    );
    bind_text(stmt, 1, namespace_id);
    bind_int64(stmt, 2, version_number);

    std::optional<std::string> status;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        status = get_text(stmt, 0);
    }
    finalize(stmt);
    return status;
}

void LedgerDatabase::set_status(const std::string& namespace_id,
                                int64_t version_number,
                                AllocationStatus status,
                                const std::string& reason) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Transaction txn(*this);

    auto current = lookup_status(namespace_id, version_number);
    if (!current) {
        throw std::invalid_argument("Unknown version " + namespace_id + " v" +
                                    std::to_string(version_number));
    }
    auto from = allocation_status_from_string(*current);
    if (!allowed_transition(from, status)) {
        throw std::logic_error("Illegal status transition " + to_string(from) + " -> " +
                               to_string(status) + " for " + namespace_id + " v" +
                               std::to_string(version_number));
    }

    auto stmt = prepare(R"(
        UPDATE allocation_versions
        SET status = ?, status_changed_at = ?, status_reason = ?
        WHERE namespace = ? AND version_number = ?;
    )");
    bind_text(stmt, 1, to_string(status));
    bind_int64(stmt, 2, now_micros());
    bind_text(stmt, 3, reason);
    bind_text(stmt, 4, namespace_id);
    bind_int64(stmt, 5, version_number);
    step_done(stmt, "Failed to set version status");

    txn.commit();
}

bool LedgerDatabase::swap_current(const std::string& namespace_id,
                                  std::optional<int64_t> expected,
                                  int64_t version_number) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Transaction txn(*this);

    auto stmt = prepare("SELECT version_number FROM current_versions WHERE namespace = ?;");
    bind_text(stmt, 1, namespace_id);
    std::optional<int64_t> actual;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        actual = get_int64(stmt, 0);
    }
    finalize(stmt);

    if (actual != expected) {
        spdlog::warn("Current pointer CAS miss for {}: expected {}, found {}",
                     namespace_id,
                     expected ? std::to_string(*expected) : "none",
                     actual ? std::to_string(*actual) : "none");
        return false;
    }

    auto status = lookup_status(namespace_id, version_number);
    if (!status || allocation_status_from_string(*status) != AllocationStatus::VALID) {
        throw std::logic_error("Only a valid version can become current: " + namespace_id +
                               " v" + std::to_string(version_number));
    }

    int64_t ts = now_micros();

    stmt = prepare(R"(
        INSERT INTO current_versions (namespace, version_number, updated_at)
        VALUES (?, ?, ?)
        ON CONFLICT (namespace) DO UPDATE
        SET version_number = excluded.version_number, updated_at = excluded.updated_at;
    )");
    bind_text(stmt, 1, namespace_id);
    bind_int64(stmt, 2, version_number);
    bind_int64(stmt, 3, ts);
    step_done(stmt, "Failed to swap current version");

    if (expected) {
        stmt = prepare(R"(
            UPDATE allocation_versions
            SET status = 'superseded', status_changed_at = ?, superseded_by = ?,
                status_reason = ?
            WHERE namespace = ? AND version_number = ?;
        )");
        bind_int64(stmt, 1, ts);
        bind_int64(stmt, 2, version_number);
        bind_text(stmt, 3, "superseded by v" + std::to_string(version_number));
        bind_text(stmt, 4, namespace_id);
        bind_int64(stmt, 5, *expected);
        step_done(stmt, "Failed to supersede previous version");

        stmt = prepare(
            "UPDATE allocation_versions SET supersedes = ? WHERE namespace = ? AND version_number = ?;"
        );
        bind_int64(stmt, 1, *expected);
        bind_text(stmt, 2, namespace_id);
        bind_int64(stmt, 3, version_number);
        step_done(stmt, "Failed to record lineage");
    }

    txn.commit();
    return true;
}

std::optional<AllocationVersion> LedgerDatabase::get_current(const std::string& namespace_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(R"(
        SELECT v.namespace, v.version_number, v.created_at, v.ledger_cutoff, v.scope_json,
               v.status, v.status_changed_at, v.supersedes, v.superseded_by,
               v.triggered_by, v.status_reason
        FROM current_versions c
        JOIN allocation_versions v
          ON v.namespace = c.namespace AND v.version_number = c.version_number
        WHERE c.namespace = ?;
    )");
    bind_text(stmt, 1, namespace_id);

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        finalize(stmt);
        return std::nullopt;
    }

    auto v = read_version(stmt);
    finalize(stmt);
    return v;
}

std::optional<AllocationVersion> LedgerDatabase::get_by_version(const std::string& namespace_id,
                                                                int64_t version_number) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(std::string("SELECT ") + VERSION_COLUMNS +
                        " FROM allocation_versions WHERE namespace = ? AND version_number = ?;");
    bind_text(stmt, 1, namespace_id);
    bind_int64(stmt, 2, version_number);

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        finalize(stmt);
        return std::nullopt;
    }

    auto v = read_version(stmt);
    finalize(stmt);
    return v;
}

std::vector<AllocationVersion> LedgerDatabase::list_versions(const std::string& namespace_id,
                                                             Micros from, Micros to) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(std::string("SELECT ") + VERSION_COLUMNS +
                        " FROM allocation_versions"
                        " WHERE namespace = ? AND created_at >= ? AND created_at <= ?"
                        " ORDER BY version_number;");
    bind_text(stmt, 1, namespace_id);
    bind_int64(stmt, 2, from);
    bind_int64(stmt, 3, to);

    std::vector<AllocationVersion> result;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.push_back(read_version(stmt));
    }
    finalize(stmt);
    return result;
}

std::vector<FifoAllocation> LedgerDatabase::get_allocations(const std::string& namespace_id,
                                                            int64_t version_number) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(R"(
        SELECT sequence, symbol, sell_order_id, buy_order_id, quantity, buy_price,
               sell_price, buy_fee_share, sell_fee_share, cost_basis, proceeds,
               net_proceeds, realized_pnl, buy_time, sell_time
        FROM fifo_allocations
        WHERE namespace = ? AND version_number = ? AND kind = 'match'
        ORDER BY sequence;
    )");
    bind_text(stmt, 1, namespace_id);
    bind_int64(stmt, 2, version_number);

    std::vector<FifoAllocation> result;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        FifoAllocation a;
        a.sequence = get_int64(stmt, 0);
        a.symbol = get_text(stmt, 1);
        a.sell_order_id = get_text(stmt, 2);
        a.buy_order_id = get_text(stmt, 3);
        a.quantity = get_decimal(stmt, 4);
        a.buy_price = get_decimal(stmt, 5);
        a.sell_price = get_decimal(stmt, 6);
        a.buy_fee_share = get_decimal(stmt, 7);
        a.sell_fee_share = get_decimal(stmt, 8);
        a.cost_basis = get_decimal(stmt, 9);
        a.proceeds = get_decimal(stmt, 10);
        a.net_proceeds = get_decimal(stmt, 11);
        a.realized_pnl = get_decimal(stmt, 12);
        a.buy_time = get_int64(stmt, 13);
        a.sell_time = get_int64(stmt, 14);
        result.push_back(a);
    }
    finalize(stmt);
    return result;
}

std::vector<UnmatchedResidue> LedgerDatabase::get_residues(const std::string& namespace_id,
                                                           int64_t version_number) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(R"(
        SELECT sequence, symbol, sell_order_id, quantity, sell_price, sell_fee_share,
               proceeds, net_proceeds, realized_pnl, residue_policy, sell_time, note
        FROM fifo_allocations
        WHERE namespace = ? AND version_number = ? AND kind = 'residue'
        ORDER BY sequence;
    )");
    bind_text(stmt, 1, namespace_id);
    bind_int64(stmt, 2, version_number);

    std::vector<UnmatchedResidue> result;
    try {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            UnmatchedResidue r;
            r.sequence = get_int64(stmt, 0);
            r.symbol = get_text(stmt, 1);
            r.sell_order_id = get_text(stmt, 2);
            r.quantity = get_decimal(stmt, 3);
            r.sell_price = get_decimal(stmt, 4);
            r.sell_fee_share = get_decimal(stmt, 5);
            r.proceeds = get_decimal(stmt, 6);
            r.net_proceeds = get_decimal(stmt, 7);
            r.realized_pnl = get_optional_decimal(stmt, 8);
            r.policy = residue_policy_from_string(get_text(stmt, 9));
            r.sell_time = get_int64(stmt, 10);
            r.note = get_text(stmt, 11);
            result.push_back(r);
        }
    } catch (const std::exception&) {
        finalize(stmt);
        throw;
    }
    finalize(stmt);
    return result;
}

void LedgerDatabase::write_validation_issues(const std::string& namespace_id,
                                             int64_t version_number,
                                             const std::vector<ValidationIssue>& issues) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Transaction txn(*this);

    for (const auto& issue : issues) {
        auto stmt = prepare(R"(
            INSERT INTO validation_issues (
                namespace, version_number, severity, code, symbol, order_id, message
            ) VALUES (?, ?, ?, ?, ?, ?, ?);
        )");
        bind_text(stmt, 1, namespace_id);
        bind_int64(stmt, 2, version_number);
        bind_text(stmt, 3, to_string(issue.severity));
        bind_text(stmt, 4, issue.code);
        bind_text(stmt, 5, issue.symbol);
        bind_text(stmt, 6, issue.order_id);
        bind_text(stmt, 7, issue.message);
        step_done(stmt, "Failed to write validation issue");
    }

    txn.commit();
}

std::vector<ValidationIssue> LedgerDatabase::get_validation_issues(const std::string& namespace_id,
                                                                   int64_t version_number) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(R"(
        SELECT severity, code, symbol, order_id, message
        FROM validation_issues
        WHERE namespace = ? AND version_number = ?
        ORDER BY id;
    )");
    bind_text(stmt, 1, namespace_id);
    bind_int64(stmt, 2, version_number);

    std::vector<ValidationIssue> result;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ValidationIssue i;
        i.severity = get_text(stmt, 0) == "error" ? ValidationIssue::Severity::ERROR
                                                  : ValidationIssue::Severity::WARNING;
        i.code = get_text(stmt, 1);
        i.symbol = get_text(stmt, 2);
        i.order_id = get_text(stmt, 3);
        i.message = get_text(stmt, 4);
        result.push_back(i);
    }
    finalize(stmt);
    return result;
}

// ============================================================================
// COMPUTATION LOG
// ============================================================================

void LedgerDatabase::log_computation(const ComputationLogEntry& entry) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(R"(
        INSERT INTO computation_log (
            namespace, version_number, started_at, finished_at, duration_ms,
            symbols_processed, buys, sells, allocations, residues, total_pnl,
            triggered_by, status, error_message
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    bind_text(stmt, 1, entry.namespace_id);
    bind_optional_int64(stmt, 2, entry.version_number > 0
                                     ? std::optional<int64_t>(entry.version_number)
                                     : std::nullopt);
    bind_int64(stmt, 3, entry.started_at);
    bind_int64(stmt, 4, entry.finished_at);
    bind_int64(stmt, 5, entry.duration_ms);
    bind_int64(stmt, 6, entry.symbols_processed);
    bind_int64(stmt, 7, entry.buys);
    bind_int64(stmt, 8, entry.sells);
    bind_int64(stmt, 9, entry.allocations);
    bind_int64(stmt, 10, entry.residues);
    bind_decimal(stmt, 11, entry.total_pnl);
    bind_text(stmt, 12, entry.triggered_by);
    bind_text(stmt, 13, entry.status);
    bind_text(stmt, 14, entry.error_message);
    step_done(stmt, "Failed to log computation");
}

std::vector<ComputationLogEntry> LedgerDatabase::list_computations(const std::string& namespace_id,
                                                                   int limit) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(R"(
        SELECT id, namespace, version_number, started_at, finished_at, duration_ms,
               symbols_processed, buys, sells, allocations, residues, total_pnl,
               triggered_by, status, error_message
        FROM computation_log
        WHERE namespace = ?
        ORDER BY id DESC
        LIMIT ?;
    )");
    bind_text(stmt, 1, namespace_id);
    bind_int64(stmt, 2, limit);

    std::vector<ComputationLogEntry> result;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ComputationLogEntry e;
        e.id = get_int64(stmt, 0);
        e.namespace_id = get_text(stmt, 1);
        e.version_number = get_optional_int64(stmt, 2).value_or(0);
        e.started_at = get_int64(stmt, 3);
        e.finished_at = get_int64(stmt, 4);
        e.duration_ms = get_int64(stmt, 5);
        e.symbols_processed = static_cast<int>(get_int64(stmt, 6));
        e.buys = static_cast<int>(get_int64(stmt, 7));
        e.sells = static_cast<int>(get_int64(stmt, 8));
        e.allocations = static_cast<int>(get_int64(stmt, 9));
        e.residues = static_cast<int>(get_int64(stmt, 10));
        e.total_pnl = get_decimal(stmt, 11);
        e.triggered_by = get_text(stmt, 12);
        e.status = get_text(stmt, 13);
        e.error_message = get_text(stmt, 14);
        result.push_back(e);
    }
    finalize(stmt);
    return result;
}

// ============================================================================
// LEASES
// ============================================================================

bool LedgerDatabase::try_acquire_lease(const std::string& namespace_id,
                                       const std::string& holder,
                                       int ttl_seconds,
                                       std::optional<LeaseInfo>* taken_over) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Transaction txn(*this);

    int64_t ts = now_micros();
    int64_t expires = ts + static_cast<int64_t>(ttl_seconds) * 1000000;

    auto existing = get_lease(namespace_id);
    if (existing && existing->expires_at > ts) {
        return false;
    }

    auto stmt = prepare(R"(
        INSERT INTO allocation_leases (namespace, holder, acquired_at, expires_at)
        VALUES (?, ?, ?, ?)
        ON CONFLICT (namespace) DO UPDATE
        SET holder = excluded.holder, acquired_at = excluded.acquired_at,
            expires_at = excluded.expires_at;
    )");
    bind_text(stmt, 1, namespace_id);
    bind_text(stmt, 2, holder);
    bind_int64(stmt, 3, ts);
    bind_int64(stmt, 4, expires);
    step_done(stmt, "Failed to acquire lease");

    txn.commit();

    if (taken_over) {
        *taken_over = existing;
    }
    return true;
}

void LedgerDatabase::release_lease(const std::string& namespace_id, const std::string& holder) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare("DELETE FROM allocation_leases WHERE namespace = ? AND holder = ?;");
    bind_text(stmt, 1, namespace_id);
    bind_text(stmt, 2, holder);
    step_done(stmt, "Failed to release lease");
}

std::optional<LeaseInfo> LedgerDatabase::get_lease(const std::string& namespace_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(
        "SELECT namespace, holder, acquired_at, expires_at FROM allocation_leases WHERE namespace = ?;"
    );
    bind_text(stmt, 1, namespace_id);

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        finalize(stmt);
        return std::nullopt;
    }

    LeaseInfo l;
    l.namespace_id = get_text(stmt, 0);
    l.holder = get_text(stmt, 1);
    l.acquired_at = get_int64(stmt, 2);
    l.expires_at = get_int64(stmt, 3);
    finalize(stmt);
    return l;
}

// ============================================================================
// RECONCILIATION REPORTS
// ============================================================================

void LedgerDatabase::save_report(const ReconciliationReport& report) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Transaction txn(*this);

    auto stmt = prepare(R"(
        INSERT INTO reconciliation_reports (
            report_id, namespace, tiers, symbols_json, window_start, window_end,
            snapshot_cutoff, created_at, local_trades, external_trades,
            missing_count, extra_count, mismatch_count
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    bind_text(stmt, 1, report.report_id);
    bind_text(stmt, 2, report.namespace_id);
    bind_text(stmt, 3, tiers_to_text(report.tiers));
    bind_text(stmt, 4, nlohmann::json(report.symbols).dump());
    bind_int64(stmt, 5, report.window.start);
    bind_int64(stmt, 6, report.window.end);
    bind_int64(stmt, 7, report.snapshot_cutoff);
    bind_int64(stmt, 8, report.created_at);
    bind_int64(stmt, 9, report.local_trades);
    bind_int64(stmt, 10, report.external_trades);
    bind_int64(stmt, 11, report.count(DiscrepancyKind::MISSING_TRADE));
    bind_int64(stmt, 12, report.count(DiscrepancyKind::EXTRA_TRADE));
    bind_int64(stmt, 13, report.count(DiscrepancyKind::AMOUNT_MISMATCH));
    step_done(stmt, "Failed to save report " + report.report_id);

    for (const auto& d : report.discrepancies) {
        stmt = prepare(R"(
            INSERT INTO discrepancies (
                report_id, kind, symbol, order_ids_json, side, field,
                local_value, external_value, delta, details
            ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
        )");
        bind_text(stmt, 1, report.report_id);
        bind_text(stmt, 2, to_string(d.kind));
        bind_text(stmt, 3, d.symbol);
        bind_text(stmt, 4, nlohmann::json(d.order_ids).dump());
        if (d.side) {
            bind_text(stmt, 5, side_to_string(*d.side));
        } else {
            sqlite3_bind_null(stmt, 5);
        }
        bind_text(stmt, 6, d.field);
        bind_optional_decimal(stmt, 7, d.local_value);
        bind_optional_decimal(stmt, 8, d.external_value);
        bind_optional_decimal(stmt, 9, d.delta);
        bind_text(stmt, 10, d.details);
        step_done(stmt, "Failed to save discrepancy");
    }

    txn.commit();
    spdlog::info("Saved reconciliation report {} ({} discrepancies)",
                 report.report_id, report.discrepancies.size());
}

std::optional<ReconciliationReport> LedgerDatabase::get_report(const std::string& report_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(R"(
        SELECT report_id, namespace, tiers, symbols_json, window_start, window_end,
               snapshot_cutoff, created_at, local_trades, external_trades
        FROM reconciliation_reports WHERE report_id = ?;
    )");
    bind_text(stmt, 1, report_id);

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        finalize(stmt);
        return std::nullopt;
    }

    ReconciliationReport r;
    r.report_id = get_text(stmt, 0);
    r.namespace_id = get_text(stmt, 1);
    r.tiers = tiers_from_text(get_text(stmt, 2));
    std::string symbols_json = get_text(stmt, 3);
    r.window.start = get_int64(stmt, 4);
    r.window.end = get_int64(stmt, 5);
    r.snapshot_cutoff = get_int64(stmt, 6);
    r.created_at = get_int64(stmt, 7);
    r.local_trades = static_cast<int>(get_int64(stmt, 8));
    r.external_trades = static_cast<int>(get_int64(stmt, 9));
    finalize(stmt);

    r.symbols = nlohmann::json::parse(symbols_json).get<SymbolScope>();

    stmt = prepare(R"(
        SELECT kind, symbol, order_ids_json, side, field, local_value,
               external_value, delta, details
        FROM discrepancies WHERE report_id = ? ORDER BY id;
    )");
    bind_text(stmt, 1, report_id);

    try {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            Discrepancy d;
            d.kind = discrepancy_kind_from_string(get_text(stmt, 0));
            d.symbol = get_text(stmt, 1);
            d.order_ids = nlohmann::json::parse(get_text(stmt, 2)).get<std::vector<std::string>>();
            if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
                d.side = side_from_string(get_text(stmt, 3));
            }
            d.field = get_text(stmt, 4);
            d.local_value = get_optional_decimal(stmt, 5);
            d.external_value = get_optional_decimal(stmt, 6);
            d.delta = get_optional_decimal(stmt, 7);
            d.details = get_text(stmt, 8);
            r.discrepancies.push_back(d);
        }
    } catch (const std::exception&) {
        finalize(stmt);
        throw;
    }
    finalize(stmt);
    return r;
}

std::vector<ReconciliationReport> LedgerDatabase::list_reports(const std::string& namespace_id,
                                                               Micros from, Micros to) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(R"(
        SELECT report_id FROM reconciliation_reports
        WHERE namespace = ? AND created_at >= ? AND created_at <= ?
        ORDER BY created_at DESC;
    )");
    bind_text(stmt, 1, namespace_id);
    bind_int64(stmt, 2, from);
    bind_int64(stmt, 3, to);

    std::vector<std::string> ids;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.push_back(get_text(stmt, 0));
    }
    finalize(stmt);

    std::vector<ReconciliationReport> result;
    for (const auto& id : ids) {
        auto report = get_report(id);
        if (report) {
            result.push_back(*report);
        }
    }
    return result;
}

// ============================================================================
// MANUAL REVIEW QUEUE
// ============================================================================

ReviewItem LedgerDatabase::read_review_item(sqlite3_stmt* stmt) {
    ReviewItem r;
    r.id = get_int64(stmt, 0);
    r.order_id = get_text(stmt, 1);
    r.symbol = get_text(stmt, 2);
    r.issue_type = get_text(stmt, 3);
    r.severity = get_text(stmt, 4);
    r.status = get_text(stmt, 5);
    r.description = get_text(stmt, 6);
    r.resolution = get_text(stmt, 7);
    r.resolved_by = get_text(stmt, 8);
    r.created_at = get_int64(stmt, 9);
    r.updated_at = get_int64(stmt, 10);
    r.resolved_at = get_optional_int64(stmt, 11).value_or(0);
    return r;
}

int64_t LedgerDatabase::enqueue_review(const ReviewItem& item) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Transaction txn(*this);

    int64_t ts = now_micros();
    auto stmt = prepare(R"(
        INSERT INTO manual_review_queue (
            order_id, symbol, issue_type, severity, status, description,
            created_at, updated_at
        ) VALUES (?, ?, ?, ?, 'pending', ?, ?, ?)
        ON CONFLICT (order_id, issue_type) DO UPDATE
        SET description = excluded.description, updated_at = excluded.updated_at;
    )");
    bind_text(stmt, 1, item.order_id);
    bind_text(stmt, 2, item.symbol);
    bind_text(stmt, 3, item.issue_type);
    bind_text(stmt, 4, item.severity);
    bind_text(stmt, 5, item.description);
    bind_int64(stmt, 6, ts);
    bind_int64(stmt, 7, ts);
    step_done(stmt, "Failed to enqueue review item for " + item.order_id);

    stmt = prepare("SELECT id FROM manual_review_queue WHERE order_id = ? AND issue_type = ?;");
    bind_text(stmt, 1, item.order_id);
    bind_text(stmt, 2, item.issue_type);
    int64_t id = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        id = get_int64(stmt, 0);
    }
    finalize(stmt);

    txn.commit();
    return id;
}

std::vector<ReviewItem> LedgerDatabase::list_review_items(const std::string& status) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + REVIEW_COLUMNS + " FROM manual_review_queue";
    if (!status.empty()) {
        sql += " WHERE status = ?";
    }
    sql += " ORDER BY created_at DESC, id DESC;";

    auto stmt = prepare(sql);
    if (!status.empty()) {
        bind_text(stmt, 1, status);
    }

    std::vector<ReviewItem> result;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.push_back(read_review_item(stmt));
    }
    finalize(stmt);
    return result;
}

bool LedgerDatabase::resolve_review_item(int64_t id,
                                         const std::string& status,
                                         const std::string& resolution,
                                         const std::string& resolved_by) {
    if (status != "in_progress" && status != "resolved" && status != "dismissed") {
        throw std::invalid_argument("Invalid review status: " + status);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    int64_t ts = now_micros();
    bool closes = status != "in_progress";

    auto stmt = prepare(R"(
        UPDATE manual_review_queue
        SET status = ?, resolution = ?, resolved_by = ?, updated_at = ?, resolved_at = ?
        WHERE id = ?;
    )");
    bind_text(stmt, 1, status);
    bind_text(stmt, 2, resolution);
    bind_text(stmt, 3, resolved_by);
    bind_int64(stmt, 4, ts);
    bind_optional_int64(stmt, 5, closes ? std::optional<int64_t>(ts) : std::nullopt);
    bind_int64(stmt, 6, id);
    step_done(stmt, "Failed to resolve review item");

    bool updated = sqlite3_changes(db_) > 0;
    if (updated) {
        spdlog::info("Review item {} marked {} by {}", id, status, resolved_by);
    }
    return updated;
}

} // namespace fifo
