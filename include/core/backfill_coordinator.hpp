#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "common/types.hpp"
#include "common/errors.hpp"
#include "core/allocation.hpp"
#include "core/discrepancy.hpp"
#include "exchange/fill_source.hpp"
#include "persistence/stores.hpp"

namespace fifo {

struct BackfillFailure {
    std::string order_id;
    std::string symbol;
    std::string reason;
};

/**
 * Result of one backfill pass. PARTIAL_BACKFILL_FAILURE means the
 * successful subset is committed and `failed` lists what to retry.
 */
struct BackfillResult {
    bool success{false};
    ErrorKind error_kind{ErrorKind::NONE};
    std::string error_message;

    std::string report_id;
    int requested{0};
    int inserted{0};
    int skipped{0};                          // Already present, no-op
    std::vector<BackfillFailure> failed;
    std::vector<std::string> inserted_order_ids;
    SymbolScope affected_symbols;

    // Emitted when at least one record was inserted
    std::optional<AllocationRequest> allocation_request;

    std::string summary() const;
};

/**
 * Inserts the fills behind a report's MissingTrade discrepancies into the
 * ledger with source "backfill". Insertion is idempotent so a pass may be
 * re-run after a partial failure. The coordinator never computes
 * allocations; it hands back an AllocationRequest for the affected
 * symbols.
 */
class BackfillCoordinator {
public:
    // Throws std::invalid_argument when no fill source is supplied
    BackfillCoordinator(TradeLedgerStore& ledger, std::shared_ptr<FillSource> source);

    // `current_scope` is the scope of the namespace's current version, if
    // any. The emitted request covers its union with the affected symbols.
    BackfillResult backfill(const ReconciliationReport& report,
                            const std::optional<SymbolScope>& current_scope = std::nullopt);

private:
    TradeLedgerStore& ledger_;
    std::shared_ptr<FillSource> source_;

    SymbolScope request_scope(const SymbolScope& affected,
                              const std::optional<SymbolScope>& current_scope) const;
};

} // namespace fifo
