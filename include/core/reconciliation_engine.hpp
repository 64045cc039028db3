#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "common/types.hpp"
#include "common/decimal.hpp"
#include "common/errors.hpp"
#include "core/discrepancy.hpp"
#include "exchange/fill_source.hpp"
#include "persistence/stores.hpp"

namespace fifo {

/**
 * Result of one reconciliation run. A report is only present on success;
 * an unreachable source never produces an empty report.
 */
struct ReconciliationOutcome {
    bool success{false};
    ErrorKind error_kind{ErrorKind::NONE};
    std::string error_message;
    std::optional<ReconciliationReport> report;

    std::string summary() const;
};

/**
 * Compares the trade ledger against the exchange's fill history.
 *
 * Tier 1 (presence): order ids present externally but not locally are
 * MissingTrade, the reverse is ExtraTrade. Tier 2 (value): for orders
 * present on both sides, quantity, price, fee and side are compared and
 * any difference beyond the tolerance is AmountMismatch.
 *
 * An order seen on one side only is looked up by id on the other side
 * before it is reported, so fills straddling the window edge are not
 * flagged. Read-only against the ledger. Every report carries the
 * snapshot cutoff it observed.
 */
class ReconciliationEngine {
public:
    struct Config {
        Decimal amount_tolerance;   // Absolute, per field
    };

    // Throws std::invalid_argument when no fill source is supplied
    ReconciliationEngine(TradeLedgerStore& ledger, std::shared_ptr<FillSource> source);
    ReconciliationEngine(TradeLedgerStore& ledger,
                         std::shared_ptr<FillSource> source,
                         const Config& config);

    // Empty `symbols` = every symbol in the ledger or on the exchange
    // within the window. Tiers run in ascending order regardless of the
    // order given. Throws std::invalid_argument when no tier is given or
    // the window is inverted.
    ReconciliationOutcome run(const std::string& namespace_id,
                              const std::vector<ReconciliationTier>& tiers,
                              const SymbolScope& symbols,
                              const TimeWindow& window);

    // Comparison functions (public for testing)
    std::vector<Discrepancy> check_presence(const std::vector<TradeRecord>& local,
                                            const std::vector<TradeRecord>& external) const;
    std::vector<Discrepancy> check_values(const std::vector<TradeRecord>& local,
                                          const std::vector<TradeRecord>& external) const;

private:
    TradeLedgerStore& ledger_;
    std::shared_ptr<FillSource> source_;
    Config config_;

    // Requested symbols, or the union of ledger and exchange symbols when
    // none were requested; throws SourceUnavailableError
    std::vector<std::string> resolve_scope(const SymbolScope& symbols,
                                           const TimeWindow& window,
                                           Micros cutoff);

    // External fills for every symbol in scope; throws SourceUnavailableError
    std::vector<TradeRecord> fetch_external(const std::vector<std::string>& symbols,
                                            const TimeWindow& window);

    // Pull in the counterpart of records whose exchange time fell just
    // outside the window on one side only
    void resolve_window_edges(std::vector<TradeRecord>& local,
                              std::vector<TradeRecord>& external,
                              Micros cutoff);

    std::optional<Discrepancy> compare_field(const TradeRecord& local,
                                             const std::string& field,
                                             const Decimal& local_value,
                                             const Decimal& external_value) const;
};

} // namespace fifo
