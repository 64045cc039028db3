#include "core/reconciliation_engine.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace fifo {

namespace {

using OrderKey = std::pair<std::string, std::string>;   // (symbol, order_id)

std::map<OrderKey, const TradeRecord*> index_by_order(const std::vector<TradeRecord>& records) {
    std::map<OrderKey, const TradeRecord*> index;
    for (const auto& r : records) {
        index.emplace(OrderKey{r.symbol, r.order_id}, &r);
    }
    return index;
}

bool discrepancy_order(const Discrepancy& a, const Discrepancy& b) {
    if (a.symbol != b.symbol) return a.symbol < b.symbol;
    if (a.kind != b.kind) return a.kind < b.kind;
    if (a.primary_order_id() != b.primary_order_id()) {
        return a.primary_order_id() < b.primary_order_id();
    }
    return a.field < b.field;
}

} // namespace

std::string ReconciliationOutcome::summary() const {
    if (!success) {
        return fmt::format("Reconciliation FAILED [{}]: {}",
                           error_kind_to_string(error_kind), error_message);
    }
    return report ? report->summary() : "Reconciliation SUCCESS";
}

ReconciliationEngine::ReconciliationEngine(TradeLedgerStore& ledger,
                                           std::shared_ptr<FillSource> source)
    : ReconciliationEngine(ledger, std::move(source), Config{})
{
}

ReconciliationEngine::ReconciliationEngine(TradeLedgerStore& ledger,
                                           std::shared_ptr<FillSource> source,
                                           const Config& config)
    : ledger_(ledger)
    , source_(std::move(source))
    , config_(config)
{
    if (!source_) {
        throw std::invalid_argument("ReconciliationEngine requires a fill source");
    }
    spdlog::info("Reconciliation engine initialized: source={}, tolerance={}",
                 source_->name(), config_.amount_tolerance.to_string());
}

ReconciliationOutcome ReconciliationEngine::run(const std::string& namespace_id,
                                                const std::vector<ReconciliationTier>& tiers,
                                                const SymbolScope& symbols,
                                                const TimeWindow& window) {
    if (tiers.empty()) {
        throw std::invalid_argument("No reconciliation tier requested");
    }
    if (window.end < window.start) {
        throw std::invalid_argument("Window end precedes window start");
    }

    ReconciliationOutcome outcome;
    std::set<ReconciliationTier> tier_set(tiers.begin(), tiers.end());
    Micros cutoff = now_micros();

    spdlog::info("Starting reconciliation for {}: tiers={}, symbols=[{}], window={} .. {}",
                 namespace_id, tier_set.size(), scope_to_string(symbols),
                 time_utils::to_iso8601(window.start), time_utils::to_iso8601(window.end));

    std::vector<TradeRecord> external;
    std::vector<TradeRecord> local;
    try {
        auto scope = resolve_scope(symbols, window, cutoff);
        external = fetch_external(scope, window);
        local = ledger_.scan_window(scope, window, cutoff);
        resolve_window_edges(local, external, cutoff);
    } catch (const SourceUnavailableError& e) {
        outcome.error_kind = ErrorKind::SOURCE_UNAVAILABLE;
        outcome.error_message = e.what();
        spdlog::error("Reconciliation aborted, no report produced: {}", e.what());
        return outcome;
    }

    spdlog::info("Compared {} local and {} external trades", local.size(), external.size());

    ReconciliationReport report;
    report.report_id = generate_uuid();
    report.namespace_id = namespace_id;
    report.tiers.assign(tier_set.begin(), tier_set.end());
    report.symbols = symbols;
    report.window = window;
    report.snapshot_cutoff = cutoff;
    report.created_at = now_micros();
    report.local_trades = static_cast<int>(local.size());
    report.external_trades = static_cast<int>(external.size());

    if (tier_set.count(ReconciliationTier::PRESENCE)) {
        auto found = check_presence(local, external);
        report.discrepancies.insert(report.discrepancies.end(), found.begin(), found.end());
    }
    if (tier_set.count(ReconciliationTier::VALUE)) {
        auto found = check_values(local, external);
        report.discrepancies.insert(report.discrepancies.end(), found.begin(), found.end());
    }

    std::sort(report.discrepancies.begin(), report.discrepancies.end(), discrepancy_order);

    // Log discrepancies
    if (!report.discrepancies.empty()) {
        spdlog::warn("Found {} discrepancies during reconciliation:", report.discrepancies.size());
        for (const auto& d : report.discrepancies) {
            spdlog::warn("  - {}: {} {} {}{}",
                         to_string(d.kind), d.symbol, d.primary_order_id(),
                         d.field.empty() ? "" : d.field + " ",
                         d.details);
        }
    }

    spdlog::info("{}", report.summary());

    outcome.success = true;
    outcome.report = std::move(report);
    return outcome;
}

std::vector<std::string> ReconciliationEngine::resolve_scope(const SymbolScope& symbols,
                                                             const TimeWindow& window,
                                                             Micros cutoff) {
    std::vector<std::string> scope = symbols;
    if (scope.empty()) {
        scope = ledger_.list_symbols(cutoff);

        auto response = source_->list_symbols(window);
        if (!response.success) {
            throw SourceUnavailableError("Symbol discovery failed: " + response.error);
        }
        scope.insert(scope.end(), response.symbols.begin(), response.symbols.end());
    }
    std::sort(scope.begin(), scope.end());
    scope.erase(std::unique(scope.begin(), scope.end()), scope.end());
    return scope;
}

std::vector<TradeRecord> ReconciliationEngine::fetch_external(const std::vector<std::string>& symbols,
                                                              const TimeWindow& window) {
    std::vector<TradeRecord> external;

    for (const auto& symbol : symbols) {
        auto response = source_->list_fills(symbol, window);
        if (!response.success) {
            throw SourceUnavailableError(
                fmt::format("{} failed to list fills for {}: {}",
                            source_->name(), symbol, response.error));
        }

        for (const auto& fill : response.fills) {
            try {
                auto record = normalize_fill(fill, TradeSource::NORMAL);
                if (record.symbol != symbol || !window.contains(record.exchange_time)) {
                    continue;
                }
                external.push_back(std::move(record));
            } catch (const std::invalid_argument& e) {
                // A malformed answer is not evidence of anything
                throw SourceUnavailableError(
                    fmt::format("{} returned a malformed fill for {}: {}",
                                source_->name(), symbol, e.what()));
            }
        }
    }

    return external;
}

void ReconciliationEngine::resolve_window_edges(std::vector<TradeRecord>& local,
                                                std::vector<TradeRecord>& external,
                                                Micros cutoff) {
    auto local_index = index_by_order(local);
    auto external_index = index_by_order(external);

    std::vector<TradeRecord> local_extra;
    for (const auto& [key, ext] : external_index) {
        if (local_index.count(key)) continue;
        auto rec = ledger_.find(key.second, key.first);
        if (rec && rec->ingested_at <= cutoff) {
            spdlog::debug("{} {} found locally outside the window", key.first, key.second);
            local_extra.push_back(*rec);
        }
    }

    std::vector<TradeRecord> external_extra;
    for (const auto& [key, rec] : local_index) {
        if (external_index.count(key)) continue;
        auto response = source_->get_fill(key.second);
        if (!response.success) {
            throw SourceUnavailableError(
                fmt::format("{} failed to look up {}: {}",
                            source_->name(), key.second, response.error));
        }
        if (response.not_found || !response.fill) continue;

        try {
            auto ext = normalize_fill(*response.fill, TradeSource::NORMAL);
            if (ext.symbol == key.first) {
                spdlog::debug("{} {} found externally outside the window", key.first, key.second);
                external_extra.push_back(std::move(ext));
            }
        } catch (const std::invalid_argument& e) {
            throw SourceUnavailableError(
                fmt::format("{} returned a malformed fill for {}: {}",
                            source_->name(), key.second, e.what()));
        }
    }

    local.insert(local.end(), local_extra.begin(), local_extra.end());
    external.insert(external.end(), external_extra.begin(), external_extra.end());
}

std::vector<Discrepancy> ReconciliationEngine::check_presence(const std::vector<TradeRecord>& local,
                                                              const std::vector<TradeRecord>& external) const {
    std::vector<Discrepancy> discrepancies;

    auto local_index = index_by_order(local);
    auto external_index = index_by_order(external);

    // Orders on the exchange we never recorded
    for (const auto& [key, ext] : external_index) {
        if (local_index.count(key)) continue;

        Discrepancy d;
        d.kind = DiscrepancyKind::MISSING_TRADE;
        d.symbol = key.first;
        d.order_ids = {key.second};
        d.side = ext->side;
        d.external_value = ext->quantity;
        d.details = fmt::format("{} {} @ {} at {} missing from ledger",
                                side_to_string(ext->side), ext->quantity.to_string(),
                                ext->price.to_string(),
                                time_utils::to_iso8601(ext->exchange_time));
        discrepancies.push_back(std::move(d));
    }

    // Orders we recorded that the exchange does not know about.
    // Flagged only; the ledger is never edited.
    for (const auto& [key, rec] : local_index) {
        if (external_index.count(key)) continue;

        Discrepancy d;
        d.kind = DiscrepancyKind::EXTRA_TRADE;
        d.symbol = key.first;
        d.order_ids = {key.second};
        d.side = rec->side;
        d.local_value = rec->quantity;
        d.details = fmt::format("{} {} @ {} at {} not reported by exchange",
                                side_to_string(rec->side), rec->quantity.to_string(),
                                rec->price.to_string(),
                                time_utils::to_iso8601(rec->exchange_time));
        discrepancies.push_back(std::move(d));
    }

    return discrepancies;
}

std::vector<Discrepancy> ReconciliationEngine::check_values(const std::vector<TradeRecord>& local,
                                                            const std::vector<TradeRecord>& external) const {
    std::vector<Discrepancy> discrepancies;

    auto external_index = index_by_order(external);

    for (const auto& [key, rec] : index_by_order(local)) {
        auto it = external_index.find(key);
        if (it == external_index.end()) continue;
        const TradeRecord& ext = *it->second;

        if (rec->side != ext.side) {
            Discrepancy d;
            d.kind = DiscrepancyKind::AMOUNT_MISMATCH;
            d.symbol = key.first;
            d.order_ids = {key.second};
            d.side = rec->side;
            d.field = "side";
            d.details = fmt::format("local={} external={}",
                                    side_to_string(rec->side), side_to_string(ext.side));
            discrepancies.push_back(std::move(d));
        }

        for (auto d : {compare_field(*rec, "quantity", rec->quantity, ext.quantity),
                       compare_field(*rec, "price", rec->price, ext.price),
                       compare_field(*rec, "fee", rec->fee, ext.fee)}) {
            if (d) discrepancies.push_back(std::move(*d));
        }
    }

    return discrepancies;
}

std::optional<Discrepancy> ReconciliationEngine::compare_field(const TradeRecord& local,
                                                               const std::string& field,
                                                               const Decimal& local_value,
                                                               const Decimal& external_value) const {
    Decimal delta = external_value - local_value;
    if (delta.abs() <= config_.amount_tolerance) {
        return std::nullopt;
    }

    Discrepancy d;
    d.kind = DiscrepancyKind::AMOUNT_MISMATCH;
    d.symbol = local.symbol;
    d.order_ids = {local.order_id};
    d.side = local.side;
    d.field = field;
    d.local_value = local_value;
    d.external_value = external_value;
    d.delta = delta;
    d.details = fmt::format("local={} external={} delta={}",
                            local_value.to_string(), external_value.to_string(),
                            delta.to_string());
    return d;
}

} // namespace fifo
