#include "core/backfill_coordinator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <set>
#include <stdexcept>

namespace fifo {

std::string BackfillResult::summary() const {
    std::string s;
    s += fmt::format("Backfill {}: ", success ? "SUCCESS" : "INCOMPLETE");
    s += fmt::format("{} requested, ", requested);
    s += fmt::format("{} inserted, ", inserted);
    s += fmt::format("{} already present, ", skipped);
    s += fmt::format("{} failed", failed.size());
    if (!affected_symbols.empty()) {
        s += fmt::format(" [symbols: {}]", scope_to_string(affected_symbols));
    }
    if (!error_message.empty()) {
        s += fmt::format(" [Error: {}]", error_message);
    }
    return s;
}

BackfillCoordinator::BackfillCoordinator(TradeLedgerStore& ledger,
                                         std::shared_ptr<FillSource> source)
    : ledger_(ledger)
    , source_(std::move(source))
{
    if (!source_) {
        throw std::invalid_argument("BackfillCoordinator requires a fill source");
    }
}

BackfillResult BackfillCoordinator::backfill(const ReconciliationReport& report,
                                             const std::optional<SymbolScope>& current_scope) {
    BackfillResult result;
    result.report_id = report.report_id;

    // One fetch per (symbol, order id), in report order
    std::set<std::pair<std::string, std::string>> seen;
    std::vector<std::pair<std::string, std::string>> targets;
    for (const auto& d : report.discrepancies) {
        if (d.kind != DiscrepancyKind::MISSING_TRADE) continue;
        for (const auto& order_id : d.order_ids) {
            if (seen.insert({d.symbol, order_id}).second) {
                targets.emplace_back(d.symbol, order_id);
            }
        }
    }
    result.requested = static_cast<int>(targets.size());

    if (targets.empty()) {
        spdlog::info("Backfill for report {}: nothing missing", report.report_id);
        result.success = true;
        return result;
    }

    spdlog::info("Backfilling {} missing trades from report {}", targets.size(), report.report_id);

    std::set<std::string> affected;

    for (const auto& [symbol, order_id] : targets) {
        if (ledger_.contains_order(order_id)) {
            spdlog::debug("Skipping {} {}: already in ledger", symbol, order_id);
            result.skipped++;
            continue;
        }

        auto response = source_->get_fill(order_id);
        if (!response.success) {
            result.failed.push_back({order_id, symbol, response.error});
            spdlog::warn("Backfill fetch failed for {} {}: {}", symbol, order_id, response.error);
            continue;
        }
        if (response.not_found || !response.fill) {
            result.failed.push_back({order_id, symbol, "not found on exchange"});
            spdlog::warn("Backfill fetch for {} {}: not found on exchange", symbol, order_id);
            continue;
        }

        TradeRecord record;
        try {
            record = normalize_fill(*response.fill, TradeSource::BACKFILL);
        } catch (const std::invalid_argument& e) {
            result.failed.push_back({order_id, symbol, e.what()});
            spdlog::warn("Backfill rejected malformed fill {}: {}", order_id, e.what());
            continue;
        }

        if (record.symbol != symbol) {
            std::string reason = fmt::format("exchange reports symbol {} for this order",
                                             record.symbol);
            result.failed.push_back({order_id, symbol, reason});
            spdlog::warn("Backfill for {} {}: {}", symbol, order_id, reason);
            continue;
        }

        if (ledger_.append(record)) {
            result.inserted++;
            result.inserted_order_ids.push_back(order_id);
            affected.insert(symbol);
            spdlog::info("Backfilled {} {} {} {} @ {}", symbol, order_id,
                         side_to_string(record.side), record.quantity.to_string(),
                         record.price.to_string());
        } else {
            // Inserted concurrently; first writer wins
            result.skipped++;
        }
    }

    result.affected_symbols.assign(affected.begin(), affected.end());

    if (result.inserted > 0) {
        AllocationRequest request;
        request.namespace_id = report.namespace_id;
        request.scope = request_scope(result.affected_symbols, current_scope);
        request.triggered_by = "backfill:" + report.report_id;
        result.allocation_request = std::move(request);
    }

    if (result.failed.empty()) {
        result.success = true;
    } else {
        result.error_kind = ErrorKind::PARTIAL_BACKFILL_FAILURE;
        result.error_message = fmt::format("{} of {} missing trades could not be backfilled",
                                           result.failed.size(), result.requested);
        spdlog::error("{}", result.error_message);
    }

    spdlog::info("{}", result.summary());
    return result;
}

SymbolScope BackfillCoordinator::request_scope(const SymbolScope& affected,
                                               const std::optional<SymbolScope>& current_scope) const {
    // No current version or an all-symbol current version: recompute all
    if (!current_scope || current_scope->empty()) {
        return {};
    }

    std::set<std::string> merged(current_scope->begin(), current_scope->end());
    merged.insert(affected.begin(), affected.end());
    return SymbolScope(merged.begin(), merged.end());
}

} // namespace fifo
