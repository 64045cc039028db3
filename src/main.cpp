#include <iostream>
#include <filesystem>
#include <memory>
#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "common/errors.hpp"
#include "config/config.hpp"
#include "core/allocation_service.hpp"
#include "core/backfill_coordinator.hpp"
#include "core/fifo_engine.hpp"
#include "core/reconciliation_engine.hpp"
#include "core/recovery_pipeline.hpp"
#include "core/version_manager.hpp"
#include "exchange/fill_source.hpp"
#include "persistence/ledger_database.hpp"
#include "utils/time_utils.hpp"

using namespace fifo;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/fifo_ledger.log",
            config.max_log_file_size_mb * 1024 * 1024,
            config.max_log_files
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("fifo_ledger", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

std::shared_ptr<FillSource> make_fill_source(const SourceConfig& config) {
    ResilientFillSource::Config rc;
    rc.max_requests = config.max_requests;
    rc.rate_window_seconds = config.rate_window_seconds;
    rc.call_timeout_ms = config.call_timeout_ms;
    rc.max_retries = config.max_retries;
    rc.initial_backoff_ms = config.initial_backoff_ms;
    rc.max_backoff_ms = config.max_backoff_ms;
    return std::make_shared<ResilientFillSource>(
        std::make_shared<JsonFileFillSource>(config.fills_path), rc);
}

Micros parse_time_or(const std::string& text, Micros fallback) {
    return text.empty() ? fallback : time_utils::from_iso8601(text);
}

std::vector<ReconciliationTier> parse_tiers(const std::string& tier) {
    if (tier == "1") return {ReconciliationTier::PRESENCE};
    if (tier == "2") return {ReconciliationTier::VALUE};
    if (tier == "all") return {ReconciliationTier::PRESENCE, ReconciliationTier::VALUE};
    throw std::invalid_argument("Unknown tier: " + tier);
}

void print_version_line(const AllocationVersion& v, bool is_current) {
    std::cout << fmt::format("{} v{:<4} {:<11} created {}  cutoff {}  symbols [{}]  {}{}\n",
                             is_current ? "*" : " ",
                             v.version_number, to_string(v.status),
                             time_utils::to_iso8601(v.created_at),
                             time_utils::to_iso8601(v.ledger_cutoff),
                             scope_to_string(v.scope),
                             v.triggered_by,
                             v.status_reason.empty() ? "" : " (" + v.status_reason + ")");
}

void print_discrepancies(const ReconciliationReport& report) {
    for (const auto& d : report.discrepancies) {
        std::cout << fmt::format("  {:<15} {:<10} {:<20} {}{}\n",
                                 to_string(d.kind), d.symbol, d.primary_order_id(),
                                 d.field.empty() ? "" : d.field + ": ", d.details);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"fifo_ledger - FIFO realized P&L with versioned allocations and exchange reconciliation"};
    app.require_subcommand(1);

    std::string config_path = "config/config.json";
    std::string namespace_id;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("-n,--namespace", namespace_id, "Allocation namespace (defaults to config)");

    // init
    auto* init_cmd = app.add_subcommand("init", "Create the database schema");
    std::string write_config;
    init_cmd->add_option("--write-config", write_config, "Also write a default config to this path");

    // allocate
    auto* allocate_cmd = app.add_subcommand("allocate", "Compute, validate and publish a new allocation version");
    std::vector<std::string> allocate_symbols;
    std::string allocate_cutoff;
    allocate_cmd->add_option("-s,--symbols", allocate_symbols, "Symbols to allocate (default: all)")
        ->delimiter(',');
    allocate_cmd->add_option("--cutoff", allocate_cutoff, "Ledger cutoff, ISO 8601 (default: now)");

    // validate
    auto* validate_cmd = app.add_subcommand("validate", "Re-run structural validation on a stored version");
    int64_t validate_version = 0;
    validate_cmd->add_option("--version", validate_version, "Version number")->required();

    // reconcile
    auto* reconcile_cmd = app.add_subcommand("reconcile", "Compare the ledger against the exchange fill history");
    std::string tier = "1";
    std::vector<std::string> reconcile_symbols;
    std::string from_time;
    std::string to_time;
    bool auto_backfill = false;
    bool from_residues = false;
    reconcile_cmd->add_option("--tier", tier, "Tier to run: 1, 2 or all")
        ->check(CLI::IsMember({"1", "2", "all"}));
    reconcile_cmd->add_option("-s,--symbols", reconcile_symbols, "Symbols to check (default: all)")
        ->delimiter(',');
    reconcile_cmd->add_option("--from", from_time, "Window start, ISO 8601 (default: epoch)");
    reconcile_cmd->add_option("--to", to_time, "Window end, ISO 8601 (default: now)");
    reconcile_cmd->add_flag("--auto-backfill", auto_backfill, "Backfill missing trades and recompute");
    reconcile_cmd->add_flag("--from-residues", from_residues,
                            "Check symbols and window around the current version's unmatched sells");

    // versions
    auto* versions_cmd = app.add_subcommand("versions", "List allocation versions");
    std::string versions_from;
    std::string versions_to;
    versions_cmd->add_option("--from", versions_from, "Created after, ISO 8601");
    versions_cmd->add_option("--to", versions_to, "Created before, ISO 8601");

    // pnl
    auto* pnl_cmd = app.add_subcommand("pnl", "Realized P&L per symbol");
    int64_t pnl_version = 0;
    pnl_cmd->add_option("--version", pnl_version, "Version number (default: current)");

    // review
    auto* review_cmd = app.add_subcommand("review", "Manual review queue");
    review_cmd->require_subcommand(1);
    auto* review_list_cmd = review_cmd->add_subcommand("list", "List review items");
    std::string review_status;
    review_list_cmd->add_option("--status", review_status, "Filter by status");
    auto* review_resolve_cmd = review_cmd->add_subcommand("resolve", "Resolve or dismiss an item");
    int64_t review_id = 0;
    std::string resolve_status = "resolved";
    std::string resolution;
    std::string resolved_by = Config::get_env("USER", "operator");
    review_resolve_cmd->add_option("--id", review_id, "Item id")->required();
    review_resolve_cmd->add_option("--status", resolve_status, "in_progress, resolved or dismissed")
        ->check(CLI::IsMember({"in_progress", "resolved", "dismissed"}));
    review_resolve_cmd->add_option("--note", resolution, "Resolution note")->required();
    review_resolve_cmd->add_option("--by", resolved_by, "Who resolved it");

    // reports
    auto* reports_cmd = app.add_subcommand("reports", "List reconciliation reports");
    std::string reports_from;
    std::string reports_to;
    bool reports_detail = false;
    reports_cmd->add_option("--from", reports_from, "Created after, ISO 8601");
    reports_cmd->add_option("--to", reports_to, "Created before, ISO 8601");
    reports_cmd->add_flag("--detail", reports_detail, "Print every discrepancy");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int rc = app.exit(e);
        return rc == 0 ? EXIT_OK : EXIT_USAGE;
    }

    // Load config
    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        } else if (app.count("--config") > 0) {
            std::cerr << "Config file not found: " << config_path << "\n";
            return EXIT_USAGE;
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    if (namespace_id.empty()) {
        namespace_id = config.default_namespace;
    }

    setup_logging(config.logging);

    try {
        auto db_dir = std::filesystem::path(config.database_path).parent_path();
        if (!db_dir.empty()) {
            std::filesystem::create_directories(db_dir);
        }

        LedgerDatabase db(config.database_path);
        db.initialize_schema();

        VersionManager::Config vm_config;
        vm_config.lease_wait_ms = config.allocation.lease_wait_ms;
        vm_config.lease_ttl_seconds = config.allocation.lease_ttl_seconds;
        VersionManager versions(db, vm_config);

        AllocationService::Config as_config;
        as_config.residue_policy = residue_policy_from_string(config.allocation.residue_policy);
        as_config.strict_validation = config.validation.strict;
        AllocationService allocator(db, db, db, versions, as_config);

        if (*init_cmd) {
            std::cout << fmt::format("Initialized {} (schema v{}, {} trade records)\n",
                                     config.database_path, db.get_schema_version(),
                                     db.count_records());
            if (!write_config.empty()) {
                config.save(write_config);
                std::cout << "Wrote default config to " << write_config << "\n";
            }
            return EXIT_OK;
        }

        if (*allocate_cmd) {
            AllocationRequest request;
            request.namespace_id = namespace_id;
            request.scope = allocate_symbols;
            if (!allocate_cutoff.empty()) {
                request.cutoff = time_utils::from_iso8601(allocate_cutoff);
            }
            request.triggered_by = "cli";

            auto result = allocator.run(request);
            std::cout << result.summary() << "\n";
            for (const auto& issue : result.validation.issues) {
                std::cout << fmt::format("  [{}] {} {} {}: {}\n", to_string(issue.severity),
                                         issue.code, issue.symbol, issue.order_id, issue.message);
            }
            return result.success ? EXIT_OK : EXIT_FAILED;
        }

        if (*validate_cmd) {
            auto result = allocator.revalidate(namespace_id, validate_version);
            std::cout << result.summary() << "\n";
            for (const auto& issue : result.issues) {
                std::cout << fmt::format("  [{}] {} {} {}: {}\n", to_string(issue.severity),
                                         issue.code, issue.symbol, issue.order_id, issue.message);
            }
            return result.is_valid ? EXIT_OK : EXIT_FAILED;
        }

        if (*reconcile_cmd) {
            auto source = make_fill_source(config.source);

            ReconciliationEngine::Config rc;
            rc.amount_tolerance = config.amount_tolerance();
            ReconciliationEngine reconciler(db, source, rc);
            BackfillCoordinator backfiller(db, source);

            RecoveryPipeline::Config pc;
            pc.residue_window_padding_days = config.reconciliation.residue_window_padding_days;
            RecoveryPipeline pipeline(reconciler, backfiller, allocator, versions, db, db, pc);

            ReconciliationRequest request;
            request.namespace_id = namespace_id;
            request.tiers = parse_tiers(tier);
            request.symbols = reconcile_symbols;
            request.window.start = parse_time_or(from_time, 0);
            request.window.end = parse_time_or(to_time, now_micros());
            request.auto_backfill = auto_backfill;
            request.from_residues = from_residues;

            auto result = pipeline.run(request);
            if (result.reconciliation.report) {
                std::cout << result.reconciliation.report->summary() << "\n";
                print_discrepancies(*result.reconciliation.report);
            }
            std::cout << result.summary() << "\n";
            return result.success ? EXIT_OK : EXIT_FAILED;
        }

        if (*versions_cmd) {
            auto current = versions.get_current(namespace_id);
            auto list = versions.list_versions(namespace_id,
                                               parse_time_or(versions_from, 0),
                                               parse_time_or(versions_to, INT64_MAX));
            if (list.empty()) {
                std::cout << "No versions for " << namespace_id << "\n";
            }
            for (const auto& v : list) {
                print_version_line(v, current && current->version_number == v.version_number);
            }
            return EXIT_OK;
        }

        if (*pnl_cmd) {
            std::optional<AllocationVersion> version = pnl_version > 0
                ? versions.get_by_version(namespace_id, pnl_version)
                : versions.get_current(namespace_id);
            if (!version) {
                std::cerr << "No such version for " << namespace_id << "\n";
                return EXIT_FAILED;
            }

            auto rows = pnl_by_symbol(db.get_allocations(namespace_id, version->version_number),
                                      db.get_residues(namespace_id, version->version_number));
            print_version_line(*version, false);
            std::cout << fmt::format("{:<12} {:>6} {:>16} {:>16} {:>16} {:>16} {:>16}\n",
                                     "SYMBOL", "LOTS", "MATCHED", "COST", "NET", "FEES", "REALIZED");
            Decimal total;
            for (const auto& [symbol, p] : rows) {
                std::cout << fmt::format("{:<12} {:>6} {:>16} {:>16} {:>16} {:>16} {:>16}{}\n",
                                         symbol, p.allocations, p.matched_quantity.to_string(),
                                         p.cost_basis.to_string(), p.net_proceeds.to_string(),
                                         p.fees.to_string(), p.realized_pnl.to_string(),
                                         p.residues > 0
                                             ? fmt::format("  ({} unmatched: {})", p.residues,
                                                           p.residue_quantity.to_string())
                                             : std::string());
                total += p.realized_pnl;
            }
            std::cout << fmt::format("{:<12} {:>104}\n", "TOTAL", total.to_string());
            return EXIT_OK;
        }

        if (*review_cmd) {
            if (*review_list_cmd) {
                auto items = db.list_review_items(review_status);
                if (items.empty()) {
                    std::cout << "Review queue is empty\n";
                }
                for (const auto& item : items) {
                    std::cout << fmt::format("#{:<5} {:<11} {:<8} {:<16} {:<10} {:<20} {}\n",
                                             item.id, item.status, item.severity, item.issue_type,
                                             item.symbol, item.order_id, item.description);
                }
                return EXIT_OK;
            }
            if (*review_resolve_cmd) {
                if (!db.resolve_review_item(review_id, resolve_status, resolution, resolved_by)) {
                    std::cerr << "No review item #" << review_id << "\n";
                    return EXIT_FAILED;
                }
                std::cout << fmt::format("Review item #{} -> {}\n", review_id, resolve_status);
                return EXIT_OK;
            }
        }

        if (*reports_cmd) {
            auto reports = db.list_reports(namespace_id,
                                           parse_time_or(reports_from, 0),
                                           parse_time_or(reports_to, INT64_MAX));
            if (reports.empty()) {
                std::cout << "No reconciliation reports for " << namespace_id << "\n";
            }
            for (const auto& report : reports) {
                std::cout << fmt::format("{} {} ", report.report_id,
                                         time_utils::to_iso8601(report.created_at))
                          << report.summary() << "\n";
                if (reports_detail) {
                    print_discrepancies(report);
                }
            }
            return EXIT_OK;
        }
    } catch (const LedgerError& e) {
        spdlog::error("{}: {}", error_kind_to_string(e.kind()), e.what());
        return EXIT_FAILED;
    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid argument: {}", e.what());
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILED;
    }

    return EXIT_OK;
}
