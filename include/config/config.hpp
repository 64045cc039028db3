#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "common/decimal.hpp"

namespace fifo {

struct SourceConfig {
    std::string fills_path{"./data/exchange_fills.json"};   // Exchange fill-history export
    int max_requests{10};                    // Rate limit: requests per window
    int rate_window_seconds{1};
    int call_timeout_ms{10000};              // Per call, overrun = unavailable
    int max_retries{3};                      // Retries after the first attempt
    int initial_backoff_ms{500};
    int max_backoff_ms{8000};
};

struct AllocationConfig {
    std::string residue_policy{"unallocated"};   // unallocated, zero_cost_basis
    int lease_wait_ms{0};                    // 0 = fail fast when a run is in flight
    int lease_ttl_seconds{3600};             // Stale lease takeover
};

struct ValidationConfig {
    bool strict{false};                      // Warnings (residues) invalidate the version
};

struct ReconciliationConfig {
    int residue_window_padding_days{30};     // Window around residue sells
    std::string amount_tolerance{"0"};       // Tier 2 absolute tolerance
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{false};                 // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct Config {
    std::string database_path{"./data/ledger.db"};
    std::string default_namespace{"default"};

    SourceConfig source;
    AllocationConfig allocation;
    ValidationConfig validation;
    ReconciliationConfig reconciliation;
    LoggingConfig logging;

    // Load from file; throws std::runtime_error when unreadable or invalid
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Typed views
    Decimal amount_tolerance() const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace fifo
