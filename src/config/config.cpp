#include "config/config.hpp"
#include "core/allocation.hpp"
#include <fstream>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace fifo {

void to_json(nlohmann::json& j, const SourceConfig& c) {
    j = nlohmann::json{
        {"fills_path", c.fills_path},
        {"max_requests", c.max_requests},
        {"rate_window_seconds", c.rate_window_seconds},
        {"call_timeout_ms", c.call_timeout_ms},
        {"max_retries", c.max_retries},
        {"initial_backoff_ms", c.initial_backoff_ms},
        {"max_backoff_ms", c.max_backoff_ms}
    };
}

void from_json(const nlohmann::json& j, SourceConfig& c) {
    if (j.contains("fills_path")) j.at("fills_path").get_to(c.fills_path);
    if (j.contains("max_requests")) j.at("max_requests").get_to(c.max_requests);
    if (j.contains("rate_window_seconds")) j.at("rate_window_seconds").get_to(c.rate_window_seconds);
    if (j.contains("call_timeout_ms")) j.at("call_timeout_ms").get_to(c.call_timeout_ms);
    if (j.contains("max_retries")) j.at("max_retries").get_to(c.max_retries);
    if (j.contains("initial_backoff_ms")) j.at("initial_backoff_ms").get_to(c.initial_backoff_ms);
    if (j.contains("max_backoff_ms")) j.at("max_backoff_ms").get_to(c.max_backoff_ms);
}

void to_json(nlohmann::json& j, const AllocationConfig& c) {
    j = nlohmann::json{
        {"residue_policy", c.residue_policy},
        {"lease_wait_ms", c.lease_wait_ms},
        {"lease_ttl_seconds", c.lease_ttl_seconds}
    };
}

void from_json(const nlohmann::json& j, AllocationConfig& c) {
    if (j.contains("residue_policy")) j.at("residue_policy").get_to(c.residue_policy);
    if (j.contains("lease_wait_ms")) j.at("lease_wait_ms").get_to(c.lease_wait_ms);
    if (j.contains("lease_ttl_seconds")) j.at("lease_ttl_seconds").get_to(c.lease_ttl_seconds);
}

void to_json(nlohmann::json& j, const ValidationConfig& c) {
    j = nlohmann::json{
        {"strict", c.strict}
    };
}

void from_json(const nlohmann::json& j, ValidationConfig& c) {
    if (j.contains("strict")) j.at("strict").get_to(c.strict);
}

void to_json(nlohmann::json& j, const ReconciliationConfig& c) {
    j = nlohmann::json{
        {"residue_window_padding_days", c.residue_window_padding_days},
        {"amount_tolerance", c.amount_tolerance}
    };
}

void from_json(const nlohmann::json& j, ReconciliationConfig& c) {
    if (j.contains("residue_window_padding_days")) j.at("residue_window_padding_days").get_to(c.residue_window_padding_days);
    if (j.contains("amount_tolerance")) j.at("amount_tolerance").get_to(c.amount_tolerance);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"database_path", c.database_path},
        {"default_namespace", c.default_namespace},
        {"source", c.source},
        {"allocation", c.allocation},
        {"validation", c.validation},
        {"reconciliation", c.reconciliation},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("database_path")) j.at("database_path").get_to(c.database_path);
    if (j.contains("default_namespace")) j.at("default_namespace").get_to(c.default_namespace);
    if (j.contains("source")) j.at("source").get_to(c.source);
    if (j.contains("allocation")) j.at("allocation").get_to(c.allocation);
    if (j.contains("validation")) j.at("validation").get_to(c.validation);
    if (j.contains("reconciliation")) j.at("reconciliation").get_to(c.reconciliation);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    if (database_path.empty()) {
        spdlog::error("database_path must be set");
        return false;
    }

    if (default_namespace.empty()) {
        spdlog::error("default_namespace must be set");
        return false;
    }

    try {
        residue_policy_from_string(allocation.residue_policy);
    } catch (const std::invalid_argument& e) {
        spdlog::error("allocation.residue_policy: {}", e.what());
        return false;
    }

    if (allocation.lease_wait_ms < 0 || allocation.lease_ttl_seconds <= 0) {
        spdlog::error("lease_wait_ms must be >= 0 and lease_ttl_seconds > 0");
        return false;
    }

    if (source.max_requests <= 0 || source.rate_window_seconds <= 0) {
        spdlog::error("source rate limit must be positive");
        return false;
    }

    if (source.call_timeout_ms <= 0) {
        spdlog::error("source.call_timeout_ms must be positive");
        return false;
    }

    if (source.max_retries < 0 || source.initial_backoff_ms < 0 ||
        source.max_backoff_ms < source.initial_backoff_ms) {
        spdlog::error("source retry settings are inconsistent");
        return false;
    }

    if (reconciliation.residue_window_padding_days < 0) {
        spdlog::error("residue_window_padding_days must be non-negative");
        return false;
    }

    try {
        if (amount_tolerance().is_negative()) {
            spdlog::error("amount_tolerance must be non-negative");
            return false;
        }
    } catch (const std::invalid_argument& e) {
        spdlog::error("amount_tolerance: {}", e.what());
        return false;
    }

    if (validation.strict) {
        spdlog::warn("Strict validation: versions with residues will not be promoted");
    }

    return true;
}

Decimal Config::amount_tolerance() const {
    return Decimal::parse(reconciliation.amount_tolerance);
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace fifo
