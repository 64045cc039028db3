#pragma once

#include <string>
#include <vector>
#include <optional>
#include "common/types.hpp"
#include "core/allocation.hpp"
#include "persistence/stores.hpp"

namespace fifo {

/**
 * RAII hold on the per-namespace computation lease. Released on
 * destruction; movable, not copyable.
 */
class ComputationLease {
public:
    ComputationLease(AllocationStore& store, std::string namespace_id, std::string holder);
    ~ComputationLease();

    ComputationLease(ComputationLease&& other) noexcept;
    ComputationLease& operator=(ComputationLease&&) = delete;
    ComputationLease(const ComputationLease&) = delete;
    ComputationLease& operator=(const ComputationLease&) = delete;

    const std::string& namespace_id() const { return namespace_id_; }
    const std::string& holder() const { return holder_; }
    bool held() const { return store_ != nullptr; }

    void release();

private:
    AllocationStore* store_;
    std::string namespace_id_;
    std::string holder_;
};

/**
 * Owns version numbering, the lease and the single current pointer per
 * namespace. Versions are never deleted; promotion is a compare-and-swap
 * on the current pointer that also supersedes the predecessor.
 */
class VersionManager {
public:
    struct Config {
        int lease_wait_ms{0};           // 0 = fail fast
        int lease_ttl_seconds{3600};    // Older leases are taken over
        int lease_poll_ms{50};
    };

    explicit VersionManager(AllocationStore& store);
    VersionManager(AllocationStore& store, const Config& config);

    // Throws ComputationInProgressError when the lease stays held for
    // longer than lease_wait_ms
    ComputationLease acquire_lease(const std::string& namespace_id);

    // Throws VersionConflictError if the number was claimed concurrently
    AllocationVersion create_version(const std::string& namespace_id,
                                     Micros ledger_cutoff,
                                     const SymbolScope& scope,
                                     const std::string& triggered_by);

    void mark_valid(const std::string& namespace_id, int64_t version_number,
                    const std::string& reason = "");
    void mark_invalid(const std::string& namespace_id, int64_t version_number,
                      const std::string& reason);

    // Make a VALID version current. Returns the superseded version
    // number, if any. Throws VersionConflictError when the current
    // pointer moved underneath us or already points at a newer version,
    // std::logic_error when the version is not VALID.
    std::optional<int64_t> promote(const std::string& namespace_id, int64_t version_number);

    std::optional<AllocationVersion> get_current(const std::string& namespace_id);
    std::optional<AllocationVersion> get_by_version(const std::string& namespace_id,
                                                    int64_t version_number);
    std::vector<AllocationVersion> list_versions(const std::string& namespace_id,
                                                 Micros from = 0,
                                                 Micros to = INT64_MAX);

    const Config& config() const { return config_; }

private:
    AllocationStore& store_;
    Config config_;
};

} // namespace fifo
