#include "core/version_manager.hpp"
#include "common/errors.hpp"
#include <spdlog/spdlog.h>
#include <thread>
#include <chrono>
#include <stdexcept>

namespace fifo {

// ComputationLease

ComputationLease::ComputationLease(AllocationStore& store, std::string namespace_id,
                                   std::string holder)
    : store_(&store)
    , namespace_id_(std::move(namespace_id))
    , holder_(std::move(holder))
{
}

ComputationLease::ComputationLease(ComputationLease&& other) noexcept
    : store_(other.store_)
    , namespace_id_(std::move(other.namespace_id_))
    , holder_(std::move(other.holder_))
{
    other.store_ = nullptr;
}

ComputationLease::~ComputationLease() {
    try {
        release();
    } catch (const std::exception& e) {
        // Left to expire through its TTL
        spdlog::error("Failed to release lease on {}: {}", namespace_id_, e.what());
    }
}

void ComputationLease::release() {
    if (store_) {
        AllocationStore* store = store_;
        store_ = nullptr;
        store->release_lease(namespace_id_, holder_);
        spdlog::debug("Released computation lease on {} ({})", namespace_id_, holder_);
    }
}

// VersionManager

VersionManager::VersionManager(AllocationStore& store)
    : VersionManager(store, Config{})
{
}

VersionManager::VersionManager(AllocationStore& store, const Config& config)
    : store_(store)
    , config_(config)
{
}

ComputationLease VersionManager::acquire_lease(const std::string& namespace_id) {
    std::string holder = generate_uuid();
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(config_.lease_wait_ms);

    while (true) {
        std::optional<LeaseInfo> previous;
        if (store_.try_acquire_lease(namespace_id, holder, config_.lease_ttl_seconds, &previous)) {
            if (previous) {
                spdlog::warn("Took over expired lease on {} from {} (acquired {})",
                             namespace_id, previous->holder,
                             format_timestamp(previous->acquired_at));
            }
            spdlog::debug("Acquired computation lease on {} ({})", namespace_id, holder);
            return ComputationLease(store_, namespace_id, holder);
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            auto current = store_.get_lease(namespace_id);
            std::string who = current ? current->holder : "unknown";
            throw ComputationInProgressError(
                "Allocation computation already in progress for " + namespace_id +
                " (lease held by " + who + ")");
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(config_.lease_poll_ms));
    }
}

AllocationVersion VersionManager::create_version(const std::string& namespace_id,
                                                 Micros ledger_cutoff,
                                                 const SymbolScope& scope,
                                                 const std::string& triggered_by) {
    return store_.create_version(namespace_id, ledger_cutoff, scope, triggered_by);
}

void VersionManager::mark_valid(const std::string& namespace_id, int64_t version_number,
                                const std::string& reason) {
    store_.set_status(namespace_id, version_number, AllocationStatus::VALID, reason);
}

void VersionManager::mark_invalid(const std::string& namespace_id, int64_t version_number,
                                  const std::string& reason) {
    store_.set_status(namespace_id, version_number, AllocationStatus::INVALID, reason);
    spdlog::error("Version {} v{} marked invalid: {}", namespace_id, version_number, reason);
}

std::optional<int64_t> VersionManager::promote(const std::string& namespace_id,
                                               int64_t version_number) {
    auto current = store_.get_current(namespace_id);
    std::optional<int64_t> expected;
    if (current) {
        expected = current->version_number;
        if (current->version_number >= version_number) {
            throw VersionConflictError(
                "Cannot promote " + namespace_id + " v" + std::to_string(version_number) +
                ": current is already v" + std::to_string(current->version_number));
        }
    }

    if (!store_.swap_current(namespace_id, expected, version_number)) {
        throw VersionConflictError(
            "Current version of " + namespace_id + " changed during promotion of v" +
            std::to_string(version_number));
    }

    if (expected) {
        spdlog::info("Promoted {} v{} to current, superseding v{}",
                     namespace_id, version_number, *expected);
    } else {
        spdlog::info("Promoted {} v{} to current (first version)", namespace_id, version_number);
    }
    return expected;
}

std::optional<AllocationVersion> VersionManager::get_current(const std::string& namespace_id) {
    return store_.get_current(namespace_id);
}

std::optional<AllocationVersion> VersionManager::get_by_version(const std::string& namespace_id,
                                                                int64_t version_number) {
    return store_.get_by_version(namespace_id, version_number);
}

std::vector<AllocationVersion> VersionManager::list_versions(const std::string& namespace_id,
                                                             Micros from, Micros to) {
    return store_.list_versions(namespace_id, from, to);
}

} // namespace fifo
