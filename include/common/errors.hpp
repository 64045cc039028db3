#pragma once

#include <string>
#include <stdexcept>

namespace fifo {

/**
 * Error taxonomy shared by every stage of the allocation and
 * reconciliation pipeline.
 */
enum class ErrorKind {
    NONE,
    SOURCE_UNAVAILABLE,        // External source unreachable or timed out (retryable)
    VERSION_CONFLICT,          // Concurrent claim on a version number or current pointer
    COMPUTATION_IN_PROGRESS,   // Lease held by another computation
    PARTIAL_BACKFILL_FAILURE,  // Some fetches failed, the rest was committed
    VALIDATION_FAILURE,        // Structural invariant violated, version not promoted
    DATA_INTEGRITY_ANOMALY     // Needs human judgement (residue, extra trade)
};

inline std::string error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::SOURCE_UNAVAILABLE: return "SOURCE_UNAVAILABLE";
        case ErrorKind::VERSION_CONFLICT: return "VERSION_CONFLICT";
        case ErrorKind::COMPUTATION_IN_PROGRESS: return "COMPUTATION_IN_PROGRESS";
        case ErrorKind::PARTIAL_BACKFILL_FAILURE: return "PARTIAL_BACKFILL_FAILURE";
        case ErrorKind::VALIDATION_FAILURE: return "VALIDATION_FAILURE";
        case ErrorKind::DATA_INTEGRITY_ANOMALY: return "DATA_INTEGRITY_ANOMALY";
    }
    return "UNKNOWN";
}

class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {
    }

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class SourceUnavailableError : public LedgerError {
public:
    explicit SourceUnavailableError(const std::string& message)
        : LedgerError(ErrorKind::SOURCE_UNAVAILABLE, message) {}
};

class VersionConflictError : public LedgerError {
public:
    explicit VersionConflictError(const std::string& message)
        : LedgerError(ErrorKind::VERSION_CONFLICT, message) {}
};

class ComputationInProgressError : public LedgerError {
public:
    explicit ComputationInProgressError(const std::string& message)
        : LedgerError(ErrorKind::COMPUTATION_IN_PROGRESS, message) {}
};

} // namespace fifo
