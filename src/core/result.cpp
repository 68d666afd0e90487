#include "vtm/result.hpp"

namespace vtm {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::TASK_NOT_FOUND: return "TASK_NOT_FOUND";
        case ErrorCode::TRANSACTION_NOT_FOUND: return "TRANSACTION_NOT_FOUND";
        case ErrorCode::INVALID_FILTER: return "INVALID_FILTER";
        case ErrorCode::INVALID_SORT: return "INVALID_SORT";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::INVALID_BATCH: return "INVALID_BATCH";
        case ErrorCode::MANIFEST_NOT_FOUND: return "MANIFEST_NOT_FOUND";
        case ErrorCode::CORRUPT_MANIFEST: return "CORRUPT_MANIFEST";
        case ErrorCode::CORRUPT_HISTORY: return "CORRUPT_HISTORY";
        case ErrorCode::CYCLE_DETECTED: return "CYCLE_DETECTED";
        case ErrorCode::DANGLING_DEPENDENCY: return "DANGLING_DEPENDENCY";
        case ErrorCode::DUPLICATE_TASK_ID: return "DUPLICATE_TASK_ID";
        case ErrorCode::NOT_READY: return "NOT_READY";
        case ErrorCode::VALIDATION_INCOMPLETE: return "VALIDATION_INCOMPLETE";
        case ErrorCode::INVALID_TRANSITION: return "INVALID_TRANSITION";
        case ErrorCode::BLOCKED_BY_DEPENDENTS: return "BLOCKED_BY_DEPENDENTS";
        case ErrorCode::ALREADY_REVERTED: return "ALREADY_REVERTED";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        default: return "UNKNOWN";
    }
}

ErrorKind error_kind(ErrorCode code) {
    switch (code) {
        case ErrorCode::TASK_NOT_FOUND:
        case ErrorCode::TRANSACTION_NOT_FOUND:
        case ErrorCode::INVALID_FILTER:
        case ErrorCode::INVALID_SORT:
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::INVALID_BATCH:
            return ErrorKind::Usage;

        case ErrorCode::MANIFEST_NOT_FOUND:
        case ErrorCode::CORRUPT_MANIFEST:
        case ErrorCode::CORRUPT_HISTORY:
        case ErrorCode::CYCLE_DETECTED:
        case ErrorCode::DANGLING_DEPENDENCY:
        case ErrorCode::DUPLICATE_TASK_ID:
            return ErrorKind::DataIntegrity;

        case ErrorCode::NOT_READY:
        case ErrorCode::VALIDATION_INCOMPLETE:
        case ErrorCode::INVALID_TRANSITION:
        case ErrorCode::BLOCKED_BY_DEPENDENTS:
        case ErrorCode::ALREADY_REVERTED:
            return ErrorKind::Precondition;

        case ErrorCode::IO_ERROR:
        default:
            return ErrorKind::Io;
    }
}

int exit_code_for(const Error& error) {
    switch (error.kind()) {
        case ErrorKind::Usage:
        case ErrorKind::Precondition:
            return 1;
        case ErrorKind::DataIntegrity:
        case ErrorKind::Io:
        default:
            return 2;
    }
}

} // namespace vtm
