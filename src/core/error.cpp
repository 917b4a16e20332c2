#include "core/error.h"

namespace kild {

const char* Error::code() const {
    switch (kind) {
        case ErrorKind::NotFound:                return "SESSION_NOT_FOUND";
        case ErrorKind::AlreadyExists:           return "SESSION_ALREADY_EXISTS";
        case ErrorKind::IdentityMismatch:        return "PROCESS_IDENTITY_MISMATCH";
        case ErrorKind::SafetyCheckBlocked:      return "SAFETY_CHECK_BLOCKED";
        case ErrorKind::PortAllocationExhausted: return "PORT_RANGE_EXHAUSTED";
        case ErrorKind::DaemonUnavailable:       return "DAEMON_UNAVAILABLE";
        case ErrorKind::WorktreeConflict:        return "WORKTREE_CONFLICT";
        case ErrorKind::IoFailure:               return "IO_FAILURE";
        case ErrorKind::InvalidInput:            return "INVALID_INPUT";
        case ErrorKind::ConfigInvalid:           return "CONFIG_INVALID";
    }
    return "IO_FAILURE";
}

std::string Error::describe() const {
    return std::string("[") + code() + "] " + message;
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::IoFailure:               return 1;
        case ErrorKind::SafetyCheckBlocked:      return 2;
        case ErrorKind::NotFound:                return 3;
        case ErrorKind::AlreadyExists:           return 4;
        case ErrorKind::IdentityMismatch:        return 5;
        case ErrorKind::PortAllocationExhausted: return 6;
        case ErrorKind::DaemonUnavailable:       return 7;
        case ErrorKind::WorktreeConflict:        return 8;
        case ErrorKind::InvalidInput:            return 9;
        case ErrorKind::ConfigInvalid:           return 10;
    }
    return 1;
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:                return "NotFound";
        case ErrorKind::AlreadyExists:           return "AlreadyExists";
        case ErrorKind::IdentityMismatch:        return "IdentityMismatch";
        case ErrorKind::SafetyCheckBlocked:      return "SafetyCheckBlocked";
        case ErrorKind::PortAllocationExhausted: return "PortAllocationExhausted";
        case ErrorKind::DaemonUnavailable:       return "DaemonUnavailable";
        case ErrorKind::WorktreeConflict:        return "WorktreeConflict";
        case ErrorKind::IoFailure:               return "IoFailure";
        case ErrorKind::InvalidInput:            return "InvalidInput";
        case ErrorKind::ConfigInvalid:           return "ConfigInvalid";
    }
    return "Unknown";
}

}
