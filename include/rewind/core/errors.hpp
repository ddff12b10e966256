#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace rewindkit::core {

// Error codes organized by category
enum class ErrorCode {
    // Success
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    NotFound = 3,
    AlreadyExists = 4,
    InvalidState = 5,
    InternalError = 6,

    // Persistence errors (100-199)
    QuotaExceeded = 100,
    SerializationFailed = 101,
    MediumUnavailable = 102,
    StoreNotOpen = 103,

    // Lookup errors (200-299)
    SnapshotNotFound = 200,
    DocumentNotFound = 201,

    // Rollback errors (300-399)
    RollbackWriteFailed = 300,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,
};

// Get human-readable message for error code
inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InternalError: return "Internal error";

        case ErrorCode::QuotaExceeded: return "Storage quota exceeded";
        case ErrorCode::SerializationFailed: return "Serialization failed";
        case ErrorCode::MediumUnavailable: return "Storage medium unavailable";
        case ErrorCode::StoreNotOpen: return "Store is not open";

        case ErrorCode::SnapshotNotFound: return "Snapshot not found";
        case ErrorCode::DocumentNotFound: return "Document not found";

        case ErrorCode::RollbackWriteFailed: return "Failed to write rolled back state";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";
    }
    return "Unknown error code";
}

// Errors raised by the storage medium or the serializer
inline bool is_persistence_error(ErrorCode code) {
    switch (code) {
        case ErrorCode::QuotaExceeded:
        case ErrorCode::SerializationFailed:
        case ErrorCode::MediumUnavailable:
        case ErrorCode::StoreNotOpen:
            return true;
        default:
            return false;
    }
}

// Errors reporting a missing snapshot or document
inline bool is_not_found(ErrorCode code) {
    return code == ErrorCode::NotFound ||
           code == ErrorCode::SnapshotNotFound ||
           code == ErrorCode::DocumentNotFound;
}

// Error structure with context
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // Key, snapshot id, document id, path
    std::optional<std::string> source;   // Component that raised it

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    // Factory methods
    static Error from_code(ErrorCode code) {
        return Error{code};
    }

    static Error from_code(ErrorCode code, std::string context) {
        Error e{code};
        e.context = std::move(context);
        return e;
    }

    static Error from_exception(const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }

    Error& with_source(std::string src) {
        source = std::move(src);
        return *this;
    }

    // Predicates
    bool is_quota_exceeded() const { return code == ErrorCode::QuotaExceeded; }
    bool is_persistence_error() const { return rewindkit::core::is_persistence_error(code); }
    bool is_not_found() const { return rewindkit::core::is_not_found(code); }
    bool is_ok() const { return code == ErrorCode::Ok; }

    // Get full error message
    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        if (source) {
            result += " at " + *source;
        }
        return result;
    }

    // For logging
    std::string to_string() const {
        return "[" + std::to_string(static_cast<int>(code)) + "] " + full_message();
    }
};

}  // namespace rewindkit::core
