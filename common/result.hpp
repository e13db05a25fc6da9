// Result.hpp
#pragma once
#include <string>

enum class ErrorCode {
    None,
    InvalidPath,
    SamePath,
    DestinationInsideSource,
    HardLinkFailed,
    TransferFailed,
    InvalidMode,
    SourceNotFound,
    TargetExists,
    StorageFailure,
    InvalidArgument
};

inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidPath: return "InvalidPath";
        case ErrorCode::SamePath: return "SamePath";
        case ErrorCode::DestinationInsideSource: return "DestinationInsideSource";
        case ErrorCode::HardLinkFailed: return "HardLinkFailed";
        case ErrorCode::TransferFailed: return "TransferFailed";
        case ErrorCode::InvalidMode: return "InvalidMode";
        case ErrorCode::SourceNotFound: return "SourceNotFound";
        case ErrorCode::TargetExists: return "TargetExists";
        case ErrorCode::StorageFailure: return "StorageFailure";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

template<typename T>
struct Result {
    bool success;
    std::string message;
    T data;
    ErrorCode error;

    static Result<T> Ok(const T& data) {
        return {true, "", data, ErrorCode::None};
    }

    static Result<T> Error(ErrorCode code, const std::string& msg) {
        return {false, msg, T{}, code};
    }

    // backend primitives report failures without a transfer-level code
    static Result<T> Error(const std::string& msg) {
        return {false, msg, T{}, ErrorCode::StorageFailure};
    }
};

// Specialization for void
template<>
struct Result<void> {
    bool success;
    std::string message;
    ErrorCode error;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None};
    }

    static Result<void> Error(ErrorCode code, const std::string& msg) {
        return {false, msg, code};
    }

    static Result<void> Error(const std::string& msg) {
        return {false, msg, ErrorCode::StorageFailure};
    }
};
