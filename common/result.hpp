// Result.hpp
#pragma once
#include <string>

enum class ErrorCode {
    None,
    IOError,          // local or socket open/seek/read/write/stat failure
    ProtocolError,    // malformed response or server reported error
    ContentMismatch,  // whole-file hash differs from the advertised one
    ConfigError       // invalid invocation arguments
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "ok";
        case ErrorCode::IOError: return "io error";
        case ErrorCode::ProtocolError: return "protocol error";
        case ErrorCode::ContentMismatch: return "content mismatch";
        case ErrorCode::ConfigError: return "config error";
    }
    return "unknown error";
}

template<typename T>
struct Result {
    bool success;
    ErrorCode code;
    std::string message;
    T data;

    static Result<T> Ok(T data) {
        return {true, ErrorCode::None, "", std::move(data)};
    }

    static Result<T> Error(ErrorCode code, const std::string& msg) {
        return {false, code, msg, T{}};
    }

    // re-wraps a failure of another Result type, prefixing context
    template<typename U>
    static Result<T> From(const Result<U>& other, const std::string& context = "") {
        return {false, other.code, context.empty() ? other.message : context + ": " + other.message, T{}};
    }
};

// Specialization for void
template<>
struct Result<void> {
    bool success;
    ErrorCode code;
    std::string message;

    static Result<void> Ok() {
        return {true, ErrorCode::None, ""};
    }

    static Result<void> Error(ErrorCode code, const std::string& msg) {
        return {false, code, msg};
    }

    template<typename U>
    static Result<void> From(const Result<U>& other, const std::string& context = "") {
        return {false, other.code, context.empty() ? other.message : context + ": " + other.message};
    }
};
