#pragma once
#include <string>
#include <utility>

namespace sandpool::runtime {

// Error kinds reported by adapters, transports and the pool
enum class ErrorKind {
    NONE,
    POOL_EMPTY,              // Not fatal, triggers provisioning
    INVALID_BASE64,
    FILE_NOT_FOUND,          // Default when no diagnostic text is available
    EXIT_CODE,               // code = exit status
    COMMAND_FAILED,          // message = stderr/stdout text
    INVALID_SANDBOX_ID,
    INVALID_MOUNT,           // message = offending mount as JSON
    API_TOKEN_REQUIRED,
    APP_NAME_REQUIRED,
    INVALID_CONFIG,
    NOT_FOUND,
    RATE_LIMITED,
    TIMEOUT,
    API_ERROR,               // code = HTTP status
    TRANSPORT_ERROR,
    PROVIDER_ERROR,
    VOLUME_CREATION_FAILED,
    NOT_IMPLEMENTED,
    STORE_ERROR,
    STOPPED,
    SESSION_NOT_FOUND,
    UNEXPECTED_STATUS        // message = status the sandbox was found in
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::POOL_EMPTY: return "pool_empty";
        case ErrorKind::INVALID_BASE64: return "invalid_base64";
        case ErrorKind::FILE_NOT_FOUND: return "file_not_found";
        case ErrorKind::EXIT_CODE: return "exit_code";
        case ErrorKind::COMMAND_FAILED: return "command_failed";
        case ErrorKind::INVALID_SANDBOX_ID: return "invalid_sandbox_id";
        case ErrorKind::INVALID_MOUNT: return "invalid_mount";
        case ErrorKind::API_TOKEN_REQUIRED: return "api_token_required";
        case ErrorKind::APP_NAME_REQUIRED: return "app_name_required";
        case ErrorKind::INVALID_CONFIG: return "invalid_config";
        case ErrorKind::NOT_FOUND: return "not_found";
        case ErrorKind::RATE_LIMITED: return "rate_limited";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::API_ERROR: return "api_error";
        case ErrorKind::TRANSPORT_ERROR: return "transport_error";
        case ErrorKind::PROVIDER_ERROR: return "provider_error";
        case ErrorKind::VOLUME_CREATION_FAILED: return "volume_creation_failed";
        case ErrorKind::NOT_IMPLEMENTED: return "not_implemented";
        case ErrorKind::STORE_ERROR: return "store_error";
        case ErrorKind::STOPPED: return "stopped";
        case ErrorKind::SESSION_NOT_FOUND: return "session_not_found";
        case ErrorKind::UNEXPECTED_STATUS: return "unexpected_status";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;
    int code = 0;  // Exit status or HTTP status

    Error() = default;
    Error(ErrorKind k, std::string msg = "", int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}

    explicit operator bool() const { return kind != ErrorKind::NONE; }

    // exit_code(3), api_error(500: boom), invalid_mount({...})
    std::string to_string() const {
        std::string out = error_kind_to_string(kind);
        if (kind == ErrorKind::EXIT_CODE) {
            return out + "(" + std::to_string(code) + ")";
        }
        if (kind == ErrorKind::API_ERROR) {
            return out + "(" + std::to_string(code) + ": " + message + ")";
        }
        if (!message.empty()) {
            out += "(" + message + ")";
        }
        return out;
    }
};

} // namespace sandpool::runtime
