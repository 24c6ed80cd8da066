#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace runlib::exec {

enum class FailureKind {
    UNSUPPORTED_LANGUAGE,
    INVALID_REQUEST,
    COMPILE_FAILED,
    RUNTIME_TIMEOUT,
    RUNTIME_NON_ZERO_EXIT,
    SPAWN_FAILED,
    INTERNAL_ERROR,
};

// Returns canonical snake_case name of @p kind e.g. "runtime_timeout"
constexpr std::string_view to_string(FailureKind kind) noexcept {
    switch (kind) {
    case FailureKind::UNSUPPORTED_LANGUAGE: return "unsupported_language";
    case FailureKind::INVALID_REQUEST: return "invalid_request";
    case FailureKind::COMPILE_FAILED: return "compile_failed";
    case FailureKind::RUNTIME_TIMEOUT: return "runtime_timeout";
    case FailureKind::RUNTIME_NON_ZERO_EXIT: return "runtime_non_zero_exit";
    case FailureKind::SPAWN_FAILED: return "spawn_failed";
    case FailureKind::INTERNAL_ERROR: return "internal_error";
    }
    return "unknown";
}

struct ExecutionRequest {
    std::string language;
    std::string source;
    std::string stdin_data;
};

struct ExecutionResult {
    std::string id; // request id, 32 hex digits
    std::string language; // as given in the request
    std::string output; // stdout of the program
    std::string error; // stderr of the program or a message describing the failure
    std::optional<FailureKind> failure_kind; // std::nullopt - the program ran and exited with 0
    bool output_truncated = false;
    bool error_truncated = false;
    std::string exit_description; // e.g. "exited with 3", empty if the program was not run
};

} // namespace runlib::exec
