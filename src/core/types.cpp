#include "core/types.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace execore {

static std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return str;
}

// ============================================================================
// Enum conversions
// ============================================================================

const char* language_to_string(Language language) {
    switch (language) {
        case Language::PYTHON:     return "python";
        case Language::JAVASCRIPT: return "javascript";
        default: return "unknown";
    }
}

std::optional<Language> language_from_string(const std::string& str) {
    std::string name = to_lower(str);
    if (name == "python" || name == "python3" || name == "py") return Language::PYTHON;
    if (name == "javascript" || name == "js" || name == "node") return Language::JAVASCRIPT;
    return std::nullopt;
}

const char* execution_mode_to_string(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::STATELESS: return "stateless";
        case ExecutionMode::SESSION:   return "session";
        default: return "unknown";
    }
}

std::optional<ExecutionMode> execution_mode_from_string(const std::string& str) {
    std::string name = to_lower(str);
    if (name == "stateless" || name == "sandbox") return ExecutionMode::STATELESS;
    if (name == "session" || name == "kernel") return ExecutionMode::SESSION;
    return std::nullopt;
}

const char* execution_status_to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::SUCCESS: return "success";
        case ExecutionStatus::ERROR:   return "error";
        case ExecutionStatus::TIMEOUT: return "timeout";
        default: return "unknown";
    }
}

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:               return "none";
        case ErrorKind::SECURITY_VIOLATION: return "security_violation";
        case ErrorKind::EXECUTION_TIMEOUT:  return "execution_timeout";
        case ErrorKind::RUNTIME_FAILURE:    return "runtime_failure";
        case ErrorKind::INTERNAL_ERROR:     return "internal_error";
        default: return "unknown";
    }
}

const char* output_kind_to_string(OutputKind kind) {
    switch (kind) {
        case OutputKind::STDOUT:        return "stdout";
        case OutputKind::STDERR:        return "stderr";
        case OutputKind::RESULT:        return "result";
        case OutputKind::VISUALIZATION: return "visualization";
        default: return "unknown";
    }
}

// ============================================================================
// ExecutionRequest / ExecutionResult
// ============================================================================

std::chrono::milliseconds ExecutionRequest::clamp_timeout(std::chrono::milliseconds timeout) {
    return std::clamp(timeout, MIN_TIMEOUT, MAX_TIMEOUT);
}

nlohmann::json ExecutionResult::to_json() const {
    nlohmann::json j;
    j["status"] = execution_status_to_string(status);
    j["output"] = output;
    j["error"] = error ? nlohmann::json(*error) : nlohmann::json(nullptr);
    j["error_kind"] = error_kind_to_string(error_kind);
    j["execution_time"] = execution_time.count() / 1000.0;
    j["visualizations"] = visualizations;
    j["data"] = structured_data;
    if (execution_count) {
        j["execution_count"] = *execution_count;
    }
    if (!session_id.empty()) {
        j["session_id"] = session_id;
    }
    return j;
}

ExecutionResult ExecutionResult::failure(ExecutionStatus status, ErrorKind kind, std::string message) {
    ExecutionResult result;
    result.status = status;
    result.error_kind = kind;
    result.error = std::move(message);
    return result;
}

// ============================================================================
// Timestamps
// ============================================================================

std::string format_timestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

} // namespace execore
