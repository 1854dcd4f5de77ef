/**
 * execore Core Types
 *
 * Request/result vocabulary shared by the security filter, both executors,
 * the output aggregator and the engine facade.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace execore {

enum class Language {
    PYTHON,
    JAVASCRIPT
};

const char* language_to_string(Language language);
std::optional<Language> language_from_string(const std::string& str);

enum class ExecutionMode {
    STATELESS,   // Disposable process per request
    SESSION      // Long-lived interpreter, state persists between requests
};

const char* execution_mode_to_string(ExecutionMode mode);
std::optional<ExecutionMode> execution_mode_from_string(const std::string& str);

enum class ExecutionStatus {
    SUCCESS,
    ERROR,
    TIMEOUT
};

const char* execution_status_to_string(ExecutionStatus status);

// Why a request did not succeed
enum class ErrorKind {
    NONE,
    SECURITY_VIOLATION,   // Blocked before any process was spawned
    EXECUTION_TIMEOUT,    // Wall-clock limit exceeded
    RUNTIME_FAILURE,      // User code failed (non-zero exit, raised exception)
    INTERNAL_ERROR        // Spawn, channel or readiness failure
};

const char* error_kind_to_string(ErrorKind kind);

// Tag attached to every streamed chunk
enum class OutputKind {
    STDOUT,
    STDERR,
    RESULT,
    VISUALIZATION
};

const char* output_kind_to_string(OutputKind kind);

// Streaming sink; fires zero or more times before the terminal result
using OutputCallback = std::function<void(OutputKind kind, const std::string& content)>;

constexpr std::chrono::milliseconds MIN_TIMEOUT{1000};
constexpr std::chrono::milliseconds MAX_TIMEOUT{120000};
constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{30000};

struct ExecutionRequest {
    std::string code;
    Language language = Language::PYTHON;
    ExecutionMode mode = ExecutionMode::STATELESS;
    std::optional<std::string> session_id;
    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;

    // Clamp into [MIN_TIMEOUT, MAX_TIMEOUT]
    static std::chrono::milliseconds clamp_timeout(std::chrono::milliseconds timeout);
};

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::SUCCESS;
    std::string output;                          // Aggregated stdout
    std::optional<std::string> error;
    ErrorKind error_kind = ErrorKind::NONE;
    std::chrono::milliseconds execution_time{0};
    std::vector<std::string> visualizations;     // base64 images, in emission order
    nlohmann::json structured_data = nlohmann::json::object();
    std::optional<uint64_t> execution_count;     // Session mode only
    std::string session_id;                      // Session mode only

    bool ok() const { return status == ExecutionStatus::SUCCESS; }

    nlohmann::json to_json() const;

    static ExecutionResult failure(ExecutionStatus status, ErrorKind kind, std::string message);
};

// ISO 8601 UTC with milliseconds, e.g. 2024-01-31T12:00:00.123Z
std::string format_timestamp(std::chrono::system_clock::time_point timestamp);

} // namespace execore
