/**
 * execore Engine Configuration
 *
 * Plain struct with defaults, optionally loaded from a JSON file and then
 * overridden by EXECORE_* environment variables.
 */
#pragma once
#include <string>
#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "runtime/resource_limits.hpp"
#include "runtime/runtime_locator.hpp"
#include "security/security_filter.hpp"
#include "session/session_pool.hpp"

namespace execore {

struct HistoryConfig {
    size_t max_entries = 1000;
    std::string path;            // JSONL file appended per execution; empty = memory only
};

struct EngineConfig {
    std::filesystem::path temp_dir = std::filesystem::temp_directory_path();
    std::chrono::milliseconds default_timeout = DEFAULT_TIMEOUT;
    size_t max_output_bytes = 1024 * 1024;
    std::string log_level = "info";

    runtime::ResourceLimits limits;
    security::SecurityConfig security;
    session::SessionPoolConfig sessions;
    runtime::RuntimePaths runtimes;
    HistoryConfig history;

    static EngineConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Parse a JSON config file into `config`; false (with `error`) if it
    // cannot be read or is not a JSON object
    static bool load_file(const std::string& path, EngineConfig& config, std::string& error);

    // Apply EXECORE_TEMP_DIR, EXECORE_DEFAULT_TIMEOUT, EXECORE_MAX_SESSIONS,
    // EXECORE_SESSION_TIMEOUT, EXECORE_PYTHON, EXECORE_NODE,
    // EXECORE_RUNTIME_DIR and EXECORE_LOG_LEVEL
    void apply_env();
};

} // namespace execore
