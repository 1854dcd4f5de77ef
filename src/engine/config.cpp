#include "engine/config.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdlib>
#include <fstream>

namespace execore {

using json = nlohmann::json;

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig config;
    if (!j.is_object()) {
        return config;
    }

    if (j.contains("temp_dir") && j["temp_dir"].is_string()) {
        config.temp_dir = j["temp_dir"].get<std::string>();
    }
    if (j.contains("default_timeout_s") && j["default_timeout_s"].is_number()) {
        config.default_timeout = ExecutionRequest::clamp_timeout(
            std::chrono::milliseconds(static_cast<int64_t>(j["default_timeout_s"].get<double>() * 1000)));
    }
    if (j.contains("max_output_bytes") && j["max_output_bytes"].is_number_integer() &&
        j["max_output_bytes"].get<int64_t>() > 0) {
        config.max_output_bytes = j["max_output_bytes"].get<size_t>();
    }
    if (j.contains("log_level") && j["log_level"].is_string()) {
        config.log_level = j["log_level"].get<std::string>();
    }

    if (j.contains("limits") && j["limits"].is_object()) {
        config.limits = runtime::ResourceLimits::from_json(j["limits"]);
    }
    if (j.contains("security") && j["security"].is_object()) {
        config.security = security::SecurityConfig::from_json(j["security"]);
    }
    if (j.contains("sessions") && j["sessions"].is_object()) {
        config.sessions = session::SessionPoolConfig::from_json(j["sessions"]);
    }
    if (j.contains("runtimes") && j["runtimes"].is_object()) {
        config.runtimes = runtime::RuntimePaths::from_json(j["runtimes"]);
    }
    if (j.contains("history") && j["history"].is_object()) {
        const auto& h = j["history"];
        if (h.contains("max_entries") && h["max_entries"].is_number_integer() &&
            h["max_entries"].get<int64_t>() >= 0) {
            config.history.max_entries = h["max_entries"].get<size_t>();
        }
        if (h.contains("path") && h["path"].is_string()) {
            config.history.path = h["path"].get<std::string>();
        }
    }

    return config;
}

json EngineConfig::to_json() const {
    json j;
    j["temp_dir"] = temp_dir.string();
    j["default_timeout_s"] = default_timeout.count() / 1000.0;
    j["max_output_bytes"] = max_output_bytes;
    j["log_level"] = log_level;
    j["limits"] = limits.to_json();
    j["security"] = security.to_json();
    j["sessions"] = sessions.to_json();
    j["runtimes"] = runtimes.to_json();
    j["history"] = {
        {"max_entries", history.max_entries},
        {"path", history.path}
    };
    return j;
}

bool EngineConfig::load_file(const std::string& path, EngineConfig& config, std::string& error) {
    std::ifstream file(path);
    if (!file) {
        error = "cannot open " + path;
        return false;
    }

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        error = "invalid JSON in " + path;
        return false;
    }
    if (!j.is_object()) {
        error = path + ": expected a JSON object";
        return false;
    }

    config = from_json(j);
    spdlog::debug("Loaded configuration from {}", path);
    return true;
}

// ============================================================================
// Environment overrides
// ============================================================================

static const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

static bool env_positive(const char* name, uint64_t& out) {
    const char* value = env_value(name);
    if (!value) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long parsed = std::strtoull(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0' || parsed == 0 || value[0] == '-') {
        spdlog::warn("Ignoring {}='{}': expected a positive integer", name, value);
        return false;
    }
    out = parsed;
    return true;
}

void EngineConfig::apply_env() {
    if (const char* value = env_value("EXECORE_TEMP_DIR")) {
        temp_dir = value;
    }

    uint64_t number = 0;
    if (env_positive("EXECORE_DEFAULT_TIMEOUT", number)) {
        default_timeout = ExecutionRequest::clamp_timeout(std::chrono::seconds(number));
    }
    if (env_positive("EXECORE_MAX_SESSIONS", number)) {
        sessions.capacity = number;
    }
    if (env_positive("EXECORE_SESSION_TIMEOUT", number)) {
        sessions.idle_timeout = std::chrono::seconds(number);
    }

    if (const char* value = env_value("EXECORE_PYTHON")) {
        runtimes.python = value;
    }
    if (const char* value = env_value("EXECORE_NODE")) {
        runtimes.node = value;
    }
    if (const char* value = env_value("EXECORE_RUNTIME_DIR")) {
        runtimes.driver_dir = value;
    }
    if (const char* value = env_value("EXECORE_LOG_LEVEL")) {
        log_level = value;
    }
}

} // namespace execore
