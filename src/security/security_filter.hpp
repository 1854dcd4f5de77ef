/**
 * execore Security Filter
 *
 * Static pre-execution gate. Rejects oversized submissions and code that
 * matches per-language deny rules for process, filesystem, network and
 * dynamic-evaluation primitives. Runs before any process is spawned.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <regex>
#include <unordered_set>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace execore::security {

// Rule categories reported back to callers
constexpr const char* CATEGORY_PROCESS = "process";
constexpr const char* CATEGORY_FILESYSTEM = "filesystem";
constexpr const char* CATEGORY_NETWORK = "network";
constexpr const char* CATEGORY_DYNAMIC_EVAL = "dynamic-eval";
constexpr const char* CATEGORY_SERIALIZATION = "serialization";
constexpr const char* CATEGORY_INTERACTIVE = "interactive-input";
constexpr const char* CATEGORY_SIZE = "size";
constexpr const char* CATEGORY_CUSTOM = "custom";

struct SecurityConfig {
    size_t max_code_length = 50000;                  // In characters (UTF-8 code points)
    std::vector<std::string> blocked_patterns;       // Extra regexes, applied to every language
    std::vector<std::string> allowed_imports;        // Python modules that import without a warning
    bool filter_session_code = true;                 // Also gate session-mode submissions

    SecurityConfig();

    static SecurityConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct SecurityVerdict {
    bool allowed = true;
    std::optional<std::string> violated_pattern;     // Rule name, never the raw regex
    std::optional<std::string> category;
    std::optional<std::string> matched;              // Offending excerpt of the submission

    // Human readable reason, suitable for ExecutionResult::error
    std::string message() const;

    static SecurityVerdict allow() { return SecurityVerdict{}; }
};

struct DenyRule {
    std::string name;
    std::string category;
    std::regex pattern;
};

class SecurityFilter {
public:
    explicit SecurityFilter(const SecurityConfig& config = SecurityConfig());

    SecurityVerdict check(const std::string& code, Language language) const;

    // Python top-level modules imported by `code` that are not in the allow-list
    std::vector<std::string> disallowed_imports(const std::string& code) const;

    size_t rule_count(Language language) const;
    const SecurityConfig& config() const { return config_; }

    // Number of characters (code points) in a UTF-8 string
    static size_t code_length(const std::string& code);

private:
    SecurityConfig config_;
    std::vector<DenyRule> python_rules_;
    std::vector<DenyRule> javascript_rules_;
    std::vector<DenyRule> custom_rules_;
    std::unordered_set<std::string> allowed_imports_;

    const std::vector<DenyRule>& rules_for(Language language) const;
};

// Modules commonly needed for data analysis; anything else is logged
const std::vector<std::string> DEFAULT_ALLOWED_IMPORTS = {
    "math", "random", "datetime", "json", "csv", "itertools", "collections",
    "functools", "operator", "string", "decimal", "fractions", "statistics",
    "re", "unicodedata", "numpy", "pandas", "matplotlib", "seaborn", "plotly",
    "scipy", "sklearn", "PIL", "cv2", "sympy"
};

} // namespace execore::security
