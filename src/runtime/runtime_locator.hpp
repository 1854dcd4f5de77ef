/**
 * execore Runtime Locator
 *
 * Maps a language to the interpreter binary used to spawn it and, for
 * languages that support long-lived sessions, to the session driver script.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace execore::runtime {

struct RuntimePaths {
    std::string python = "python3";   // Name (searched in PATH) or path
    std::string node = "node";
    std::string driver_dir;           // Directory holding python/session_driver.py; empty = search

    static RuntimePaths from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

class RuntimeLocator {
public:
    virtual ~RuntimeLocator() = default;

    // Absolute path of the interpreter for `language`, nullopt if not installed
    virtual std::optional<std::string> find_interpreter(Language language) const = 0;

    // Session driver script, nullopt when the language has no long-lived runtime
    virtual std::optional<std::string> find_session_driver(Language language) const = 0;
};

class DefaultRuntimeLocator : public RuntimeLocator {
public:
    explicit DefaultRuntimeLocator(const RuntimePaths& paths = RuntimePaths());

    std::optional<std::string> find_interpreter(Language language) const override;
    std::optional<std::string> find_session_driver(Language language) const override;

    // Resolve a command name against $PATH (paths containing '/' are checked directly)
    static std::optional<std::string> search_path(const std::string& name);

private:
    RuntimePaths paths_;

    std::vector<std::string> driver_search_dirs() const;
};

} // namespace execore::runtime
