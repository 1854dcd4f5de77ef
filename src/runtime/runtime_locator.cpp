#include "runtime/runtime_locator.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <climits>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace execore::runtime {

constexpr const char* PYTHON_DRIVER = "python/session_driver.py";

// ============================================================================
// RuntimePaths
// ============================================================================

RuntimePaths RuntimePaths::from_json(const nlohmann::json& j) {
    RuntimePaths paths;
    if (j.contains("python") && j["python"].is_string()) paths.python = j["python"].get<std::string>();
    if (j.contains("node") && j["node"].is_string()) paths.node = j["node"].get<std::string>();
    if (j.contains("driver_dir") && j["driver_dir"].is_string()) {
        paths.driver_dir = j["driver_dir"].get<std::string>();
    }
    return paths;
}

nlohmann::json RuntimePaths::to_json() const {
    nlohmann::json j;
    j["python"] = python;
    j["node"] = node;
    j["driver_dir"] = driver_dir;
    return j;
}

// ============================================================================
// DefaultRuntimeLocator
// ============================================================================

DefaultRuntimeLocator::DefaultRuntimeLocator(const RuntimePaths& paths)
    : paths_(paths) {}

// Version-manager shims (pyenv, asdf) are shell scripts that need the
// caller's environment; children run with a scrubbed one
static bool is_wrapper_script(const fs::path& p) {
    std::ifstream file(p, std::ios::binary);
    char magic[2] = {0, 0};
    file.read(magic, 2);
    return file.gcount() == 2 && magic[0] == '#' && magic[1] == '!';
}

std::optional<std::string> DefaultRuntimeLocator::search_path(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }

    auto executable = [](const fs::path& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        if (!executable(name)) return std::nullopt;
        std::error_code ec;
        auto absolute = fs::absolute(name, ec);
        return ec ? name : absolute.string();
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::optional<std::string> first_wrapper;
    std::istringstream stream(search);
    std::string dir;
    while (std::getline(stream, dir, ':')) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        if (!executable(candidate)) continue;
        if (!is_wrapper_script(candidate)) {
            return candidate.string();
        }
        if (!first_wrapper) {
            first_wrapper = candidate.string();
        }
    }

    if (first_wrapper) {
        spdlog::warn("Only a wrapper script was found for {}: {}", name, *first_wrapper);
    }
    return first_wrapper;
}

std::optional<std::string> DefaultRuntimeLocator::find_interpreter(Language language) const {
    switch (language) {
        case Language::PYTHON:     return search_path(paths_.python);
        case Language::JAVASCRIPT: return search_path(paths_.node);
        default: return std::nullopt;
    }
}

std::vector<std::string> DefaultRuntimeLocator::driver_search_dirs() const {
    std::vector<std::string> dirs;
    if (!paths_.driver_dir.empty()) {
        dirs.push_back(paths_.driver_dir);
    }

#ifdef EXECORE_RUNTIME_DIR
    dirs.push_back(EXECORE_RUNTIME_DIR);
#endif

    dirs.push_back("runtimes");
    dirs.push_back("../runtimes");

    // Also check relative to the executable
    char exe_path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
    if (len != -1) {
        exe_path[len] = '\0';
        fs::path exe_dir = fs::path(exe_path).parent_path();
        dirs.push_back((exe_dir / "runtimes").string());
        dirs.push_back((exe_dir / "../runtimes").string());
        dirs.push_back((exe_dir / "../share/execore/runtimes").string());
    }
    return dirs;
}

std::optional<std::string> DefaultRuntimeLocator::find_session_driver(Language language) const {
    if (language != Language::PYTHON) {
        return std::nullopt;
    }

    for (const auto& dir : driver_search_dirs()) {
        fs::path candidate = fs::path(dir) / PYTHON_DRIVER;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            auto canonical = fs::canonical(candidate, ec);
            return ec ? candidate.string() : canonical.string();
        }
    }

    spdlog::debug("No session driver found for {}", language_to_string(language));
    return std::nullopt;
}

} // namespace execore::runtime
