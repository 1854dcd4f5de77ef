/**
 * execore Harness
 *
 * Materializes a submission inside its disposable directory: the user code,
 * the runner that executes it (Python), and the scrubbed environment the
 * interpreter is started with.
 */
#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include "core/types.hpp"

namespace execore::runtime {

constexpr const char* PYTHON_USER_FILE = "main.py";
constexpr const char* PYTHON_RUNNER_FILE = "_runner.py";
constexpr const char* JAVASCRIPT_USER_FILE = "main.js";

// Writes the files for `language` into `dir`. On success `args` holds the
// interpreter arguments (argv[1..]).
bool write_harness(Language language, const std::string& code,
                   const std::filesystem::path& dir,
                   std::vector<std::string>& args, std::string& error);

// Minimal environment: fixed PATH, HOME/TMP pointed at `dir`, UTF-8 forced,
// headless plotting. Nothing is inherited from the host.
std::vector<std::string> sandbox_environment(const std::filesystem::path& dir);

} // namespace execore::runtime
