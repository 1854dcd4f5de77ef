/**
 * execore Stateless Sandbox Executor
 *
 * One disposable process per submission: security filter, fresh working
 * directory, harness, spawn with resource limits, multiplexed wait over
 * stdout/stderr/exit up to the deadline, artifact collection, cleanup.
 */
#pragma once
#include <string>
#include <chrono>
#include <filesystem>
#include "core/types.hpp"
#include "runtime/resource_limits.hpp"
#include "runtime/runtime_locator.hpp"
#include "security/security_filter.hpp"

namespace execore::runtime {

struct StatelessConfig {
    std::filesystem::path temp_dir = std::filesystem::temp_directory_path();
    ResourceLimits limits;
    size_t max_output_bytes = 1024 * 1024;   // Per stream
};

class StatelessExecutor {
public:
    // `filter` and `locator` must outlive the executor
    StatelessExecutor(const StatelessConfig& config,
                      const security::SecurityFilter& filter,
                      const RuntimeLocator& locator);

    // Never throws; every failure is reported through the result
    ExecutionResult run(const std::string& code, Language language,
                        std::chrono::milliseconds timeout,
                        const OutputCallback& on_output = nullptr) const;

    const StatelessConfig& config() const { return config_; }

private:
    StatelessConfig config_;
    const security::SecurityFilter& filter_;
    const RuntimeLocator& locator_;

    ExecutionResult run_checked(const std::string& code, Language language,
                                std::chrono::milliseconds timeout,
                                const OutputCallback& on_output,
                                std::chrono::steady_clock::time_point start) const;
};

} // namespace execore::runtime
