/**
 * execore Resource Limits
 *
 * OS-level caps applied to every spawned interpreter between fork() and
 * exec(): address space, CPU time and open file descriptors (setrlimit).
 */
#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace execore::runtime {

// A value of 0 leaves the corresponding limit untouched
struct ResourceLimits {
    uint64_t memory_limit_bytes = 512ULL * 1024 * 1024;  // RLIMIT_AS
    uint64_t cpu_seconds = 60;                            // RLIMIT_CPU
    uint64_t max_open_files = 20;                         // RLIMIT_NOFILE

    // Node reserves several GB of virtual address space and opens many
    // descriptors at startup, so JavaScript only receives the CPU cap
    ResourceLimits for_language(Language language) const;

    bool unlimited() const {
        return memory_limit_bytes == 0 && cpu_seconds == 0 && max_open_files == 0;
    }

    static ResourceLimits none() { return ResourceLimits{0, 0, 0}; }

    static ResourceLimits from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// Apply limits to the calling process. Only async-signal-safe calls, so it
// may run in a freshly forked child. Returns 0 or the failing errno.
int apply_resource_limits(const ResourceLimits& limits) noexcept;

} // namespace execore::runtime
