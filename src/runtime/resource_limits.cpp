#include "runtime/resource_limits.hpp"
#include <sys/resource.h>
#include <cerrno>

namespace execore::runtime {

ResourceLimits ResourceLimits::for_language(Language language) const {
    ResourceLimits limits = *this;
    if (language == Language::JAVASCRIPT) {
        limits.memory_limit_bytes = 0;
        limits.max_open_files = 0;
    }
    return limits;
}

// Zero disables a limit. Negative values keep the default.
static bool non_negative(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_number_integer() && j[key].get<int64_t>() >= 0;
}

ResourceLimits ResourceLimits::from_json(const nlohmann::json& j) {
    ResourceLimits limits;
    if (non_negative(j, "memory_mb")) {
        limits.memory_limit_bytes = j["memory_mb"].get<uint64_t>() * 1024 * 1024;
    }
    if (non_negative(j, "cpu_seconds")) {
        limits.cpu_seconds = j["cpu_seconds"].get<uint64_t>();
    }
    if (non_negative(j, "max_open_files")) {
        limits.max_open_files = j["max_open_files"].get<uint64_t>();
    }
    return limits;
}

nlohmann::json ResourceLimits::to_json() const {
    nlohmann::json j;
    j["memory_mb"] = memory_limit_bytes / (1024 * 1024);
    j["cpu_seconds"] = cpu_seconds;
    j["max_open_files"] = max_open_files;
    return j;
}

// Lower both soft and hard limit, never above the current hard limit
static int set_limit(int resource, uint64_t value) noexcept {
    if (value == 0) {
        return 0;
    }

    struct rlimit current;
    if (getrlimit(resource, &current) < 0) {
        return errno;
    }

    rlim_t wanted = static_cast<rlim_t>(value);
    if (current.rlim_max != RLIM_INFINITY && wanted > current.rlim_max) {
        wanted = current.rlim_max;
    }

    struct rlimit limit;
    limit.rlim_cur = wanted;
    limit.rlim_max = wanted;
    if (resource == RLIMIT_CPU) {
        // SIGXCPU at the soft limit, SIGKILL one second later
        if (current.rlim_max == RLIM_INFINITY || wanted < current.rlim_max) {
            limit.rlim_max = wanted + 1;
        }
    }

    if (setrlimit(resource, &limit) < 0) {
        return errno;
    }
    return 0;
}

int apply_resource_limits(const ResourceLimits& limits) noexcept {
    int err = set_limit(RLIMIT_AS, limits.memory_limit_bytes);
    if (err != 0) return err;

    err = set_limit(RLIMIT_CPU, limits.cpu_seconds);
    if (err != 0) return err;

    return set_limit(RLIMIT_NOFILE, limits.max_open_files);
}

} // namespace execore::runtime
