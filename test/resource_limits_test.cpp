#include <gtest/gtest.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include "runtime/resource_limits.hpp"

using namespace execore;
using namespace execore::runtime;

TEST(resource_limits, javascript_keeps_only_cpu_cap) {
    ResourceLimits limits;
    auto js = limits.for_language(Language::JAVASCRIPT);
    EXPECT_EQ(js.memory_limit_bytes, 0u);
    EXPECT_EQ(js.max_open_files, 0u);
    EXPECT_EQ(js.cpu_seconds, limits.cpu_seconds);

    auto py = limits.for_language(Language::PYTHON);
    EXPECT_EQ(py.memory_limit_bytes, limits.memory_limit_bytes);
    EXPECT_EQ(py.max_open_files, limits.max_open_files);
}

TEST(resource_limits, none_is_unlimited) {
    EXPECT_TRUE(ResourceLimits::none().unlimited());
    EXPECT_FALSE(ResourceLimits().unlimited());
}

TEST(resource_limits, from_json_reads_megabytes) {
    auto limits = ResourceLimits::from_json({{"memory_mb", 256}, {"cpu_seconds", 5}});
    EXPECT_EQ(limits.memory_limit_bytes, 256ULL * 1024 * 1024);
    EXPECT_EQ(limits.cpu_seconds, 5u);
    EXPECT_EQ(limits.max_open_files, 20u);

    // Negative and non-numeric values keep the defaults
    auto defaults = ResourceLimits::from_json({{"memory_mb", -1}, {"cpu_seconds", "ten"}});
    EXPECT_EQ(defaults.memory_limit_bytes, ResourceLimits().memory_limit_bytes);
    EXPECT_EQ(defaults.cpu_seconds, ResourceLimits().cpu_seconds);

    EXPECT_EQ(limits.to_json()["memory_mb"], 256);
}

TEST(resource_limits, applied_in_forked_child) {
    pid_t pid = fork();
    ASSERT_GE(pid, 0);

    if (pid == 0) {
        ResourceLimits limits;
        limits.memory_limit_bytes = 256ULL * 1024 * 1024;
        limits.cpu_seconds = 7;
        limits.max_open_files = 16;
        if (apply_resource_limits(limits) != 0) _exit(1);

        struct rlimit rl;
        if (getrlimit(RLIMIT_NOFILE, &rl) < 0 || rl.rlim_cur != 16) _exit(2);
        if (getrlimit(RLIMIT_AS, &rl) < 0 || rl.rlim_cur != 256ULL * 1024 * 1024) _exit(3);
        if (getrlimit(RLIMIT_CPU, &rl) < 0 || rl.rlim_cur != 7) _exit(4);
        _exit(0);
    }

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}
