#include <gtest/gtest.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <string>
#include "runtime/child_process.hpp"
#include "test_support.hpp"

using namespace execore;
using namespace execore::runtime;

namespace {

SpawnOptions shell(const std::string& script) {
    SpawnOptions options;
    options.program = "/bin/sh";
    options.args = {"-c", script};
    options.env = {"PATH=/usr/bin:/bin"};
    return options;
}

// Read until EOF; only valid once every writer has exited
std::string drain(int fd) {
    std::string out;
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    return out;
}

} // namespace

TEST(child_process, captures_output_and_exit_code) {
    ChildProcess child;
    ASSERT_TRUE(child.spawn(shell("echo out; echo err >&2; exit 3"))) << child.error();
    EXPECT_EQ(child.state(), ProcessState::RUNNING);

    ASSERT_TRUE(child.wait_for_exit(std::chrono::seconds(10)));
    EXPECT_EQ(child.state(), ProcessState::EXITED);
    EXPECT_EQ(child.exit_code(), 3);
    EXPECT_EQ(child.term_signal(), 0);
    EXPECT_EQ(drain(child.stdout_fd()), "out\n");
    EXPECT_EQ(drain(child.stderr_fd()), "err\n");
}

TEST(child_process, environment_is_replaced) {
    setenv("EXECORE_HOST_ONLY", "leak", 1);

    auto options = shell("printf '%s|%s' \"$FOO\" \"$EXECORE_HOST_ONLY\"");
    options.env.push_back("FOO=bar");

    ChildProcess child;
    ASSERT_TRUE(child.spawn(options)) << child.error();
    ASSERT_TRUE(child.wait_for_exit(std::chrono::seconds(10)));
    EXPECT_EQ(drain(child.stdout_fd()), "bar|");

    unsetenv("EXECORE_HOST_ONLY");
}

TEST(child_process, runs_in_working_dir) {
    test::TempRoot root;
    auto options = shell("pwd -P");
    options.working_dir = root.path().string();

    ChildProcess child;
    ASSERT_TRUE(child.spawn(options)) << child.error();
    ASSERT_TRUE(child.wait_for_exit(std::chrono::seconds(10)));
    EXPECT_EQ(drain(child.stdout_fd()),
              std::filesystem::canonical(root.path()).string() + "\n");
}

TEST(child_process, missing_program_fails) {
    SpawnOptions options;
    options.program = "/nonexistent/execore-interpreter";

    ChildProcess child;
    EXPECT_FALSE(child.spawn(options));
    EXPECT_EQ(child.state(), ProcessState::FAILED);
    EXPECT_TRUE(test::contains(child.error(), "execve failed for /nonexistent/execore-interpreter"));
    EXPECT_EQ(child.stdout_fd(), -1);
}

TEST(child_process, spawn_twice_is_rejected) {
    ChildProcess child;
    ASSERT_TRUE(child.spawn(shell("exit 0")));
    EXPECT_FALSE(child.spawn(shell("exit 0")));
    EXPECT_TRUE(child.wait_for_exit(std::chrono::seconds(10)));
}

TEST(child_process, stop_terminates_process_group) {
    ChildProcess child;
    ASSERT_TRUE(child.spawn(shell("exec sleep 30"))) << child.error();
    EXPECT_TRUE(child.is_running());

    EXPECT_TRUE(child.stop(std::chrono::milliseconds(2000)));
    EXPECT_EQ(child.state(), ProcessState::EXITED);
    EXPECT_EQ(child.term_signal(), SIGTERM);
    EXPECT_EQ(child.exit_code(), 128 + SIGTERM);
    EXPECT_FALSE(child.is_running());
}

TEST(child_process, wait_times_out_while_running) {
    ChildProcess child;
    ASSERT_TRUE(child.spawn(shell("exec sleep 30")));
    EXPECT_FALSE(child.wait_for_exit(std::chrono::milliseconds(50)));
    child.kill_group();
    EXPECT_EQ(child.term_signal(), SIGKILL);
}

TEST(child_process, inherited_fds_start_at_three) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);

    auto options = shell("echo via-fd3 >&3");
    options.capture_output = false;
    options.inherit_fds = {fds[1]};

    ChildProcess child;
    ASSERT_TRUE(child.spawn(options)) << child.error();
    close(fds[1]);
    ASSERT_TRUE(child.wait_for_exit(std::chrono::seconds(10)));

    EXPECT_EQ(drain(fds[0]), "via-fd3\n");
    close(fds[0]);
}

TEST(child_process, limits_apply_before_exec) {
    auto options = shell("ulimit -n");
    options.limits.max_open_files = 20;

    ChildProcess child;
    ASSERT_TRUE(child.spawn(options)) << child.error();
    ASSERT_TRUE(child.wait_for_exit(std::chrono::seconds(10)));
    EXPECT_EQ(drain(child.stdout_fd()), "20\n");
}

TEST(child_process, counts_spawns) {
    auto before = ChildProcess::spawn_count();
    ChildProcess child;
    ASSERT_TRUE(child.spawn(shell("exit 0")));
    EXPECT_EQ(ChildProcess::spawn_count(), before + 1);
    child.wait_for_exit(std::chrono::seconds(10));
}
