/**
 * execore Child Process
 *
 * fork()/execve() wrapper used by both executors. The child gets a scrubbed
 * environment, its own process group, piped stdout/stderr, optional extra
 * descriptors mapped to fd 3, 4, 5..., and resource limits applied before
 * exec. Exit is observed through a pidfd so callers can poll() on it.
 */
#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <atomic>
#include <cstdint>
#include <sys/types.h>
#include "runtime/resource_limits.hpp"

namespace execore::runtime {

struct SpawnOptions {
    std::string program;                 // Path to the executable (no PATH lookup)
    std::vector<std::string> args;       // argv[1..]
    std::vector<std::string> env;        // Complete environment, "KEY=VALUE"
    std::string working_dir;             // Empty = inherit
    ResourceLimits limits = ResourceLimits::none();
    bool capture_output = true;          // Pipe stdout/stderr back to the parent
    std::vector<int> inherit_fds;        // Parent fds exposed to the child as 3, 4, 5...
};

enum class ProcessState {
    CREATED,
    RUNNING,
    EXITED,
    FAILED
};

const char* process_state_to_string(ProcessState state);

class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    // Non-copyable
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Lifecycle
    bool spawn(const SpawnOptions& options);
    bool signal(int sig);              // Signal the child only
    bool signal_group(int sig);        // Signal the whole process group
    bool stop(std::chrono::milliseconds grace);  // SIGTERM group, then SIGKILL
    void kill_group();                 // SIGKILL group and reap

    // Wait up to `timeout` for the child to exit; true once it has been reaped
    bool wait_for_exit(std::chrono::milliseconds timeout);

    // Non-blocking reap
    bool poll_exit();
    bool is_running();

    // Status
    ProcessState state() const { return state_; }
    pid_t pid() const { return pid_; }
    int exit_code() const { return exit_code_; }     // 128 + signal when killed
    int term_signal() const { return term_signal_; } // 0 unless killed by a signal
    const std::string& error() const { return error_; }

    // Readable ends of the child's stdout/stderr, -1 when not captured or closed
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }
    void close_stdout();
    void close_stderr();

    // Becomes readable when the child exits; -1 if pidfd is unsupported
    int exit_fd() const { return pidfd_; }

    // Processes successfully forked since startup
    static uint64_t spawn_count();

private:
    ProcessState state_ = ProcessState::CREATED;
    pid_t pid_ = -1;
    int pidfd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    int exit_code_ = -1;
    int term_signal_ = 0;
    std::string error_;

    void record_status(int status);
    void close_fds();
};

} // namespace execore::runtime
