#include "runtime/child_process.hpp"
#include <spdlog/spdlog.h>

#include <sys/wait.h>
#include <sys/syscall.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

namespace execore::runtime {

static std::atomic<uint64_t> g_spawn_count{0};

// Failure report written by the child to the exec pipe
struct ExecFailure {
    int stage;
    int err;
};

enum ChildStage {
    STAGE_DESCRIPTORS = 1,
    STAGE_CHDIR = 2,
    STAGE_LIMITS = 3,
    STAGE_EXEC = 4
};

static const char* stage_to_string(int stage) {
    switch (stage) {
        case STAGE_DESCRIPTORS: return "descriptor setup";
        case STAGE_CHDIR:       return "chdir";
        case STAGE_LIMITS:      return "setrlimit";
        case STAGE_EXEC:        return "execve";
        default: return "child setup";
    }
}

static int open_pidfd(pid_t pid) {
#ifdef SYS_pidfd_open
    return static_cast<int>(syscall(SYS_pidfd_open, pid, 0));
#else
    (void)pid;
    return -1;
#endif
}

static void close_pair(int fds[2]) {
    for (int i = 0; i < 2; i++) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

[[noreturn]] static void child_fail(int report_fd, int stage) {
    ExecFailure failure{stage, errno};
    ssize_t n;
    do {
        n = write(report_fd, &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    _exit(127);
}

// ============================================================================
// Utility
// ============================================================================

const char* process_state_to_string(ProcessState state) {
    switch (state) {
        case ProcessState::CREATED: return "CREATED";
        case ProcessState::RUNNING: return "RUNNING";
        case ProcessState::EXITED:  return "EXITED";
        case ProcessState::FAILED:  return "FAILED";
        default: return "UNKNOWN";
    }
}

uint64_t ChildProcess::spawn_count() {
    return g_spawn_count.load();
}

// ============================================================================
// ChildProcess Implementation
// ============================================================================

ChildProcess::~ChildProcess() {
    if (state_ == ProcessState::RUNNING) {
        kill_group();
    }
    close_fds();
}

bool ChildProcess::spawn(const SpawnOptions& options) {
    if (state_ != ProcessState::CREATED) {
        error_ = "process already spawned";
        spdlog::error("ChildProcess::spawn called twice (pid={})", pid_);
        return false;
    }

    // Writing to a dead child's pipe must report EPIPE, not kill the host
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { ::signal(SIGPIPE, SIG_IGN); });

    // Everything the child needs is built before fork()
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(options.program.c_str()));
    for (const auto& arg : options.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (const auto& var : options.env) {
        envp.push_back(const_cast<char*>(var.c_str()));
    }
    envp.push_back(nullptr);

    const int fd_count = static_cast<int>(options.inherit_fds.size());
    const int first_free_fd = 3 + fd_count;
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) {
        max_fd = 65536;
    }

    int exec_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};

    if (pipe2(exec_pipe, O_CLOEXEC) < 0 ||
        (options.capture_output && (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0))) {
        error_ = std::string("pipe2 failed: ") + strerror(errno);
        spdlog::error("Failed to create pipes for {}: {}", options.program, strerror(errno));
        close_pair(exec_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        state_ = ProcessState::FAILED;
        return false;
    }

    pid_t pid = fork();

    if (pid < 0) {
        error_ = std::string("fork failed: ") + strerror(errno);
        spdlog::error("fork() failed: {}", strerror(errno));
        close_pair(exec_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        state_ = ProcessState::FAILED;
        return false;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only from here on
        setpgid(0, 0);

        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        ::signal(SIGPIPE, SIG_DFL);
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);

        // Park the report pipe and the inherited fds above the target range
        int report_fd = fcntl(exec_pipe[1], F_DUPFD_CLOEXEC, first_free_fd);
        if (report_fd < 0) {
            _exit(127);
        }

        int moved[64];
        if (fd_count > 64) {
            errno = EMFILE;
            child_fail(report_fd, STAGE_DESCRIPTORS);
        }
        for (int i = 0; i < fd_count; i++) {
            moved[i] = fcntl(options.inherit_fds[i], F_DUPFD_CLOEXEC, first_free_fd);
            if (moved[i] < 0) child_fail(report_fd, STAGE_DESCRIPTORS);
        }

        int null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);
        if (null_fd < 0 || dup2(null_fd, STDIN_FILENO) < 0) {
            child_fail(report_fd, STAGE_DESCRIPTORS);
        }
        if (options.capture_output) {
            if (dup2(out_pipe[1], STDOUT_FILENO) < 0 || dup2(err_pipe[1], STDERR_FILENO) < 0) {
                child_fail(report_fd, STAGE_DESCRIPTORS);
            }
        } else {
            if (dup2(null_fd, STDOUT_FILENO) < 0 || dup2(null_fd, STDERR_FILENO) < 0) {
                child_fail(report_fd, STAGE_DESCRIPTORS);
            }
        }

        for (int i = 0; i < fd_count; i++) {
            if (dup2(moved[i], 3 + i) < 0) child_fail(report_fd, STAGE_DESCRIPTORS);
        }

        for (long fd = first_free_fd; fd < max_fd; fd++) {
            if (fd != report_fd) close(static_cast<int>(fd));
        }

        if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) < 0) {
            child_fail(report_fd, STAGE_CHDIR);
        }

        int limit_err = apply_resource_limits(options.limits);
        if (limit_err != 0) {
            errno = limit_err;
            child_fail(report_fd, STAGE_LIMITS);
        }

        execve(argv[0], argv.data(), envp.data());
        child_fail(report_fd, STAGE_EXEC);
    }

    // Parent
    g_spawn_count++;
    pid_ = pid;
    setpgid(pid_, pid_);  // Both sides call it, whoever runs first wins

    close(exec_pipe[1]);
    exec_pipe[1] = -1;
    if (options.capture_output) {
        close(out_pipe[1]);
        close(err_pipe[1]);
        stdout_fd_ = out_pipe[0];
        stderr_fd_ = err_pipe[0];
        fcntl(stdout_fd_, F_SETFL, fcntl(stdout_fd_, F_GETFL) | O_NONBLOCK);
        fcntl(stderr_fd_, F_SETFL, fcntl(stderr_fd_, F_GETFL) | O_NONBLOCK);
    }

    // EOF on the exec pipe means execve() succeeded
    ExecFailure failure{0, 0};
    ssize_t n;
    do {
        n = read(exec_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        record_status(status);
        close_fds();
        error_ = std::string(stage_to_string(failure.stage)) + " failed for " +
                 options.program + ": " + strerror(failure.err);
        spdlog::error("Failed to start {}: {}", options.program, error_);
        state_ = ProcessState::FAILED;
        return false;
    }

    pidfd_ = open_pidfd(pid_);
    if (pidfd_ < 0) {
        spdlog::debug("pidfd_open unavailable, falling back to waitpid polling");
    }

    state_ = ProcessState::RUNNING;
    spdlog::debug("Spawned {} (pid={})", options.program, pid_);
    return true;
}

bool ChildProcess::signal(int sig) {
    if (state_ != ProcessState::RUNNING || pid_ <= 0) {
        return false;
    }
    if (kill(pid_, sig) < 0) {
        if (errno != ESRCH) {
            spdlog::error("kill({}, {}) failed: {}", pid_, sig, strerror(errno));
        }
        return false;
    }
    return true;
}

bool ChildProcess::signal_group(int sig) {
    if (pid_ <= 0) {
        return false;
    }
    // The group may outlive its leader when the child left descendants behind
    if (kill(-pid_, sig) < 0) {
        if (errno != ESRCH) {
            spdlog::error("kill(-{}, {}) failed: {}", pid_, sig, strerror(errno));
        }
        return false;
    }
    return true;
}

bool ChildProcess::poll_exit() {
    if (state_ != ProcessState::RUNNING) {
        return state_ == ProcessState::EXITED;
    }

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        record_status(status);
        state_ = ProcessState::EXITED;
        return true;
    }
    if (result < 0 && errno == ECHILD) {
        state_ = ProcessState::EXITED;
        return true;
    }
    return false;
}

bool ChildProcess::is_running() {
    return !poll_exit() && state_ == ProcessState::RUNNING;
}

bool ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (poll_exit()) {
            return true;
        }
        if (state_ != ProcessState::RUNNING) {
            return false;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return false;
        }

        if (pidfd_ >= 0) {
            struct pollfd pfd = {pidfd_, POLLIN, 0};
            int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (rc < 0 && errno != EINTR) {
                spdlog::error("poll on pidfd failed: {}", strerror(errno));
                return false;
            }
        } else {
            std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(10)));
        }
    }
}

bool ChildProcess::stop(std::chrono::milliseconds grace) {
    if (state_ != ProcessState::RUNNING) {
        return true;
    }

    spdlog::debug("Stopping process {} (grace={}ms)", pid_, grace.count());

    if (!signal_group(SIGTERM)) {
        signal(SIGTERM);
    }

    if (wait_for_exit(grace)) {
        // Descendants that ignored SIGTERM go too
        signal_group(SIGKILL);
        return true;
    }

    spdlog::warn("Process {} not responding, sending SIGKILL", pid_);
    kill_group();
    return true;
}

void ChildProcess::kill_group() {
    signal_group(SIGKILL);

    if (state_ != ProcessState::RUNNING) {
        return;
    }

    signal(SIGKILL);
    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        record_status(status);
    }
    state_ = ProcessState::EXITED;
}

void ChildProcess::record_status(int status) {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
        term_signal_ = 0;
    } else if (WIFSIGNALED(status)) {
        term_signal_ = WTERMSIG(status);
        exit_code_ = 128 + term_signal_;
    }
}

void ChildProcess::close_stdout() {
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
}

void ChildProcess::close_stderr() {
    if (stderr_fd_ >= 0) {
        close(stderr_fd_);
        stderr_fd_ = -1;
    }
}

void ChildProcess::close_fds() {
    close_stdout();
    close_stderr();
    if (pidfd_ >= 0) {
        close(pidfd_);
        pidfd_ = -1;
    }
}

} // namespace execore::runtime
