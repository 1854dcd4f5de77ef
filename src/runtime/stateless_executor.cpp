#include "runtime/stateless_executor.hpp"
#include "runtime/child_process.hpp"
#include "runtime/harness.hpp"
#include "runtime/work_dir.hpp"
#include "output/aggregator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <poll.h>
#include <unistd.h>
#include <signal.h>
#include <cerrno>
#include <cstring>

namespace execore::runtime {

constexpr const char* TRUNCATION_MARKER = "\n... [output truncated]\n";

// Captured text of one stream, bounded by max_output_bytes
struct CapturedStream {
    OutputKind kind;
    size_t limit;
    std::string text;
    bool truncated = false;

    // Returns the part that was kept
    std::string append(const char* data, size_t len) {
        if (truncated) {
            return "";
        }
        size_t room = limit > text.size() ? limit - text.size() : 0;
        size_t keep = std::min(room, len);
        std::string kept(data, keep);
        text += kept;
        if (keep < len) {
            truncated = true;
            text += TRUNCATION_MARKER;
        }
        return kept;
    }
};

// Drain a non-blocking pipe. Returns false once it reached EOF.
static bool drain_pipe(int fd, CapturedStream& stream, const OutputCallback& on_output) {
    char buffer[8192];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            std::string kept = stream.append(buffer, static_cast<size_t>(n));
            if (on_output && !kept.empty()) {
                try {
                    on_output(stream.kind, kept);
                } catch (const std::exception& e) {
                    spdlog::warn("Output callback threw: {}", e.what());
                }
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        spdlog::error("Read error on child output: {}", strerror(errno));
        return false;
    }
}

static std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

// ============================================================================
// StatelessExecutor Implementation
// ============================================================================

StatelessExecutor::StatelessExecutor(const StatelessConfig& config,
                                     const security::SecurityFilter& filter,
                                     const RuntimeLocator& locator)
    : config_(config)
    , filter_(filter)
    , locator_(locator) {}

ExecutionResult StatelessExecutor::run(const std::string& code, Language language,
                                       std::chrono::milliseconds timeout,
                                       const OutputCallback& on_output) const {
    auto start = std::chrono::steady_clock::now();
    try {
        return run_checked(code, language, timeout, on_output, start);
    } catch (const std::exception& e) {
        spdlog::error("Stateless execution failed: {}", e.what());
        auto result = ExecutionResult::failure(ExecutionStatus::ERROR, ErrorKind::INTERNAL_ERROR,
                                               std::string("Internal error: ") + e.what());
        result.execution_time = std::min(elapsed_since(start), timeout);
        return result;
    }
}

ExecutionResult StatelessExecutor::run_checked(const std::string& code, Language language,
                                               std::chrono::milliseconds timeout,
                                               const OutputCallback& on_output,
                                               std::chrono::steady_clock::time_point start) const {
    auto internal_error = [&](const std::string& message) {
        spdlog::error("Stateless {} execution: {}", language_to_string(language), message);
        auto result = ExecutionResult::failure(ExecutionStatus::ERROR, ErrorKind::INTERNAL_ERROR, message);
        result.execution_time = std::min(elapsed_since(start), timeout);
        return result;
    };

    auto verdict = filter_.check(code, language);
    if (!verdict.allowed) {
        auto result = ExecutionResult::failure(ExecutionStatus::ERROR, ErrorKind::SECURITY_VIOLATION,
                                               verdict.message());
        result.execution_time = elapsed_since(start);
        return result;
    }

    auto interpreter = locator_.find_interpreter(language);
    if (!interpreter) {
        return internal_error(std::string("No interpreter available for ") + language_to_string(language));
    }

    // Removed on every exit path below
    WorkDir work_dir;
    if (!work_dir.create(config_.temp_dir, "execore-")) {
        return internal_error("Failed to create working directory: " + work_dir.error());
    }

    SpawnOptions options;
    options.program = *interpreter;
    options.env = sandbox_environment(work_dir.path());
    options.working_dir = work_dir.path().string();
    options.limits = config_.limits.for_language(language);
    options.capture_output = true;

    std::string harness_error;
    if (!write_harness(language, code, work_dir.path(), options.args, harness_error)) {
        return internal_error("Failed to prepare harness: " + harness_error);
    }

    ChildProcess child;
    if (!child.spawn(options)) {
        return internal_error("Failed to start interpreter: " + child.error());
    }

    spdlog::debug("Stateless {} run started (pid={}, timeout={}ms)",
        language_to_string(language), child.pid(), timeout.count());

    CapturedStream out{OutputKind::STDOUT, config_.max_output_bytes};
    CapturedStream err{OutputKind::STDERR, config_.max_output_bytes};
    auto deadline = start + timeout;
    bool exited = false;
    bool timed_out = false;

    while (!exited) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        struct pollfd fds[3];
        int nfds = 0;
        int out_idx = -1, err_idx = -1, exit_idx = -1;
        if (child.stdout_fd() >= 0) {
            out_idx = nfds;
            fds[nfds++] = {child.stdout_fd(), POLLIN, 0};
        }
        if (child.stderr_fd() >= 0) {
            err_idx = nfds;
            fds[nfds++] = {child.stderr_fd(), POLLIN, 0};
        }
        if (child.exit_fd() >= 0) {
            exit_idx = nfds;
            fds[nfds++] = {child.exit_fd(), POLLIN, 0};
        }

        // Without a pidfd, fall back to short waitpid polling
        int wait_ms = static_cast<int>(remaining.count());
        if (exit_idx < 0) {
            wait_ms = std::min(wait_ms, 10);
        }

        int rc = poll(fds, nfds, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            child.kill_group();
            return internal_error(std::string("poll failed: ") + strerror(errno));
        }

        if (out_idx >= 0 && fds[out_idx].revents != 0 && !drain_pipe(child.stdout_fd(), out, on_output)) {
            child.close_stdout();
        }
        if (err_idx >= 0 && fds[err_idx].revents != 0 && !drain_pipe(child.stderr_fd(), err, on_output)) {
            child.close_stderr();
        }

        if ((exit_idx >= 0 && fds[exit_idx].revents != 0) || exit_idx < 0) {
            exited = child.poll_exit();
        }
    }

    if (timed_out) {
        child.kill_group();
        spdlog::warn("Stateless {} execution timed out after {}ms (pid={})",
            language_to_string(language), timeout.count(), child.pid());

        auto result = ExecutionResult::failure(ExecutionStatus::TIMEOUT, ErrorKind::EXECUTION_TIMEOUT,
            fmt::format("Execution timed out after {:.1f} seconds", timeout.count() / 1000.0));
        result.output = out.text;
        result.execution_time = timeout;
        return result;
    }

    // Whatever is still buffered in the pipes, then anything the child left running
    if (child.stdout_fd() >= 0) drain_pipe(child.stdout_fd(), out, on_output);
    if (child.stderr_fd() >= 0) drain_pipe(child.stderr_fd(), err, on_output);
    child.signal_group(SIGKILL);

    output::ProcessOutput process{out.text, err.text, child.exit_code(), child.term_signal()};
    auto result = output::aggregate_process_output(process, work_dir.path());
    result.execution_time = std::min(elapsed_since(start), timeout);

    if (result.ok()) {
        spdlog::debug("Stateless {} run finished in {}ms", language_to_string(language),
            result.execution_time.count());
    } else {
        spdlog::debug("Stateless {} run failed (exit={})", language_to_string(language), child.exit_code());
    }
    return result;
}

} // namespace execore::runtime
