/**
 * execore Interpreter Session
 *
 * One long-lived interpreter process running the session driver, plus the
 * three pipes it talks over:
 *
 *   command  engine -> driver   (fd 3 in the child)
 *   reply    driver -> engine   (fd 4)
 *   event    driver -> engine   (fd 5)
 *
 * State machine: STARTING -> IDLE <-> BUSY -> ... -> DEAD, with INTERRUPTED
 * reachable from BUSY until the aborted submission settles. Executions on
 * one session never interleave.
 */
#pragma once
#include <string>
#include <optional>
#include <chrono>
#include <mutex>
#include <condition_variable>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "ipc/channel.hpp"
#include "output/aggregator.hpp"
#include "runtime/child_process.hpp"
#include "runtime/resource_limits.hpp"
#include "runtime/work_dir.hpp"

namespace execore::session {

enum class SessionState {
    STARTING,
    IDLE,
    BUSY,
    INTERRUPTED,
    DEAD
};

const char* session_state_to_string(SessionState state);

// Snapshot returned by SessionPool::list_sessions
struct SessionInfo {
    std::string session_id;
    Language language = Language::PYTHON;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_activity;
    uint64_t execution_count = 0;
    SessionState state = SessionState::STARTING;

    nlohmann::json to_json() const;
};

struct SessionOptions {
    std::string interpreter;                  // Absolute interpreter path
    std::string driver;                       // Session driver script
    std::filesystem::path temp_dir;           // Parent of the session's working directory
    runtime::ResourceLimits limits = runtime::ResourceLimits::none();
    std::chrono::milliseconds ready_timeout{30000};
    std::chrono::milliseconds kill_grace{1000};
    std::chrono::milliseconds interrupt_settle{5000};
};

class InterpreterSession {
public:
    InterpreterSession(std::string id, Language language, SessionOptions options);
    ~InterpreterSession();

    InterpreterSession(const InterpreterSession&) = delete;
    InterpreterSession& operator=(const InterpreterSession&) = delete;

    // Spawn the driver and wait for the readiness handshake
    bool start(std::string& error);

    // Run `code` in the session namespace. Waits for a concurrent execution
    // at most `timeout`; never throws.
    ExecutionResult execute(const std::string& code, std::chrono::milliseconds timeout,
                            const OutputCallback& on_output = nullptr);

    // SIGINT the interpreter; false if the session is dead
    bool interrupt();

    // SIGTERM, SIGKILL after the grace period, remove the working directory.
    // Safe while an execution is in flight.
    void terminate();

    // Settle leftovers of earlier timed-out submissions and notice a dead
    // process. Non-blocking; skipped while an execution is in flight.
    void refresh();

    bool is_alive();
    void touch();

    SessionInfo info() const;
    SessionState state() const;
    const std::string& id() const { return id_; }
    Language language() const { return language_; }
    uint64_t execution_count() const;
    std::chrono::steady_clock::duration idle_for() const;
    pid_t pid() const;
    std::filesystem::path work_dir() const;

private:
    enum class WaitOutcome {
        COMPLETE,
        TIMED_OUT,
        CHANNEL_CLOSED
    };

    const std::string id_;
    const Language language_;
    const SessionOptions options_;

    // Guards state, counters, timestamps and the child process
    mutable std::mutex mutex_;
    SessionState state_ = SessionState::STARTING;
    uint64_t execution_count_ = 0;
    std::chrono::system_clock::time_point created_at_;
    std::chrono::system_clock::time_point last_activity_;
    std::chrono::steady_clock::time_point last_activity_steady_;
    std::condition_variable started_cv_;  // Signalled when STARTING ends
    bool driver_busy_ = false;            // Driver reported busy for the current run
    bool interrupt_deferred_ = false;     // SIGINT waits for that report
    runtime::ChildProcess child_;
    runtime::WorkDir work_dir_;

    // Held by the execution that owns the channels
    std::timed_mutex exec_mutex_;
    int command_fd_ = -1;
    ipc::MessageReader reply_reader_;
    ipc::MessageReader event_reader_;
    uint32_t next_msg_id_ = 1;
    std::optional<uint32_t> pending_msg_id_;  // Timed out, still running in the driver

    bool launch(std::string& error);
    bool handshake(std::string& error);
    WaitOutcome wait_for(uint32_t msg_id, output::OutputAggregator* aggregator,
                         std::chrono::steady_clock::time_point deadline);
    bool process_events(uint32_t msg_id, output::OutputAggregator* aggregator);
    bool process_replies(uint32_t msg_id, output::OutputAggregator* aggregator);
    void discard_stale(const ipc::Message& msg);
    void deliver_deferred_interrupt();
    void settle_pending(std::chrono::milliseconds budget);
    void mark_dead(const std::string& reason);
    void close_channels();
};

} // namespace execore::session
