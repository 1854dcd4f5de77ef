#include "session/interpreter_session.hpp"
#include "runtime/harness.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <cerrno>
#include <cstring>

namespace execore::session {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::STARTING:    return "starting";
        case SessionState::IDLE:        return "idle";
        case SessionState::BUSY:        return "busy";
        case SessionState::INTERRUPTED: return "interrupted";
        case SessionState::DEAD:        return "dead";
        default: return "unknown";
    }
}

json SessionInfo::to_json() const {
    json j;
    j["session_id"] = session_id;
    j["language"] = language_to_string(language);
    j["created_at"] = format_timestamp(created_at);
    j["last_activity"] = format_timestamp(last_activity);
    j["execution_count"] = execution_count;
    j["state"] = session_state_to_string(state);
    return j;
}

static bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static std::chrono::milliseconds remaining_until(Clock::time_point deadline) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
}

static bool is_idle(const output::OutputEvent& event) {
    auto status = std::get_if<output::StatusEvent>(&event);
    return status && status->state == output::ExecutionState::IDLE;
}

static bool is_busy(const output::OutputEvent& event) {
    auto status = std::get_if<output::StatusEvent>(&event);
    return status && status->state == output::ExecutionState::BUSY;
}

// ============================================================================
// Lifecycle
// ============================================================================

InterpreterSession::InterpreterSession(std::string id, Language language, SessionOptions options)
    : id_(std::move(id))
    , language_(language)
    , options_(std::move(options)) {
    created_at_ = std::chrono::system_clock::now();
    last_activity_ = created_at_;
    last_activity_steady_ = Clock::now();
}

InterpreterSession::~InterpreterSession() {
    terminate();
    close_channels();
}

bool InterpreterSession::start(std::string& error) {
    bool started = launch(error);
    started_cv_.notify_all();
    return started;
}

bool InterpreterSession::launch(std::string& error) {
    std::lock_guard<std::timed_mutex> exec_lock(exec_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::STARTING) {
            error = "session already started";
            return false;
        }

        if (!work_dir_.create(options_.temp_dir, "execore-session-")) {
            error = "Failed to create working directory: " + work_dir_.error();
            state_ = SessionState::DEAD;
            return false;
        }

        int command_pipe[2] = {-1, -1};
        int reply_pipe[2] = {-1, -1};
        int event_pipe[2] = {-1, -1};
        if (!ipc::make_pipe(command_pipe, error) ||
            !ipc::make_pipe(reply_pipe, error) ||
            !ipc::make_pipe(event_pipe, error)) {
            for (int* p : {command_pipe, reply_pipe, event_pipe}) {
                close_fd(p[0]);
                close_fd(p[1]);
            }
            state_ = SessionState::DEAD;
            work_dir_.remove();
            return false;
        }

        runtime::SpawnOptions spawn;
        spawn.program = options_.interpreter;
        spawn.args = {options_.driver};
        spawn.env = runtime::sandbox_environment(work_dir_.path());
        spawn.working_dir = work_dir_.path().string();
        spawn.limits = options_.limits;
        spawn.capture_output = false;
        spawn.inherit_fds = {command_pipe[0], reply_pipe[1], event_pipe[1]};

        bool spawned = child_.spawn(spawn);

        // The child holds its own copies now
        close_fd(command_pipe[0]);
        close_fd(reply_pipe[1]);
        close_fd(event_pipe[1]);
        command_fd_ = command_pipe[1];
        reply_reader_.reset(reply_pipe[0]);
        event_reader_.reset(event_pipe[0]);

        if (!spawned) {
            error = "Failed to start interpreter: " + child_.error();
            state_ = SessionState::DEAD;
            close_channels();
            work_dir_.remove();
            return false;
        }

        if (!set_nonblocking(command_fd_) || !set_nonblocking(reply_reader_.fd()) ||
            !set_nonblocking(event_reader_.fd())) {
            error = std::string("fcntl failed: ") + strerror(errno);
            child_.kill_group();
            state_ = SessionState::DEAD;
            close_channels();
            work_dir_.remove();
            return false;
        }
    }

    if (!handshake(error)) {
        std::lock_guard<std::mutex> lock(mutex_);
        child_.kill_group();
        state_ = SessionState::DEAD;
        work_dir_.remove();
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SessionState::IDLE;
    last_activity_ = std::chrono::system_clock::now();
    last_activity_steady_ = Clock::now();
    return true;
}

bool InterpreterSession::handshake(std::string& error) {
    uint32_t msg_id = next_msg_id_++;
    auto deadline = Clock::now() + options_.ready_timeout;

    ipc::Message request(msg_id, ipc::MessageKind::INFO_REQUEST, std::string("{}"));
    if (!ipc::write_message(command_fd_, request, options_.ready_timeout, error)) {
        error = "Readiness handshake failed: " + error;
        return false;
    }

    while (true) {
        while (auto msg = reply_reader_.pop()) {
            if (msg->kind != ipc::MessageKind::INFO_REPLY || msg->msg_id != msg_id) {
                spdlog::debug("Session {}: ignoring {} during handshake", id_, ipc::kind_to_string(msg->kind));
                continue;
            }
            json info = json::parse(msg->payload_str(), nullptr, false);
            if (info.is_discarded() || !info.is_object()) {
                error = "Readiness handshake failed: malformed info reply";
                return false;
            }
            spdlog::info("Session {} ready ({} {}, pid={})", id_,
                info.value("implementation", std::string("driver")),
                info.value("version", std::string("?")), child_.pid());
            return true;
        }

        if (reply_reader_.eof()) {
            error = "Interpreter exited before becoming ready";
            return false;
        }

        auto remaining = remaining_until(deadline);
        if (remaining.count() <= 0) {
            error = fmt::format("Interpreter not ready after {} ms", options_.ready_timeout.count());
            return false;
        }

        struct pollfd pfd = {reply_reader_.fd(), POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            error = std::string("poll failed: ") + strerror(errno);
            return false;
        }
        if (rc > 0) {
            reply_reader_.read_available();
        }
    }
}

void InterpreterSession::terminate() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (child_.state() == runtime::ProcessState::RUNNING) {
            spdlog::info("Terminating session {} (pid={})", id_, child_.pid());
            child_.stop(options_.kill_grace);
        }
        state_ = SessionState::DEAD;
        work_dir_.remove();
    }
    started_cv_.notify_all();
}

void InterpreterSession::close_channels() {
    close_fd(command_fd_);
    int reply_fd = reply_reader_.fd();
    int event_fd = event_reader_.fd();
    close_fd(reply_fd);
    close_fd(event_fd);
    reply_reader_.reset(-1);
    event_reader_.reset(-1);
}

void InterpreterSession::mark_dead(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::DEAD) {
        spdlog::error("Session {} died: {}", id_, reason);
    }
    state_ = SessionState::DEAD;
    // A broken channel with a live process would otherwise leak it
    if (!child_.poll_exit()) {
        child_.kill_group();
    }
}

// ============================================================================
// Execution
// ============================================================================

ExecutionResult InterpreterSession::execute(const std::string& code, std::chrono::milliseconds timeout,
                                            const OutputCallback& on_output) {
    auto start = Clock::now();
    auto deadline = start + timeout;

    auto finish = [&](ExecutionResult result) {
        result.session_id = id_;
        result.execution_time = std::min(
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start), timeout);
        return result;
    };

    {
        // Another caller may still be running the readiness handshake
        std::unique_lock<std::mutex> lock(mutex_);
        if (!started_cv_.wait_until(lock, deadline, [this]() { return state_ != SessionState::STARTING; })) {
            auto result = ExecutionResult::failure(ExecutionStatus::TIMEOUT, ErrorKind::EXECUTION_TIMEOUT,
                fmt::format("Session {} is still starting", id_));
            result.session_id = id_;
            result.execution_time = timeout;
            return result;
        }
    }

    std::unique_lock<std::timed_mutex> exec_lock(exec_mutex_, std::defer_lock);
    if (!exec_lock.try_lock_until(deadline)) {
        spdlog::warn("Session {} busy for {}ms, giving up", id_, timeout.count());
        auto result = ExecutionResult::failure(ExecutionStatus::TIMEOUT, ErrorKind::EXECUTION_TIMEOUT,
            fmt::format("Session {} is busy", id_));
        result.session_id = id_;
        result.execution_time = timeout;
        return result;
    }

    uint32_t msg_id = 0;
    uint64_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::DEAD || state_ == SessionState::STARTING) {
            return finish(ExecutionResult::failure(ExecutionStatus::ERROR, ErrorKind::INTERNAL_ERROR,
                fmt::format("Session {} is not running", id_)));
        }
        count = ++execution_count_;
        last_activity_ = std::chrono::system_clock::now();
        last_activity_steady_ = Clock::now();
        state_ = SessionState::BUSY;
        driver_busy_ = false;
        interrupt_deferred_ = false;
        msg_id = next_msg_id_++;
    }

    json request;
    request["code"] = code;
    std::string payload = request.dump(-1, ' ', false, json::error_handler_t::replace);

    std::string write_error;
    auto budget = std::max(remaining_until(deadline), std::chrono::milliseconds(1));
    if (!ipc::write_message(command_fd_, ipc::Message(msg_id, ipc::MessageKind::EXECUTE_REQUEST, payload),
                            budget, write_error)) {
        mark_dead("failed to submit code: " + write_error);
        auto result = ExecutionResult::failure(ExecutionStatus::ERROR, ErrorKind::INTERNAL_ERROR,
            "Failed to submit code to interpreter: " + write_error);
        result.execution_count = count;
        return finish(std::move(result));
    }

    spdlog::debug("Session {} execute id={} ({} bytes)", id_, msg_id, code.size());

    output::OutputAggregator aggregator(on_output);
    WaitOutcome outcome = wait_for(msg_id, &aggregator, deadline);
    ExecutionResult result = aggregator.finish();
    result.execution_count = count;

    switch (outcome) {
        case WaitOutcome::COMPLETE: {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SessionState::DEAD) {
                state_ = SessionState::IDLE;
            }
            last_activity_ = std::chrono::system_clock::now();
            last_activity_steady_ = Clock::now();
            break;
        }
        case WaitOutcome::TIMED_OUT:
            // The driver keeps running it; interrupt() or a later settle catches up
            pending_msg_id_ = msg_id;
            spdlog::warn("Session {} execution {} timed out after {}ms", id_, count, timeout.count());
            result.status = ExecutionStatus::TIMEOUT;
            result.error_kind = ErrorKind::EXECUTION_TIMEOUT;
            result.error = fmt::format("Execution timed out after {:.1f} seconds", timeout.count() / 1000.0);
            break;
        case WaitOutcome::CHANNEL_CLOSED: {
            mark_dead("interpreter process exited");
            int exit_code = 0;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                exit_code = child_.exit_code();
            }
            result.status = ExecutionStatus::ERROR;
            result.error_kind = ErrorKind::INTERNAL_ERROR;
            result.error = exit_code > 0
                ? fmt::format("Interpreter process exited unexpectedly (exit code {})", exit_code)
                : std::string("Interpreter process exited unexpectedly");
            break;
        }
    }

    return finish(std::move(result));
}

InterpreterSession::WaitOutcome InterpreterSession::wait_for(uint32_t msg_id,
                                                             output::OutputAggregator* aggregator,
                                                             Clock::time_point deadline) {
    while (true) {
        if (process_events(msg_id, aggregator) || process_replies(msg_id, aggregator)) {
            return WaitOutcome::COMPLETE;
        }
        if (event_reader_.eof() || reply_reader_.eof()) {
            return WaitOutcome::CHANNEL_CLOSED;
        }

        auto remaining = remaining_until(deadline);
        if (remaining.count() <= 0) {
            return WaitOutcome::TIMED_OUT;
        }

        struct pollfd fds[2] = {
            {event_reader_.fd(), POLLIN, 0},
            {reply_reader_.fd(), POLLIN, 0}
        };
        int rc = poll(fds, 2, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            spdlog::error("Session {}: poll failed: {}", id_, strerror(errno));
            return WaitOutcome::CHANNEL_CLOSED;
        }

        if (fds[0].revents != 0) {
            event_reader_.read_available();
        }
        if (fds[1].revents != 0) {
            reply_reader_.read_available();
        }
    }
}

bool InterpreterSession::process_events(uint32_t msg_id, output::OutputAggregator* aggregator) {
    while (auto msg = event_reader_.pop()) {
        if (msg->msg_id != msg_id) {
            discard_stale(*msg);
            continue;
        }

        auto event = output::decode_event(*msg);
        if (!event) {
            spdlog::warn("Session {}: malformed {} event", id_, ipc::kind_to_string(msg->kind));
            continue;
        }
        if (is_busy(*event)) {
            deliver_deferred_interrupt();
        }

        bool done = aggregator ? aggregator->consume(*event) : is_idle(*event);
        if (done) {
            return true;
        }
    }
    return false;
}

bool InterpreterSession::process_replies(uint32_t msg_id, output::OutputAggregator* aggregator) {
    while (auto msg = reply_reader_.pop()) {
        if (msg->msg_id != msg_id || msg->kind != ipc::MessageKind::EXECUTE_REPLY) {
            discard_stale(*msg);
            continue;
        }

        // The driver finishes writing every event, idle included, before the
        // reply, so once the event pipe is drained nothing more is coming
        event_reader_.read_available();
        bool idle = process_events(msg_id, aggregator);

        auto reply = output::decode_reply(*msg);
        if (!reply) {
            spdlog::warn("Session {}: malformed execute reply", id_);
        } else if (aggregator && !idle && !aggregator->consume_reply(*reply)) {
            spdlog::warn("Session {}: reply for id={} arrived without an idle status", id_, msg_id);
        }
        return true;
    }
    return false;
}

void InterpreterSession::discard_stale(const ipc::Message& msg) {
    if (pending_msg_id_ && msg.msg_id == *pending_msg_id_) {
        bool settled = msg.kind == ipc::MessageKind::EXECUTE_REPLY;
        if (msg.kind == ipc::MessageKind::STATUS) {
            auto event = output::decode_event(msg);
            settled = event && is_idle(*event);
        }
        if (settled) {
            spdlog::debug("Session {}: earlier submission id={} settled", id_, msg.msg_id);
            pending_msg_id_.reset();
        }
        return;
    }
    spdlog::debug("Session {}: discarding stale {} id={}", id_, ipc::kind_to_string(msg.kind), msg.msg_id);
}

void InterpreterSession::settle_pending(std::chrono::milliseconds budget) {
    if (!pending_msg_id_) {
        return;
    }
    uint32_t msg_id = *pending_msg_id_;
    WaitOutcome outcome = wait_for(msg_id, nullptr, Clock::now() + budget);
    if (outcome == WaitOutcome::COMPLETE) {
        pending_msg_id_.reset();
    } else if (outcome == WaitOutcome::CHANNEL_CLOSED) {
        mark_dead("interpreter process exited");
    } else {
        spdlog::warn("Session {}: submission id={} still running after {}ms", id_, msg_id, budget.count());
    }
}

// ============================================================================
// Control
// ============================================================================

bool InterpreterSession::interrupt() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::DEAD || !child_.is_running()) {
            return false;
        }
        // Before its busy report the driver may still be reading the request
        // and would drop the signal
        if (state_ == SessionState::BUSY && !driver_busy_) {
            interrupt_deferred_ = true;
            spdlog::info("Interrupt for session {} deferred until the driver is busy", id_);
        } else if (!child_.signal(SIGINT)) {
            spdlog::error("Failed to interrupt session {}: {}", id_, child_.error());
            return false;
        } else {
            spdlog::info("Interrupted session {}", id_);
        }
        if (state_ == SessionState::BUSY) {
            state_ = SessionState::INTERRUPTED;
        }
    }

    // With an execution in flight, it observes the abort itself
    std::unique_lock<std::timed_mutex> exec_lock(exec_mutex_, std::try_to_lock);
    if (!exec_lock.owns_lock()) {
        return true;
    }

    settle_pending(options_.interrupt_settle);

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::INTERRUPTED && !pending_msg_id_) {
        state_ = SessionState::IDLE;
    }
    return true;
}

void InterpreterSession::deliver_deferred_interrupt() {
    std::lock_guard<std::mutex> lock(mutex_);
    driver_busy_ = true;
    if (!interrupt_deferred_) {
        return;
    }
    interrupt_deferred_ = false;
    if (!child_.signal(SIGINT)) {
        spdlog::error("Failed to interrupt session {}: {}", id_, child_.error());
        return;
    }
    spdlog::info("Interrupted session {}", id_);
}

void InterpreterSession::refresh() {
    std::unique_lock<std::timed_mutex> exec_lock(exec_mutex_, std::try_to_lock);
    if (!exec_lock.owns_lock()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::DEAD || state_ == SessionState::STARTING) {
            return;
        }
    }

    if (pending_msg_id_) {
        settle_pending(std::chrono::milliseconds(0));
    } else {
        event_reader_.read_available();
        reply_reader_.read_available();
        while (auto msg = event_reader_.pop()) discard_stale(*msg);
        while (auto msg = reply_reader_.pop()) discard_stale(*msg);
        if (event_reader_.eof() || reply_reader_.eof()) {
            mark_dead("interpreter process exited");
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::DEAD && !child_.is_running()) {
        spdlog::error("Session {} died: interpreter process exited (code {})", id_, child_.exit_code());
        state_ = SessionState::DEAD;
    }
    if (!pending_msg_id_ && (state_ == SessionState::BUSY || state_ == SessionState::INTERRUPTED)) {
        state_ = SessionState::IDLE;
    }
}

// ============================================================================
// Accessors
// ============================================================================

bool InterpreterSession::is_alive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ != SessionState::DEAD && child_.is_running();
}

void InterpreterSession::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_activity_ = std::chrono::system_clock::now();
    last_activity_steady_ = Clock::now();
}

SessionInfo InterpreterSession::info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionInfo info;
    info.session_id = id_;
    info.language = language_;
    info.created_at = created_at_;
    info.last_activity = last_activity_;
    info.execution_count = execution_count_;
    info.state = state_;
    return info;
}

SessionState InterpreterSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

uint64_t InterpreterSession::execution_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return execution_count_;
}

Clock::duration InterpreterSession::idle_for() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Clock::now() - last_activity_steady_;
}

pid_t InterpreterSession::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return child_.pid();
}

std::filesystem::path InterpreterSession::work_dir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return work_dir_.path();
}

} // namespace execore::session
