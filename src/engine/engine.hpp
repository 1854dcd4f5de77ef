/**
 * execore Engine
 *
 * Entry point for callers. Routes each ExecutionRequest to the stateless
 * executor or the session pool, owns the idle-session reaper, and hands a
 * record of every completed execution to the history and the persistence
 * hook on a dispatcher thread.
 */
#pragma once
#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <future>
#include <atomic>
#include <functional>
#include <chrono>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "engine/config.hpp"
#include "engine/execution_history.hpp"
#include "runtime/runtime_locator.hpp"
#include "runtime/stateless_executor.hpp"
#include "security/security_filter.hpp"
#include "session/periodic_task.hpp"
#include "session/session_pool.hpp"

namespace execore {

// Called once per completed execution, off the execution path
using PersistenceHook = std::function<void(const ExecutionRecord& record)>;

constexpr size_t MAX_PENDING_RECORDS = 1024;

class Engine {
public:
    explicit Engine(const EngineConfig& config = EngineConfig(),
                    std::shared_ptr<runtime::RuntimeLocator> locator = nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Start the idle-session reaper
    void start();

    ExecutionResult execute(const ExecutionRequest& request);
    ExecutionResult execute_streaming(const ExecutionRequest& request, const OutputCallback& on_output);

    // Run on a worker thread
    std::future<ExecutionResult> submit(ExecutionRequest request, OutputCallback on_output = nullptr);

    // Sessions
    std::vector<session::SessionInfo> list_sessions();
    bool interrupt(const std::string& session_id);
    bool kill(const std::string& session_id);
    size_t reap_idle_sessions();

    // Stop the reaper and kill every session
    void shutdown_all();

    // Languages with an interpreter installed
    std::vector<Language> available_languages() const;
    bool supports_sessions(Language language) const;

    nlohmann::json status() const;

    void set_persistence_hook(PersistenceHook hook);

    // Block until every queued record has been handed to the hooks
    void flush_records();

    ExecutionHistory& history() { return history_; }
    const EngineConfig& config() const { return config_; }

    // Random 16 hex digit id for session requests that carry none
    static std::string generate_session_id();

private:
    EngineConfig config_;
    std::shared_ptr<runtime::RuntimeLocator> locator_;
    security::SecurityFilter filter_;
    runtime::StatelessExecutor stateless_;
    session::SessionPool pool_;
    ExecutionHistory history_;
    session::PeriodicTask reaper_;
    std::chrono::steady_clock::time_point started_at_;

    // Record dispatcher
    std::mutex records_mutex_;
    std::condition_variable records_cv_;
    std::condition_variable records_idle_cv_;
    std::deque<ExecutionRecord> pending_records_;
    PersistenceHook hook_;
    bool dispatching_ = false;
    bool stop_dispatcher_ = false;
    uint64_t dropped_records_ = 0;
    std::thread dispatcher_;

    // submit() workers still running
    std::mutex inflight_mutex_;
    std::condition_variable inflight_cv_;
    size_t inflight_ = 0;

    std::atomic<uint64_t> executions_{0};

    ExecutionResult run(const ExecutionRequest& request, const OutputCallback& on_output);
    ExecutionResult route(ExecutionRequest& request, const OutputCallback& on_output);
    void enqueue_record(ExecutionRecord record);
    void dispatch_loop();
    void stop_dispatcher();
};

} // namespace execore
