/**
 * execore Session Pool
 *
 * Owns every live InterpreterSession, keyed by session id. Admission beyond
 * capacity evicts the least recently active session (ties broken by the
 * smallest id). Idle and dead sessions are removed by reap_idle(), which the
 * engine runs on a PeriodicTask.
 */
#pragma once
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "runtime/resource_limits.hpp"
#include "runtime/runtime_locator.hpp"
#include "session/interpreter_session.hpp"

namespace execore::session {

struct SessionPoolConfig {
    size_t capacity = 10;
    std::chrono::seconds idle_timeout{3600};
    std::chrono::seconds reap_interval{300};
    std::chrono::seconds ready_timeout{30};
    std::chrono::milliseconds kill_grace{1000};
    std::chrono::milliseconds interrupt_settle{5000};

    static SessionPoolConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct SessionPoolStats {
    uint64_t created = 0;
    uint64_t evicted = 0;
    uint64_t reaped = 0;
    uint64_t killed = 0;
};

class SessionPool {
public:
    // `locator` must outlive the pool. Sessions get `limits` without the CPU
    // cap, since CPU time accumulates over the whole session lifetime.
    SessionPool(const SessionPoolConfig& config,
                const runtime::RuntimeLocator& locator,
                std::filesystem::path temp_dir,
                const runtime::ResourceLimits& limits);
    ~SessionPool();

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    // True when both an interpreter and a session driver exist for `language`
    bool supports(Language language) const;

    // Existing session (activity refreshed) or a freshly started one;
    // nullptr with `error` set on failure
    std::shared_ptr<InterpreterSession> get_or_create(const std::string& session_id,
                                                      Language language, std::string& error);

    ExecutionResult execute(const std::string& session_id, Language language,
                            const std::string& code, std::chrono::milliseconds timeout,
                            const OutputCallback& on_output = nullptr);

    bool interrupt(const std::string& session_id);
    bool kill(const std::string& session_id);

    std::vector<SessionInfo> list_sessions();

    // Kill sessions idle longer than idle_timeout or whose process died
    size_t reap_idle();

    void shutdown_all();

    size_t size() const;
    size_t capacity() const { return config_.capacity; }
    bool contains(const std::string& session_id) const;
    std::shared_ptr<InterpreterSession> find(const std::string& session_id) const;
    SessionPoolStats stats() const;
    const SessionPoolConfig& config() const { return config_; }

private:
    SessionPoolConfig config_;
    const runtime::RuntimeLocator& locator_;
    std::filesystem::path temp_dir_;
    runtime::ResourceLimits limits_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<InterpreterSession>> sessions_;
    SessionPoolStats stats_;

    bool evict_one_locked();
};

} // namespace execore::session
