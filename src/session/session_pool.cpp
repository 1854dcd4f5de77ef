#include "session/session_pool.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>

namespace execore::session {

using json = nlohmann::json;

// ============================================================================
// SessionPoolConfig
// ============================================================================

SessionPoolConfig SessionPoolConfig::from_json(const json& j) {
    SessionPoolConfig config;

    // Zero would disable the pool or spin the reaper
    auto positive = [&j](const char* key) {
        return j.contains(key) && j[key].is_number_integer() && j[key].get<int64_t>() > 0;
    };

    if (positive("capacity")) {
        config.capacity = j["capacity"].get<size_t>();
    }
    if (positive("idle_timeout_s")) {
        config.idle_timeout = std::chrono::seconds(j["idle_timeout_s"].get<int64_t>());
    }
    if (positive("reap_interval_s")) {
        config.reap_interval = std::chrono::seconds(j["reap_interval_s"].get<int64_t>());
    }
    if (positive("ready_timeout_s")) {
        config.ready_timeout = std::chrono::seconds(j["ready_timeout_s"].get<int64_t>());
    }
    if (positive("kill_grace_ms")) {
        config.kill_grace = std::chrono::milliseconds(j["kill_grace_ms"].get<int64_t>());
    }
    if (positive("interrupt_settle_ms")) {
        config.interrupt_settle = std::chrono::milliseconds(j["interrupt_settle_ms"].get<int64_t>());
    }
    return config;
}

json SessionPoolConfig::to_json() const {
    return {
        {"capacity", capacity},
        {"idle_timeout_s", idle_timeout.count()},
        {"reap_interval_s", reap_interval.count()},
        {"ready_timeout_s", ready_timeout.count()},
        {"kill_grace_ms", kill_grace.count()},
        {"interrupt_settle_ms", interrupt_settle.count()}
    };
}

// ============================================================================
// SessionPool Implementation
// ============================================================================

SessionPool::SessionPool(const SessionPoolConfig& config,
                         const runtime::RuntimeLocator& locator,
                         std::filesystem::path temp_dir,
                         const runtime::ResourceLimits& limits)
    : config_(config)
    , locator_(locator)
    , temp_dir_(std::move(temp_dir))
    , limits_(limits) {
    limits_.cpu_seconds = 0;
}

SessionPool::~SessionPool() {
    shutdown_all();
}

bool SessionPool::supports(Language language) const {
    return locator_.find_interpreter(language) && locator_.find_session_driver(language);
}

std::shared_ptr<InterpreterSession> SessionPool::get_or_create(const std::string& session_id,
                                                               Language language, std::string& error) {
    std::shared_ptr<InterpreterSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            auto& existing = it->second;
            if (existing->language() != language) {
                error = fmt::format("Session {} runs {}, not {}", session_id,
                    language_to_string(existing->language()), language_to_string(language));
                return nullptr;
            }
            // A starting session holds its execution lock until it is ready
            if (existing->state() == SessionState::STARTING || existing->is_alive()) {
                existing->touch();
                return existing;
            }
            spdlog::warn("Session {} is dead, starting a new interpreter", session_id);
            existing->terminate();
            sessions_.erase(it);
        }

        if (config_.capacity == 0) {
            error = "Session pool capacity is zero";
            return nullptr;
        }

        auto interpreter = locator_.find_interpreter(language);
        auto driver = locator_.find_session_driver(language);
        if (!interpreter || !driver) {
            error = fmt::format("No session runtime available for {}", language_to_string(language));
            return nullptr;
        }

        while (sessions_.size() >= config_.capacity) {
            if (!evict_one_locked()) {
                error = fmt::format("Session pool is full ({} sessions starting)", sessions_.size());
                return nullptr;
            }
        }

        SessionOptions options;
        options.interpreter = *interpreter;
        options.driver = *driver;
        options.temp_dir = temp_dir_;
        options.limits = limits_.for_language(language);
        options.ready_timeout = config_.ready_timeout;
        options.kill_grace = config_.kill_grace;
        options.interrupt_settle = config_.interrupt_settle;

        session = std::make_shared<InterpreterSession>(session_id, language, std::move(options));
        sessions_[session_id] = session;
    }

    // The handshake can take up to ready_timeout, so it runs without the pool lock
    if (!session->start(error)) {
        spdlog::error("Failed to start session {}: {}", session_id, error);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end() && it->second == session) {
            sessions_.erase(it);
        }
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.created++;
    spdlog::info("Created {} session {} ({}/{})", language_to_string(language), session_id,
        sessions_.size(), config_.capacity);
    return session;
}

bool SessionPool::evict_one_locked() {
    auto victim = sessions_.end();
    auto victim_idle = std::chrono::steady_clock::duration::min();
    // std::map iterates in id order, so the strict comparison keeps the smallest id on ties
    for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
        if (it->second->state() == SessionState::STARTING) {
            continue;
        }
        auto idle = it->second->idle_for();
        if (victim == sessions_.end() || idle > victim_idle) {
            victim = it;
            victim_idle = idle;
        }
    }
    if (victim == sessions_.end()) {
        return false;
    }

    spdlog::info("Evicting session {} (idle {}s, pool at capacity {})", victim->first,
        std::chrono::duration_cast<std::chrono::seconds>(victim_idle).count(), config_.capacity);
    auto session = victim->second;
    sessions_.erase(victim);
    session->terminate();
    stats_.evicted++;
    return true;
}

ExecutionResult SessionPool::execute(const std::string& session_id, Language language,
                                     const std::string& code, std::chrono::milliseconds timeout,
                                     const OutputCallback& on_output) {
    std::string error;
    auto session = get_or_create(session_id, language, error);
    if (!session) {
        auto result = ExecutionResult::failure(ExecutionStatus::ERROR, ErrorKind::INTERNAL_ERROR, error);
        result.session_id = session_id;
        return result;
    }
    return session->execute(code, timeout, on_output);
}

bool SessionPool::interrupt(const std::string& session_id) {
    auto session = find(session_id);
    if (!session) {
        return false;
    }
    return session->interrupt();
}

bool SessionPool::kill(const std::string& session_id) {
    std::shared_ptr<InterpreterSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
        sessions_.erase(it);
        stats_.killed++;
    }
    session->terminate();
    spdlog::info("Killed session {}", session_id);
    return true;
}

std::vector<SessionInfo> SessionPool::list_sessions() {
    std::vector<std::shared_ptr<InterpreterSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            sessions.push_back(session);
        }
    }

    std::vector<SessionInfo> infos;
    infos.reserve(sessions.size());
    for (const auto& session : sessions) {
        session->refresh();
        infos.push_back(session->info());
    }
    return infos;
}

size_t SessionPool::reap_idle() {
    std::vector<std::shared_ptr<InterpreterSession>> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            auto& session = it->second;
            if (session->state() == SessionState::STARTING) {
                ++it;
                continue;
            }
            bool expired = session->idle_for() > config_.idle_timeout;
            if (expired || !session->is_alive()) {
                spdlog::info("Reaping session {} ({})", it->first, expired ? "idle timeout" : "process dead");
                victims.push_back(session);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
        stats_.reaped += victims.size();
    }

    for (const auto& session : victims) {
        try {
            session->terminate();
        } catch (const std::exception& e) {
            spdlog::error("Failed to reap session {}: {}", session->id(), e.what());
        }
    }

    if (!victims.empty()) {
        spdlog::info("Reaped {} session(s), {} remaining", victims.size(), size());
    }
    return victims.size();
}

void SessionPool::shutdown_all() {
    std::map<std::string, std::shared_ptr<InterpreterSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    if (sessions.empty()) {
        return;
    }

    spdlog::info("Shutting down {} session(s)", sessions.size());
    for (auto& [id, session] : sessions) {
        session->terminate();
    }
}

size_t SessionPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool SessionPool::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

std::shared_ptr<InterpreterSession> SessionPool::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

SessionPoolStats SessionPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace execore::session
