#include "engine/engine.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <random>

namespace execore {

using json = nlohmann::json;

static runtime::StatelessConfig stateless_config(const EngineConfig& config) {
    runtime::StatelessConfig stateless;
    stateless.temp_dir = config.temp_dir;
    stateless.limits = config.limits;
    stateless.max_output_bytes = config.max_output_bytes;
    return stateless;
}

static std::shared_ptr<runtime::RuntimeLocator> default_locator(const EngineConfig& config,
                                                                std::shared_ptr<runtime::RuntimeLocator> locator) {
    if (locator) {
        return locator;
    }
    return std::make_shared<runtime::DefaultRuntimeLocator>(config.runtimes);
}

// ============================================================================
// Lifecycle
// ============================================================================

Engine::Engine(const EngineConfig& config, std::shared_ptr<runtime::RuntimeLocator> locator)
    : config_(config)
    , locator_(default_locator(config, std::move(locator)))
    , filter_(config.security)
    , stateless_(stateless_config(config), filter_, *locator_)
    , pool_(config.sessions, *locator_, config.temp_dir, config.limits)
    , history_(config.history.max_entries, config.history.path)
    , reaper_("session-reaper", config.sessions.reap_interval, [this]() { pool_.reap_idle(); })
    , started_at_(std::chrono::steady_clock::now()) {
    dispatcher_ = std::thread([this]() { dispatch_loop(); });

    spdlog::info("Engine ready (temp_dir={}, session capacity={})",
        config_.temp_dir.string(), config_.sessions.capacity);
}

Engine::~Engine() {
    shutdown_all();

    {
        std::unique_lock<std::mutex> lock(inflight_mutex_);
        inflight_cv_.wait(lock, [this]() { return inflight_ == 0; });
    }

    stop_dispatcher();
}

void Engine::start() {
    reaper_.start();
    spdlog::info("Session reaper running every {}s (idle timeout {}s)",
        config_.sessions.reap_interval.count(), config_.sessions.idle_timeout.count());
}

void Engine::shutdown_all() {
    reaper_.stop();
    pool_.shutdown_all();
}

// ============================================================================
// Execution
// ============================================================================

ExecutionResult Engine::execute(const ExecutionRequest& request) {
    return run(request, nullptr);
}

ExecutionResult Engine::execute_streaming(const ExecutionRequest& request, const OutputCallback& on_output) {
    return run(request, on_output);
}

std::future<ExecutionResult> Engine::submit(ExecutionRequest request, OutputCallback on_output) {
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        inflight_++;
    }

    auto promise = std::make_shared<std::promise<ExecutionResult>>();
    auto future = promise->get_future();

    std::thread([this, promise, request = std::move(request), on_output = std::move(on_output)]() {
        promise->set_value(run(request, on_output));

        std::lock_guard<std::mutex> lock(inflight_mutex_);
        inflight_--;
        inflight_cv_.notify_all();
    }).detach();

    return future;
}

ExecutionResult Engine::run(const ExecutionRequest& original, const OutputCallback& on_output) {
    ExecutionRequest request = original;
    executions_++;

    auto clamped = ExecutionRequest::clamp_timeout(request.timeout);
    if (clamped != request.timeout) {
        spdlog::warn("Timeout {}ms out of range, clamped to {}ms", request.timeout.count(), clamped.count());
        request.timeout = clamped;
    }

    ExecutionResult result;
    try {
        result = route(request, on_output);
    } catch (const std::exception& e) {
        spdlog::error("Execution failed with internal error: {}", e.what());
        result = ExecutionResult::failure(ExecutionStatus::ERROR, ErrorKind::INTERNAL_ERROR,
                                          std::string("Internal error: ") + e.what());
        if (request.session_id) {
            result.session_id = *request.session_id;
        }
    }

    spdlog::debug("{} {} execution finished: {} in {}ms", language_to_string(request.language),
        execution_mode_to_string(request.mode), execution_status_to_string(result.status),
        result.execution_time.count());

    enqueue_record(ExecutionRecord::from_result(request, result));
    return result;
}

ExecutionResult Engine::route(ExecutionRequest& request, const OutputCallback& on_output) {
    if (request.mode == ExecutionMode::STATELESS) {
        return stateless_.run(request.code, request.language, request.timeout, on_output);
    }

    if (!request.session_id || request.session_id->empty()) {
        request.session_id = generate_session_id();
        spdlog::debug("Generated session id {}", *request.session_id);
    }
    const std::string& session_id = *request.session_id;

    if (!pool_.supports(request.language)) {
        spdlog::warn("No session runtime for {}, running session {} statelessly",
            language_to_string(request.language), session_id);
        auto result = stateless_.run(request.code, request.language, request.timeout, on_output);
        result.session_id = session_id;
        return result;
    }

    if (config_.security.filter_session_code) {
        auto verdict = filter_.check(request.code, request.language);
        if (!verdict.allowed) {
            auto result = ExecutionResult::failure(ExecutionStatus::ERROR, ErrorKind::SECURITY_VIOLATION,
                                                   verdict.message());
            result.session_id = session_id;
            return result;
        }
    }

    return pool_.execute(session_id, request.language, request.code, request.timeout, on_output);
}

std::string Engine::generate_session_id() {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    uint64_t value;
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        value = rng();
    }
    return fmt::format("{:016x}", value);
}

// ============================================================================
// Sessions
// ============================================================================

std::vector<session::SessionInfo> Engine::list_sessions() {
    return pool_.list_sessions();
}

bool Engine::interrupt(const std::string& session_id) {
    return pool_.interrupt(session_id);
}

bool Engine::kill(const std::string& session_id) {
    return pool_.kill(session_id);
}

size_t Engine::reap_idle_sessions() {
    return pool_.reap_idle();
}

// ============================================================================
// Introspection
// ============================================================================

std::vector<Language> Engine::available_languages() const {
    std::vector<Language> languages;
    for (auto language : {Language::PYTHON, Language::JAVASCRIPT}) {
        if (locator_->find_interpreter(language)) {
            languages.push_back(language);
        }
    }
    return languages;
}

bool Engine::supports_sessions(Language language) const {
    return pool_.supports(language);
}

json Engine::status() const {
    json j;
    j["uptime_s"] = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_).count();
    j["executions"] = executions_.load();
    j["processes_spawned"] = runtime::ChildProcess::spawn_count();

    json languages = json::array();
    for (auto language : available_languages()) {
        languages.push_back({
            {"language", language_to_string(language)},
            {"sessions", pool_.supports(language)}
        });
    }
    j["languages"] = languages;

    auto stats = pool_.stats();
    j["sessions"] = {
        {"active", pool_.size()},
        {"capacity", pool_.capacity()},
        {"created", stats.created},
        {"evicted", stats.evicted},
        {"reaped", stats.reaped},
        {"killed", stats.killed}
    };
    j["reaper_running"] = reaper_.running();
    j["history_entries"] = history_.size();
    return j;
}

// ============================================================================
// Record dispatch
// ============================================================================

void Engine::set_persistence_hook(PersistenceHook hook) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    hook_ = std::move(hook);
}

void Engine::enqueue_record(ExecutionRecord record) {
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        if (stop_dispatcher_) {
            return;
        }
        if (pending_records_.size() >= MAX_PENDING_RECORDS) {
            dropped_records_++;
            spdlog::warn("Record queue full, dropping execution record ({} dropped so far)", dropped_records_);
            return;
        }
        pending_records_.push_back(std::move(record));
    }
    records_cv_.notify_one();
}

void Engine::dispatch_loop() {
    std::unique_lock<std::mutex> lock(records_mutex_);
    while (true) {
        records_cv_.wait(lock, [this]() { return stop_dispatcher_ || !pending_records_.empty(); });
        if (pending_records_.empty()) {
            break;  // Stopping with nothing left
        }

        ExecutionRecord record = std::move(pending_records_.front());
        pending_records_.pop_front();
        PersistenceHook hook = hook_;
        dispatching_ = true;
        lock.unlock();

        record.sequence_id = history_.record(record);
        if (hook) {
            try {
                hook(record);
            } catch (const std::exception& e) {
                spdlog::error("Persistence hook failed for record {}: {}", record.sequence_id, e.what());
            }
        }

        lock.lock();
        dispatching_ = false;
        if (pending_records_.empty()) {
            records_idle_cv_.notify_all();
        }
    }
}

void Engine::flush_records() {
    std::unique_lock<std::mutex> lock(records_mutex_);
    records_idle_cv_.wait(lock, [this]() { return pending_records_.empty() && !dispatching_; });
}

void Engine::stop_dispatcher() {
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        stop_dispatcher_ = true;
    }
    records_cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    records_idle_cv_.notify_all();
}

} // namespace execore
