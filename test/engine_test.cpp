#include <gtest/gtest.h>
#include <atomic>
#include <cctype>
#include <future>
#include <set>
#include <stdexcept>
#include <vector>
#include "engine/engine.hpp"
#include "runtime/child_process.hpp"
#include "test_support.hpp"

using namespace execore;
using namespace std::chrono_literals;

namespace {

// Interpreters from the host, but no session drivers
class StatelessOnlyLocator : public runtime::RuntimeLocator {
public:
    std::optional<std::string> find_interpreter(Language language) const override {
        return host_.find_interpreter(language);
    }
    std::optional<std::string> find_session_driver(Language) const override {
        return std::nullopt;
    }

private:
    runtime::DefaultRuntimeLocator host_;
};

class EngineTest : public ::testing::Test {
protected:
    test::TempRoot root_;

    EngineConfig config() const {
        EngineConfig config;
        config.temp_dir = root_.path();
        config.sessions.capacity = 3;
        config.sessions.kill_grace = 500ms;
        return config;
    }
};

ExecutionRequest stateless(const std::string& code, std::chrono::milliseconds timeout = 10s) {
    ExecutionRequest request;
    request.code = code;
    request.timeout = timeout;
    return request;
}

ExecutionRequest in_session(const std::string& code, std::optional<std::string> session_id = std::nullopt) {
    ExecutionRequest request;
    request.code = code;
    request.mode = ExecutionMode::SESSION;
    request.session_id = std::move(session_id);
    request.timeout = 10s;
    return request;
}

bool is_hex_id(const std::string& id) {
    if (id.size() != 16) return false;
    for (char c : id) {
        if (!std::isxdigit(static_cast<unsigned char>(c)) || std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace

TEST(execution_request, clamp_timeout) {
    EXPECT_EQ(ExecutionRequest::clamp_timeout(10ms), 1000ms);
    EXPECT_EQ(ExecutionRequest::clamp_timeout(5000ms), 5000ms);
    EXPECT_EQ(ExecutionRequest::clamp_timeout(600s), 120000ms);
}

TEST(execution_request, parses_language_aliases) {
    EXPECT_EQ(language_from_string("Python3"), Language::PYTHON);
    EXPECT_EQ(language_from_string("py"), Language::PYTHON);
    EXPECT_EQ(language_from_string("NODE"), Language::JAVASCRIPT);
    EXPECT_EQ(language_from_string("js"), Language::JAVASCRIPT);
    EXPECT_FALSE(language_from_string("ruby"));
    EXPECT_EQ(execution_mode_from_string("session"), ExecutionMode::SESSION);
}

TEST(execution_result, json_shape) {
    auto result = ExecutionResult::failure(ExecutionStatus::TIMEOUT, ErrorKind::EXECUTION_TIMEOUT, "slow");
    result.execution_time = 1500ms;

    auto j = result.to_json();
    EXPECT_EQ(j["status"], "timeout");
    EXPECT_EQ(j["error"], "slow");
    EXPECT_EQ(j["execution_time"], 1.5);
}

TEST(engine, generates_distinct_session_ids) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; i++) {
        auto id = Engine::generate_session_id();
        EXPECT_TRUE(is_hex_id(id)) << id;
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST_F(EngineTest, runs_stateless_request) {
    EXECORE_REQUIRE_INTERPRETER(Language::PYTHON);
    Engine engine(config());

    auto result = engine.execute(stateless("print('hello')"));
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS) << result.error.value_or("");
    EXPECT_EQ(result.output, "hello\n");
    EXPECT_TRUE(result.session_id.empty());
    EXPECT_FALSE(result.execution_count);

    engine.flush_records();
    auto records = engine.history().entries();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].mode, ExecutionMode::STATELESS);
    EXPECT_EQ(records[0].output_bytes, 6u);
}

TEST_F(EngineTest, blocks_code_before_spawning) {
    Engine engine(config());
    auto before = runtime::ChildProcess::spawn_count();

    auto result = engine.execute(stateless("import subprocess"));
    EXPECT_EQ(result.error_kind, ErrorKind::SECURITY_VIOLATION);

    auto session_result = engine.execute(in_session("import socket", std::string("guarded")));
    EXPECT_EQ(session_result.error_kind, ErrorKind::SECURITY_VIOLATION);
    EXPECT_EQ(session_result.session_id, "guarded");

    EXPECT_EQ(runtime::ChildProcess::spawn_count(), before);
}

TEST_F(EngineTest, short_timeout_is_raised_to_minimum) {
    EXECORE_REQUIRE_INTERPRETER(Language::PYTHON);
    Engine engine(config());

    auto result = engine.execute(stateless("import time\ntime.sleep(0.3)\nprint('done')", 10ms));
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS) << result.error.value_or("");
    EXPECT_EQ(result.output, "done\n");
}

TEST_F(EngineTest, session_requests_share_state) {
    EXECORE_REQUIRE_SESSION_RUNTIME(Language::PYTHON);
    Engine engine(config());

    auto first = engine.execute(in_session("counter = 10"));
    ASSERT_EQ(first.status, ExecutionStatus::SUCCESS) << first.error.value_or("");
    EXPECT_TRUE(is_hex_id(first.session_id)) << first.session_id;

    auto second = engine.execute(in_session("counter += 1\ncounter", first.session_id));
    EXPECT_EQ(second.status, ExecutionStatus::SUCCESS) << second.error.value_or("");
    EXPECT_EQ(second.output, "11\n");
    EXPECT_EQ(second.execution_count, std::optional<uint64_t>(2));

    auto sessions = engine.list_sessions();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].session_id, first.session_id);

    EXPECT_TRUE(engine.kill(first.session_id));
    EXPECT_TRUE(engine.list_sessions().empty());
    EXPECT_FALSE(engine.interrupt(first.session_id));
}

TEST_F(EngineTest, session_streaming_reports_rich_output) {
    EXECORE_REQUIRE_SESSION_RUNTIME(Language::PYTHON);
    Engine engine(config());

    std::vector<OutputKind> kinds;
    auto result = engine.execute_streaming(in_session("print('a')\n6 * 7", std::string("stream")),
        [&](OutputKind kind, const std::string&) { kinds.push_back(kind); });

    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS) << result.error.value_or("");
    EXPECT_EQ(result.output, "a\n42\n");
    std::vector<OutputKind> expected = {OutputKind::STDOUT, OutputKind::RESULT};
    EXPECT_EQ(kinds, expected);
}

TEST_F(EngineTest, falls_back_to_stateless_without_session_runtime) {
    EXECORE_REQUIRE_INTERPRETER(Language::PYTHON);
    Engine engine(config(), std::make_shared<StatelessOnlyLocator>());
    EXPECT_FALSE(engine.supports_sessions(Language::PYTHON));

    auto result = engine.execute(in_session("print(3)", std::string("fallback")));
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS) << result.error.value_or("");
    EXPECT_EQ(result.output, "3\n");
    EXPECT_EQ(result.session_id, "fallback");
    EXPECT_TRUE(engine.list_sessions().empty());
}

TEST_F(EngineTest, persistence_hook_sees_every_record) {
    Engine engine(config());

    std::atomic<int> calls{0};
    engine.set_persistence_hook([&](const ExecutionRecord& record) {
        calls++;
        if (record.sequence_id == 1) {
            throw std::runtime_error("database unavailable");
        }
    });

    engine.execute(stateless("import subprocess"));
    engine.execute(stateless("eval('1')"));
    engine.flush_records();

    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(engine.history().size(), 2u);
}

TEST_F(EngineTest, submit_runs_concurrently) {
    EXECORE_REQUIRE_INTERPRETER(Language::PYTHON);
    Engine engine(config());

    std::vector<std::future<ExecutionResult>> futures;
    for (int i = 0; i < 4; i++) {
        futures.push_back(engine.submit(stateless("print(" + std::to_string(i) + ")")));
    }
    for (int i = 0; i < 4; i++) {
        auto result = futures[i].get();
        EXPECT_EQ(result.status, ExecutionStatus::SUCCESS) << result.error.value_or("");
        EXPECT_EQ(result.output, std::to_string(i) + "\n");
    }
}

TEST_F(EngineTest, status_reports_counters) {
    Engine engine(config());
    engine.start();
    engine.execute(stateless("import subprocess"));
    engine.flush_records();

    auto status = engine.status();
    EXPECT_EQ(status["executions"], 1);
    EXPECT_EQ(status["sessions"]["active"], 0);
    EXPECT_EQ(status["sessions"]["capacity"], 3);
    EXPECT_EQ(status["history_entries"], 1);
    EXPECT_TRUE(status["reaper_running"].get<bool>());
    EXPECT_TRUE(status["languages"].is_array());

    engine.shutdown_all();
    EXPECT_FALSE(engine.status()["reaper_running"].get<bool>());
}
