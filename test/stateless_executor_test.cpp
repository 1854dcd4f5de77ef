#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>
#include "runtime/child_process.hpp"
#include "runtime/stateless_executor.hpp"
#include "util/base64.hpp"
#include "test_support.hpp"

using namespace execore;
using namespace execore::runtime;
using namespace std::chrono_literals;

namespace {

class NoInterpreterLocator : public RuntimeLocator {
public:
    std::optional<std::string> find_interpreter(Language) const override { return std::nullopt; }
    std::optional<std::string> find_session_driver(Language) const override { return std::nullopt; }
};

class StatelessExecutorTest : public ::testing::Test {
protected:
    test::TempRoot root_;
    security::SecurityFilter filter_;
    DefaultRuntimeLocator locator_;

    StatelessConfig config() const {
        StatelessConfig config;
        config.temp_dir = root_.path();
        return config;
    }

    ExecutionResult run(const std::string& code, Language language = Language::PYTHON,
                        std::chrono::milliseconds timeout = 10s,
                        const OutputCallback& on_output = nullptr) {
        StatelessExecutor executor(config(), filter_, locator_);
        return executor.run(code, language, timeout, on_output);
    }
};

} // namespace

TEST_F(StatelessExecutorTest, prints_hello) {
    EXECORE_REQUIRE_INTERPRETER(Language::PYTHON);

    auto result = run("print('hello')", Language::PYTHON, 5s);
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS) << result.error.value_or("");
    EXPECT_EQ(result.output, "hello\n");
    EXPECT_FALSE(result.error);
    EXPECT_TRUE(result.visualizations.empty());
    EXPECT_TRUE(result.session_id.empty());
    EXPECT_LE(result.execution_time, 5000ms);
    EXPECT_EQ(root_.entry_count(), 0u);
}

TEST_F(StatelessExecutorTest, blocked_code_never_spawns) {
    auto before = ChildProcess::spawn_count();

    auto result = run("import subprocess\nsubprocess.run(['ls'])");
    EXPECT_EQ(result.status, ExecutionStatus::ERROR);
    EXPECT_EQ(result.error_kind, ErrorKind::SECURITY_VIOLATION);
    EXPECT_TRUE(test::contains(result.error.value_or(""), "Security violation"));
    EXPECT_EQ(ChildProcess::spawn_count(), before);
    EXPECT_EQ(root_.entry_count(), 0u);
}

TEST_F(StatelessExecutorTest, timeout_kills_process_and_cleans_up) {
    EXECORE_REQUIRE_INTERPRETER(Language::PYTHON);

    auto result = run("print('partial', flush=True)\nwhile True:\n    pass", Language::PYTHON, 1000ms);
    EXPECT_EQ(result.status, ExecutionStatus::TIMEOUT);
    EXPECT_EQ(result.error_kind, ErrorKind::EXECUTION_TIMEOUT);
    EXPECT_EQ(result.error.value_or(""), "Execution timed out after 1.0 seconds");
    EXPECT_EQ(result.execution_time, 1000ms);
    EXPECT_EQ(result.output, "partial\n");
    EXPECT_EQ(root_.entry_count(), 0u);

    // Nothing keeps running in the removed working directory
    auto survivors = test::processes_inside(root_.path());
    for (int i = 0; i < 20 && !survivors.empty(); i++) {
        std::this_thread::sleep_for(100ms);
        survivors = test::processes_inside(root_.path());
    }
    EXPECT_TRUE(survivors.empty()) << "still running: " << survivors.front();
}

TEST_F(StatelessExecutorTest, runtime_error_reports_traceback) {
    EXECORE_REQUIRE_INTERPRETER(Language::PYTHON);

    auto result = run("print('before')\n1 / 0");
    EXPECT_EQ(result.status, ExecutionStatus::ERROR);
    EXPECT_EQ(result.error_kind, ErrorKind::RUNTIME_FAILURE);
    EXPECT_EQ(result.output, "before\n");
    EXPECT_TRUE(test::contains(result.error.value_or(""), "ZeroDivisionError"));
    EXPECT_FALSE(test::contains(result.error.value_or(""), "_runner.py"));
}

TEST_F(StatelessExecutorTest, system_exit_code_is_reported) {
    EXECORE_REQUIRE_INTERPRETER(Language::PYTHON);

    auto result = run("raise SystemExit(4)");
    EXPECT_EQ(result.status, ExecutionStatus::ERROR);
    EXPECT_EQ(result.error.value_or(""), "Process exited with code 4");
}

TEST_F(StatelessExecutorTest, collects_artifacts_from_working_dir) {
    EXECORE_REQUIRE_INTERPRETER(Language::PYTHON);

    auto result = run(
        "import io\n"
        "io.FileIO('data_stats.json', 'w').write(b'{\"mean\": 2.5}')\n"
        "io.FileIO('chart.png', 'w').write(b'PNG')\n");
    ASSERT_EQ(result.status, ExecutionStatus::SUCCESS) << result.error.value_or("");
    EXPECT_EQ(result.visualizations, std::vector<std::string>{util::base64_encode("PNG")});
    EXPECT_EQ(result.structured_data["data_stats"]["mean"], 2.5);
}

TEST_F(StatelessExecutorTest, streams_output_before_result) {
    EXECORE_REQUIRE_INTERPRETER(Language::PYTHON);

    std::string streamed_out;
    std::string streamed_err;
    auto result = run("import time\nprint('a')\ntime.sleep(0.2)\nprint('b')\nraise ValueError('x')",
        Language::PYTHON, 10s,
        [&](OutputKind kind, const std::string& content) {
            if (kind == OutputKind::STDOUT) streamed_out += content;
            if (kind == OutputKind::STDERR) streamed_err += content;
        });

    EXPECT_EQ(streamed_out, "a\nb\n");
    EXPECT_EQ(streamed_out, result.output);
    EXPECT_EQ(streamed_err, result.error.value_or(""));
}

TEST_F(StatelessExecutorTest, output_is_truncated) {
    EXECORE_REQUIRE_INTERPRETER(Language::PYTHON);

    auto cfg = config();
    cfg.max_output_bytes = 100;
    StatelessExecutor executor(cfg, filter_, locator_);

    auto result = executor.run("print('x' * 10000)", Language::PYTHON, 10s);
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(result.output.substr(0, 100), std::string(100, 'x'));
    EXPECT_TRUE(test::contains(result.output, "[output truncated]"));
}

TEST_F(StatelessExecutorTest, missing_interpreter_is_internal_error) {
    NoInterpreterLocator missing;
    StatelessExecutor executor(config(), filter_, missing);

    auto result = executor.run("print(1)", Language::PYTHON, 5s);
    EXPECT_EQ(result.status, ExecutionStatus::ERROR);
    EXPECT_EQ(result.error_kind, ErrorKind::INTERNAL_ERROR);
    EXPECT_TRUE(test::contains(result.error.value_or(""), "No interpreter available for python"));
}

TEST_F(StatelessExecutorTest, runs_javascript) {
    EXECORE_REQUIRE_INTERPRETER(Language::JAVASCRIPT);

    auto result = run("console.log(1 + 1)", Language::JAVASCRIPT);
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS) << result.error.value_or("");
    EXPECT_EQ(result.output, "2\n");
}
