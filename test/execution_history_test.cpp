#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include "engine/execution_history.hpp"
#include "test_support.hpp"

using namespace execore;
using namespace std::chrono_literals;

namespace {

ExecutionRecord make_record(const std::string& session_id, ExecutionStatus status = ExecutionStatus::SUCCESS) {
    ExecutionRecord record;
    record.session_id = session_id;
    record.mode = session_id.empty() ? ExecutionMode::STATELESS : ExecutionMode::SESSION;
    record.code = "print(1)";
    record.status = status;
    record.execution_time = 250ms;
    return record;
}

size_t line_count(const std::string& text) {
    size_t count = 0;
    for (char c : text) {
        if (c == '\n') count++;
    }
    return count;
}

} // namespace

TEST(execution_history, assigns_increasing_sequence_ids) {
    ExecutionHistory history;
    EXPECT_EQ(history.record(make_record("")), 1u);
    EXPECT_EQ(history.record(make_record("")), 2u);
    EXPECT_EQ(history.last_sequence_id(), 2u);

    auto entries = history.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].sequence_id, 1u);
    EXPECT_NE(entries[0].timestamp, std::chrono::system_clock::time_point{});
}

TEST(execution_history, keeps_most_recent_entries) {
    ExecutionHistory history(3);
    for (int i = 0; i < 5; i++) {
        history.record(make_record(""));
    }
    EXPECT_EQ(history.size(), 3u);

    auto entries = history.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries.front().sequence_id, 3u);
    EXPECT_EQ(entries.back().sequence_id, 5u);

    // Sequence ids keep increasing after a clear
    history.clear();
    EXPECT_EQ(history.size(), 0u);
    EXPECT_EQ(history.record(make_record("")), 6u);
}

TEST(execution_history, pages_by_sequence) {
    ExecutionHistory history;
    for (int i = 0; i < 10; i++) {
        history.record(make_record(""));
    }

    auto page = history.entries(4, 3);
    ASSERT_EQ(page.size(), 3u);
    EXPECT_EQ(page[0].sequence_id, 5u);
    EXPECT_EQ(page[2].sequence_id, 7u);
    EXPECT_TRUE(history.entries(10).empty());
}

TEST(execution_history, filters_by_session) {
    ExecutionHistory history;
    history.record(make_record("a"));
    history.record(make_record("b"));
    history.record(make_record("a", ExecutionStatus::ERROR));
    history.record(make_record("a"));

    auto all = history.entries_for_session("a");
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].sequence_id, 1u);
    EXPECT_EQ(all[1].status, ExecutionStatus::ERROR);

    auto recent = history.entries_for_session("a", 2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].sequence_id, 3u);
    EXPECT_EQ(recent[1].sequence_id, 4u);
}

TEST(execution_history, record_json_fields) {
    ExecutionHistory history;
    history.record(make_record(""));
    history.record(make_record("s1", ExecutionStatus::TIMEOUT));

    auto entries = history.entries();
    auto stateless = entries[0].to_json();
    EXPECT_TRUE(stateless["session_id"].is_null());
    EXPECT_EQ(stateless["mode"], "stateless");
    EXPECT_EQ(stateless["execution_time"], 0.25);

    auto session = entries[1].to_json();
    EXPECT_EQ(session["session_id"], "s1");
    EXPECT_EQ(session["status"], "timeout");

    auto exported = history.export_jsonl();
    EXPECT_EQ(line_count(exported), 2u);
}

TEST(execution_history, from_result_summarizes_output) {
    ExecutionRequest request;
    request.code = "x";
    request.mode = ExecutionMode::SESSION;

    ExecutionResult result;
    result.output = "hello\n";
    result.visualizations = {"AAAA", "BBBB"};
    result.session_id = "s";
    result.execution_time = 40ms;

    auto record = ExecutionRecord::from_result(request, result);
    EXPECT_EQ(record.output_bytes, 6u);
    EXPECT_EQ(record.visualization_count, 2u);
    EXPECT_EQ(record.session_id, "s");
    EXPECT_EQ(record.mode, ExecutionMode::SESSION);
}

TEST(execution_history, appends_to_file_and_reloads) {
    test::TempRoot root;
    auto path = (root.path() / "history.jsonl").string();

    {
        ExecutionHistory history(100, path);
        history.record(make_record("a"));
        history.record(make_record("", ExecutionStatus::ERROR));
    }
    {
        std::ofstream out(path, std::ios::app);
        out << "{ truncated line\n";
    }

    ExecutionHistory reloaded;
    std::string error;
    ASSERT_TRUE(reloaded.load(path, error)) << error;
    ASSERT_EQ(reloaded.size(), 2u);

    auto entries = reloaded.entries();
    EXPECT_EQ(entries[0].session_id, "a");
    EXPECT_EQ(entries[0].execution_time, 250ms);
    EXPECT_EQ(entries[1].status, ExecutionStatus::ERROR);
    EXPECT_EQ(reloaded.record(make_record("")), 3u);

    EXPECT_FALSE(reloaded.load((root.path() / "missing.jsonl").string(), error));
}
