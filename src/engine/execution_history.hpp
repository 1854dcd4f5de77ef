/**
 * execore Execution History
 *
 * Bounded in-memory record of completed executions, optionally mirrored to
 * a JSON-lines file. Installed by the engine as its default persistence hook.
 */
#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace execore {

// One completed execution, as handed to persistence hooks
struct ExecutionRecord {
    uint64_t sequence_id = 0;                   // Assigned by ExecutionHistory
    std::chrono::system_clock::time_point timestamp;
    std::string session_id;                     // Empty for stateless runs
    Language language = Language::PYTHON;
    ExecutionMode mode = ExecutionMode::STATELESS;
    std::string code;
    ExecutionStatus status = ExecutionStatus::SUCCESS;
    ErrorKind error_kind = ErrorKind::NONE;
    std::chrono::milliseconds execution_time{0};
    size_t output_bytes = 0;
    size_t visualization_count = 0;

    nlohmann::json to_json() const;
    static ExecutionRecord from_json(const nlohmann::json& j);

    static ExecutionRecord from_result(const ExecutionRequest& request, const ExecutionResult& result);
};

class ExecutionHistory {
public:
    explicit ExecutionHistory(size_t max_entries = 1000, std::string path = "");
    ~ExecutionHistory() = default;

    // Assigns the sequence id and timestamp (when unset); returns the sequence id
    uint64_t record(ExecutionRecord record);

    // Records after `start_sequence`, oldest first
    std::vector<ExecutionRecord> entries(uint64_t start_sequence = 0, size_t limit = 100) const;

    // Most recent records of one session, oldest first
    std::vector<ExecutionRecord> entries_for_session(const std::string& session_id, size_t limit = 100) const;

    // One JSON object per line
    std::string export_jsonl() const;

    // Reload records from a JSONL file written by this class
    bool load(const std::string& path, std::string& error);

    size_t size() const;
    void clear();
    uint64_t last_sequence_id() const;

private:
    size_t max_entries_;
    std::string path_;
    std::ofstream file_;

    mutable std::mutex mutex_;
    std::deque<ExecutionRecord> entries_;
    uint64_t next_sequence_id_ = 1;

    void trim_entries();
};

} // namespace execore
