#include "engine/execution_history.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace execore {

using json = nlohmann::json;

// ============================================================================
// ExecutionRecord
// ============================================================================

json ExecutionRecord::to_json() const {
    json j;
    j["sequence_id"] = sequence_id;
    j["timestamp"] = format_timestamp(timestamp);
    j["session_id"] = session_id.empty() ? json(nullptr) : json(session_id);
    j["language"] = language_to_string(language);
    j["mode"] = execution_mode_to_string(mode);
    j["code"] = code;
    j["status"] = execution_status_to_string(status);
    j["error_kind"] = error_kind_to_string(error_kind);
    j["execution_time"] = execution_time.count() / 1000.0;
    j["output_bytes"] = output_bytes;
    j["visualization_count"] = visualization_count;
    return j;
}

static std::chrono::system_clock::time_point parse_timestamp(const std::string& str) {
    std::tm tm{};
    std::istringstream iss(str);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::chrono::system_clock::now();
    }
    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
    int ms = 0;
    if (iss.peek() == '.') {
        iss.get();
        iss >> ms;
    }
    return tp + std::chrono::milliseconds(ms);
}

ExecutionRecord ExecutionRecord::from_json(const json& j) {
    ExecutionRecord record;
    record.sequence_id = j.value("sequence_id", 0ULL);
    if (j.contains("timestamp") && j["timestamp"].is_string()) {
        record.timestamp = parse_timestamp(j["timestamp"].get<std::string>());
    }
    if (j.contains("session_id") && j["session_id"].is_string()) {
        record.session_id = j["session_id"].get<std::string>();
    }
    if (j.contains("language") && j["language"].is_string()) {
        record.language = language_from_string(j["language"].get<std::string>()).value_or(Language::PYTHON);
    }
    if (j.contains("mode") && j["mode"].is_string()) {
        record.mode = execution_mode_from_string(j["mode"].get<std::string>()).value_or(ExecutionMode::STATELESS);
    }
    if (j.contains("code") && j["code"].is_string()) {
        record.code = j["code"].get<std::string>();
    }

    std::string status = j.value("status", std::string("success"));
    if (status == "error") record.status = ExecutionStatus::ERROR;
    else if (status == "timeout") record.status = ExecutionStatus::TIMEOUT;

    std::string kind = j.value("error_kind", std::string("none"));
    for (auto k : {ErrorKind::SECURITY_VIOLATION, ErrorKind::EXECUTION_TIMEOUT,
                   ErrorKind::RUNTIME_FAILURE, ErrorKind::INTERNAL_ERROR}) {
        if (kind == error_kind_to_string(k)) record.error_kind = k;
    }

    if (j.contains("execution_time") && j["execution_time"].is_number()) {
        record.execution_time = std::chrono::milliseconds(
            static_cast<int64_t>(j["execution_time"].get<double>() * 1000 + 0.5));
    }
    record.output_bytes = j.value("output_bytes", size_t(0));
    record.visualization_count = j.value("visualization_count", size_t(0));
    return record;
}

ExecutionRecord ExecutionRecord::from_result(const ExecutionRequest& request, const ExecutionResult& result) {
    ExecutionRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.session_id = result.session_id;
    record.language = request.language;
    record.mode = request.mode;
    record.code = request.code;
    record.status = result.status;
    record.error_kind = result.error_kind;
    record.execution_time = result.execution_time;
    record.output_bytes = result.output.size();
    record.visualization_count = result.visualizations.size();
    return record;
}

// ============================================================================
// ExecutionHistory Implementation
// ============================================================================

ExecutionHistory::ExecutionHistory(size_t max_entries, std::string path)
    : max_entries_(max_entries)
    , path_(std::move(path)) {
    if (!path_.empty()) {
        file_.open(path_, std::ios::app);
        if (!file_) {
            spdlog::error("Cannot open history file {}, keeping history in memory only", path_);
        }
    }
    spdlog::debug("ExecutionHistory initialized (max_entries={})", max_entries_);
}

uint64_t ExecutionHistory::record(ExecutionRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);

    record.sequence_id = next_sequence_id_++;
    if (record.timestamp == std::chrono::system_clock::time_point{}) {
        record.timestamp = std::chrono::system_clock::now();
    }

    if (file_.is_open()) {
        file_ << record.to_json().dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
        file_.flush();
        if (!file_) {
            spdlog::error("Failed to append to history file {}", path_);
            file_.close();
        }
    }

    entries_.push_back(std::move(record));
    trim_entries();

    spdlog::trace("Recorded execution seq={}", entries_.back().sequence_id);
    return entries_.back().sequence_id;
}

void ExecutionHistory::trim_entries() {
    while (entries_.size() > max_entries_) {
        entries_.pop_front();
    }
}

std::vector<ExecutionRecord> ExecutionHistory::entries(uint64_t start_sequence, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ExecutionRecord> result;

    for (const auto& entry : entries_) {
        if (entry.sequence_id > start_sequence) {
            result.push_back(entry);
            if (result.size() >= limit) {
                break;
            }
        }
    }

    return result;
}

std::vector<ExecutionRecord> ExecutionHistory::entries_for_session(const std::string& session_id,
                                                                   size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ExecutionRecord> result;

    for (auto it = entries_.rbegin(); it != entries_.rend() && result.size() < limit; ++it) {
        if (it->session_id == session_id) {
            result.push_back(*it);
        }
    }

    std::reverse(result.begin(), result.end());
    return result;
}

std::string ExecutionHistory::export_jsonl() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string out;
    for (const auto& entry : entries_) {
        out += entry.to_json().dump(-1, ' ', false, json::error_handler_t::replace);
        out += '\n';
    }
    return out;
}

bool ExecutionHistory::load(const std::string& path, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open " + path;
        return false;
    }

    std::deque<ExecutionRecord> loaded;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (line.empty()) {
            continue;
        }
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            spdlog::warn("Skipping malformed history line {} in {}", line_no, path);
            continue;
        }
        loaded.push_back(ExecutionRecord::from_json(j));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& record : loaded) {
        next_sequence_id_ = std::max(next_sequence_id_, record.sequence_id + 1);
        entries_.push_back(std::move(record));
    }
    std::stable_sort(entries_.begin(), entries_.end(),
        [](const ExecutionRecord& a, const ExecutionRecord& b) { return a.sequence_id < b.sequence_id; });
    trim_entries();

    spdlog::info("Loaded {} history entries from {}", loaded.size(), path);
    return true;
}

size_t ExecutionHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ExecutionHistory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

uint64_t ExecutionHistory::last_sequence_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_sequence_id_ - 1;
}

} // namespace execore
