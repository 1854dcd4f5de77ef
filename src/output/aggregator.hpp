/**
 * execore Output Aggregator
 *
 * Folds an ordered stream of OutputEvents (session mode) or captured
 * stdout/stderr plus directory artifacts (stateless mode) into one
 * ExecutionResult. Classification:
 *
 *   stream          -> output, streamed as stdout
 *   result/display  -> text/plain to output, image/png to visualizations,
 *                      text/html to data["html"], application/json to data["json"]
 *   error           -> error ("ename: evalue" + traceback), streamed as stderr
 *   status idle     -> submission complete
 *   reply != ok     -> submission complete, error if none captured yet
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "core/types.hpp"
#include "output/output_event.hpp"

namespace execore::output {

class OutputAggregator {
public:
    explicit OutputAggregator(OutputCallback on_output = nullptr);

    // Returns true once the submission is complete
    bool consume(const OutputEvent& event);
    bool consume_reply(const ExecuteReply& reply);

    bool complete() const { return complete_; }
    size_t event_count() const { return event_count_; }

    // Result so far; SUCCESS unless an error was captured
    ExecutionResult finish() const;

private:
    OutputCallback on_output_;
    ExecutionResult result_;
    bool complete_ = false;
    size_t event_count_ = 0;

    void emit(OutputKind kind, const std::string& content);
    void add_bundle(const MimeBundle& bundle);
};

// Batch form of OutputAggregator
ExecutionResult aggregate(const std::vector<OutputEvent>& events,
                          const std::optional<ExecuteReply>& reply = std::nullopt);

// What a one-shot process left behind
struct ProcessOutput {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    int term_signal = 0;
};

// Stateless result: status from the exit code, error from stderr, plus
// images (*.png, *.jpg, *.jpeg) and data_*.json files found in `artifact_dir`
ExecutionResult aggregate_process_output(const ProcessOutput& process,
                                         const std::filesystem::path& artifact_dir);

// Append artifacts from `dir` to `result`
void collect_artifacts(const std::filesystem::path& dir, ExecutionResult& result);

} // namespace execore::output
