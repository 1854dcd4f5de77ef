#include "output/aggregator.hpp"
#include "util/base64.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>

namespace fs = std::filesystem;

namespace execore::output {

using json = nlohmann::json;

// ============================================================================
// OutputAggregator Implementation
// ============================================================================

OutputAggregator::OutputAggregator(OutputCallback on_output)
    : on_output_(std::move(on_output)) {}

void OutputAggregator::emit(OutputKind kind, const std::string& content) {
    if (!on_output_) {
        return;
    }
    try {
        on_output_(kind, content);
    } catch (const std::exception& e) {
        spdlog::warn("Output callback threw on {} chunk: {}", output_kind_to_string(kind), e.what());
    }
}

void OutputAggregator::add_bundle(const MimeBundle& bundle) {
    if (bundle.text_plain) {
        result_.output += *bundle.text_plain + "\n";
        emit(OutputKind::RESULT, *bundle.text_plain);
    }
    if (bundle.image_png) {
        result_.visualizations.push_back(*bundle.image_png);
        emit(OutputKind::VISUALIZATION, *bundle.image_png);
    }
    if (bundle.text_html) {
        auto& html = result_.structured_data["html"];
        if (html.is_string()) {
            html = html.get<std::string>() + "\n" + *bundle.text_html;
        } else {
            html = *bundle.text_html;
        }
    }
    if (bundle.application_json) {
        auto& data = result_.structured_data["json"];
        if (data.is_object() && bundle.application_json->is_object()) {
            data.update(*bundle.application_json);
        } else {
            data = *bundle.application_json;
        }
    }
}

bool OutputAggregator::consume(const OutputEvent& event) {
    event_count_++;

    std::visit(overloaded{
        [&](const StreamEvent& e) {
            result_.output += e.text;
            emit(OutputKind::STDOUT, e.text);
        },
        [&](const ResultEvent& e) {
            add_bundle(e.data);
        },
        [&](const DisplayEvent& e) {
            add_bundle(e.data);
        },
        [&](const ErrorEvent& e) {
            std::string text = e.text();
            result_.error = text;
            emit(OutputKind::STDERR, text);
        },
        [&](const StatusEvent& e) {
            if (e.state == ExecutionState::IDLE) {
                complete_ = true;
            }
        },
    }, event);

    return complete_;
}

bool OutputAggregator::consume_reply(const ExecuteReply& reply) {
    if (reply.status == ReplyStatus::OK) {
        return complete_;
    }

    if (!result_.error) {
        if (!reply.ename.empty()) {
            result_.error = ErrorEvent{reply.ename, reply.evalue, reply.traceback}.text();
        } else if (reply.status == ReplyStatus::ABORTED) {
            result_.error = "Execution aborted";
        } else {
            result_.error = "Execution failed";
        }
    }
    complete_ = true;
    return complete_;
}

ExecutionResult OutputAggregator::finish() const {
    ExecutionResult result = result_;
    if (result.error) {
        result.status = ExecutionStatus::ERROR;
        result.error_kind = ErrorKind::RUNTIME_FAILURE;
    } else {
        result.status = ExecutionStatus::SUCCESS;
        result.error_kind = ErrorKind::NONE;
    }
    return result;
}

ExecutionResult aggregate(const std::vector<OutputEvent>& events,
                          const std::optional<ExecuteReply>& reply) {
    OutputAggregator aggregator;
    for (const auto& event : events) {
        aggregator.consume(event);
    }
    if (reply) {
        aggregator.consume_reply(*reply);
    }
    return aggregator.finish();
}

// ============================================================================
// Stateless process output
// ============================================================================

static std::string lower_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

void collect_artifacts(const fs::path& dir, ExecutionResult& result) {
    std::vector<fs::path> images;
    std::vector<fs::path> data_files;

    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        // Symlinks could point outside the sandbox directory
        std::error_code status_ec;
        if (!fs::is_regular_file(it->symlink_status(status_ec)) || status_ec) {
            continue;
        }

        const fs::path& path = it->path();
        std::string name = path.filename().string();
        std::string ext = lower_extension(path);

        if (ext == ".png" || ext == ".jpg" || ext == ".jpeg") {
            images.push_back(path);
        } else if (ext == ".json" && name.rfind("data_", 0) == 0) {
            data_files.push_back(path);
        }
    }
    if (ec) {
        spdlog::warn("Failed to scan artifacts in {}: {}", dir.string(), ec.message());
    }

    std::sort(images.begin(), images.end());
    std::sort(data_files.begin(), data_files.end());

    for (const auto& image : images) {
        auto encoded = util::base64_encode_file(image);
        if (!encoded) {
            spdlog::warn("Failed to read image artifact {}", image.filename().string());
            continue;
        }
        result.visualizations.push_back(std::move(*encoded));
    }

    for (const auto& file : data_files) {
        std::ifstream in(file);
        json value = json::parse(in, nullptr, false);
        if (value.is_discarded()) {
            spdlog::warn("Ignoring malformed data artifact {}", file.filename().string());
            continue;
        }
        result.structured_data[file.stem().string()] = std::move(value);
    }
}

ExecutionResult aggregate_process_output(const ProcessOutput& process, const fs::path& artifact_dir) {
    ExecutionResult result;
    result.output = process.stdout_text;

    if (!process.stderr_text.empty()) {
        result.error = process.stderr_text;
    }

    if (process.exit_code == 0) {
        result.status = ExecutionStatus::SUCCESS;
        result.error_kind = ErrorKind::NONE;
    } else {
        result.status = ExecutionStatus::ERROR;
        result.error_kind = ErrorKind::RUNTIME_FAILURE;
        if (!result.error) {
            if (process.term_signal != 0) {
                result.error = "Process killed by signal " + std::to_string(process.term_signal) +
                               " (" + strsignal(process.term_signal) + ")";
            } else {
                result.error = "Process exited with code " + std::to_string(process.exit_code);
            }
        }
    }

    if (!artifact_dir.empty()) {
        collect_artifacts(artifact_dir, result);
    }
    return result;
}

} // namespace execore::output
