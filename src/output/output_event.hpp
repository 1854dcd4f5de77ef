/**
 * execore Output Events
 *
 * Closed set of messages a session driver emits while running a submission,
 * plus the control-channel reply that closes it.
 */
#pragma once
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "ipc/protocol.hpp"

namespace execore::output {

// Rich representations of one value; absent entries were not provided
struct MimeBundle {
    std::optional<std::string> text_plain;       // text/plain
    std::optional<std::string> image_png;        // image/png, base64
    std::optional<std::string> text_html;        // text/html
    std::optional<nlohmann::json> application_json;  // application/json

    static MimeBundle from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct StreamEvent {
    std::string name;       // "stdout" or "stderr"
    std::string text;
};

struct ResultEvent {
    MimeBundle data;
    uint64_t execution_count = 0;
};

struct DisplayEvent {
    MimeBundle data;
};

struct ErrorEvent {
    std::string ename;
    std::string evalue;
    std::vector<std::string> traceback;

    // "ename: evalue" followed by the traceback lines
    std::string text() const;
};

enum class ExecutionState {
    STARTING,
    BUSY,
    IDLE
};

struct StatusEvent {
    ExecutionState state = ExecutionState::IDLE;
};

using OutputEvent = std::variant<StreamEvent, ResultEvent, DisplayEvent, ErrorEvent, StatusEvent>;

// Visitor helper for exhaustive std::visit over OutputEvent
template <typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

enum class ReplyStatus {
    OK,
    ERROR,
    ABORTED
};

const char* reply_status_to_string(ReplyStatus status);

struct ExecuteReply {
    ReplyStatus status = ReplyStatus::OK;
    uint64_t execution_count = 0;
    std::string ename;
    std::string evalue;
    std::vector<std::string> traceback;
};

// Decode an event-channel message; nullopt for other kinds or malformed payloads
std::optional<OutputEvent> decode_event(const ipc::Message& msg);

// Decode an EXECUTE_REPLY message
std::optional<ExecuteReply> decode_reply(const ipc::Message& msg);

// Encode an event as its wire message (drivers and tests)
ipc::Message encode_event(uint32_t msg_id, const OutputEvent& event);

} // namespace execore::output
