#include "output/output_event.hpp"
#include <spdlog/spdlog.h>

namespace execore::output {

using json = nlohmann::json;

static std::vector<std::string> string_list(const json& j) {
    std::vector<std::string> out;
    if (!j.is_array()) return out;
    for (const auto& item : j) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

static std::string string_field(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

// ============================================================================
// MimeBundle / ErrorEvent
// ============================================================================

MimeBundle MimeBundle::from_json(const json& j) {
    MimeBundle bundle;
    if (!j.is_object()) return bundle;

    if (j.contains("text/plain") && j["text/plain"].is_string()) {
        bundle.text_plain = j["text/plain"].get<std::string>();
    }
    if (j.contains("image/png") && j["image/png"].is_string()) {
        bundle.image_png = j["image/png"].get<std::string>();
    }
    if (j.contains("text/html") && j["text/html"].is_string()) {
        bundle.text_html = j["text/html"].get<std::string>();
    }
    if (j.contains("application/json")) {
        bundle.application_json = j["application/json"];
    }
    return bundle;
}

json MimeBundle::to_json() const {
    json j = json::object();
    if (text_plain) j["text/plain"] = *text_plain;
    if (image_png) j["image/png"] = *image_png;
    if (text_html) j["text/html"] = *text_html;
    if (application_json) j["application/json"] = *application_json;
    return j;
}

std::string ErrorEvent::text() const {
    std::string out = ename + ": " + evalue + "\n";
    for (const auto& line : traceback) {
        out += line;
        if (!line.empty() && line.back() != '\n') out += "\n";
    }
    return out;
}

const char* reply_status_to_string(ReplyStatus status) {
    switch (status) {
        case ReplyStatus::OK:      return "ok";
        case ReplyStatus::ERROR:   return "error";
        case ReplyStatus::ABORTED: return "aborted";
        default: return "unknown";
    }
}

// ============================================================================
// Decoding
// ============================================================================

std::optional<OutputEvent> decode_event(const ipc::Message& msg) {
    json j = json::parse(msg.payload.begin(), msg.payload.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("Malformed {} payload (id={})", ipc::kind_to_string(msg.kind), msg.msg_id);
        return std::nullopt;
    }

    switch (msg.kind) {
        case ipc::MessageKind::STREAM: {
            std::string name = string_field(j, "name");
            return StreamEvent{name.empty() ? "stdout" : name, string_field(j, "text")};
        }

        case ipc::MessageKind::RESULT: {
            ResultEvent event;
            event.data = MimeBundle::from_json(j.value("data", json::object()));
            if (j.contains("execution_count") && j["execution_count"].is_number_integer() &&
                j["execution_count"].get<int64_t>() >= 0) {
                event.execution_count = j["execution_count"].get<uint64_t>();
            }
            return event;
        }

        case ipc::MessageKind::DISPLAY:
            return DisplayEvent{MimeBundle::from_json(j.value("data", json::object()))};

        case ipc::MessageKind::ERROR:
            return ErrorEvent{string_field(j, "ename"), string_field(j, "evalue"),
                              string_list(j.value("traceback", json::array()))};

        case ipc::MessageKind::STATUS: {
            std::string state = string_field(j, "execution_state");
            if (state == "busy") return StatusEvent{ExecutionState::BUSY};
            if (state == "idle") return StatusEvent{ExecutionState::IDLE};
            if (state == "starting") return StatusEvent{ExecutionState::STARTING};
            spdlog::warn("Unknown execution_state '{}' (id={})", state, msg.msg_id);
            return std::nullopt;
        }

        default:
            return std::nullopt;
    }
}

std::optional<ExecuteReply> decode_reply(const ipc::Message& msg) {
    if (msg.kind != ipc::MessageKind::EXECUTE_REPLY) {
        return std::nullopt;
    }

    json j = json::parse(msg.payload.begin(), msg.payload.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("Malformed EXECUTE_REPLY payload (id={})", msg.msg_id);
        return std::nullopt;
    }

    ExecuteReply reply;
    std::string status = string_field(j, "status");
    if (status == "ok") {
        reply.status = ReplyStatus::OK;
    } else if (status == "aborted") {
        reply.status = ReplyStatus::ABORTED;
    } else {
        reply.status = ReplyStatus::ERROR;
    }
    if (j.contains("execution_count") && j["execution_count"].is_number_integer() &&
        j["execution_count"].get<int64_t>() >= 0) {
        reply.execution_count = j["execution_count"].get<uint64_t>();
    }
    reply.ename = string_field(j, "ename");
    reply.evalue = string_field(j, "evalue");
    reply.traceback = string_list(j.value("traceback", json::array()));
    return reply;
}

// ============================================================================
// Encoding
// ============================================================================

ipc::Message encode_event(uint32_t msg_id, const OutputEvent& event) {
    json j;
    ipc::MessageKind kind = std::visit(overloaded{
        [&](const StreamEvent& e) {
            j["name"] = e.name;
            j["text"] = e.text;
            return ipc::MessageKind::STREAM;
        },
        [&](const ResultEvent& e) {
            j["data"] = e.data.to_json();
            j["execution_count"] = e.execution_count;
            return ipc::MessageKind::RESULT;
        },
        [&](const DisplayEvent& e) {
            j["data"] = e.data.to_json();
            return ipc::MessageKind::DISPLAY;
        },
        [&](const ErrorEvent& e) {
            j["ename"] = e.ename;
            j["evalue"] = e.evalue;
            j["traceback"] = e.traceback;
            return ipc::MessageKind::ERROR;
        },
        [&](const StatusEvent& e) {
            switch (e.state) {
                case ExecutionState::BUSY:     j["execution_state"] = "busy"; break;
                case ExecutionState::IDLE:     j["execution_state"] = "idle"; break;
                case ExecutionState::STARTING: j["execution_state"] = "starting"; break;
            }
            return ipc::MessageKind::STATUS;
        },
    }, event);

    return ipc::Message(msg_id, kind, j.dump());
}

} // namespace execore::output
