/**
 * execore Session Protocol
 *
 * Binary framing between the engine and a session driver process.
 * Header: 17 bytes (magic + msg_id + kind + payload_size), then a JSON payload.
 * The msg_id of every reply and event is the id of the request it answers.
 */
#pragma once
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <optional>

namespace execore::ipc {

// Magic bytes for protocol validation
constexpr uint32_t MAGIC_BYTES = 0x45584543; // "EXEC" in hex
constexpr size_t HEADER_SIZE = 17;
constexpr size_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024; // 16MB max, images travel inline

enum class MessageKind : uint8_t {
    // Requests (engine -> driver, command channel)
    EXECUTE_REQUEST  = 0x01,
    INFO_REQUEST     = 0x02,  // Readiness handshake
    SHUTDOWN_REQUEST = 0x03,
    // Replies (driver -> engine, reply channel)
    EXECUTE_REPLY    = 0x11,
    INFO_REPLY       = 0x12,
    // Events (driver -> engine, event channel)
    STREAM           = 0x20,  // {"name": "stdout"|"stderr", "text": ...}
    RESULT           = 0x21,  // {"data": mime bundle, "execution_count": n}
    DISPLAY          = 0x22,  // {"data": mime bundle}
    ERROR            = 0x23,  // {"ename", "evalue", "traceback": [...]}
    STATUS           = 0x24   // {"execution_state": "busy"|"idle"}
};

// Wire protocol header (17 bytes, packed)
struct __attribute__((packed)) MessageHeader {
    uint32_t magic;         // Must be MAGIC_BYTES
    uint32_t msg_id;        // Correlation id
    MessageKind kind;       // Message type
    uint64_t payload_size;  // Bytes following this header
};

static_assert(sizeof(MessageHeader) == HEADER_SIZE, "Header size mismatch");

// Application-level message
struct Message {
    uint32_t msg_id;
    MessageKind kind;
    std::vector<uint8_t> payload;

    Message() : msg_id(0), kind(MessageKind::INFO_REQUEST) {}

    Message(uint32_t id, MessageKind k, const std::vector<uint8_t>& data = {})
        : msg_id(id), kind(k), payload(data) {}

    Message(uint32_t id, MessageKind k, const std::string& data)
        : msg_id(id), kind(k), payload(data.begin(), data.end()) {}

    // Get payload as string
    std::string payload_str() const {
        return std::string(payload.begin(), payload.end());
    }

    // Serialize message to wire format
    std::vector<uint8_t> serialize() const {
        std::vector<uint8_t> buffer(HEADER_SIZE + payload.size());

        MessageHeader header;
        header.magic = MAGIC_BYTES;
        header.msg_id = msg_id;
        header.kind = kind;
        header.payload_size = payload.size();

        std::memcpy(buffer.data(), &header, HEADER_SIZE);
        if (!payload.empty()) {
            std::memcpy(buffer.data() + HEADER_SIZE, payload.data(), payload.size());
        }

        return buffer;
    }

    // Deserialize message from wire format
    static std::optional<Message> deserialize(const uint8_t* data, size_t len) {
        auto total = get_message_size(data, len);
        if (!total || len < *total) {
            return std::nullopt;
        }

        MessageHeader header;
        std::memcpy(&header, data, HEADER_SIZE);

        Message msg;
        msg.msg_id = header.msg_id;
        msg.kind = header.kind;

        if (header.payload_size > 0) {
            msg.payload.resize(header.payload_size);
            std::memcpy(msg.payload.data(), data + HEADER_SIZE, header.payload_size);
        }

        return msg;
    }

    // Total message size from header, nullopt if the header is incomplete or invalid
    static std::optional<size_t> get_message_size(const uint8_t* data, size_t len) {
        if (len < HEADER_SIZE) {
            return std::nullopt;
        }

        MessageHeader header;
        std::memcpy(&header, data, HEADER_SIZE);

        if (header.magic != MAGIC_BYTES) {
            return std::nullopt;
        }

        if (header.payload_size > MAX_PAYLOAD_SIZE) {
            return std::nullopt;
        }

        return HEADER_SIZE + header.payload_size;
    }

    // True when the first bytes cannot start a valid message
    static bool header_invalid(const uint8_t* data, size_t len) {
        return len >= HEADER_SIZE && !get_message_size(data, len);
    }
};

// Convert message kind to string for logging
inline const char* kind_to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::EXECUTE_REQUEST:  return "EXECUTE_REQUEST";
        case MessageKind::INFO_REQUEST:     return "INFO_REQUEST";
        case MessageKind::SHUTDOWN_REQUEST: return "SHUTDOWN_REQUEST";
        case MessageKind::EXECUTE_REPLY:    return "EXECUTE_REPLY";
        case MessageKind::INFO_REPLY:       return "INFO_REPLY";
        case MessageKind::STREAM:           return "STREAM";
        case MessageKind::RESULT:           return "RESULT";
        case MessageKind::DISPLAY:          return "DISPLAY";
        case MessageKind::ERROR:            return "ERROR";
        case MessageKind::STATUS:           return "STATUS";
        default: return "UNKNOWN";
    }
}

} // namespace execore::ipc
