#include <gtest/gtest.h>
#include <fcntl.h>
#include <unistd.h>
#include <string>
#include <vector>
#include "ipc/channel.hpp"
#include "ipc/protocol.hpp"

using namespace execore::ipc;

namespace {

// Both ends of a pipe, closed on scope exit
struct Pipe {
    int fds[2] = {-1, -1};

    Pipe() {
        std::string error;
        EXPECT_TRUE(make_pipe(fds, error)) << error;
    }
    ~Pipe() {
        close_read();
        close_write();
    }

    int read_fd() const { return fds[0]; }
    int write_fd() const { return fds[1]; }

    void close_read() {
        if (fds[0] >= 0) close(fds[0]);
        fds[0] = -1;
    }
    void close_write() {
        if (fds[1] >= 0) close(fds[1]);
        fds[1] = -1;
    }
};

void set_nonblocking(int fd) {
    fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
}

} // namespace

TEST(protocol, header_layout) {
    Message msg(7, MessageKind::EXECUTE_REQUEST, std::string(R"({"code":"1"})"));
    auto wire = msg.serialize();
    ASSERT_EQ(wire.size(), HEADER_SIZE + 12);
    // Magic is written little-endian: "CEXE" on the wire
    EXPECT_EQ(wire[0], 0x43);
    EXPECT_EQ(wire[3], 0x45);
    EXPECT_EQ(wire[4], 7);
    EXPECT_EQ(wire[8], 0x01);
    EXPECT_EQ(wire[9], 12);

    auto decoded = Message::deserialize(wire.data(), wire.size());
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded->msg_id, 7u);
    EXPECT_EQ(decoded->kind, MessageKind::EXECUTE_REQUEST);
    EXPECT_EQ(decoded->payload_str(), R"({"code":"1"})");
}

TEST(protocol, incomplete_and_invalid_headers) {
    auto wire = Message(1, MessageKind::STATUS, std::string("{}")).serialize();

    EXPECT_FALSE(Message::get_message_size(wire.data(), HEADER_SIZE - 1));
    EXPECT_FALSE(Message::deserialize(wire.data(), wire.size() - 1));
    EXPECT_FALSE(Message::header_invalid(wire.data(), HEADER_SIZE - 1));

    auto bad_magic = wire;
    bad_magic[0] ^= 0xFF;
    EXPECT_TRUE(Message::header_invalid(bad_magic.data(), bad_magic.size()));

    MessageHeader header{MAGIC_BYTES, 1, MessageKind::DISPLAY, MAX_PAYLOAD_SIZE + 1};
    std::vector<uint8_t> oversized(HEADER_SIZE);
    std::memcpy(oversized.data(), &header, HEADER_SIZE);
    EXPECT_TRUE(Message::header_invalid(oversized.data(), oversized.size()));
}

TEST(protocol, reader_assembles_split_messages) {
    MessageReader reader;
    auto first = Message(1, MessageKind::STREAM, std::string(R"({"name":"stdout","text":"a"})")).serialize();
    auto second = Message(2, MessageKind::STATUS, std::string(R"({"execution_state":"idle"})")).serialize();

    std::vector<uint8_t> wire(first);
    wire.insert(wire.end(), second.begin(), second.end());

    // One byte at a time
    for (uint8_t byte : wire) {
        reader.feed(&byte, 1);
    }

    auto a = reader.pop();
    auto b = reader.pop();
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(a->msg_id, 1u);
    EXPECT_EQ(a->kind, MessageKind::STREAM);
    EXPECT_EQ(b->msg_id, 2u);
    EXPECT_EQ(b->kind, MessageKind::STATUS);
    EXPECT_FALSE(reader.pop());
    EXPECT_EQ(reader.buffered(), 0u);
}

TEST(protocol, reader_resynchronizes_after_garbage) {
    MessageReader reader;
    std::vector<uint8_t> wire(40, 'x');
    auto msg = Message(9, MessageKind::RESULT, std::string(R"({"data":{}})")).serialize();
    wire.insert(wire.end(), msg.begin(), msg.end());

    reader.feed(wire.data(), wire.size());

    auto decoded = reader.pop();
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded->msg_id, 9u);
    EXPECT_EQ(reader.dropped_bytes(), 40u);
}

TEST(protocol, write_and_read_over_pipe) {
    Pipe pipe;
    set_nonblocking(pipe.read_fd());

    std::string error;
    for (uint32_t id = 1; id <= 3; id++) {
        Message msg(id, MessageKind::EXECUTE_REPLY, std::string(R"({"status":"ok"})"));
        ASSERT_TRUE(write_message(pipe.write_fd(), msg, std::chrono::milliseconds(1000), error)) << error;
    }
    pipe.close_write();

    MessageReader reader(pipe.read_fd());
    EXPECT_FALSE(reader.read_available());  // Drained everything, then hit EOF
    EXPECT_TRUE(reader.eof());

    for (uint32_t id = 1; id <= 3; id++) {
        auto msg = reader.pop();
        ASSERT_TRUE(msg);
        EXPECT_EQ(msg->msg_id, id);
    }
}

TEST(protocol, write_times_out_when_reader_stalls) {
    Pipe pipe;
    set_nonblocking(pipe.write_fd());

    // Larger than any default pipe buffer
    std::string payload(4 * 1024 * 1024, 'a');
    std::string error;
    EXPECT_FALSE(write_message(pipe.write_fd(), Message(1, MessageKind::DISPLAY, payload),
                               std::chrono::milliseconds(100), error));
    EXPECT_EQ(error, "write timed out");
}

TEST(protocol, write_rejects_oversized_payload) {
    Pipe pipe;
    std::string error;
    std::vector<uint8_t> payload(MAX_PAYLOAD_SIZE + 1, 0);
    EXPECT_FALSE(write_message(pipe.write_fd(), Message(1, MessageKind::DISPLAY, payload),
                               std::chrono::milliseconds(100), error));
    EXPECT_FALSE(error.empty());
}

TEST(protocol, kind_names) {
    EXPECT_STREQ(kind_to_string(MessageKind::EXECUTE_REQUEST), "EXECUTE_REQUEST");
    EXPECT_STREQ(kind_to_string(MessageKind::STATUS), "STATUS");
    EXPECT_STREQ(kind_to_string(static_cast<MessageKind>(0x7F)), "UNKNOWN");
}
