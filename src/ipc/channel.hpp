/**
 * execore Channel I/O
 *
 * Framed message I/O over pipe descriptors. MessageReader accumulates bytes
 * from a non-blocking fd and yields complete messages; write_message pushes
 * one framed message, waiting for the pipe to drain up to a deadline.
 */
#pragma once
#include <vector>
#include <deque>
#include <chrono>
#include <string>
#include "ipc/protocol.hpp"

namespace execore::ipc {

class MessageReader {
public:
    explicit MessageReader(int fd = -1) : fd_(fd) {}

    void reset(int fd);
    int fd() const { return fd_; }

    // Drain everything currently readable. False on EOF or read error.
    bool read_available();

    // Feed raw bytes (used by read_available, and directly by tests)
    void feed(const uint8_t* data, size_t len);

    // Next complete message, if any
    std::optional<Message> pop();

    bool eof() const { return eof_; }
    const std::string& error() const { return error_; }
    size_t buffered() const { return recv_buffer_.size(); }
    uint64_t dropped_bytes() const { return dropped_bytes_; }

private:
    int fd_;
    bool eof_ = false;
    std::string error_;
    std::vector<uint8_t> recv_buffer_;
    std::deque<Message> ready_;
    uint64_t dropped_bytes_ = 0;

    void process_messages();
};

// Write one message to `fd`; false (with `error`) on failure or timeout
bool write_message(int fd, const Message& msg, std::chrono::milliseconds timeout, std::string& error);

// Create a pipe with O_CLOEXEC on both ends
bool make_pipe(int fds[2], std::string& error);

} // namespace execore::ipc
