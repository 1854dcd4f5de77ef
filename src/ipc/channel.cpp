#include "ipc/channel.hpp"
#include <spdlog/spdlog.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

namespace execore::ipc {

// ============================================================================
// MessageReader Implementation
// ============================================================================

void MessageReader::reset(int fd) {
    fd_ = fd;
    eof_ = false;
    error_.clear();
    recv_buffer_.clear();
    ready_.clear();
    dropped_bytes_ = 0;
}

bool MessageReader::read_available() {
    if (fd_ < 0 || eof_) {
        return false;
    }

    uint8_t buffer[65536];
    while (true) {
        ssize_t n = read(fd_, buffer, sizeof(buffer));
        if (n > 0) {
            recv_buffer_.insert(recv_buffer_.end(), buffer, buffer + n);
        } else if (n == 0) {
            eof_ = true;
            break;
        } else {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break; // No more data
            }
            error_ = strerror(errno);
            spdlog::error("Read error on channel fd={}: {}", fd_, error_);
            eof_ = true;
            break;
        }
    }

    process_messages();
    return !eof_;
}

void MessageReader::feed(const uint8_t* data, size_t len) {
    recv_buffer_.insert(recv_buffer_.end(), data, data + len);
    process_messages();
}

std::optional<Message> MessageReader::pop() {
    if (ready_.empty()) {
        return std::nullopt;
    }
    Message msg = std::move(ready_.front());
    ready_.pop_front();
    return msg;
}

void MessageReader::process_messages() {
    static const uint8_t magic[4] = {
        static_cast<uint8_t>(MAGIC_BYTES & 0xFF),
        static_cast<uint8_t>((MAGIC_BYTES >> 8) & 0xFF),
        static_cast<uint8_t>((MAGIC_BYTES >> 16) & 0xFF),
        static_cast<uint8_t>((MAGIC_BYTES >> 24) & 0xFF)
    };

    while (true) {
        if (Message::header_invalid(recv_buffer_.data(), recv_buffer_.size())) {
            // Resynchronize on the next magic sequence
            auto next = std::search(recv_buffer_.begin() + 1, recv_buffer_.end(),
                                    std::begin(magic), std::end(magic));
            size_t skipped = static_cast<size_t>(next - recv_buffer_.begin());
            spdlog::warn("Invalid message header on channel fd={}, dropping {} bytes", fd_, skipped);
            dropped_bytes_ += skipped;
            recv_buffer_.erase(recv_buffer_.begin(), next);
            continue;
        }

        auto msg_size = Message::get_message_size(recv_buffer_.data(), recv_buffer_.size());
        if (!msg_size || recv_buffer_.size() < *msg_size) {
            break; // Need more data
        }

        auto msg = Message::deserialize(recv_buffer_.data(), recv_buffer_.size());
        recv_buffer_.erase(recv_buffer_.begin(), recv_buffer_.begin() + *msg_size);
        if (!msg) {
            continue;
        }

        spdlog::trace("Channel fd={} -> {} id={} ({}B payload)",
            fd_, kind_to_string(msg->kind), msg->msg_id, msg->payload.size());
        ready_.push_back(std::move(*msg));
    }
}

// ============================================================================
// Writing
// ============================================================================

bool write_message(int fd, const Message& msg, std::chrono::milliseconds timeout, std::string& error) {
    if (fd < 0) {
        error = "channel closed";
        return false;
    }
    if (msg.payload.size() > MAX_PAYLOAD_SIZE) {
        error = "payload exceeds " + std::to_string(MAX_PAYLOAD_SIZE) + " bytes";
        return false;
    }

    auto send_buffer = msg.serialize();
    size_t offset = 0;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (offset < send_buffer.size()) {
        ssize_t n = write(fd, send_buffer.data() + offset, send_buffer.size() - offset);
        if (n > 0) {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            error = std::string("write failed: ") + strerror(errno);
            return false;
        }

        // Would block, wait for the reader to drain the pipe
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            error = "write timed out";
            return false;
        }
        struct pollfd pfd = {fd, POLLOUT, 0};
        int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0 && errno != EINTR) {
            error = std::string("poll failed: ") + strerror(errno);
            return false;
        }
        if (rc > 0 && (pfd.revents & (POLLERR | POLLHUP))) {
            error = "reader closed the channel";
            return false;
        }
    }

    spdlog::trace("Channel fd={} <- {} id={} ({}B payload)",
        fd, kind_to_string(msg.kind), msg.msg_id, msg.payload.size());
    return true;
}

bool make_pipe(int fds[2], std::string& error) {
    if (pipe2(fds, O_CLOEXEC) < 0) {
        error = std::string("pipe2 failed: ") + strerror(errno);
        fds[0] = fds[1] = -1;
        return false;
    }
    return true;
}

} // namespace execore::ipc
