/*
 * Framed IPC channel - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace agentworker::ipc {

// Invalid: a frame arrived but the message codec rejected it.
enum class RecvStatus { Message, Timeout, Closed, Invalid };

constexpr std::uint32_t kMaxFrameSize = 16u * 1024u * 1024u;

// Length-prefixed (4 bytes, big endian) frames over a stream socket.
// send() may be called from several threads; recv() from one reader only.
class FrameChannel {
public:
    explicit FrameChannel(int fd, bool owns_fd = true);
    ~FrameChannel();
    FrameChannel(const FrameChannel&) = delete;
    FrameChannel& operator=(const FrameChannel&) = delete;

    int fd() const { return m_fd; }
    bool send(const std::string& payload);
    RecvStatus recv(std::string& out, std::chrono::milliseconds timeout);
    void close();

private:
    bool extract_frame(std::string& out);

    int m_fd;
    bool m_owns_fd;
    bool m_eof = false;
    std::mutex m_send_mutex;
    std::string m_buffer;
};

} // namespace agentworker::ipc
