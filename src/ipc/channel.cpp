/*
 * Framed IPC channel implementation - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/ipc/channel.hpp>
#include <cerrno>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace agentworker::ipc {

FrameChannel::FrameChannel(int fd, bool owns_fd) : m_fd(fd), m_owns_fd(owns_fd) {}

FrameChannel::~FrameChannel() { close(); }

void FrameChannel::close() {
    std::lock_guard<std::mutex> lock(m_send_mutex);
    if (m_fd >= 0 && m_owns_fd) ::close(m_fd);
    m_fd = -1;
}

bool FrameChannel::send(const std::string& payload) {
    if (payload.size() > kMaxFrameSize) return false;
    std::string frame;
    frame.reserve(payload.size() + 4);
    auto n = static_cast<std::uint32_t>(payload.size());
    frame.push_back(static_cast<char>((n >> 24) & 0xFF));
    frame.push_back(static_cast<char>((n >> 16) & 0xFF));
    frame.push_back(static_cast<char>((n >> 8) & 0xFF));
    frame.push_back(static_cast<char>(n & 0xFF));
    frame += payload;

    std::lock_guard<std::mutex> lock(m_send_mutex);
    if (m_fd < 0) return false;
    size_t off = 0;
    while (off < frame.size()) {
        ssize_t w = ::send(m_fd, frame.data() + off, frame.size() - off, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false; // EPIPE once the peer is gone
        }
        off += static_cast<size_t>(w);
    }
    return true;
}

bool FrameChannel::extract_frame(std::string& out) {
    if (m_buffer.size() < 4) return false;
    auto b = reinterpret_cast<const unsigned char*>(m_buffer.data());
    std::uint32_t n = (std::uint32_t(b[0]) << 24) | (std::uint32_t(b[1]) << 16) | (std::uint32_t(b[2]) << 8) | std::uint32_t(b[3]);
    if (m_buffer.size() < 4 + static_cast<size_t>(n)) return false;
    out.assign(m_buffer, 4, n);
    m_buffer.erase(0, 4 + static_cast<size_t>(n));
    return true;
}

RecvStatus FrameChannel::recv(std::string& out, std::chrono::milliseconds timeout) {
    if (extract_frame(out)) return RecvStatus::Message;
    if (m_eof || m_fd < 0) return RecvStatus::Closed;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() < 0) left = std::chrono::milliseconds(0);
        struct pollfd pfd{m_fd, POLLIN, 0};
        int r = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (r < 0) {
            if (errno == EINTR) continue;
            m_eof = true;
            return RecvStatus::Closed;
        }
        if (r == 0) return RecvStatus::Timeout;
        char buf[8192];
        ssize_t got = ::recv(m_fd, buf, sizeof(buf), 0);
        if (got < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            m_eof = true;
            return RecvStatus::Closed;
        }
        if (got == 0) {
            m_eof = true;
            return RecvStatus::Closed;
        }
        m_buffer.append(buf, static_cast<size_t>(got));
        if (m_buffer.size() >= 4) {
            auto b = reinterpret_cast<const unsigned char*>(m_buffer.data());
            std::uint32_t n = (std::uint32_t(b[0]) << 24) | (std::uint32_t(b[1]) << 16) | (std::uint32_t(b[2]) << 8) | std::uint32_t(b[3]);
            if (n > kMaxFrameSize) { m_eof = true; return RecvStatus::Closed; }
        }
        if (extract_frame(out)) return RecvStatus::Message;
    }
}

} // namespace agentworker::ipc
