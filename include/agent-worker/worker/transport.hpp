/*
 * Control-plane transport - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace agentworker {

// Message-oriented duplex connection. Failures throw TransportError.
// send() may race with receive() on another thread; connect()/close() may not.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void connect(const std::string& url, const std::string& token) = 0;
    virtual void send(const std::string& text) = 0;
    // nullopt when nothing arrived within timeout; throws once the peer closed
    virtual std::optional<std::string> receive(std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
};

// ws:// and wss:// through libcurl's WebSocket support.
class CurlWebSocketTransport : public Transport {
public:
    CurlWebSocketTransport();
    ~CurlWebSocketTransport() override;

    void connect(const std::string& url, const std::string& token) override;
    void send(const std::string& text) override;
    std::optional<std::string> receive(std::chrono::milliseconds timeout) override;
    void close() override;

private:
    void cleanup_locked();

    std::mutex m_mutex;
    void* m_curl = nullptr; // CURL*
    long m_socket = -1;
    std::string m_partial;
};

// http(s)://host -> ws(s)://host
std::string to_websocket_url(const std::string& url);

} // namespace agentworker
