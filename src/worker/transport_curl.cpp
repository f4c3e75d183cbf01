/*
 * libcurl WebSocket transport - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/worker/transport.hpp>
#include <agent-worker/errors.hpp>
#include <curl/curl.h>
#include <curl/websockets.h>
#include <algorithm>
#include <poll.h>

namespace agentworker {

std::string to_websocket_url(const std::string& url) {
    if (url.rfind("https://", 0) == 0) return "wss://" + url.substr(8);
    if (url.rfind("http://", 0) == 0) return "ws://" + url.substr(7);
    return url;
}

CurlWebSocketTransport::CurlWebSocketTransport() = default;

CurlWebSocketTransport::~CurlWebSocketTransport() {
    std::lock_guard<std::mutex> lock(m_mutex);
    cleanup_locked();
}

void CurlWebSocketTransport::cleanup_locked() {
    if (m_curl) curl_easy_cleanup(static_cast<CURL*>(m_curl));
    m_curl = nullptr;
    m_socket = -1;
    m_partial.clear();
}

void CurlWebSocketTransport::connect(const std::string& url, const std::string& token) {
    std::lock_guard<std::mutex> lock(m_mutex);
    cleanup_locked();
    CURL* curl = curl_easy_init();
    if (!curl) throw TransportError("curl init failed");
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L); // WebSocket upgrade, then hand over
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    struct curl_slist* headers = nullptr;
    std::string auth = "Authorization: Bearer " + token;
    headers = curl_slist_append(headers, auth.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    auto res = curl_easy_perform(curl);
    curl_slist_free_all(headers);
    if (res != CURLE_OK) {
        std::string err = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw TransportError("websocket connect failed: " + err);
    }
    curl_socket_t sock = CURL_SOCKET_BAD;
    if (curl_easy_getinfo(curl, CURLINFO_ACTIVESOCKET, &sock) != CURLE_OK || sock == CURL_SOCKET_BAD) {
        curl_easy_cleanup(curl);
        throw TransportError("websocket connect failed: no active socket");
    }
    m_curl = curl;
    m_socket = static_cast<long>(sock);
}

void CurlWebSocketTransport::send(const std::string& text) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_curl) throw TransportError("not connected");
    auto* curl = static_cast<CURL*>(m_curl);
    for (int attempt = 0; attempt < 50; ++attempt) {
        size_t sent = 0;
        auto res = curl_ws_send(curl, text.data(), text.size(), &sent, 0, CURLWS_TEXT);
        if (res == CURLE_OK) {
            if (sent != text.size()) throw TransportError("short websocket write");
            return;
        }
        if (res != CURLE_AGAIN) throw TransportError(std::string("websocket send failed: ") + curl_easy_strerror(res));
        struct pollfd pfd{static_cast<int>(m_socket), POLLOUT, 0};
        ::poll(&pfd, 1, 100);
    }
    throw TransportError("websocket send timed out");
}

std::optional<std::string> CurlWebSocketTransport::receive(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        int fd = -1;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_curl) throw TransportError("not connected");
            auto* curl = static_cast<CURL*>(m_curl);
            char buf[16384];
            size_t got = 0;
            struct curl_ws_frame* meta = nullptr;
            auto res = curl_ws_recv(curl, buf, sizeof(buf), &got, &meta);
            if (res == CURLE_OK && meta) {
                if (meta->flags & CURLWS_CLOSE) throw TransportError("connection closed by server");
                if (meta->flags & (CURLWS_TEXT | CURLWS_BINARY | CURLWS_CONT)) {
                    m_partial.append(buf, got);
                    if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
                        std::string out;
                        out.swap(m_partial);
                        return out;
                    }
                }
                continue; // ping/pong or an unfinished frame
            }
            if (res != CURLE_AGAIN) throw TransportError(std::string("websocket receive failed: ") + curl_easy_strerror(res));
            fd = static_cast<int>(m_socket);
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return std::nullopt;
        // wait without the lock so send() can proceed
        struct pollfd pfd{fd, POLLIN, 0};
        ::poll(&pfd, 1, static_cast<int>(std::min<long long>(left.count(), 100)));
    }
}

void CurlWebSocketTransport::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_curl) {
        size_t sent = 0;
        // the handle is torn down whether or not the close frame made it
        (void)curl_ws_send(static_cast<CURL*>(m_curl), "", 0, &sent, 0, CURLWS_CLOSE);
    }
    cleanup_locked();
}

} // namespace agentworker
