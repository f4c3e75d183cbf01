/*
 * IPC message codec - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/ipc/message.hpp>
#include <chrono>

namespace agentworker::ipc {

std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

const char* message_name(const Message& msg) {
    return std::visit([](auto& m) -> const char* {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, InitializeRequest>) return "initializeRequest";
        else if constexpr (std::is_same_v<T, InitializeResponse>) return "initializeResponse";
        else if constexpr (std::is_same_v<T, StartJobRequest>) return "startJobRequest";
        else if constexpr (std::is_same_v<T, StartJobResponse>) return "startJobResponse";
        else if constexpr (std::is_same_v<T, PingRequest>) return "pingRequest";
        else if constexpr (std::is_same_v<T, PongResponse>) return "pongResponse";
        else if constexpr (std::is_same_v<T, ShutdownRequest>) return "shutdownRequest";
        else if constexpr (std::is_same_v<T, Exiting>) return "exiting";
        else if constexpr (std::is_same_v<T, ShutdownResponse>) return "shutdownResponse";
        else if constexpr (std::is_same_v<T, UserExit>) return "userExit";
        else static_assert(always_false_v<T>, "unhandled ipc message");
    }, msg);
}

std::string encode(const Message& msg) {
    Json j = Json::object();
    j.set("type", message_name(msg));
    std::visit([&](auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, InitializeRequest>) {
            j.set("pingInterval", Json(static_cast<long long>(m.ping_interval_ms)));
            j.set("pingTimeout", Json(static_cast<long long>(m.ping_timeout_ms)));
            j.set("highPingThreshold", m.high_ping_threshold_ms);
        } else if constexpr (std::is_same_v<T, StartJobRequest>) {
            j.set("runningJob", to_json(m.running_job));
        } else if constexpr (std::is_same_v<T, StartJobResponse>) {
            if (m.error) j.set("error", *m.error);
        } else if constexpr (std::is_same_v<T, PingRequest>) {
            j.set("timestamp", Json(static_cast<long long>(m.timestamp)));
        } else if constexpr (std::is_same_v<T, PongResponse>) {
            j.set("lastTimestamp", Json(static_cast<long long>(m.last_timestamp)));
            j.set("timestamp", Json(static_cast<long long>(m.timestamp)));
        } else if constexpr (std::is_same_v<T, ShutdownRequest> || std::is_same_v<T, Exiting>) {
            if (!m.reason.empty()) j.set("reason", m.reason);
        }
        // InitializeResponse, ShutdownResponse, UserExit carry no payload
    }, msg);
    return j.dump();
}

std::optional<Message> decode(const std::string& payload) {
    auto parsed = Json::parse(payload);
    if (!parsed || !parsed->is_object()) return std::nullopt;
    const Json& j = *parsed;
    std::string type = j["type"].as_string();
    if (type == "initializeRequest") {
        InitializeRequest m;
        m.ping_interval_ms = j["pingInterval"].as_int64();
        m.ping_timeout_ms = j["pingTimeout"].as_int64();
        m.high_ping_threshold_ms = j["highPingThreshold"].as_number();
        return Message{m};
    }
    if (type == "initializeResponse") return Message{InitializeResponse{}};
    if (type == "startJobRequest") {
        auto info = running_job_from_json(j["runningJob"]);
        if (!info) return std::nullopt;
        return Message{StartJobRequest{*info}};
    }
    if (type == "startJobResponse") {
        StartJobResponse m;
        if (j["error"].is_string()) m.error = j["error"].as_string();
        return Message{m};
    }
    if (type == "pingRequest") return Message{PingRequest{j["timestamp"].as_int64()}};
    if (type == "pongResponse") return Message{PongResponse{j["lastTimestamp"].as_int64(), j["timestamp"].as_int64()}};
    if (type == "shutdownRequest") return Message{ShutdownRequest{j["reason"].as_string()}};
    if (type == "exiting") return Message{Exiting{j["reason"].as_string()}};
    if (type == "shutdownResponse") return Message{ShutdownResponse{}};
    if (type == "userExit") return Message{UserExit{}};
    return std::nullopt;
}

} // namespace agentworker::ipc
