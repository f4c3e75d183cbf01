/*
 * Supervisor <-> job process messages - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <agent-worker/job/job.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace agentworker::ipc {

// supervisor -> process, first message on the channel
struct InitializeRequest {
    std::int64_t ping_interval_ms = 0;
    std::int64_t ping_timeout_ms = 0;
    double high_ping_threshold_ms = 0.0;
};

// process -> supervisor, warm-up done
struct InitializeResponse {};

// supervisor -> process
struct StartJobRequest {
    RunningJobInfo running_job;
};

// process -> supervisor; error absent means the job connected to its resource
struct StartJobResponse {
    std::optional<std::string> error;
};

struct PingRequest {
    std::int64_t timestamp = 0;
};

struct PongResponse {
    std::int64_t last_timestamp = 0;
    std::int64_t timestamp = 0;
};

struct ShutdownRequest {
    std::string reason;
};

// process -> supervisor, informational, precedes the final message
struct Exiting {
    std::string reason;
};

struct ShutdownResponse {};

// process finished on its own (job done or crashed in user code)
struct UserExit {};

using Message = std::variant<InitializeRequest, InitializeResponse, StartJobRequest, StartJobResponse,
                             PingRequest, PongResponse, ShutdownRequest, Exiting, ShutdownResponse, UserExit>;

template <class> inline constexpr bool always_false_v = false;

const char* message_name(const Message& msg);
std::string encode(const Message& msg);
std::optional<Message> decode(const std::string& payload);

std::int64_t now_ms();

} // namespace agentworker::ipc
