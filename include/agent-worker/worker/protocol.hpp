/*
 * Control-plane wire messages - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <agent-worker/job/job.hpp>
#include <agent-worker/util/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentworker::protocol {

constexpr int kProtocolVersion = 1;

enum class WorkerStatus { Available, Full };
const char* worker_status_name(WorkerStatus status); // WS_AVAILABLE / WS_FULL

enum class JobStatus { Success, Failed };
const char* job_status_name(JobStatus status);       // JS_SUCCESS / JS_FAILED

struct WorkerPermissions {
    bool can_publish = true;
    bool can_subscribe = true;
    bool can_publish_data = true;
    bool can_update_metadata = true;
    std::vector<std::string> can_publish_sources;
    bool hidden = false;
    bool agent = true;
};

// server -> worker

struct RegisterResponse {
    std::string worker_id;
    Json server_info;
};

struct AvailabilityRequest {
    Job job;
    bool resuming = false;
};

struct JobAssignment {
    Job job;
    std::string url;
    std::string token;
};

struct JobTermination {
    std::string job_id;
};

using ServerMessage = std::variant<RegisterResponse, AvailabilityRequest, JobAssignment, JobTermination>;

// worker -> server

struct RegisterRequest {
    JobType type = JobType::Room;
    std::string agent_name;
    std::string version;
    WorkerPermissions permissions;
    int protocol_version = kProtocolVersion;
};

struct AvailabilityResponse {
    std::string job_id;
    bool available = false;
    JobAcceptArguments accept_arguments; // sent only when available
};

struct UpdateWorker {
    std::optional<double> load;
    WorkerStatus status = WorkerStatus::Available;
};

struct UpdateJob {
    std::string job_id;
    JobStatus status = JobStatus::Success;
    std::string error;
};

struct SimulateJob {
    JobType type = JobType::Room;
    std::string room_name;
    std::optional<std::string> participant_identity;
};

using WorkerMessage = std::variant<RegisterRequest, AvailabilityResponse, UpdateWorker, UpdateJob, SimulateJob>;

std::string encode(const WorkerMessage& msg);
std::optional<WorkerMessage> decode_worker_message(const std::string& text);

std::string encode(const ServerMessage& msg);
std::optional<ServerMessage> decode_server_message(const std::string& text);

} // namespace agentworker::protocol
