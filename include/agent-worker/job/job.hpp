/*
 * Job descriptors - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <agent-worker/util/json.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace agentworker {

enum class JobType { Room, Publisher };

const char* job_type_name(JobType type);            // JT_ROOM / JT_PUBLISHER
std::optional<JobType> parse_job_type(const std::string& name);

struct RoomInfo {
    std::string sid;
    std::string name;
};

struct ParticipantInfo {
    std::string sid;
    std::string identity;
    std::string name;
};

// Immutable once received from the control plane.
struct Job {
    std::string id;
    JobType type = JobType::Room;
    RoomInfo room;
    std::optional<ParticipantInfo> participant;
    std::string metadata;      // opaque
    std::string agent_name;
};

// What the decision function chose when accepting.
struct JobAcceptArguments {
    std::string identity;
    std::string name;
    std::string metadata;
    std::map<std::string, std::string> attributes;
};

struct RunningJobInfo {
    Job job;
    JobAcceptArguments accept_arguments;
    std::string url;
    std::string token;
};

Json to_json(const Job& job);
Json to_json(const JobAcceptArguments& args);
Json to_json(const RunningJobInfo& info);
std::optional<Job> job_from_json(const Json& j);
JobAcceptArguments accept_arguments_from_json(const Json& j);
std::optional<RunningJobInfo> running_job_from_json(const Json& j);

// Handed to the user decision function for one availability offer.
// The first accept()/reject() wins; later calls return false.
class JobRequest {
public:
    using Answer = std::function<void(bool available, const JobAcceptArguments& args)>;

    JobRequest(Job job, bool resuming, Answer answer);

    const Job& job() const { return m_job; }
    const std::string& id() const { return m_job.id; }
    const RoomInfo& room() const { return m_job.room; }
    const std::optional<ParticipantInfo>& publisher() const { return m_job.participant; }
    bool resuming() const { return m_resuming; }
    bool answered() const;

    bool accept(const JobAcceptArguments& args = {});
    bool reject();

private:
    bool answer(bool available, const JobAcceptArguments& args);

    Job m_job;
    bool m_resuming = false;
    Answer m_answer;
    mutable std::mutex m_mutex;
    bool m_answered = false;
};

} // namespace agentworker
