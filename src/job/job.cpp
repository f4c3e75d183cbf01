/*
 * Job descriptors implementation - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/job/job.hpp>

namespace agentworker {

const char* job_type_name(JobType type) {
    switch (type) {
        case JobType::Room: return "JT_ROOM";
        case JobType::Publisher: return "JT_PUBLISHER";
    }
    return "JT_ROOM";
}

std::optional<JobType> parse_job_type(const std::string& name) {
    if (name == "JT_ROOM" || name == "room") return JobType::Room;
    if (name == "JT_PUBLISHER" || name == "publisher") return JobType::Publisher;
    return std::nullopt;
}

Json to_json(const Job& job) {
    Json j = Json::object();
    j.set("id", job.id);
    j.set("type", job_type_name(job.type));
    Json room = Json::object();
    room.set("sid", job.room.sid);
    room.set("name", job.room.name);
    j.set("room", room);
    if (job.participant) {
        Json p = Json::object();
        p.set("sid", job.participant->sid);
        p.set("identity", job.participant->identity);
        p.set("name", job.participant->name);
        j.set("participant", p);
    }
    j.set("metadata", job.metadata);
    j.set("agentName", job.agent_name);
    return j;
}

Json to_json(const JobAcceptArguments& args) {
    Json j = Json::object();
    j.set("identity", args.identity);
    j.set("name", args.name);
    j.set("metadata", args.metadata);
    Json attrs = Json::object();
    for (auto& kv : args.attributes) attrs.set(kv.first, kv.second);
    j.set("attributes", attrs);
    return j;
}

Json to_json(const RunningJobInfo& info) {
    Json j = Json::object();
    j.set("job", to_json(info.job));
    j.set("acceptArguments", to_json(info.accept_arguments));
    j.set("url", info.url);
    j.set("token", info.token);
    return j;
}

std::optional<Job> job_from_json(const Json& j) {
    if (!j.is_object()) return std::nullopt;
    Job job;
    job.id = j["id"].as_string();
    if (job.id.empty()) return std::nullopt;
    job.type = parse_job_type(j["type"].as_string()).value_or(JobType::Room);
    job.room.sid = j["room"]["sid"].as_string();
    job.room.name = j["room"]["name"].as_string();
    if (j["participant"].is_object()) {
        ParticipantInfo p;
        p.sid = j["participant"]["sid"].as_string();
        p.identity = j["participant"]["identity"].as_string();
        p.name = j["participant"]["name"].as_string();
        job.participant = p;
    }
    job.metadata = j["metadata"].as_string();
    job.agent_name = j["agentName"].as_string();
    return job;
}

JobAcceptArguments accept_arguments_from_json(const Json& j) {
    JobAcceptArguments args;
    args.identity = j["identity"].as_string();
    args.name = j["name"].as_string();
    args.metadata = j["metadata"].as_string();
    for (auto& m : j["attributes"].members()) args.attributes[m.first] = m.second.as_string();
    return args;
}

std::optional<RunningJobInfo> running_job_from_json(const Json& j) {
    auto job = job_from_json(j["job"]);
    if (!job) return std::nullopt;
    RunningJobInfo info;
    info.job = *job;
    info.accept_arguments = accept_arguments_from_json(j["acceptArguments"]);
    info.url = j["url"].as_string();
    info.token = j["token"].as_string();
    return info;
}

JobRequest::JobRequest(Job job, bool resuming, Answer answer)
    : m_job(std::move(job)), m_resuming(resuming), m_answer(std::move(answer)) {}

bool JobRequest::answered() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_answered;
}

bool JobRequest::accept(const JobAcceptArguments& args) {
    return answer(true, args);
}

bool JobRequest::reject() {
    return answer(false, {});
}

bool JobRequest::answer(bool available, const JobAcceptArguments& args) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_answered) return false;
        m_answered = true;
    }
    if (m_answer) m_answer(available, args);
    return true;
}

} // namespace agentworker
