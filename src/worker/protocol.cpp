/*
 * Control-plane wire codec - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/worker/protocol.hpp>
#include <type_traits>

namespace agentworker::protocol {

template <class> inline constexpr bool always_false_v = false;

const char* worker_status_name(WorkerStatus status) {
    return status == WorkerStatus::Full ? "WS_FULL" : "WS_AVAILABLE";
}

const char* job_status_name(JobStatus status) {
    return status == JobStatus::Failed ? "JS_FAILED" : "JS_SUCCESS";
}

namespace {

Json permissions_to_json(const WorkerPermissions& p) {
    Json j = Json::object();
    j.set("canPublish", p.can_publish);
    j.set("canSubscribe", p.can_subscribe);
    j.set("canPublishData", p.can_publish_data);
    j.set("canUpdateMetadata", p.can_update_metadata);
    Json sources = Json::array();
    for (auto& s : p.can_publish_sources) sources.push_back(s);
    j.set("canPublishSources", sources);
    j.set("hidden", p.hidden);
    j.set("agent", p.agent);
    return j;
}

WorkerPermissions permissions_from_json(const Json& j) {
    WorkerPermissions p;
    p.can_publish = j["canPublish"].as_bool(true);
    p.can_subscribe = j["canSubscribe"].as_bool(true);
    p.can_publish_data = j["canPublishData"].as_bool(true);
    p.can_update_metadata = j["canUpdateMetadata"].as_bool(true);
    for (auto& s : j["canPublishSources"].items()) p.can_publish_sources.push_back(s.as_string());
    p.hidden = j["hidden"].as_bool(false);
    p.agent = j["agent"].as_bool(true);
    return p;
}

Json wrap(const char* key, Json body) {
    Json j = Json::object();
    j.set(key, std::move(body));
    return j;
}

// {"<case>": {...}} -> (case, body)
std::optional<std::pair<std::string, Json>> unwrap(const std::string& text) {
    auto parsed = Json::parse(text);
    if (!parsed || !parsed->is_object() || parsed->members().size() != 1) return std::nullopt;
    auto& m = parsed->members().front();
    if (!m.second.is_object()) return std::nullopt;
    return std::make_pair(m.first, m.second);
}

} // namespace

std::string encode(const WorkerMessage& msg) {
    return std::visit([](auto& m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        Json b = Json::object();
        if constexpr (std::is_same_v<T, RegisterRequest>) {
            b.set("type", job_type_name(m.type));
            b.set("agentName", m.agent_name);
            b.set("version", m.version);
            b.set("protocolVersion", m.protocol_version);
            b.set("allowedPermissions", permissions_to_json(m.permissions));
            return wrap("register", b).dump();
        } else if constexpr (std::is_same_v<T, AvailabilityResponse>) {
            b.set("jobId", m.job_id);
            b.set("available", m.available);
            if (m.available) {
                auto& a = m.accept_arguments;
                if (!a.identity.empty()) b.set("participantIdentity", a.identity);
                if (!a.name.empty()) b.set("participantName", a.name);
                if (!a.metadata.empty()) b.set("participantMetadata", a.metadata);
                if (!a.attributes.empty()) {
                    Json attrs = Json::object();
                    for (auto& kv : a.attributes) attrs.set(kv.first, kv.second);
                    b.set("participantAttributes", attrs);
                }
            }
            return wrap("availability", b).dump();
        } else if constexpr (std::is_same_v<T, UpdateWorker>) {
            if (m.load) b.set("load", *m.load);
            b.set("status", worker_status_name(m.status));
            return wrap("updateWorker", b).dump();
        } else if constexpr (std::is_same_v<T, UpdateJob>) {
            b.set("jobId", m.job_id);
            b.set("status", job_status_name(m.status));
            if (!m.error.empty()) b.set("error", m.error);
            return wrap("updateJob", b).dump();
        } else if constexpr (std::is_same_v<T, SimulateJob>) {
            b.set("type", job_type_name(m.type));
            b.set("room", Json::object().set("name", m.room_name));
            if (m.participant_identity) b.set("participant", Json::object().set("identity", *m.participant_identity));
            return wrap("simulateJob", b).dump();
        } else {
            static_assert(always_false_v<T>, "unhandled worker message");
        }
    }, msg);
}

std::optional<WorkerMessage> decode_worker_message(const std::string& text) {
    auto u = unwrap(text);
    if (!u) return std::nullopt;
    const std::string& kind = u->first;
    const Json& b = u->second;
    if (kind == "register") {
        RegisterRequest m;
        m.type = parse_job_type(b["type"].as_string()).value_or(JobType::Room);
        m.agent_name = b["agentName"].as_string();
        m.version = b["version"].as_string();
        m.protocol_version = static_cast<int>(b["protocolVersion"].as_int64(kProtocolVersion));
        m.permissions = permissions_from_json(b["allowedPermissions"]);
        return WorkerMessage{m};
    }
    if (kind == "availability") {
        AvailabilityResponse m;
        m.job_id = b["jobId"].as_string();
        m.available = b["available"].as_bool();
        m.accept_arguments.identity = b["participantIdentity"].as_string();
        m.accept_arguments.name = b["participantName"].as_string();
        m.accept_arguments.metadata = b["participantMetadata"].as_string();
        for (auto& kv : b["participantAttributes"].members()) m.accept_arguments.attributes[kv.first] = kv.second.as_string();
        return WorkerMessage{m};
    }
    if (kind == "updateWorker") {
        UpdateWorker m;
        if (b["load"].is_number()) m.load = b["load"].as_number();
        m.status = b["status"].as_string() == "WS_FULL" ? WorkerStatus::Full : WorkerStatus::Available;
        return WorkerMessage{m};
    }
    if (kind == "updateJob") {
        UpdateJob m;
        m.job_id = b["jobId"].as_string();
        m.status = b["status"].as_string() == "JS_FAILED" ? JobStatus::Failed : JobStatus::Success;
        m.error = b["error"].as_string();
        return WorkerMessage{m};
    }
    if (kind == "simulateJob") {
        SimulateJob m;
        m.type = parse_job_type(b["type"].as_string()).value_or(JobType::Room);
        m.room_name = b["room"]["name"].as_string();
        if (b["participant"].is_object()) m.participant_identity = b["participant"]["identity"].as_string();
        return WorkerMessage{m};
    }
    return std::nullopt;
}

std::string encode(const ServerMessage& msg) {
    return std::visit([](auto& m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        Json b = Json::object();
        if constexpr (std::is_same_v<T, RegisterResponse>) {
            b.set("workerId", m.worker_id);
            b.set("serverInfo", m.server_info.is_object() ? m.server_info : Json::object());
            return wrap("register", b).dump();
        } else if constexpr (std::is_same_v<T, AvailabilityRequest>) {
            b.set("job", to_json(m.job));
            b.set("resuming", m.resuming);
            return wrap("availability", b).dump();
        } else if constexpr (std::is_same_v<T, JobAssignment>) {
            b.set("job", to_json(m.job));
            b.set("url", m.url);
            b.set("token", m.token);
            return wrap("assignment", b).dump();
        } else if constexpr (std::is_same_v<T, JobTermination>) {
            b.set("jobId", m.job_id);
            return wrap("termination", b).dump();
        } else {
            static_assert(always_false_v<T>, "unhandled server message");
        }
    }, msg);
}

std::optional<ServerMessage> decode_server_message(const std::string& text) {
    auto u = unwrap(text);
    if (!u) return std::nullopt;
    const std::string& kind = u->first;
    const Json& b = u->second;
    if (kind == "register") {
        RegisterResponse m;
        m.worker_id = b["workerId"].as_string();
        m.server_info = b["serverInfo"];
        return ServerMessage{m};
    }
    if (kind == "availability") {
        auto job = job_from_json(b["job"]);
        if (!job) return std::nullopt;
        return ServerMessage{AvailabilityRequest{*job, b["resuming"].as_bool()}};
    }
    if (kind == "assignment") {
        auto job = job_from_json(b["job"]);
        if (!job) return std::nullopt;
        return ServerMessage{JobAssignment{*job, b["url"].as_string(), b["token"].as_string()}};
    }
    if (kind == "termination") {
        auto id = b["jobId"].as_string();
        if (id.empty()) return std::nullopt;
        return ServerMessage{JobTermination{id}};
    }
    return std::nullopt;
}

} // namespace agentworker::protocol
