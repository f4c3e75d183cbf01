/*
 * Worker connection implementation - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/worker/worker.hpp>
#include <agent-worker/errors.hpp>
#include <agent-worker/worker/token.hpp>
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace agentworker {

namespace {

std::string getenv_or(const char* k, const std::string& def = "") {
    const char* v = std::getenv(k);
    return v ? std::string(v) : def;
}

std::string format_load(double load) {
    std::ostringstream os;
    os.precision(2);
    os << std::fixed << load;
    return os.str();
}

} // namespace

const char* worker_state_name(WorkerState state) {
    switch (state) {
        case WorkerState::Disconnected: return "disconnected";
        case WorkerState::Connecting: return "connecting";
        case WorkerState::Registered: return "registered";
        case WorkerState::Reconnecting: return "reconnecting";
        case WorkerState::Draining: return "draining";
        case WorkerState::Closed: return "closed";
    }
    return "unknown";
}

Worker::Worker(WorkerOptions options, LoggerPtr logger, std::unique_ptr<Transport> transport,
               std::shared_ptr<ProcessLauncher> launcher, TokenMinter minter)
    : m_opts(std::move(options)), m_logger(std::move(logger)), m_transport(std::move(transport)),
      m_launcher(std::move(launcher)), m_minter(std::move(minter)) {
    if (m_opts.url.empty()) m_opts.url = getenv_or("AGENT_WORKER_URL");
    if (m_opts.api_key.empty()) m_opts.api_key = getenv_or("AGENT_WORKER_API_KEY");
    if (m_opts.api_secret.empty()) m_opts.api_secret = getenv_or("AGENT_WORKER_API_SECRET");
    if (m_opts.url.empty()) throw CredentialsError("control plane url is required (AGENT_WORKER_URL)");
    if (m_opts.api_key.empty()) throw CredentialsError("api key is required (AGENT_WORKER_API_KEY)");
    if (m_opts.api_secret.empty()) throw CredentialsError("api secret is required (AGENT_WORKER_API_SECRET)");

    if (!m_opts.request_fnc) m_opts.request_fnc = [](JobRequest& req) { req.accept(); };
    if (!m_opts.load_fnc) {
        m_sampler = std::make_unique<CpuLoadSampler>();
        CpuLoadSampler* sampler = m_sampler.get();
        m_opts.load_fnc = [sampler] { return sampler->sample(); };
    }
    if (!m_transport) m_transport = std::make_unique<CurlWebSocketTransport>();
    if (!m_launcher) m_launcher = std::make_shared<PosixProcessLauncher>();
    if (!m_minter) m_minter = [](const std::string& k, const std::string& s) { return mint_access_token(k, s); };

    PoolOptions pool_opts;
    pool_opts.num_idle = m_opts.num_idle_processes;
    pool_opts.spawn.executable = m_opts.job_executable;
    pool_opts.spawn.args = m_opts.job_args;
    pool_opts.process = m_opts.process;
    pool_opts.on_job_exit = [this](const std::string& job_id, bool clean) { on_job_exit(job_id, clean); };
    m_pool = std::make_unique<ProcPool>(std::move(pool_opts), m_launcher, m_logger->child({{"component", "pool"}}));
}

Worker::~Worker() {
    close();
}

void Worker::run() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closing) return;
        if (m_running) throw std::logic_error("worker is already running");
        m_running = true;
        m_run_thread = std::this_thread::get_id();
    }
    struct RunningGuard {
        Worker& w;
        ~RunningGuard() {
            {
                std::lock_guard<std::mutex> lock(w.m_mutex);
                w.m_running = false;
            }
            w.m_cv.notify_all();
        }
    } guard{*this};

    m_pool->start();
    int retries = 0;
    while (!closing()) {
        try {
            set_state(WorkerState::Connecting);
            connect_and_register();
            retries = 0;
            session_loop();
            break;
        } catch (const TransportError& e) {
            set_connected(false);
            if (closing()) break;
            if (retries >= m_opts.max_retry) {
                set_state(WorkerState::Disconnected);
                throw ConnectionError("failed to connect to the control plane after " + std::to_string(retries) +
                                      " attempts: " + e.what());
            }
            ++retries;
            auto delay = std::min(m_opts.retry_step * retries, m_opts.retry_max);
            m_logger->warn("failed to connect to the control plane, retrying",
                           {{"attempt", std::to_string(retries)}, {"delay_ms", std::to_string(delay.count())}, {"error", e.what()}});
            set_state(WorkerState::Reconnecting);
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait_for(lock, delay, [&] { return m_closing; });
        }
    }
}

void Worker::connect_and_register() {
    std::string url = to_websocket_url(m_opts.url);
    while (!url.empty() && url.back() == '/') url.pop_back();
    url += "/agent";
    std::string token = m_minter(m_opts.api_key, m_opts.api_secret);
    m_transport->connect(url, token);

    protocol::RegisterRequest reg;
    reg.type = m_opts.worker_type;
    reg.agent_name = m_opts.agent_name;
    reg.version = kWorkerVersion;
    reg.permissions = m_opts.permissions;
    {
        std::lock_guard<std::mutex> lock(m_send_mutex);
        m_transport->send(protocol::encode(reg));
    }

    auto first = m_transport->receive(m_opts.register_timeout);
    if (!first) throw TransportError("timed out waiting for the register response");
    auto msg = protocol::decode_server_message(*first);
    auto* ack = msg ? std::get_if<protocol::RegisterResponse>(&*msg) : nullptr;
    if (!ack) {
        m_transport->close();
        throw ProtocolError("expected a register response as the first message from the control plane");
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_id = ack->worker_id;
        m_state = m_draining ? WorkerState::Draining : WorkerState::Registered;
    }
    set_connected(true);
    m_logger->info("registered worker", {{"id", ack->worker_id}, {"url", m_opts.url},
                                         {"server_version", ack->server_info["version"].as_string()}});
    if (m_opts.on_registered) m_opts.on_registered(ack->worker_id);
    if (m_opts.simulate_on_register && !m_simulated) {
        m_simulated = true;
        m_logger->info("requesting a simulated job", {{"room", m_opts.simulate_on_register->room_name}});
        send(*m_opts.simulate_on_register);
    }
}

void Worker::session_loop() {
    auto next_update = Clock::now();
    while (!closing()) {
        auto now = Clock::now();
        if (now >= next_update) {
            report_load();
            next_update = now + m_opts.update_interval;
        }
        expire_pending();

        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next_update - Clock::now());
        wait = std::max(std::chrono::milliseconds(0), std::min(wait, std::chrono::milliseconds(50)));
        auto text = m_transport->receive(wait);
        if (!text) continue;
        auto msg = protocol::decode_server_message(*text);
        if (!msg) {
            m_logger->warn("ignoring unrecognised message from the control plane");
            continue;
        }
        dispatch(*msg);
    }
}

void Worker::dispatch(const protocol::ServerMessage& msg) {
    std::visit([&](auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, protocol::RegisterResponse>) {
            m_logger->warn("unexpected register response, ignoring");
        } else if constexpr (std::is_same_v<T, protocol::AvailabilityRequest>) {
            handle_availability(m);
        } else if constexpr (std::is_same_v<T, protocol::JobAssignment>) {
            handle_assignment(m);
        } else if constexpr (std::is_same_v<T, protocol::JobTermination>) {
            handle_termination(m);
        } else {
            static_assert(ipc::always_false_v<T>, "unhandled server message");
        }
    }, msg);
}

void Worker::handle_availability(const protocol::AvailabilityRequest& req) {
    const Job& job = req.job;
    bool draining = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        draining = m_draining || m_closing;
        if (!draining) {
            if (m_offers.count(job.id) || m_pending.count(job.id)) {
                m_logger->warn("duplicate availability request, ignoring", {{"job_id", job.id}});
                return;
            }
            m_offers.insert(job.id);
        }
    }
    if (draining) {
        m_logger->debug("worker is draining, declining job", {{"job_id", job.id}});
        send(protocol::AvailabilityResponse{job.id, false, {}});
        return;
    }

    bool resuming = req.resuming;
    spawn_task([this, job, resuming] {
        JobRequest request(job, resuming, [this, job](bool available, const JobAcceptArguments& args) {
            answer_availability(job, available, args);
        });
        try {
            m_opts.request_fnc(request);
        } catch (const std::exception& e) {
            m_logger->error("job request handler failed", {{"job_id", job.id}, {"error", e.what()}});
        }
        if (!request.answered()) {
            m_logger->warn("no answer to job request, rejecting", {{"job_id", job.id}});
            request.reject();
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_offers.erase(job.id);
    });
}

void Worker::answer_availability(const Job& job, bool available, const JobAcceptArguments& args) {
    if (!available) {
        m_logger->debug("rejected job", {{"job_id", job.id}});
        send(protocol::AvailabilityResponse{job.id, false, {}});
        return;
    }
    bool draining = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        draining = m_draining || m_closing;
        // recorded before replying, so the assignment always finds it
        if (!draining) m_pending[job.id] = PendingAssignment{args, Clock::now() + m_opts.assignment_timeout};
    }
    if (draining) {
        m_logger->info("worker started draining, declining accepted job", {{"job_id", job.id}});
        send(protocol::AvailabilityResponse{job.id, false, {}});
        return;
    }
    m_logger->info("accepted job, waiting for assignment", {{"job_id", job.id}});
    send(protocol::AvailabilityResponse{job.id, true, args});
}

void Worker::handle_assignment(const protocol::JobAssignment& assignment) {
    std::optional<PendingAssignment> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_pending.find(assignment.job.id);
        if (it != m_pending.end()) {
            pending = it->second;
            m_pending.erase(it);
        }
    }
    if (!pending) {
        m_logger->warn("received assignment for an unknown job", {{"job_id", assignment.job.id}});
        return;
    }
    if (Clock::now() >= pending->deadline) {
        m_logger->warn("assignment for job timed out", {{"job_id", assignment.job.id}});
        return;
    }

    RunningJobInfo info;
    info.job = assignment.job;
    info.accept_arguments = pending->accept_arguments;
    info.url = assignment.url.empty() ? m_opts.url : assignment.url;
    info.token = assignment.token;
    std::lock_guard<std::mutex> launch(m_launch_mutex);
    if (draining()) {
        m_logger->warn("worker is draining, refusing assignment", {{"job_id", info.job.id}});
        send(protocol::UpdateJob{info.job.id, protocol::JobStatus::Failed, "worker is draining"});
        return;
    }
    try {
        auto proc = m_pool->launch_job(info);
        m_logger->info("launched job", {{"job_id", info.job.id}, {"pid", std::to_string(proc->pid())}});
    } catch (const std::exception& e) {
        m_logger->error("failed to launch job", {{"job_id", info.job.id}, {"error", e.what()}});
        send(protocol::UpdateJob{info.job.id, protocol::JobStatus::Failed, e.what()});
    }
}

void Worker::handle_termination(const protocol::JobTermination& termination) {
    auto proc = m_pool->get_by_job_id(termination.job_id);
    if (!proc) {
        m_logger->debug("termination for a job that is not running, ignoring", {{"job_id", termination.job_id}});
        return;
    }
    m_logger->info("terminating job", {{"job_id", termination.job_id}});
    spawn_task([proc] { proc->close(); });
}

void Worker::expire_pending() {
    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto now = Clock::now();
        for (auto it = m_pending.begin(); it != m_pending.end();) {
            if (now >= it->second.deadline) {
                expired.push_back(it->first);
                it = m_pending.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& id : expired)
        m_logger->warn("assignment for job timed out", {{"job_id", id}});
}

void Worker::report_load() {
    double load = 0.0;
    try {
        load = m_opts.load_fnc();
    } catch (const std::exception& e) {
        m_logger->warn("load function failed", {{"error", e.what()}});
    }
    WorkerStatus status;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        status = (m_draining || load >= m_opts.load_threshold) ? WorkerStatus::Full : WorkerStatus::Available;
        changed = status != m_status;
        m_status = status;
    }
    if (changed) {
        if (status == WorkerStatus::Full)
            m_logger->info("worker is at full capacity, marking as unavailable", {{"load", format_load(load)}});
        else
            m_logger->info("worker is below capacity, marking as available", {{"load", format_load(load)}});
    }
    send(protocol::UpdateWorker{load, status});
}

void Worker::on_job_exit(const std::string& job_id, bool clean) {
    m_logger->info("job ended", {{"job_id", job_id}, {"clean", clean ? "true" : "false"}});
    send(protocol::UpdateJob{job_id, clean ? protocol::JobStatus::Success : protocol::JobStatus::Failed,
                             clean ? "" : "job process exited abnormally"});
}

void Worker::drain(std::optional<std::chrono::milliseconds> timeout) {
    {
        std::lock_guard<std::mutex> launch(m_launch_mutex);
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closing) return;
        m_draining = true;
        m_status = WorkerStatus::Full;
        m_state = WorkerState::Draining;
    }
    m_logger->info("draining worker", {{"id", id()}});
    send(protocol::UpdateWorker{std::nullopt, WorkerStatus::Full});
    if (!m_pool->drain(timeout)) throw DrainTimeoutError("timed out draining the worker");
    m_logger->info("worker drained");
}

void Worker::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closing) return;
        m_closing = true;
    }
    m_cv.notify_all();
    m_logger->info("shutting down worker");

    m_pool->close(std::chrono::milliseconds(0));
    wait_tasks();
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_run_thread != std::this_thread::get_id())
            m_cv.wait(lock, [&] { return !m_running; });
    }
    {
        std::lock_guard<std::mutex> lock(m_send_mutex);
        m_connected = false;
        m_transport->close();
    }
    set_state(WorkerState::Closed);
}

bool Worker::shutdown(bool drain_first, std::optional<std::chrono::milliseconds> drain_timeout) {
    bool drained = true;
    if (drain_first) {
        try {
            drain(drain_timeout);
        } catch (const DrainTimeoutError& e) {
            m_logger->error(e.what());
            drained = false;
        }
    }
    close();
    return drained;
}

bool Worker::simulate_job(JobType type, const std::string& room_name, const std::optional<std::string>& participant_identity) {
    return send(protocol::SimulateJob{type, room_name, participant_identity});
}

bool Worker::send(const protocol::WorkerMessage& msg) {
    std::lock_guard<std::mutex> lock(m_send_mutex);
    if (!m_connected) {
        m_logger->debug("not connected, dropping message");
        return false;
    }
    try {
        m_transport->send(protocol::encode(msg));
        return true;
    } catch (const TransportError& e) {
        m_logger->warn("failed to send to the control plane", {{"error", e.what()}});
        return false;
    }
}

void Worker::set_connected(bool connected) {
    std::lock_guard<std::mutex> lock(m_send_mutex);
    m_connected = connected;
}

void Worker::set_state(WorkerState state) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == state) return;
    // draining and closed are sticky
    if (m_state == WorkerState::Closed) return;
    if (m_state == WorkerState::Draining && state == WorkerState::Registered) return;
    m_state = state;
}

bool Worker::closing() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closing;
}

void Worker::spawn_task(std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(m_tasks_mutex);
    m_tasks.erase(std::remove_if(m_tasks.begin(), m_tasks.end(), [](std::future<void>& f) {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }), m_tasks.end());
    m_tasks.push_back(std::async(std::launch::async, std::move(fn)));
}

void Worker::wait_tasks() {
    while (true) {
        std::vector<std::future<void>> tasks;
        {
            std::lock_guard<std::mutex> lock(m_tasks_mutex);
            tasks.swap(m_tasks);
        }
        if (tasks.empty()) return;
        for (auto& t : tasks) t.wait();
    }
}

std::string Worker::id() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_id;
}

WorkerState Worker::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

WorkerStatus Worker::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

bool Worker::draining() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_draining;
}

std::vector<RunningJobInfo> Worker::active_jobs() const {
    std::vector<RunningJobInfo> jobs;
    for (auto& p : m_pool->processes()) {
        if (p->state() == JobProcessState::Closed) continue;
        if (auto job = p->running_job()) jobs.push_back(*job);
    }
    return jobs;
}

} // namespace agentworker
