/*
 * Job process supervisor implementation - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/proc/job_process.hpp>
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace agentworker {

const char* job_process_state_name(JobProcessState state) {
    switch (state) {
        case JobProcessState::Starting: return "starting";
        case JobProcessState::Running: return "running";
        case JobProcessState::ShuttingDown: return "shutting_down";
        case JobProcessState::Closed: return "closed";
    }
    return "unknown";
}

JobProcess::JobProcess(std::shared_ptr<ProcessLauncher> launcher, SpawnArgs spawn, ProcessOptions options, LoggerPtr logger)
    : m_launcher(std::move(launcher)), m_spawn(std::move(spawn)), m_opts(options), m_logger(std::move(logger)) {}

JobProcess::~JobProcess() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_started && !m_exited) {
            begin_close_locked("supervisor destroyed");
            m_kill_deadline = Clock::now();
        }
    }
    if (m_thread.joinable()) m_thread.join();
}

void JobProcess::start() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_started) throw std::logic_error("job process already started");
        if (m_close_requested) throw std::logic_error("job process is closing");
        m_handle = m_launcher->spawn(m_spawn);
        m_logger = m_logger->child({{"pid", std::to_string(m_handle->pid())}});
        m_started = true;

        ipc::InitializeRequest init;
        init.ping_interval_ms = m_opts.ping_interval.count();
        init.ping_timeout_ms = m_opts.ping_timeout.count();
        init.high_ping_threshold_ms = m_opts.high_ping_threshold_ms;
        send_locked(init);

        auto now = Clock::now();
        m_start_deadline = now + m_opts.initialize_timeout;
        m_next_ping = now + m_opts.ping_interval;
        m_pong_deadline = now + m_opts.ping_timeout;
        m_logger->debug("job process spawned");
    }
    m_thread = std::thread(&JobProcess::supervise, this);
}

void JobProcess::launch_job(const RunningJobInfo& info) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_started) throw std::logic_error("job process not started");
    if (m_job) throw std::logic_error("job process already has a job");
    if (m_close_requested || m_exited) throw std::logic_error("job process is closing");
    m_job = info;
    // the start timer now guards the job start instead of the warm-up
    m_start_deadline = Clock::now() + m_opts.start_timeout;
    send_locked(ipc::StartJobRequest{info});
    m_logger->info("job assigned to process", job_fields());
}

void JobProcess::begin_close(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        begin_close_locked(reason);
    }
    m_cv.notify_all();
}

void JobProcess::close() {
    begin_close();
    join();
}

void JobProcess::join() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [&] { return m_exited; });
}

bool JobProcess::join_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [&] { return m_exited; });
}

JobProcessState JobProcess::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool JobProcess::initialized() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_initialized;
}

bool JobProcess::closing() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_close_requested || m_exited;
}

bool JobProcess::has_job() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_job.has_value();
}

std::optional<RunningJobInfo> JobProcess::running_job() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_job;
}

std::optional<std::string> JobProcess::job_id() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_job) return std::nullopt;
    return m_job->job.id;
}

ActiveTimers JobProcess::timers() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return ActiveTimers{m_start_deadline.has_value(), m_next_ping.has_value(), m_pong_deadline.has_value()};
}

std::optional<int> JobProcess::exit_code() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_exit_code;
}

int JobProcess::pid() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handle ? m_handle->pid() : -1;
}

void JobProcess::supervise() {
    auto slice = std::min(std::chrono::milliseconds(100), m_opts.ping_interval);
    if (slice.count() <= 0) slice = std::chrono::milliseconds(10);
    while (true) {
        if (!m_channel_closed) {
            ipc::Message msg;
            auto st = m_handle->receive(msg, slice);
            if (st == ipc::RecvStatus::Message) {
                handle_message(msg);
            } else if (st == ipc::RecvStatus::Invalid) {
                m_logger->warn("dropping undecodable message from job process");
            } else if (st == ipc::RecvStatus::Closed) {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_channel_closed = true;
                if (!m_final_received && !m_killed && !m_kill_deadline)
                    m_kill_deadline = Clock::now() + m_opts.close_timeout;
                m_logger->debug("job process channel closed");
            }
        } else {
            std::this_thread::sleep_for(std::min(slice, std::chrono::milliseconds(20)));
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            check_timers();
        }
        if (auto code = m_handle->try_wait()) {
            on_exited(*code);
            return;
        }
    }
}

void JobProcess::handle_message(const ipc::Message& msg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::visit([&](auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ipc::InitializeResponse>) {
            m_initialized = true;
            if (!m_job) m_start_deadline.reset();
            m_logger->debug("job process initialized");
        } else if constexpr (std::is_same_v<T, ipc::StartJobResponse>) {
            if (!m_job) {
                m_logger->warn("startJobResponse without an attached job");
                return;
            }
            if (m_state != JobProcessState::Starting) return;
            if (m.error) {
                auto fields = job_fields();
                fields.emplace_back("error", *m.error);
                m_logger->error("job failed to start", fields);
                clear_timers();
                kill_locked();
                return;
            }
            m_start_deadline.reset();
            m_state = JobProcessState::Running;
            m_logger->info("job started", job_fields());
        } else if constexpr (std::is_same_v<T, ipc::PongResponse>) {
            auto delay = m.timestamp - m.last_timestamp;
            if (static_cast<double>(delay) > m_opts.high_ping_threshold_ms) {
                auto fields = job_fields();
                fields.emplace_back("delay_ms", std::to_string(delay));
                m_logger->warn("job process is responding slowly", fields);
            }
            if (m_pong_deadline) m_pong_deadline = Clock::now() + m_opts.ping_timeout;
        } else if constexpr (std::is_same_v<T, ipc::Exiting>) {
            auto fields = job_fields();
            fields.emplace_back("reason", m.reason);
            m_logger->info("job process exiting", fields);
        } else if constexpr (std::is_same_v<T, ipc::UserExit> || std::is_same_v<T, ipc::ShutdownResponse>) {
            if (m_final_received) {
                m_logger->warn("duplicate final message from job process", {{"message", ipc::message_name(msg)}});
                return;
            }
            m_final_received = true;
            clear_timers();
            m_kill_deadline = Clock::now() + m_opts.close_timeout;
            if (m_state == JobProcessState::Running) m_state = JobProcessState::ShuttingDown;
            m_logger->debug("job process finished", {{"message", ipc::message_name(msg)}});
        } else {
            m_logger->warn("unexpected message from job process", {{"message", ipc::message_name(msg)}});
        }
    }, msg);
}

void JobProcess::on_exited(int code) {
    bool clean = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        clear_timers();
        m_kill_deadline.reset();
        m_exited = true;
        m_exit_code = code;
        // a running job always passes through ShuttingDown
        if (m_state == JobProcessState::Running) m_state = JobProcessState::ShuttingDown;
        m_state = JobProcessState::Closed;
        clean = m_final_received && code == 0 && !m_killed;
        auto fields = job_fields();
        fields.emplace_back("exit_code", std::to_string(code));
        if (clean) m_logger->info("job process exited", fields);
        else m_logger->warn("job process exited abnormally", fields);
    }
    m_cv.notify_all();
    if (m_on_exit) m_on_exit(*this, clean);
}

void JobProcess::check_timers() {
    auto now = Clock::now();
    if (m_start_deadline && now >= *m_start_deadline) {
        m_logger->error(m_job ? "job process did not start in time" : "job process did not initialize in time", job_fields());
        clear_timers();
        kill_locked();
        return;
    }
    if (m_pong_deadline && now >= *m_pong_deadline) {
        m_logger->error("job process is not responding, killing it", job_fields());
        clear_timers();
        kill_locked();
        return;
    }
    if (m_next_ping && now >= *m_next_ping) {
        send_locked(ipc::PingRequest{ipc::now_ms()});
        m_next_ping = now + m_opts.ping_interval;
        check_memory();
    }
    if (m_kill_deadline && now >= *m_kill_deadline) {
        m_logger->warn("job process did not exit in time, killing it", job_fields());
        kill_locked();
    }
}

void JobProcess::check_memory() {
    if (m_opts.memory_warn_mb <= 0 && m_opts.memory_limit_mb <= 0) return;
    auto rss = m_handle->rss_mb();
    if (!rss) return;
    std::ostringstream mb;
    mb << *rss;
    if (m_opts.memory_limit_mb > 0 && *rss > m_opts.memory_limit_mb) {
        auto fields = job_fields();
        fields.emplace_back("memory_mb", mb.str());
        m_logger->error("job process exceeded its memory limit, shutting down", fields);
        begin_close_locked("memory limit exceeded");
        return;
    }
    if (m_opts.memory_warn_mb > 0 && *rss > m_opts.memory_warn_mb) {
        if (!m_memory_warned) {
            auto fields = job_fields();
            fields.emplace_back("memory_mb", mb.str());
            m_logger->warn("job process memory usage is high", fields);
        }
        m_memory_warned = true;
    } else {
        m_memory_warned = false;
    }
}

void JobProcess::clear_timers() {
    m_start_deadline.reset();
    m_next_ping.reset();
    m_pong_deadline.reset();
}

void JobProcess::begin_close_locked(const std::string& reason) {
    if (m_close_requested) return;
    m_close_requested = true;
    if (!m_started || m_exited) {
        m_exited = true;
        m_state = JobProcessState::Closed;
        return;
    }
    clear_timers();
    if (!m_final_received && !m_killed) {
        send_locked(ipc::ShutdownRequest{reason});
        m_kill_deadline = Clock::now() + m_opts.close_timeout;
    }
    m_state = JobProcessState::ShuttingDown;
    auto fields = job_fields();
    if (!reason.empty()) fields.emplace_back("reason", reason);
    m_logger->debug("closing job process", fields);
}

void JobProcess::kill_locked() {
    m_handle->kill();
    m_killed = true;
    m_kill_deadline.reset();
    if (m_state == JobProcessState::Running) m_state = JobProcessState::ShuttingDown;
}

void JobProcess::send_locked(const ipc::Message& msg) {
    if (!m_handle->send(msg))
        m_logger->debug("failed to send to job process", {{"message", ipc::message_name(msg)}});
}

std::vector<LogField> JobProcess::job_fields() const {
    if (!m_job) return {};
    return {{"job_id", m_job->job.id}};
}

} // namespace agentworker
