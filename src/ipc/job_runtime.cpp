/*
 * Job-side IPC runtime implementation - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/ipc/job_runtime.hpp>
#include <algorithm>
#include <memory>
#include <thread>

namespace agentworker::ipc {

JobContext::JobContext(RunningJobInfo info, FrameChannel& channel)
    : m_info(std::move(info)), m_channel(channel) {}

bool JobContext::report_connected(const std::optional<std::string>& error) {
    if (m_reported.exchange(true)) return false;
    return m_channel.send(encode(StartJobResponse{error}));
}

bool JobContext::shutting_down() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shutdown;
}

bool JobContext::wait_for_shutdown(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [&] { return m_shutdown; });
}

std::string JobContext::shutdown_reason() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reason;
}

void JobContext::request_shutdown(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) return;
        m_shutdown = true;
        m_reason = reason;
    }
    m_cv.notify_all();
}

JobRuntime::JobRuntime(int fd, LoggerPtr logger, std::chrono::milliseconds orphan_timeout)
    : m_channel(fd), m_logger(std::move(logger)), m_orphan_timeout(orphan_timeout) {}

bool JobRuntime::send(const Message& msg) {
    if (!m_channel.send(encode(msg))) {
        m_logger->warn("failed to send to supervisor", {{"message", message_name(msg)}});
        return false;
    }
    return true;
}

int JobRuntime::run(const JobEntry& entry) {
    std::string payload;
    if (m_channel.recv(payload, m_orphan_timeout) != RecvStatus::Message) {
        m_logger->error("supervisor never initialized the process");
        return 1;
    }
    auto first = decode(payload);
    auto* init = first ? std::get_if<InitializeRequest>(&*first) : nullptr;
    if (!init) {
        m_logger->error("first message from supervisor must be initializeRequest");
        return 1;
    }
    // never give up on a supervisor that pings less often than the orphan window
    auto orphan_timeout = std::max(m_orphan_timeout, std::chrono::milliseconds(init->ping_interval_ms * 3));
    send(InitializeResponse{});
    m_logger->debug("process initialized");

    std::unique_ptr<JobContext> ctx;
    std::thread job_thread;
    std::atomic<bool> job_done{false};
    std::atomic<bool> job_failed{false};
    auto orphan_deadline = std::chrono::steady_clock::now() + orphan_timeout;

    auto stop_job = [&](const std::string& reason) {
        if (ctx) ctx->request_shutdown(reason);
        if (job_thread.joinable()) job_thread.join();
    };

    while (true) {
        if (job_done.load()) {
            stop_job("");
            send(UserExit{});
            return job_failed.load() ? 1 : 0;
        }
        if (std::chrono::steady_clock::now() >= orphan_deadline) {
            m_logger->warn("no ping from supervisor, exiting");
            stop_job("orphaned");
            return 1;
        }

        auto st = m_channel.recv(payload, std::chrono::milliseconds(100));
        if (st == RecvStatus::Timeout) continue;
        if (st == RecvStatus::Closed) {
            m_logger->error("supervisor channel closed");
            stop_job("supervisor gone");
            return 1;
        }
        auto msg = decode(payload);
        if (!msg) {
            m_logger->warn("dropping undecodable message from supervisor");
            continue;
        }

        if (auto* ping = std::get_if<PingRequest>(&*msg)) {
            send(PongResponse{ping->timestamp, now_ms()});
            orphan_deadline = std::chrono::steady_clock::now() + orphan_timeout;
        } else if (auto* start = std::get_if<StartJobRequest>(&*msg)) {
            if (ctx) {
                m_logger->error("job already started, ignoring startJobRequest", {{"job_id", start->running_job.job.id}});
                continue;
            }
            m_logger->info("starting job", {{"job_id", start->running_job.job.id}});
            ctx = std::make_unique<JobContext>(start->running_job, m_channel);
            JobContext* c = ctx.get();
            job_thread = std::thread([this, c, &entry, &job_done, &job_failed] {
                try {
                    entry(*c);
                    if (!c->reported()) c->report_connected();
                } catch (const std::exception& e) {
                    m_logger->error("job entry failed", {{"error", e.what()}});
                    job_failed = true;
                    if (!c->reported()) c->report_connected(std::string(e.what()));
                }
                job_done = true;
            });
        } else if (auto* shutdown = std::get_if<ShutdownRequest>(&*msg)) {
            m_logger->info("shutdown requested", {{"reason", shutdown->reason}});
            stop_job(shutdown->reason.empty() ? "shutdown requested" : shutdown->reason);
            send(Exiting{shutdown->reason});
            send(ShutdownResponse{});
            return 0;
        } else {
            m_logger->warn("unexpected message from supervisor", {{"message", message_name(*msg)}});
        }
    }
}

} // namespace agentworker::ipc
