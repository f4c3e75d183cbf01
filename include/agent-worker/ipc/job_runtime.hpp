/*
 * Job-side IPC runtime - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <agent-worker/ipc/channel.hpp>
#include <agent-worker/ipc/message.hpp>
#include <agent-worker/util/log.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace agentworker::ipc {

// Environment variable carrying the descriptor of the supervisor channel.
constexpr const char* kIpcFdEnv = "AGENT_WORKER_IPC_FD";

// What a running job sees of its supervisor.
class JobContext {
public:
    JobContext(RunningJobInfo info, FrameChannel& channel);

    const RunningJobInfo& info() const { return m_info; }

    // Sends StartJobResponse; only the first call is delivered.
    bool report_connected(const std::optional<std::string>& error = std::nullopt);
    bool reported() const { return m_reported.load(); }

    bool shutting_down() const;
    // true once a shutdown was requested, false when the timeout elapsed first
    bool wait_for_shutdown(std::chrono::milliseconds timeout) const;
    std::string shutdown_reason() const;

    void request_shutdown(const std::string& reason);

private:
    RunningJobInfo m_info;
    FrameChannel& m_channel;
    std::atomic<bool> m_reported{false};
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    bool m_shutdown = false;
    std::string m_reason;
};

using JobEntry = std::function<void(JobContext&)>;

// Drives one job process: initialize handshake, pings, the job entry and
// the final UserExit / ShutdownResponse. run() returns the exit status.
class JobRuntime {
public:
    JobRuntime(int fd, LoggerPtr logger, std::chrono::milliseconds orphan_timeout = std::chrono::seconds(15));

    int run(const JobEntry& entry);

private:
    bool send(const Message& msg);

    FrameChannel m_channel;
    LoggerPtr m_logger;
    std::chrono::milliseconds m_orphan_timeout;
};

} // namespace agentworker::ipc
