/*
 * Process pool - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <agent-worker/proc/job_process.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace agentworker {

struct PoolOptions {
    std::size_t num_idle = 3;
    std::size_t max_concurrent_initializations = 3;
    SpawnArgs spawn;
    ProcessOptions process;
    // job id, clean exit; called on the exiting supervisor's thread
    std::function<void(const std::string& job_id, bool clean)> on_job_exit;
};

// Keeps num_idle warm job processes and maps running jobs to their process.
class ProcPool {
public:
    ProcPool(PoolOptions options, std::shared_ptr<ProcessLauncher> launcher, LoggerPtr logger);
    ~ProcPool();
    ProcPool(const ProcPool&) = delete;
    ProcPool& operator=(const ProcPool&) = delete;

    void start();

    // Attaches the job to a warm process, or to a cold one when none is idle.
    // Throws std::system_error if a cold spawn fails, std::runtime_error once closed.
    std::shared_ptr<JobProcess> launch_job(const RunningJobInfo& info);

    // nullptr when the job is not (or no longer) running here
    std::shared_ptr<JobProcess> get_by_job_id(const std::string& job_id) const;
    std::vector<std::shared_ptr<JobProcess>> processes() const;
    std::size_t idle_count() const;
    std::size_t warm_count() const;

    // Closes idle processes, stops replenishing and waits for running jobs.
    // false when the timeout elapsed first.
    bool drain(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Closes idle processes and joins running ones; once grace elapses the
    // rest are asked to shut down (and killed after their close timeout).
    void close(std::optional<std::chrono::milliseconds> grace = std::nullopt);

private:
    std::shared_ptr<JobProcess> spawn_locked();
    void maintain();
    static bool is_idle(const JobProcess& proc);

    PoolOptions m_opts;
    std::shared_ptr<ProcessLauncher> m_launcher;
    LoggerPtr m_logger;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<std::shared_ptr<JobProcess>> m_procs;
    bool m_started = false;
    bool m_replenish = true;
    bool m_stopping = false;
    bool m_closed = false;
    std::thread m_thread;
};

} // namespace agentworker
