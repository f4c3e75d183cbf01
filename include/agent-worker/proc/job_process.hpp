/*
 * Job process supervisor - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <agent-worker/job/job.hpp>
#include <agent-worker/proc/launcher.hpp>
#include <agent-worker/util/log.hpp>
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

// A warm idle process has answered InitializeRequest but reports Starting
// until its job starts; initialized() tells the two apart.
enum class JobProcessState { Starting, Running, ShuttingDown, Closed };

const char* job_process_state_name(JobProcessState state);

struct ProcessOptions {
    std::chrono::milliseconds initialize_timeout{10000};
    std::chrono::milliseconds start_timeout{90000};
    std::chrono::milliseconds ping_interval{5000};
    std::chrono::milliseconds ping_timeout{90000};
    double high_ping_threshold_ms = 10.0;
    std::chrono::milliseconds close_timeout{60000}; // ShutdownRequest -> kill
    double memory_warn_mb = 0.0;   // 0 disables
    double memory_limit_mb = 0.0;  // 0 disables
};

struct ActiveTimers {
    bool start = false;
    bool ping = false;
    bool pong = false;
};

// Supervises one spawned process: start handshake, heartbeat and shutdown.
// All timers are deadlines evaluated by the supervisor thread.
class JobProcess {
public:
    // clean: the process said goodbye (UserExit/ShutdownResponse) and exited 0
    using ExitCallback = std::function<void(JobProcess& proc, bool clean)>;

    JobProcess(std::shared_ptr<ProcessLauncher> launcher, SpawnArgs spawn, ProcessOptions options, LoggerPtr logger);
    ~JobProcess();
    JobProcess(const JobProcess&) = delete;
    JobProcess& operator=(const JobProcess&) = delete;

    // must be set before start()
    void set_exit_callback(ExitCallback cb) { m_on_exit = std::move(cb); }

    // Spawns the process and the supervisor thread. Throws std::system_error.
    void start();
    // Attaches a job and sends it to the process. Throws std::logic_error when a
    // job is already attached or the process is closing.
    void launch_job(const RunningJobInfo& info);

    // Graceful shutdown without waiting; safe from the supervisor thread.
    void begin_close(const std::string& reason = "");
    // begin_close() then join(); idempotent.
    void close();
    void join();
    bool join_for(std::chrono::milliseconds timeout);

    JobProcessState state() const;
    bool initialized() const;
    bool closing() const;
    bool has_job() const;
    std::optional<RunningJobInfo> running_job() const;
    std::optional<std::string> job_id() const;
    ActiveTimers timers() const;
    std::optional<int> exit_code() const;
    int pid() const;

private:
    using Clock = std::chrono::steady_clock;

    void supervise();
    void handle_message(const ipc::Message& msg);
    void on_exited(int code);
    // the helpers below expect m_mutex to be held
    void check_timers();
    void check_memory();
    void clear_timers();
    void begin_close_locked(const std::string& reason);
    void kill_locked();
    void send_locked(const ipc::Message& msg);
    std::vector<LogField> job_fields() const;

    std::shared_ptr<ProcessLauncher> m_launcher;
    SpawnArgs m_spawn;
    ProcessOptions m_opts;
    LoggerPtr m_logger;
    ExitCallback m_on_exit;

    std::unique_ptr<ProcessHandle> m_handle;
    std::thread m_thread;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    JobProcessState m_state = JobProcessState::Starting;
    std::optional<RunningJobInfo> m_job;
    bool m_started = false;
    bool m_initialized = false;
    bool m_close_requested = false;
    bool m_final_received = false;
    bool m_killed = false;
    bool m_channel_closed = false;
    bool m_exited = false;
    std::optional<int> m_exit_code;
    bool m_memory_warned = false;

    std::optional<Clock::time_point> m_start_deadline;
    std::optional<Clock::time_point> m_next_ping;
    std::optional<Clock::time_point> m_pong_deadline;
    std::optional<Clock::time_point> m_kill_deadline;
};

} // namespace agentworker
