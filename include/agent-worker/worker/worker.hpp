/*
 * Worker connection to the control plane - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <agent-worker/job/job.hpp>
#include <agent-worker/proc/pool.hpp>
#include <agent-worker/util/log.hpp>
#include <agent-worker/worker/load.hpp>
#include <agent-worker/worker/protocol.hpp>
#include <agent-worker/worker/transport.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace agentworker {

constexpr const char* kWorkerVersion = "0.1.0";

using protocol::WorkerStatus;

enum class WorkerState { Disconnected, Connecting, Registered, Reconnecting, Draining, Closed };
const char* worker_state_name(WorkerState state);

using RequestHandler = std::function<void(JobRequest& request)>;
using LoadFunction = std::function<double()>;
using TokenMinter = std::function<std::string(const std::string& api_key, const std::string& api_secret)>;

struct WorkerOptions {
    RequestHandler request_fnc;      // default: accept every job
    LoadFunction load_fnc;           // default: host CPU utilisation
    double load_threshold = 0.65;
    std::size_t num_idle_processes = 3;
    std::string job_executable;
    std::vector<std::string> job_args;
    ProcessOptions process;
    int max_retry = 10;
    std::chrono::milliseconds retry_step{2000};
    std::chrono::milliseconds retry_max{10000};
    std::chrono::milliseconds assignment_timeout{7500};
    std::chrono::milliseconds update_interval{2500};
    std::chrono::milliseconds register_timeout{10000};
    std::string url;                 // AGENT_WORKER_URL
    std::string api_key;             // AGENT_WORKER_API_KEY
    std::string api_secret;          // AGENT_WORKER_API_SECRET
    std::string agent_name;
    JobType worker_type = JobType::Room;
    protocol::WorkerPermissions permissions;
    std::function<void(const std::string& worker_id)> on_registered;
    // sent once, after the first registration only
    std::optional<protocol::SimulateJob> simulate_on_register;
};

// Control-plane session: registration, offers, assignments, load reports,
// draining and reconnects. run() blocks until close() or a fatal error.
class Worker {
public:
    // Throws CredentialsError when url, key or secret are missing.
    Worker(WorkerOptions options, LoggerPtr logger, std::unique_ptr<Transport> transport = nullptr,
           std::shared_ptr<ProcessLauncher> launcher = nullptr, TokenMinter minter = nullptr);
    ~Worker();
    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Throws ProtocolError or ConnectionError.
    void run();
    // Reports Full and waits for running jobs; throws DrainTimeoutError.
    void drain(std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    void close();
    // drain (when asked) then close; false when the drain timed out
    bool shutdown(bool drain_first, std::optional<std::chrono::milliseconds> drain_timeout = std::nullopt);

    bool simulate_job(JobType type, const std::string& room_name,
                      const std::optional<std::string>& participant_identity = std::nullopt);

    std::string id() const;
    WorkerState state() const;
    WorkerStatus status() const;
    bool draining() const;
    std::vector<RunningJobInfo> active_jobs() const;
    ProcPool& pool() { return *m_pool; }

private:
    using Clock = std::chrono::steady_clock;

    struct PendingAssignment {
        JobAcceptArguments accept_arguments;
        Clock::time_point deadline;
    };

    void connect_and_register();
    void session_loop();
    void dispatch(const protocol::ServerMessage& msg);
    void handle_availability(const protocol::AvailabilityRequest& req);
    void answer_availability(const Job& job, bool available, const JobAcceptArguments& args);
    void handle_assignment(const protocol::JobAssignment& assignment);
    void handle_termination(const protocol::JobTermination& termination);
    void expire_pending();
    void report_load();
    void on_job_exit(const std::string& job_id, bool clean);
    bool send(const protocol::WorkerMessage& msg);
    void set_connected(bool connected);
    void set_state(WorkerState state);
    bool closing() const;
    void spawn_task(std::function<void()> fn);
    void wait_tasks();

    WorkerOptions m_opts;
    LoggerPtr m_logger;
    std::unique_ptr<Transport> m_transport;
    std::shared_ptr<ProcessLauncher> m_launcher;
    TokenMinter m_minter;
    std::unique_ptr<CpuLoadSampler> m_sampler;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    WorkerState m_state = WorkerState::Disconnected;
    WorkerStatus m_status = WorkerStatus::Available;
    std::string m_id;
    bool m_draining = false;
    bool m_closing = false;
    bool m_running = false;
    std::thread::id m_run_thread;
    std::map<std::string, PendingAssignment> m_pending;
    std::set<std::string> m_offers; // decisions in flight
    bool m_simulated = false;        // run thread only
    // serialises launches against the start of a drain
    std::mutex m_launch_mutex;

    std::mutex m_send_mutex;
    bool m_connected = false;

    std::mutex m_tasks_mutex;
    std::vector<std::future<void>> m_tasks;

    std::unique_ptr<ProcPool> m_pool;
};

} // namespace agentworker
