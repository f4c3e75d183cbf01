/*
 * Process pool implementation - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/proc/pool.hpp>
#include <stdexcept>
#include <system_error>

namespace agentworker {

ProcPool::ProcPool(PoolOptions options, std::shared_ptr<ProcessLauncher> launcher, LoggerPtr logger)
    : m_opts(std::move(options)), m_launcher(std::move(launcher)), m_logger(std::move(logger)) {}

ProcPool::~ProcPool() {
    close(std::chrono::milliseconds(0));
}

bool ProcPool::is_idle(const JobProcess& proc) {
    return !proc.has_job() && !proc.closing();
}

void ProcPool::start() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_started || m_closed) return;
        m_started = true;
    }
    m_logger->debug("starting process pool", {{"num_idle", std::to_string(m_opts.num_idle)}});
    m_thread = std::thread(&ProcPool::maintain, this);
}

std::shared_ptr<JobProcess> ProcPool::spawn_locked() {
    auto proc = std::make_shared<JobProcess>(m_launcher, m_opts.spawn, m_opts.process, m_logger);
    proc->set_exit_callback([this](JobProcess& p, bool clean) {
        auto id = p.job_id();
        m_cv.notify_all();
        if (id && m_opts.on_job_exit) m_opts.on_job_exit(*id, clean);
    });
    proc->start();
    m_procs.push_back(proc);
    return proc;
}

void ProcPool::maintain() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopping) {
        std::vector<std::shared_ptr<JobProcess>> dead;
        for (auto it = m_procs.begin(); it != m_procs.end();) {
            if ((*it)->state() == JobProcessState::Closed) {
                dead.push_back(std::move(*it));
                it = m_procs.erase(it);
            } else {
                ++it;
            }
        }
        if (m_replenish) {
            std::size_t idle = 0, warming = 0;
            for (auto& p : m_procs) {
                if (!is_idle(*p)) continue;
                ++idle;
                if (!p->initialized()) ++warming;
            }
            while (idle < m_opts.num_idle && warming < m_opts.max_concurrent_initializations) {
                try {
                    spawn_locked();
                } catch (const std::system_error& e) {
                    m_logger->error("failed to spawn idle job process", {{"error", e.what()}});
                    break;
                }
                ++idle;
                ++warming;
            }
        }
        // supervisor threads are joined outside the lock
        lock.unlock();
        dead.clear();
        lock.lock();
        if (m_stopping) break;
        m_cv.wait_for(lock, std::chrono::milliseconds(100));
    }
}

std::shared_ptr<JobProcess> ProcPool::launch_job(const RunningJobInfo& info) {
    std::shared_ptr<JobProcess> proc;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) throw std::runtime_error("process pool is closed");
        for (auto& p : m_procs) {
            if (is_idle(*p) && p->initialized()) { proc = p; break; }
        }
        if (!proc) {
            for (auto& p : m_procs) {
                if (is_idle(*p)) { proc = p; break; }
            }
        }
        try {
            if (!proc) {
                m_logger->debug("no idle job process, spawning one", {{"job_id", info.job.id}});
                proc = spawn_locked();
            }
            proc->launch_job(info);
        } catch (const std::logic_error&) {
            // the chosen process started closing on its own meanwhile
            proc = spawn_locked();
            proc->launch_job(info);
        }
    }
    m_cv.notify_all();
    return proc;
}

std::shared_ptr<JobProcess> ProcPool::get_by_job_id(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& p : m_procs) {
        if (p->state() == JobProcessState::Closed) continue;
        auto id = p->job_id();
        if (id && *id == job_id) return p;
    }
    return nullptr;
}

std::vector<std::shared_ptr<JobProcess>> ProcPool::processes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_procs;
}

std::size_t ProcPool::idle_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t n = 0;
    for (auto& p : m_procs) if (is_idle(*p)) ++n;
    return n;
}

std::size_t ProcPool::warm_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t n = 0;
    for (auto& p : m_procs) if (is_idle(*p) && p->initialized()) ++n;
    return n;
}

bool ProcPool::drain(std::optional<std::chrono::milliseconds> timeout) {
    std::vector<std::shared_ptr<JobProcess>> idle;
    std::size_t running = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_replenish = false;
        for (auto& p : m_procs) {
            if (p->has_job()) ++running;
            else idle.push_back(p);
        }
    }
    m_logger->info("draining process pool", {{"running", std::to_string(running)}});
    for (auto& p : idle) p->begin_close("draining");

    auto deadline = std::chrono::steady_clock::now() + timeout.value_or(std::chrono::milliseconds(0));
    // rescans the live list so jobs launched meanwhile are waited for too
    while (true) {
        std::vector<std::shared_ptr<JobProcess>> jobs;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto& p : m_procs)
                if (p->has_job() && p->state() != JobProcessState::Closed) jobs.push_back(p);
        }
        if (jobs.empty()) return true;
        for (auto& p : jobs) {
            if (!timeout) {
                p->join();
                continue;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (!p->join_for(left)) {
                m_logger->warn("timed out waiting for running jobs to finish");
                return false;
            }
        }
    }
}

void ProcPool::close(std::optional<std::chrono::milliseconds> grace) {
    std::vector<std::shared_ptr<JobProcess>> procs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) return;
        m_closed = true;
        m_replenish = false;
        m_stopping = true;
        procs = m_procs;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) m_thread.join();

    for (auto& p : procs) {
        if (!p->has_job()) p->begin_close("pool closing");
    }
    auto deadline = std::chrono::steady_clock::now() + grace.value_or(std::chrono::milliseconds(0));
    for (auto& p : procs) {
        if (!p->has_job()) continue;
        if (!grace) {
            p->join();
            continue;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (!p->join_for(left)) p->begin_close("shutdown timeout");
    }
    for (auto& p : procs) p->join();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_procs.clear();
    }
    procs.clear();
    m_logger->debug("process pool closed");
}

} // namespace agentworker
