#include <gtest/gtest.h>
#include <agent-worker/proc/pool.hpp>
#include "fakes.hpp"
#include <future>
#include <sstream>

using namespace agentworker;
using namespace agentworker::testing;
using namespace std::chrono_literals;

namespace {

class ProcPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_launcher = std::make_shared<FakeLauncher>();
        m_logger = std::make_shared<Logger>(LogLevel::Debug, m_log);
        m_opts.num_idle = 3;
        m_opts.spawn.executable = "/bin/job";
        m_opts.process.ping_interval = 20ms;
        m_opts.process.ping_timeout = 1000ms;
        m_opts.process.close_timeout = 1000ms;
        m_opts.on_job_exit = [this](const std::string& id, bool clean) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_exits.emplace_back(id, clean);
        };
    }

    std::unique_ptr<ProcPool> make() { return std::make_unique<ProcPool>(m_opts, m_launcher, m_logger); }

    std::vector<std::pair<std::string, bool>> exits() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_exits;
    }

    std::shared_ptr<FakeLauncher> m_launcher;
    std::ostringstream m_log;
    LoggerPtr m_logger;
    PoolOptions m_opts;
    std::mutex m_mutex;
    std::vector<std::pair<std::string, bool>> m_exits;
};

} // namespace

TEST_F(ProcPoolTest, KeepsIdleProcessesWarm) {
    auto pool = make();
    pool->start();
    ASSERT_TRUE(wait_until([&] { return pool->warm_count() == 3; }));
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(m_launcher->spawned(), 3u);
    EXPECT_EQ(pool->idle_count(), 3u);
}

TEST_F(ProcPoolTest, LimitsConcurrentInitializations) {
    m_launcher->behaviour.auto_initialize = false;
    m_opts.max_concurrent_initializations = 1;
    auto pool = make();
    pool->start();
    ASSERT_TRUE(wait_until([&] { return m_launcher->spawned() >= 1; }));
    std::this_thread::sleep_for(250ms);
    EXPECT_EQ(m_launcher->spawned(), 1u);
    m_launcher->procs()[0]->push(ipc::InitializeResponse{});
    ASSERT_TRUE(wait_until([&] { return m_launcher->spawned() == 2; }));
}

TEST_F(ProcPoolTest, LaunchUsesWarmProcessAndReplenishes) {
    auto pool = make();
    pool->start();
    ASSERT_TRUE(wait_until([&] { return pool->warm_count() == 3; }));

    auto proc = pool->launch_job(make_running_job("AJ_1"));
    ASSERT_NE(proc, nullptr);
    EXPECT_LT(proc->pid(), 1003);
    EXPECT_EQ(pool->get_by_job_id("AJ_1"), proc);
    EXPECT_EQ(pool->get_by_job_id("AJ_2"), nullptr);
    ASSERT_TRUE(wait_until([&] { return pool->warm_count() == 3; }));
    EXPECT_EQ(m_launcher->spawned(), 4u);
    EXPECT_EQ(m_launcher->start_requests_for("AJ_1"), 1u);
}

TEST_F(ProcPoolTest, ColdSpawnWhenNothingIsIdle) {
    m_opts.num_idle = 0;
    auto pool = make();
    pool->start();
    auto proc = pool->launch_job(make_running_job("AJ_1"));
    EXPECT_EQ(m_launcher->spawned(), 1u);
    ASSERT_TRUE(wait_until([&] { return proc->state() == JobProcessState::Running; }));
}

TEST_F(ProcPoolTest, SpawnFailureSurfaces) {
    m_opts.num_idle = 0;
    auto pool = make();
    pool->start();
    m_launcher->fail_spawn = true;
    EXPECT_THROW(pool->launch_job(make_running_job("AJ_1")), std::system_error);
    EXPECT_EQ(pool->get_by_job_id("AJ_1"), nullptr);
}

TEST_F(ProcPoolTest, ReplacesCrashedIdleProcess) {
    auto pool = make();
    pool->start();
    ASSERT_TRUE(wait_until([&] { return pool->warm_count() == 3; }));
    m_launcher->procs()[0]->crash();
    ASSERT_TRUE(wait_until([&] { return m_launcher->spawned() == 4 && pool->warm_count() == 3; }));
    EXPECT_EQ(pool->processes().size(), 3u);
    EXPECT_TRUE(exits().empty());
}

TEST_F(ProcPoolTest, UnresponsiveJobIsKilledAndForgotten) {
    m_opts.process.ping_timeout = 100ms;
    auto pool = make();
    pool->start();
    ASSERT_TRUE(wait_until([&] { return pool->warm_count() == 3; }));
    auto proc = pool->launch_job(make_running_job("AJ_1"));
    ASSERT_TRUE(wait_until([&] { return proc->state() == JobProcessState::Running; }));
    auto fake = m_launcher->by_pid(proc->pid());
    ASSERT_NE(fake, nullptr);
    fake->set_auto_pong(false);

    ASSERT_TRUE(proc->join_for(2000ms));
    EXPECT_TRUE(fake->was_killed());
    EXPECT_EQ(pool->get_by_job_id("AJ_1"), nullptr);
    ASSERT_TRUE(wait_until([&] { return exits().size() == 1; }));
    EXPECT_EQ(exits()[0].first, "AJ_1");
    EXPECT_FALSE(exits()[0].second);
    // the killed process was not idle: only the replacement for the launch was spawned
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(pool->warm_count(), 3u);
    EXPECT_EQ(m_launcher->spawned(), 4u);
}

TEST_F(ProcPoolTest, DrainWaitsForRunningJob) {
    auto pool = make();
    pool->start();
    ASSERT_TRUE(wait_until([&] { return pool->warm_count() == 3; }));
    auto proc = pool->launch_job(make_running_job("AJ_1"));
    ASSERT_TRUE(wait_until([&] { return proc->state() == JobProcessState::Running && pool->warm_count() == 3; }));
    auto running = m_launcher->by_pid(proc->pid());
    auto spawned = m_launcher->spawned();

    auto drained = std::async(std::launch::async, [&] { return pool->drain(); });
    ASSERT_TRUE(wait_until([&] {
        for (auto& p : m_launcher->procs())
            if (p != running && !p->exited()) return false;
        return true;
    }));
    EXPECT_EQ(drained.wait_for(100ms), std::future_status::timeout);
    EXPECT_EQ(running->count<ipc::ShutdownRequest>(), 0u);
    EXPECT_EQ(proc->state(), JobProcessState::Running);

    running->finish();
    ASSERT_EQ(drained.wait_for(2000ms), std::future_status::ready);
    EXPECT_TRUE(drained.get());
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(m_launcher->spawned(), spawned);
    ASSERT_TRUE(wait_until([&] { return exits().size() == 1; }));
    EXPECT_TRUE(exits()[0].second);
}

TEST_F(ProcPoolTest, DrainWaitsForJobLaunchedWhileDraining) {
    m_opts.num_idle = 0;
    auto pool = make();
    pool->start();
    auto first = pool->launch_job(make_running_job("AJ_1"));
    ASSERT_TRUE(wait_until([&] { return first->state() == JobProcessState::Running; }));

    auto drained = std::async(std::launch::async, [&] { return pool->drain(); });
    auto second = pool->launch_job(make_running_job("AJ_2"));
    ASSERT_TRUE(wait_until([&] { return second->state() == JobProcessState::Running; }));
    m_launcher->by_pid(first->pid())->finish();
    ASSERT_TRUE(first->join_for(2000ms));
    EXPECT_EQ(drained.wait_for(150ms), std::future_status::timeout);

    m_launcher->by_pid(second->pid())->finish();
    ASSERT_EQ(drained.wait_for(2000ms), std::future_status::ready);
    EXPECT_TRUE(drained.get());
}

TEST_F(ProcPoolTest, DrainTimesOut) {
    m_opts.num_idle = 0;
    auto pool = make();
    pool->start();
    auto proc = pool->launch_job(make_running_job("AJ_1"));
    ASSERT_TRUE(wait_until([&] { return proc->state() == JobProcessState::Running; }));
    EXPECT_FALSE(pool->drain(50ms));
    EXPECT_EQ(proc->state(), JobProcessState::Running);
}

TEST_F(ProcPoolTest, CloseShutsEverythingDown) {
    auto pool = make();
    pool->start();
    ASSERT_TRUE(wait_until([&] { return pool->warm_count() == 3; }));
    auto proc = pool->launch_job(make_running_job("AJ_1"));
    ASSERT_TRUE(wait_until([&] { return proc->state() == JobProcessState::Running; }));

    pool->close(0ms);
    for (auto& p : m_launcher->procs()) {
        EXPECT_TRUE(p->exited());
        EXPECT_EQ(p->count<ipc::ShutdownRequest>(), 1u);
    }
    EXPECT_TRUE(pool->processes().empty());
    EXPECT_THROW(pool->launch_job(make_running_job("AJ_2")), std::runtime_error);
    pool->close();
}
