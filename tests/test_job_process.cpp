#include <gtest/gtest.h>
#include <agent-worker/proc/job_process.hpp>
#include "fakes.hpp"
#include <atomic>
#include <sstream>

using namespace agentworker;
using namespace agentworker::testing;
using namespace std::chrono_literals;

namespace {

class JobProcessTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_launcher = std::make_shared<FakeLauncher>();
        m_logger = std::make_shared<Logger>(LogLevel::Debug, m_log);
        m_opts.initialize_timeout = 1000ms;
        m_opts.start_timeout = 1000ms;
        m_opts.ping_interval = 20ms;
        m_opts.ping_timeout = 1000ms;
        m_opts.close_timeout = 1000ms;
    }

    std::unique_ptr<JobProcess> make() {
        auto proc = std::make_unique<JobProcess>(m_launcher, SpawnArgs{"/bin/job", {}, {}}, m_opts, m_logger);
        proc->set_exit_callback([this](JobProcess&, bool clean) {
            m_clean = clean;
            m_exits.fetch_add(1);
        });
        return proc;
    }

    std::shared_ptr<FakeProcess> fake() { return m_launcher->procs().back(); }

    // destroys the supervisor first so the log is no longer written to
    std::string logs(std::unique_ptr<JobProcess>& proc) {
        proc.reset();
        return m_log.str();
    }

    std::shared_ptr<FakeLauncher> m_launcher;
    std::ostringstream m_log;
    LoggerPtr m_logger;
    ProcessOptions m_opts;
    std::atomic<int> m_exits{0};
    std::atomic<bool> m_clean{false};
};

} // namespace

TEST_F(JobProcessTest, InitializeThenStartJob) {
    auto proc = make();
    proc->start();
    ASSERT_EQ(fake()->count<ipc::InitializeRequest>(), 1u);
    auto init = std::get<ipc::InitializeRequest>(fake()->messages().front());
    EXPECT_EQ(init.ping_interval_ms, 20);
    EXPECT_EQ(init.ping_timeout_ms, 1000);

    ASSERT_TRUE(wait_until([&] { return proc->initialized(); }));
    EXPECT_EQ(proc->state(), JobProcessState::Starting);
    EXPECT_FALSE(proc->timers().start);
    EXPECT_TRUE(proc->timers().ping);
    EXPECT_TRUE(proc->timers().pong);

    proc->launch_job(make_running_job("AJ_1"));
    EXPECT_EQ(proc->job_id(), std::optional<std::string>("AJ_1"));
    ASSERT_TRUE(wait_until([&] { return proc->state() == JobProcessState::Running; }));
    EXPECT_FALSE(proc->timers().start);
    EXPECT_EQ(fake()->count<ipc::StartJobRequest>(), 1u);
    ASSERT_TRUE(wait_until([&] { return fake()->count<ipc::PingRequest>() >= 2; }));
}

TEST_F(JobProcessTest, SecondJobIsRejected) {
    auto proc = make();
    proc->start();
    proc->launch_job(make_running_job("AJ_1"));
    EXPECT_THROW(proc->launch_job(make_running_job("AJ_2")), std::logic_error);
}

TEST_F(JobProcessTest, LaunchBeforeStartIsRejected) {
    auto proc = make();
    EXPECT_THROW(proc->launch_job(make_running_job("AJ_1")), std::logic_error);
}

TEST_F(JobProcessTest, InitializeTimeoutKills) {
    m_launcher->behaviour.auto_initialize = false;
    m_opts.initialize_timeout = 50ms;
    auto proc = make();
    proc->start();
    ASSERT_TRUE(proc->join_for(2000ms));
    EXPECT_TRUE(fake()->was_killed());
    EXPECT_EQ(proc->state(), JobProcessState::Closed);
    EXPECT_EQ(proc->exit_code(), std::optional<int>(137));
    auto t = proc->timers();
    EXPECT_FALSE(t.start || t.ping || t.pong);
    ASSERT_TRUE(wait_until([&] { return m_exits.load() == 1; }));
    EXPECT_FALSE(m_clean.load());
    EXPECT_NE(logs(proc).find("did not initialize in time"), std::string::npos);
}

TEST_F(JobProcessTest, StartTimeoutKills) {
    m_launcher->behaviour.auto_start = false;
    m_opts.start_timeout = 50ms;
    auto proc = make();
    proc->start();
    ASSERT_TRUE(wait_until([&] { return proc->initialized(); }));
    proc->launch_job(make_running_job("AJ_1"));
    EXPECT_TRUE(proc->timers().start);
    ASSERT_TRUE(proc->join_for(2000ms));
    EXPECT_TRUE(fake()->was_killed());
    EXPECT_EQ(proc->state(), JobProcessState::Closed);
    ASSERT_TRUE(wait_until([&] { return m_exits.load() == 1; }));
    EXPECT_FALSE(m_clean.load());
    EXPECT_NE(logs(proc).find("did not start in time"), std::string::npos);
}

TEST_F(JobProcessTest, StartErrorClearsTimersAndKills) {
    m_launcher->behaviour.start_error = "room not found";
    auto proc = make();
    proc->start();
    proc->launch_job(make_running_job("AJ_1"));
    ASSERT_TRUE(proc->join_for(2000ms));
    auto t = proc->timers();
    EXPECT_FALSE(t.start || t.ping || t.pong);
    EXPECT_TRUE(fake()->was_killed());
    ASSERT_TRUE(wait_until([&] { return m_exits.load() == 1; }));
    EXPECT_FALSE(m_clean.load());
    auto log = logs(proc);
    EXPECT_NE(log.find("job failed to start"), std::string::npos);
    EXPECT_NE(log.find("room not found"), std::string::npos);
}

TEST_F(JobProcessTest, MissingPongKillsRunningProcess) {
    m_opts.ping_timeout = 100ms;
    auto proc = make();
    proc->start();
    proc->launch_job(make_running_job("AJ_1"));
    ASSERT_TRUE(wait_until([&] { return proc->state() == JobProcessState::Running; }));
    fake()->set_auto_pong(false);
    ASSERT_TRUE(proc->join_for(2000ms));
    EXPECT_TRUE(fake()->was_killed());
    EXPECT_EQ(proc->state(), JobProcessState::Closed);
    ASSERT_TRUE(wait_until([&] { return m_exits.load() == 1; }));
    EXPECT_FALSE(m_clean.load());
    EXPECT_NE(logs(proc).find("not responding"), std::string::npos);
}

TEST_F(JobProcessTest, SlowPongIsLogged) {
    m_opts.high_ping_threshold_ms = 5.0;
    m_launcher->behaviour.auto_pong = false;
    auto proc = make();
    proc->start();
    auto pings = fake()->count<ipc::PingRequest>();
    fake()->push(ipc::PongResponse{1000, 1500});
    ASSERT_TRUE(wait_until([&] { return fake()->count<ipc::PingRequest>() >= pings + 2; }));
    EXPECT_EQ(proc->state(), JobProcessState::Starting);
    EXPECT_NE(logs(proc).find("responding slowly"), std::string::npos);
}

TEST_F(JobProcessTest, CloseSendsOneShutdownRequest) {
    auto proc = make();
    proc->start();
    proc->launch_job(make_running_job("AJ_1"));
    ASSERT_TRUE(wait_until([&] { return proc->state() == JobProcessState::Running; }));
    proc->begin_close("first");
    proc->begin_close("second");
    proc->close();
    proc->close();
    EXPECT_EQ(fake()->count<ipc::ShutdownRequest>(), 1u);
    auto msgs = fake()->messages();
    bool found = false;
    for (auto& m : msgs) {
        if (auto* s = std::get_if<ipc::ShutdownRequest>(&m)) { EXPECT_EQ(s->reason, "first"); found = true; }
    }
    EXPECT_TRUE(found);
    EXPECT_FALSE(fake()->was_killed());
    EXPECT_EQ(proc->state(), JobProcessState::Closed);
    EXPECT_EQ(proc->exit_code(), std::optional<int>(0));
    ASSERT_TRUE(wait_until([&] { return m_exits.load() == 1; }));
    EXPECT_TRUE(m_clean.load());
}

TEST_F(JobProcessTest, CloseTimeoutKills) {
    m_launcher->behaviour.auto_shutdown = false;
    m_opts.close_timeout = 50ms;
    auto proc = make();
    proc->start();
    proc->launch_job(make_running_job("AJ_1"));
    ASSERT_TRUE(wait_until([&] { return proc->state() == JobProcessState::Running; }));
    proc->close();
    EXPECT_TRUE(fake()->was_killed());
    EXPECT_EQ(proc->state(), JobProcessState::Closed);
    ASSERT_TRUE(wait_until([&] { return m_exits.load() == 1; }));
    EXPECT_FALSE(m_clean.load());
}

TEST_F(JobProcessTest, JobFinishingOnItsOwnIsClean) {
    auto proc = make();
    proc->start();
    proc->launch_job(make_running_job("AJ_1"));
    ASSERT_TRUE(wait_until([&] { return proc->state() == JobProcessState::Running; }));
    fake()->finish();
    ASSERT_TRUE(proc->join_for(2000ms));
    EXPECT_EQ(proc->state(), JobProcessState::Closed);
    EXPECT_EQ(fake()->count<ipc::ShutdownRequest>(), 0u);
    ASSERT_TRUE(wait_until([&] { return m_exits.load() == 1; }));
    EXPECT_TRUE(m_clean.load());
}

TEST_F(JobProcessTest, CrashIsNotClean) {
    auto proc = make();
    proc->start();
    proc->launch_job(make_running_job("AJ_1"));
    ASSERT_TRUE(wait_until([&] { return proc->state() == JobProcessState::Running; }));
    fake()->crash(139);
    ASSERT_TRUE(proc->join_for(2000ms));
    EXPECT_EQ(proc->exit_code(), std::optional<int>(139));
    ASSERT_TRUE(wait_until([&] { return m_exits.load() == 1; }));
    EXPECT_FALSE(m_clean.load());
}

TEST_F(JobProcessTest, MemoryLimitShutsDown) {
    m_opts.memory_warn_mb = 100;
    m_opts.memory_limit_mb = 500;
    auto proc = make();
    proc->start();
    {
        std::lock_guard<std::mutex> lock(fake()->mutex);
        fake()->rss = 800;
    }
    ASSERT_TRUE(proc->join_for(2000ms));
    auto msgs = fake()->messages();
    bool found = false;
    for (auto& m : msgs) {
        if (auto* s = std::get_if<ipc::ShutdownRequest>(&m)) { EXPECT_EQ(s->reason, "memory limit exceeded"); found = true; }
    }
    EXPECT_TRUE(found);
    EXPECT_NE(logs(proc).find("exceeded its memory limit"), std::string::npos);
}

TEST_F(JobProcessTest, MemoryWarningLoggedOnce) {
    m_opts.memory_warn_mb = 100;
    auto proc = make();
    proc->start();
    {
        std::lock_guard<std::mutex> lock(fake()->mutex);
        fake()->rss = 200;
    }
    ASSERT_TRUE(wait_until([&] { return fake()->count<ipc::PingRequest>() >= 5; }));
    auto log = logs(proc);
    auto first = log.find("memory usage is high");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(log.find("memory usage is high", first + 1), std::string::npos);
}

TEST_F(JobProcessTest, CloseBeforeStart) {
    auto proc = make();
    proc->close();
    EXPECT_EQ(proc->state(), JobProcessState::Closed);
    EXPECT_EQ(m_launcher->spawned(), 0u);
    EXPECT_THROW(proc->start(), std::logic_error);
}
