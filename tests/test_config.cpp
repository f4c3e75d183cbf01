#include <gtest/gtest.h>
#include <agent-worker/config.hpp>
#include <agent-worker/worker/load.hpp>
#include <cstdio>
#include <fstream>
#include <map>
#include <sstream>
#include <unistd.h>

using namespace agentworker;

TEST(Config, LoadsKeyValueLines) {
    std::istringstream in(
        "# worker settings\n"
        "url = https://cp.example.test\n"
        "api_key=key\n"
        "\n"
        "num_idle_processes=5\n"
        "load_threshold = 0.8\n"
        "shutdown_process_timeout=2.5\n"
        "color=false\n");
    WorkerConfig cfg;
    std::vector<std::string> warnings;
    load_config_stream(cfg, in, warnings);
    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(cfg.url, "https://cp.example.test");
    EXPECT_EQ(cfg.api_key, "key");
    EXPECT_EQ(cfg.num_idle_processes, 5u);
    EXPECT_DOUBLE_EQ(cfg.load_threshold, 0.8);
    EXPECT_DOUBLE_EQ(cfg.shutdown_process_timeout, 2.5);
    EXPECT_FALSE(cfg.color);
}

TEST(Config, WarnsOnBadInput) {
    std::istringstream in("bogus=1\nload_threshold=1.5\nnum_idle_processes=-1\nlog_level=loud\nmax_retry=abc\n");
    WorkerConfig cfg;
    std::vector<std::string> warnings;
    load_config_stream(cfg, in, warnings);
    EXPECT_EQ(warnings.size(), 5u);
    EXPECT_DOUBLE_EQ(cfg.load_threshold, 0.65);
    EXPECT_EQ(cfg.num_idle_processes, 3u);
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.max_retry, 10);
}

TEST(Config, EnvironmentOverridesFile) {
    WorkerConfig cfg;
    cfg.url = "https://from-file";
    std::map<std::string, std::string> env{{"AGENT_WORKER_URL", "https://from-env"}, {"AGENT_WORKER_LOG_LEVEL", "debug"}};
    std::vector<std::string> warnings;
    apply_environment(cfg, [&](const char* k) -> const char* {
        auto it = env.find(k);
        return it == env.end() ? nullptr : it->second.c_str();
    }, warnings);
    EXPECT_EQ(cfg.url, "https://from-env");
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_TRUE(warnings.empty());
}

TEST(Config, MissingFile) {
    WorkerConfig cfg;
    std::vector<std::string> warnings;
    EXPECT_FALSE(load_config_file(cfg, "/nonexistent/agent-workerrc", warnings));
}

TEST(Config, LoadsFile) {
    char path[] = "/tmp/agent_worker_cfg_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);
    { std::ofstream out(path); out << "agent_name=greeter\nmemory_limit_mb=512\n"; }
    WorkerConfig cfg;
    std::vector<std::string> warnings;
    EXPECT_TRUE(load_config_file(cfg, path, warnings));
    std::remove(path);
    EXPECT_EQ(cfg.agent_name, "greeter");
    EXPECT_DOUBLE_EQ(cfg.memory_limit_mb, 512.0);
}

TEST(Config, BuildsWorkerOptions) {
    WorkerConfig cfg;
    cfg.url = "https://x";
    cfg.num_idle_processes = 1;
    cfg.shutdown_process_timeout = 1.5;
    cfg.initialize_process_timeout = 0.25;
    auto opts = make_worker_options(cfg);
    EXPECT_EQ(opts.url, "https://x");
    EXPECT_EQ(opts.num_idle_processes, 1u);
    EXPECT_EQ(opts.process.close_timeout.count(), 1500);
    EXPECT_EQ(opts.process.initialize_timeout.count(), 250);
    EXPECT_DOUBLE_EQ(opts.load_threshold, 0.65);
}

TEST(LoadSampler, ParsesAggregateLine) {
    auto t = parse_proc_stat("cpu  100 0 50 800 50 0 0 0 0 0\ncpu0 1 2 3 4\n");
    ASSERT_TRUE(t);
    EXPECT_EQ(t->idle, 850u);
    EXPECT_EQ(t->total, 1000u);
    EXPECT_FALSE(parse_proc_stat("cpu0 1 2 3 4\n"));
    EXPECT_FALSE(parse_proc_stat("cpu  1 2\n"));
}

TEST(LoadSampler, DeltaBetweenSamples) {
    char path[] = "/tmp/agent_worker_stat_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);
    { std::ofstream out(path); out << "cpu  100 0 0 900 0\n"; }
    CpuLoadSampler sampler(path);
    EXPECT_DOUBLE_EQ(sampler.sample(), 0.0);
    { std::ofstream out(path); out << "cpu  175 0 0 925 0\n"; }
    EXPECT_DOUBLE_EQ(sampler.sample(), 0.75);
    std::remove(path);
    EXPECT_DOUBLE_EQ(CpuLoadSampler("/nonexistent/stat").sample(), 0.0);
}
