/*
 * agent-worker CLI: start | dev | connect - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/config.hpp>
#include <agent-worker/errors.hpp>
#include <agent-worker/util/log.hpp>
#include <agent-worker/worker/worker.hpp>

#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <signal.h>
#include <unistd.h>

using namespace agentworker;

static const std::chrono::minutes kDrainTimeout(30);

static void usage() {
    std::cerr << "usage: agent-worker <start|dev|connect> [options]\n"
                 "  start     production mode, drain on SIGINT/SIGTERM\n"
                 "  dev       debug logging, close immediately on signal\n"
                 "  connect   like dev, then ask the server to simulate a job (--room)\n"
                 "options:\n"
                 "  --config PATH                rc file (default ~/.agent-workerrc)\n"
                 "  --url URL                    control plane url (AGENT_WORKER_URL)\n"
                 "  --api-key KEY                (AGENT_WORKER_API_KEY)\n"
                 "  --api-secret SECRET          (AGENT_WORKER_API_SECRET)\n"
                 "  --agent-name NAME\n"
                 "  --log-level LEVEL            trace|debug|info|warn|error\n"
                 "  --job-executable PATH        job process binary\n"
                 "  --num-idle N                 warm job processes\n"
                 "  --room NAME                  room for connect\n"
                 "  --participant-identity ID    participant for connect\n";
}

// agent-worker-job next to our own binary
static std::string default_job_executable() {
    char buf[4096];
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return "agent-worker-job";
    std::string self(buf, static_cast<size_t>(n));
    auto slash = self.rfind('/');
    if (slash == std::string::npos) return "agent-worker-job";
    return self.substr(0, slash) + "/agent-worker-job";
}

int main(int argc, char* argv[]) {
    if (argc < 2) { usage(); return 2; }
    std::string mode = argv[1];
    if (mode == "-h" || mode == "--help") { usage(); return 0; }
    if (mode != "start" && mode != "dev" && mode != "connect") { usage(); return 2; }
    bool production = mode == "start";

    std::string config_path = default_config_path();
    bool explicit_config = false;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::string room;
    std::optional<std::string> participant_identity;
    bool log_level_set = false;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };
        std::optional<std::string> v;
        if (a == "--config") { v = next(); if (v) { config_path = *v; explicit_config = true; } }
        else if (a == "--url") { v = next(); if (v) overrides.emplace_back("url", *v); }
        else if (a == "--api-key") { v = next(); if (v) overrides.emplace_back("api_key", *v); }
        else if (a == "--api-secret") { v = next(); if (v) overrides.emplace_back("api_secret", *v); }
        else if (a == "--agent-name") { v = next(); if (v) overrides.emplace_back("agent_name", *v); }
        else if (a == "--log-level") { v = next(); if (v) { overrides.emplace_back("log_level", *v); log_level_set = true; } }
        else if (a == "--job-executable") { v = next(); if (v) overrides.emplace_back("job_executable", *v); }
        else if (a == "--num-idle") { v = next(); if (v) overrides.emplace_back("num_idle_processes", *v); }
        else if (a == "--room") { v = next(); if (v) room = *v; }
        else if (a == "--participant-identity") { v = next(); if (v) participant_identity = *v; }
        else { std::cerr << "unknown option: " << a << "\n"; usage(); return 2; }
        if (!v) { std::cerr << a << " requires a value\n"; return 2; }
    }
    if (mode == "connect" && room.empty()) { std::cerr << "connect requires --room\n"; return 2; }

    WorkerConfig cfg;
    std::vector<std::string> warnings;
    if (!config_path.empty() && !load_config_file(cfg, config_path, warnings) && explicit_config) {
        std::cerr << "cannot read config file: " << config_path << "\n";
        return 2;
    }
    if (getenv("AGENT_WORKER_LOG_LEVEL")) log_level_set = true;
    apply_environment(cfg, [](const char* k) { return static_cast<const char*>(std::getenv(k)); }, warnings);
    if (mode != "start" && !log_level_set) cfg.log_level = "debug";
    for (auto& kv : overrides) apply_config_value(cfg, kv.first, kv.second, warnings);
    if (cfg.job_executable.empty()) cfg.job_executable = default_job_executable();

    auto level = parse_log_level(cfg.log_level).value_or(LogLevel::Info);
    auto logger = std::make_shared<Logger>(level, std::cerr, cfg.color && isatty(STDERR_FILENO));
    for (auto& w : warnings) logger->warn(w);

    // signals go to the sigwait thread only; spawned jobs reset the mask
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        logger->error("failed to initialise libcurl");
        return 1;
    }

    std::unique_ptr<Worker> worker;
    WorkerOptions opts = make_worker_options(cfg);
    if (mode == "connect")
        opts.simulate_on_register = protocol::SimulateJob{JobType::Room, room, participant_identity};
    try {
        worker = std::make_unique<Worker>(std::move(opts), logger);
    } catch (const CredentialsError& e) {
        logger->error(e.what());
        curl_global_cleanup();
        return 1;
    }

    std::atomic<bool> run_done{false};
    std::atomic<bool> drain_failed{false};
    std::thread shutdown;
    std::thread signals([&] {
        int count = 0;
        struct timespec tick{0, 200 * 1000 * 1000};
        while (!run_done.load()) {
            int sig = sigtimedwait(&sigs, nullptr, &tick);
            if (sig < 0) continue;
            if (++count > 1) {
                logger->warn("received a second signal, exiting immediately");
                std::_Exit(130);
            }
            logger->info("received signal, shutting down", {{"signal", strsignal(sig)}});
            shutdown = std::thread([&] {
                if (!worker->shutdown(production, std::chrono::duration_cast<std::chrono::milliseconds>(kDrainTimeout)))
                    drain_failed = true;
            });
        }
    });

    int status = 0;
    try {
        worker->run();
    } catch (const WorkerError& e) {
        logger->error("worker failed", {{"error", e.what()}});
        status = 1;
    }
    run_done = true;
    signals.join();
    if (shutdown.joinable()) shutdown.join();
    worker->close();
    worker.reset();
    curl_global_cleanup();
    if (drain_failed.load()) status = 1;
    return status;
}
