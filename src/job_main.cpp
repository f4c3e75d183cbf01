/*
 * agent-worker-job: reference job process - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Spawned by the worker's process pool. The job metadata, when present, is a
 * shell command run for the lifetime of the job; without one the job simply
 * holds its slot until the supervisor asks it to stop.
 */
#include <agent-worker/ipc/job_runtime.hpp>
#include <agent-worker/util/log.hpp>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <vector>

extern char** environ;

using namespace agentworker;

static std::string getenv_or(const char* k, const std::string& def = "") { const char* v = std::getenv(k); return v ? std::string(v) : def; }

static void run_command(ipc::JobContext& ctx, const LoggerPtr& logger) {
    const auto& info = ctx.info();
    const std::string& command = info.job.metadata;
    if (command.empty()) {
        ctx.report_connected();
        logger->info("job has no command, holding until shutdown");
        while (!ctx.wait_for_shutdown(std::chrono::seconds(1))) {}
        return;
    }

    std::vector<std::string> env_s;
    for (char** e = environ; e && *e; ++e) env_s.emplace_back(*e);
    env_s.push_back("AGENT_JOB_ID=" + info.job.id);
    env_s.push_back("AGENT_ROOM=" + info.job.room.name);
    env_s.push_back("AGENT_URL=" + info.url);
    env_s.push_back("AGENT_TOKEN=" + info.token);
    env_s.push_back("AGENT_PARTICIPANT_IDENTITY=" + info.accept_arguments.identity);
    std::vector<char*> cenv;
    for (auto& s : env_s) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);
    const char* argv[] = {"/bin/sh", "-c", command.c_str(), nullptr};

    pid_t pid = fork();
    if (pid < 0) throw std::system_error(errno, std::generic_category(), "fork");
    if (pid == 0) {
        // stays in our process group, so a supervisor kill takes it down too
        execve("/bin/sh", const_cast<char* const*>(argv), cenv.data());
        perror("execve");
        _exit(127);
    }
    ctx.report_connected();
    logger->info("job command started", {{"command_pid", std::to_string(pid)}});

    while (true) {
        int st = 0;
        pid_t r = waitpid(pid, &st, WNOHANG);
        if (r == pid) {
            int code = WIFEXITED(st) ? WEXITSTATUS(st) : 128 + WTERMSIG(st);
            if (code != 0) throw std::runtime_error("job command exited with status " + std::to_string(code));
            logger->info("job command finished");
            return;
        }
        if (r < 0 && errno != EINTR) throw std::system_error(errno, std::generic_category(), "waitpid");
        if (ctx.wait_for_shutdown(std::chrono::milliseconds(100))) break;
    }

    // shutdown requested: TERM the command, KILL after a grace period
    kill(pid, SIGTERM);
    for (int i = 0; i < 50; ++i) {
        int st = 0;
        if (waitpid(pid, &st, WNOHANG) == pid) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    logger->warn("job command ignored SIGTERM, killing it");
    kill(pid, SIGKILL);
    int st = 0;
    while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
}

int main() {
    std::string fd_env = getenv_or(ipc::kIpcFdEnv);
    if (fd_env.empty()) {
        std::cerr << "agent-worker-job: must be started by agent-worker (" << ipc::kIpcFdEnv << " not set)\n";
        return 2;
    }
    int fd = 0;
    try { fd = std::stoi(fd_env); } catch (const std::exception&) { fd = -1; }
    if (fd < 0) {
        std::cerr << "agent-worker-job: invalid " << ipc::kIpcFdEnv << "\n";
        return 2;
    }
    std::signal(SIGPIPE, SIG_IGN);

    auto level = parse_log_level(getenv_or("AGENT_WORKER_LOG_LEVEL", "info")).value_or(LogLevel::Info);
    auto logger = std::make_shared<Logger>(level, std::cerr, false)->child({{"pid", std::to_string(getpid())}});

    ipc::JobRuntime runtime(fd, logger);
    return runtime.run([&](ipc::JobContext& ctx) { run_command(ctx, logger); });
}
