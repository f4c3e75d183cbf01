/*
 * POSIX process launcher - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/proc/launcher.hpp>
#include <agent-worker/ipc/job_runtime.hpp>
#include <cerrno>
#include <csignal>
#include <signal.h>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/socket.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

extern char** environ;

namespace agentworker {

namespace {

constexpr int kChildIpcFd = 3;

int decode_wait_status(int st) {
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    if (WIFSIGNALED(st)) return 128 + WTERMSIG(st);
    return 1;
}

class PosixProcessHandle : public ProcessHandle {
public:
    PosixProcessHandle(pid_t pid, int fd) : m_pid(pid), m_channel(fd) {}

    ~PosixProcessHandle() override {
        m_channel.close();
        if (!m_exit) {
            kill();
            int st = 0;
            while (::waitpid(m_pid, &st, 0) < 0 && errno == EINTR) {}
        }
    }

    int pid() const override { return m_pid; }

    bool send(const ipc::Message& msg) override { return m_channel.send(ipc::encode(msg)); }

    ipc::RecvStatus receive(ipc::Message& out, std::chrono::milliseconds timeout) override {
        std::string payload;
        auto st = m_channel.recv(payload, timeout);
        if (st != ipc::RecvStatus::Message) return st;
        auto msg = ipc::decode(payload);
        if (!msg) return ipc::RecvStatus::Invalid;
        out = std::move(*msg);
        return ipc::RecvStatus::Message;
    }

    void kill() override {
        if (m_exit) return;
        // the child leads its own process group; take its children with it
        if (::kill(-m_pid, SIGKILL) != 0) ::kill(m_pid, SIGKILL);
    }

    std::optional<int> try_wait() override {
        if (m_exit) return m_exit;
        int st = 0;
        pid_t r = ::waitpid(m_pid, &st, WNOHANG);
        if (r == m_pid) m_exit = decode_wait_status(st);
        else if (r < 0 && errno == ECHILD) m_exit = 1; // reaped elsewhere
        return m_exit;
    }

    std::optional<double> rss_mb() const override {
        std::ifstream in("/proc/" + std::to_string(m_pid) + "/statm");
        long size = 0, resident = 0;
        if (!(in >> size >> resident)) return std::nullopt;
        long page = ::sysconf(_SC_PAGESIZE);
        return static_cast<double>(resident) * static_cast<double>(page) / (1024.0 * 1024.0);
    }

private:
    pid_t m_pid;
    ipc::FrameChannel m_channel;
    std::optional<int> m_exit;
};

} // namespace

std::unique_ptr<ProcessHandle> PosixProcessLauncher::spawn(const SpawnArgs& args) {
    // everything the child needs is prepared before fork
    std::vector<std::string> argv_s;
    argv_s.push_back(args.executable);
    argv_s.insert(argv_s.end(), args.args.begin(), args.args.end());
    std::vector<char*> cargv;
    cargv.reserve(argv_s.size() + 1);
    for (auto& s : argv_s) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::string fd_prefix = std::string(ipc::kIpcFdEnv) + "=";
    std::vector<std::string> env_s;
    for (char** e = environ; e && *e; ++e) {
        if (std::strncmp(*e, fd_prefix.c_str(), fd_prefix.size()) == 0) continue;
        env_s.emplace_back(*e);
    }
    for (auto& kv : args.env) env_s.push_back(kv.first + "=" + kv.second);
    env_s.push_back(fd_prefix + std::to_string(kChildIpcFd));
    std::vector<char*> cenv;
    cenv.reserve(env_s.size() + 1);
    for (auto& s : env_s) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    int sv[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) != 0)
        throw std::system_error(errno, std::generic_category(), "socketpair");

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(sv[0]);
        ::close(sv[1]);
        throw std::system_error(err, std::generic_category(), "fork");
    }
    if (pid == 0) {
        // the worker blocks SIGINT/SIGTERM for its sigwait thread; the mask survives exec
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        std::signal(SIGINT, SIG_IGN);
        setpgid(0, 0);
        if (sv[1] == kChildIpcFd) {
            int flags = fcntl(kChildIpcFd, F_GETFD);
            if (flags >= 0) fcntl(kChildIpcFd, F_SETFD, flags & ~FD_CLOEXEC);
        } else if (dup2(sv[1], kChildIpcFd) < 0) {
            _exit(127);
        }
        execve(cargv[0], cargv.data(), cenv.data());
        perror("execve");
        _exit(127);
    }
    ::close(sv[1]);
    return std::make_unique<PosixProcessHandle>(pid, sv[0]);
}

} // namespace agentworker
