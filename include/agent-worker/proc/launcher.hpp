/*
 * Process launcher abstraction - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <agent-worker/ipc/channel.hpp>
#include <agent-worker/ipc/message.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentworker {

struct SpawnArgs {
    std::string executable;
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env; // added to the inherited environment
};

// One spawned job process with its IPC channel.
// receive(), kill() and try_wait() belong to the supervising thread; send() may
// be called from any thread.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    virtual int pid() const = 0;
    virtual bool send(const ipc::Message& msg) = 0;
    virtual ipc::RecvStatus receive(ipc::Message& out, std::chrono::milliseconds timeout) = 0;
    virtual void kill() = 0;
    // exit status once the process has exited (128+signal when killed by a signal)
    virtual std::optional<int> try_wait() = 0;
    // resident set size, when it can be read
    virtual std::optional<double> rss_mb() const = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;
    virtual std::unique_ptr<ProcessHandle> spawn(const SpawnArgs& args) = 0;
};

// fork/exec with a socketpair; the child finds its end of the channel through
// AGENT_WORKER_IPC_FD. Throws std::system_error when the OS refuses.
class PosixProcessLauncher : public ProcessLauncher {
public:
    std::unique_ptr<ProcessHandle> spawn(const SpawnArgs& args) override;
};

} // namespace agentworker
