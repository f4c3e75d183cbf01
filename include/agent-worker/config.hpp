/*
 * Worker configuration - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <agent-worker/worker/worker.hpp>
#include <functional>
#include <istream>
#include <string>
#include <vector>

namespace agentworker {

// Layered: defaults < rc file < environment < command line.
struct WorkerConfig {
    std::string url;
    std::string api_key;
    std::string api_secret;
    std::string agent_name;
    std::string log_level = "info";
    bool color = true;
    std::size_t num_idle_processes = 3;
    double load_threshold = 0.65;
    int max_retry = 10;
    std::string job_executable;
    double shutdown_process_timeout = 60.0;   // seconds
    double initialize_process_timeout = 10.0; // seconds
    double memory_warn_mb = 0.0;
    double memory_limit_mb = 0.0;
};

// Applies one key=value pair; false (and a message in warnings) for unknown
// keys or malformed values.
bool apply_config_value(WorkerConfig& cfg, const std::string& key, const std::string& value,
                        std::vector<std::string>& warnings);

// key=value lines, '#' comments.
void load_config_stream(WorkerConfig& cfg, std::istream& in, std::vector<std::string>& warnings);
// false when the file cannot be opened
bool load_config_file(WorkerConfig& cfg, const std::string& path, std::vector<std::string>& warnings);

using EnvLookup = std::function<const char*(const char*)>;
// AGENT_WORKER_URL, AGENT_WORKER_API_KEY, AGENT_WORKER_API_SECRET, AGENT_WORKER_LOG_LEVEL
void apply_environment(WorkerConfig& cfg, const EnvLookup& lookup, std::vector<std::string>& warnings);

std::string default_config_path();

WorkerOptions make_worker_options(const WorkerConfig& cfg);

} // namespace agentworker
