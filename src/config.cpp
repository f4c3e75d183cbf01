/*
 * Worker configuration loading - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/config.hpp>
#include <cstdlib>
#include <fstream>

namespace agentworker {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

bool parse_bool(const std::string& v) { return v == "1" || v == "true" || v == "on" || v == "yes"; }

bool parse_double(const std::string& v, double& out) {
    try {
        size_t pos = 0;
        double d = std::stod(v, &pos);
        if (pos != v.size() || d < 0) return false;
        out = d;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_int(const std::string& v, long& out) {
    try {
        size_t pos = 0;
        long n = std::stol(v, &pos);
        if (pos != v.size() || n < 0) return false;
        out = n;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::chrono::milliseconds seconds_to_ms(double s) {
    return std::chrono::milliseconds(static_cast<long long>(s * 1000.0));
}

} // namespace

bool apply_config_value(WorkerConfig& cfg, const std::string& key, const std::string& value,
                        std::vector<std::string>& warnings) {
    auto bad = [&] {
        warnings.push_back("invalid value for " + key + ": '" + value + "'");
        return false;
    };
    double d = 0;
    long n = 0;
    if (key == "url") cfg.url = value;
    else if (key == "api_key") cfg.api_key = value;
    else if (key == "api_secret") cfg.api_secret = value;
    else if (key == "agent_name") cfg.agent_name = value;
    else if (key == "log_level") {
        if (!parse_log_level(value)) return bad();
        cfg.log_level = value;
    }
    else if (key == "color") cfg.color = parse_bool(value);
    else if (key == "num_idle_processes") { if (!parse_int(value, n)) return bad(); cfg.num_idle_processes = static_cast<std::size_t>(n); }
    else if (key == "load_threshold") { if (!parse_double(value, d) || d > 1.0) return bad(); cfg.load_threshold = d; }
    else if (key == "max_retry") { if (!parse_int(value, n)) return bad(); cfg.max_retry = static_cast<int>(n); }
    else if (key == "job_executable") cfg.job_executable = value;
    else if (key == "shutdown_process_timeout") { if (!parse_double(value, d)) return bad(); cfg.shutdown_process_timeout = d; }
    else if (key == "initialize_process_timeout") { if (!parse_double(value, d)) return bad(); cfg.initialize_process_timeout = d; }
    else if (key == "memory_warn_mb") { if (!parse_double(value, d)) return bad(); cfg.memory_warn_mb = d; }
    else if (key == "memory_limit_mb") { if (!parse_double(value, d)) return bad(); cfg.memory_limit_mb = d; }
    else {
        warnings.push_back("unknown config key: " + key);
        return false;
    }
    return true;
}

void load_config_stream(WorkerConfig& cfg, std::istream& in, std::vector<std::string>& warnings) {
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        apply_config_value(cfg, trim(line.substr(0, eq)), trim(line.substr(eq + 1)), warnings);
    }
}

bool load_config_file(WorkerConfig& cfg, const std::string& path, std::vector<std::string>& warnings) {
    std::ifstream in(path);
    if (!in) return false;
    load_config_stream(cfg, in, warnings);
    return true;
}

void apply_environment(WorkerConfig& cfg, const EnvLookup& lookup, std::vector<std::string>& warnings) {
    static const std::pair<const char*, const char*> vars[] = {
        {"AGENT_WORKER_URL", "url"},
        {"AGENT_WORKER_API_KEY", "api_key"},
        {"AGENT_WORKER_API_SECRET", "api_secret"},
        {"AGENT_WORKER_LOG_LEVEL", "log_level"},
    };
    for (auto& v : vars) {
        const char* val = lookup(v.first);
        if (val && *val) apply_config_value(cfg, v.second, val, warnings);
    }
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return "";
    return std::string(home) + "/.agent-workerrc";
}

WorkerOptions make_worker_options(const WorkerConfig& cfg) {
    WorkerOptions opts;
    opts.url = cfg.url;
    opts.api_key = cfg.api_key;
    opts.api_secret = cfg.api_secret;
    opts.agent_name = cfg.agent_name;
    opts.num_idle_processes = cfg.num_idle_processes;
    opts.load_threshold = cfg.load_threshold;
    opts.max_retry = cfg.max_retry;
    opts.job_executable = cfg.job_executable;
    opts.process.close_timeout = seconds_to_ms(cfg.shutdown_process_timeout);
    opts.process.initialize_timeout = seconds_to_ms(cfg.initialize_process_timeout);
    opts.process.memory_warn_mb = cfg.memory_warn_mb;
    opts.process.memory_limit_mb = cfg.memory_limit_mb;
    return opts;
}

} // namespace agentworker
