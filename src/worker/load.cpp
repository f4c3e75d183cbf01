/*
 * Host load sampling implementation - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/worker/load.hpp>
#include <fstream>
#include <sstream>

namespace agentworker {

std::optional<CpuTimes> parse_proc_stat(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("cpu ", 0) != 0) continue;
        std::istringstream fields(line.substr(4));
        CpuTimes t;
        std::uint64_t v = 0;
        int idx = 0;
        while (fields >> v) {
            t.total += v;
            if (idx == 3 || idx == 4) t.idle += v; // idle + iowait
            ++idx;
        }
        if (idx < 4) return std::nullopt;
        return t;
    }
    return std::nullopt;
}

CpuLoadSampler::CpuLoadSampler(std::string stat_path) : m_path(std::move(stat_path)) {}

double CpuLoadSampler::sample() {
    std::ifstream in(m_path);
    if (!in) return 0.0;
    std::stringstream ss;
    ss << in.rdbuf();
    auto now = parse_proc_stat(ss.str());
    if (!now) return 0.0;

    std::lock_guard<std::mutex> lock(m_mutex);
    double load = 0.0;
    if (m_last && now->total > m_last->total) {
        double total = static_cast<double>(now->total - m_last->total);
        double idle = static_cast<double>(now->idle - m_last->idle);
        load = 1.0 - idle / total;
        if (load < 0.0) load = 0.0;
        if (load > 1.0) load = 1.0;
    }
    m_last = now;
    return load;
}

} // namespace agentworker
