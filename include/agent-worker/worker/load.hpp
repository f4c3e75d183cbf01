/*
 * Host load sampling - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace agentworker {

struct CpuTimes {
    std::uint64_t idle = 0;
    std::uint64_t total = 0;
};

// parses the aggregate "cpu" line of /proc/stat
std::optional<CpuTimes> parse_proc_stat(const std::string& text);

// CPU utilisation in [0, 1] between consecutive samples; the first sample is 0.
class CpuLoadSampler {
public:
    explicit CpuLoadSampler(std::string stat_path = "/proc/stat");
    double sample();

private:
    std::string m_path;
    std::mutex m_mutex;
    std::optional<CpuTimes> m_last;
};

} // namespace agentworker
