/*
 * Logger implementation - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/util/log.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace agentworker {

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string low = name;
    std::transform(low.begin(), low.end(), low.begin(), [](unsigned char c){ return std::tolower(c); });
    if (low == "trace") return LogLevel::Trace;
    if (low == "debug") return LogLevel::Debug;
    if (low == "info") return LogLevel::Info;
    if (low == "warn" || low == "warning") return LogLevel::Warn;
    if (low == "error" || low == "fatal") return LogLevel::Error;
    return std::nullopt;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO ";
        case LogLevel::Warn: return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "?????";
}

static const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "90";
        case LogLevel::Debug: return "36";
        case LogLevel::Info: return "32";
        case LogLevel::Warn: return "33";
        case LogLevel::Error: return "31";
    }
    return "0";
}

// Values with spaces or quotes get quoted so lines stay grep-able.
static std::string quote_value(const std::string& v) {
    bool plain = !v.empty() && std::none_of(v.begin(), v.end(), [](unsigned char c){ return std::isspace(c) || c == '"' || c == '='; });
    if (plain) return v;
    std::string out = "\"";
    for (char c : v) {
        if (c == '"' || c == '\\') out += '\\';
        if (c == '\n') { out += "\\n"; continue; }
        out += c;
    }
    out += '"';
    return out;
}

Logger::Logger(LogLevel level, std::ostream& out, bool color)
    : m_sink(std::make_shared<Sink>()) {
    m_sink->out = &out;
    m_sink->level = level;
    m_sink->color = color;
}

Logger::Logger(std::shared_ptr<Sink> sink, std::vector<LogField> fields)
    : m_sink(std::move(sink)), m_fields(std::move(fields)) {}

std::shared_ptr<Logger> Logger::child(std::vector<LogField> fields) const {
    std::vector<LogField> merged = m_fields;
    for (auto& f : fields) merged.push_back(std::move(f));
    return std::shared_ptr<Logger>(new Logger(m_sink, std::move(merged)));
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_sink->mutex);
    m_sink->level = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(m_sink->mutex);
    return m_sink->level;
}

bool Logger::enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(this->level());
}

void Logger::log(LogLevel level, const std::string& msg, const std::vector<LogField>& extra) const {
    if (!enabled(level)) return;
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream line;
    line << '[' << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    std::lock_guard<std::mutex> lock(m_sink->mutex);
    if (m_sink->color) line << "\x1b[" << level_color(level) << "m[" << log_level_name(level) << "]\x1b[0m ";
    else line << '[' << log_level_name(level) << "] ";
    line << msg;
    for (auto& f : m_fields) line << ' ' << f.first << '=' << quote_value(f.second);
    for (auto& f : extra) line << ' ' << f.first << '=' << quote_value(f.second);
    *m_sink->out << line.str() << '\n';
    m_sink->out->flush();
}

} // namespace agentworker
