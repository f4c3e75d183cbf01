/*
 * Logger - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agentworker {

enum class LogLevel { Trace = 0, Debug, Info, Warn, Error };

std::optional<LogLevel> parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

using LogField = std::pair<std::string, std::string>;

// Explicitly constructed and handed to every component; children share the sink.
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Info, std::ostream& out = std::cerr, bool color = false);

    std::shared_ptr<Logger> child(std::vector<LogField> fields) const;

    void set_level(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& msg, const std::vector<LogField>& extra = {}) const;

    void trace(const std::string& msg, const std::vector<LogField>& extra = {}) const { log(LogLevel::Trace, msg, extra); }
    void debug(const std::string& msg, const std::vector<LogField>& extra = {}) const { log(LogLevel::Debug, msg, extra); }
    void info(const std::string& msg, const std::vector<LogField>& extra = {}) const { log(LogLevel::Info, msg, extra); }
    void warn(const std::string& msg, const std::vector<LogField>& extra = {}) const { log(LogLevel::Warn, msg, extra); }
    void error(const std::string& msg, const std::vector<LogField>& extra = {}) const { log(LogLevel::Error, msg, extra); }

private:
    struct Sink {
        std::mutex mutex;
        std::ostream* out;
        LogLevel level;
        bool color;
    };
    Logger(std::shared_ptr<Sink> sink, std::vector<LogField> fields);

    std::shared_ptr<Sink> m_sink;
    std::vector<LogField> m_fields;
};

using LoggerPtr = std::shared_ptr<Logger>;

} // namespace agentworker
