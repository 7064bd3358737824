#pragma once
#include <sstream>
#include <string>
#include <mutex>
#include <ostream>
#include <optional>
#include <iostream>

enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR };

// "debug", "WARN", ... -> LogLevel; nullopt for anything else
std::optional<LogLevel> parse_log_level(const std::string& name);
const char* log_level_name(LogLevel lvl) noexcept;

class Logger {
public:
    // name shows up on every line; output defaults to stderr so codes on stdout stay clean
    explicit Logger(std::string name, std::ostream& out = std::cerr);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level) noexcept;
    LogLevel level() const noexcept;
    bool enabled(LogLevel lvl) const noexcept;
    const std::string& name() const noexcept { return name_; }

    // thread-safe
    void log(LogLevel lvl, const std::string& msg);
    void trace(const std::string& msg);
    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

    // concatenating helpers: debug_fmt("digits ", 7, " -> ", 6)
    template<typename... Args>
    void log_fmt(LogLevel lvl, Args&&... args);
    template<typename... Args>
    void trace_fmt(Args&&... args) { log_fmt(LogLevel::TRACE, std::forward<Args>(args)...); }
    template<typename... Args>
    void debug_fmt(Args&&... args) { log_fmt(LogLevel::DEBUG, std::forward<Args>(args)...); }
    template<typename... Args>
    void info_fmt(Args&&... args) { log_fmt(LogLevel::INFO, std::forward<Args>(args)...); }
    template<typename... Args>
    void warn_fmt(Args&&... args) { log_fmt(LogLevel::WARN, std::forward<Args>(args)...); }

private:
    std::string name_;
    LogLevel level_;
    std::ostream* out_;
    mutable std::mutex mutex_;
    void emit(LogLevel lvl, const std::string& payload);
};

template<typename... Args>
inline void Logger::log_fmt(LogLevel lvl, Args&&... args) {
    // skip the formatting work entirely when filtered out
    if (!enabled(lvl)) return;
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    emit(lvl, oss.str());
}
