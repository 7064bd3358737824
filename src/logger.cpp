#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string up(name);
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (up == "TRACE") return LogLevel::TRACE;
    if (up == "DEBUG") return LogLevel::DEBUG;
    if (up == "INFO")  return LogLevel::INFO;
    if (up == "WARN" || up == "WARNING") return LogLevel::WARN;
    if (up == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

const char* log_level_name(LogLevel lvl) noexcept {
    switch (lvl) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

Logger::Logger(std::string name, std::ostream& out)
  : name_(std::move(name)),
    level_(LogLevel::INFO),
    out_(&out)
{}

void Logger::set_level(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lk(mutex_);
    level_ = level;
}

LogLevel Logger::level() const noexcept {
    std::lock_guard<std::mutex> lk(mutex_);
    return level_;
}

bool Logger::enabled(LogLevel lvl) const noexcept {
    return static_cast<int>(lvl) >= static_cast<int>(level());
}

void Logger::emit(LogLevel lvl, const std::string& payload) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream line;
    line << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
         << '.' << std::setw(3) << std::setfill('0') << ms.count()
         << " [" << log_level_name(lvl) << "] " << name_ << ": " << payload << '\n';

    std::lock_guard<std::mutex> lk(mutex_);
    (*out_) << line.str();
    out_->flush();
}

void Logger::log(LogLevel lvl, const std::string& msg) {
    if (!enabled(lvl)) return;
    emit(lvl, msg);
}

void Logger::trace(const std::string& msg) { log(LogLevel::TRACE, msg); }
void Logger::debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
void Logger::info(const std::string& msg)  { log(LogLevel::INFO,  msg); }
void Logger::warn(const std::string& msg)  { log(LogLevel::WARN,  msg); }
void Logger::error(const std::string& msg) { log(LogLevel::ERROR, msg); }
