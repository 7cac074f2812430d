#include "gitsim_engine/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace gitsim {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_console(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enabled;
}

void Logger::set_sink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::Debug, component, message, context);
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::Info, component, message, context);
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::Warning, component, message, context);
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::Error, component, message, context);
}

const char* Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "UNKNOWN";
}

bool Logger::parse_level(const std::string& text, LogLevel& out) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") out = LogLevel::Debug;
    else if (lower == "info") out = LogLevel::Info;
    else if (lower == "warning" || lower == "warn") out = LogLevel::Warning;
    else if (lower == "error") out = LogLevel::Error;
    else if (lower == "off" || lower == "none") out = LogLevel::Off;
    else return false;
    return true;
}

static std::string timestamp_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    std::ostringstream os;
    os << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return os.str();
}

void Logger::write(LogLevel level, const std::string& component, const std::string& message, const std::string& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_ || level_ == LogLevel::Off) return;
    if (!console_ && sink_ == nullptr) return;
    std::ostream& out = sink_ != nullptr ? *sink_ : std::cerr;
    out << '[' << timestamp_now() << "] [" << level_name(level) << "] [" << component << "] " << message;
    if (!context.empty()) out << " (" << context << ')';
    out << '\n';
}

} // namespace gitsim
