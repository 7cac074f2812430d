#pragma once

#include <iosfwd>
#include <mutex>
#include <string>

namespace gitsim {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off
};

// Process-wide logger. Messages carry the emitting component and an optional
// context string; they go to stderr unless another sink is installed.
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;
    void set_console(bool enabled);
    // nullptr restores stderr. The stream must outlive its use by the logger.
    void set_sink(std::ostream* sink);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");

    static const char* level_name(LogLevel level);
    static bool parse_level(const std::string& text, LogLevel& out);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const std::string& component, const std::string& message, const std::string& context);

    mutable std::mutex mutex_;
    LogLevel level_ = LogLevel::Warning;
    bool console_ = true;
    std::ostream* sink_ = nullptr;
};

// GITSIM_LOG_*(component, message [, context])
#define GITSIM_LOG_DEBUG(component, ...) ::gitsim::Logger::instance().debug(component, __VA_ARGS__)
#define GITSIM_LOG_INFO(component, ...) ::gitsim::Logger::instance().info(component, __VA_ARGS__)
#define GITSIM_LOG_WARNING(component, ...) ::gitsim::Logger::instance().warning(component, __VA_ARGS__)
#define GITSIM_LOG_ERROR(component, ...) ::gitsim::Logger::instance().error(component, __VA_ARGS__)

} // namespace gitsim
