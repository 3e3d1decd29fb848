#pragma once

#include <string>
#include <mutex>

namespace remembrances {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

// Accepts "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Unknown names map to INFO.
LogLevel logLevelFromString(const std::string& name);

class Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level);
    LogLevel level() const { return level_; }
    void setTimestamps(bool enabled);

    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

    // Installer progress lines, emitted at INFO
    void step(const std::string& msg);
    void success(const std::string& msg);
    void keyValue(const std::string& key, const std::string& value);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& tag, const std::string& msg);
    std::string levelToString(LogLevel level);
    std::string getTimestamp();

    LogLevel level_;
    std::string prefix_;
    bool timestamps_;
    std::mutex mutex_;
};

#define LOG_DEBUG(msg) remembrances::Logger::instance().debug(msg)
#define LOG_INFO(msg) remembrances::Logger::instance().info(msg)
#define LOG_WARN(msg) remembrances::Logger::instance().warn(msg)
#define LOG_ERROR(msg) remembrances::Logger::instance().error(msg)
#define LOG_STEP(msg) remembrances::Logger::instance().step(msg)
#define LOG_SUCCESS(msg) remembrances::Logger::instance().success(msg)
#define LOG_KV(key, value) remembrances::Logger::instance().keyValue(key, value)

}
