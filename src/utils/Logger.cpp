#include "utils/Logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace remembrances {

LogLevel logLevelFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , prefix_("[INSTALL]")
    , timestamps_(false) {
}

void Logger::setLevel(LogLevel level) {
    level_ = level;
}

void Logger::setTimestamps(bool enabled) {
    timestamps_ = enabled;
}

std::string Logger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream ss;
    ss << std::put_time(std::localtime(&time), "%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return ss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default:              return "?????";
    }
}

void Logger::log(LogLevel level, const std::string& tag, const std::string& msg) {
    if (level < level_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::ostream& out = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    if (timestamps_) {
        out << "[" << getTimestamp() << "] ";
    }
    out << prefix_ << " "
        << tag << ": "
        << msg << std::endl;
}

void Logger::debug(const std::string& msg) {
    log(LogLevel::DEBUG, levelToString(LogLevel::DEBUG), msg);
}

void Logger::info(const std::string& msg) {
    log(LogLevel::INFO, levelToString(LogLevel::INFO), msg);
}

void Logger::warn(const std::string& msg) {
    log(LogLevel::WARN, levelToString(LogLevel::WARN), msg);
}

void Logger::error(const std::string& msg) {
    log(LogLevel::ERROR, levelToString(LogLevel::ERROR), msg);
}

void Logger::step(const std::string& msg) {
    log(LogLevel::INFO, "==>  ", msg);
}

void Logger::success(const std::string& msg) {
    log(LogLevel::INFO, "OK   ", msg);
}

void Logger::keyValue(const std::string& key, const std::string& value) {
    std::ostringstream ss;
    ss << "  " << std::left << std::setw(22) << key << " " << value;
    log(LogLevel::INFO, levelToString(LogLevel::INFO), ss.str());
}

}
