#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

LogLevel Logger::threshold_ = LogLevel::INFO;

Logger::Logger(const std::string& component) : component_(component) {}

void Logger::trace(const std::string& message) const { write(LogLevel::TRACE, message); }
void Logger::debug(const std::string& message) const { write(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message) const { write(LogLevel::INFO, message); }
void Logger::warn(const std::string& message) const { write(LogLevel::WARN, message); }
void Logger::error(const std::string& message) const { write(LogLevel::ERROR, message); }

void Logger::setLevel(LogLevel level) {
    threshold_ = level;
}

LogLevel Logger::level() {
    return threshold_;
}

void Logger::write(LogLevel level, const std::string& message) const {
    if (level < threshold_) return;

    switch (level) {
        case LogLevel::WARN:
            std::cerr << "\033[33m[" << component_ << "] " << message << "\033[0m\n";
            break;
        case LogLevel::ERROR:
            std::cerr << "\033[31m[" << component_ << "] " << message << "\033[0m\n";
            break;
        default:
            std::cerr << "[" << component_ << "] " << message << "\n";
            break;
    }
}

Result<LogLevel> parseLogLevel(const std::string& text) {
    std::string name = text;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace") return Result<LogLevel>::Ok(LogLevel::TRACE);
    if (name == "debug") return Result<LogLevel>::Ok(LogLevel::DEBUG);
    if (name == "info") return Result<LogLevel>::Ok(LogLevel::INFO);
    if (name == "warn" || name == "warning") return Result<LogLevel>::Ok(LogLevel::WARN);
    if (name == "error") return Result<LogLevel>::Ok(LogLevel::ERROR);
    return Result<LogLevel>::Error(ErrorCode::InvalidArgument, "Unknown log level '" + text + "'");
}
