#pragma once
#include <string>
#include "result.hpp"

enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR };

class Logger {
public:
    explicit Logger(const std::string& component);

    void trace(const std::string& message) const;
    void debug(const std::string& message) const;
    void info(const std::string& message) const;
    void warn(const std::string& message) const;
    void error(const std::string& message) const;

    // threshold shared by every logger in the process
    static void setLevel(LogLevel level);
    static LogLevel level();

private:
    void write(LogLevel level, const std::string& message) const;
    std::string component_;
    static LogLevel threshold_;
};

Result<LogLevel> parseLogLevel(const std::string& text);
