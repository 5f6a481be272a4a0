#pragma once

#include <string>

// Sink for cache diagnostics. Levels follow LogUtils::LogLevel.
class ILogger {
public:
    virtual ~ILogger() noexcept = default;
    virtual void info(const std::string& message) = 0;    
    virtual void debug(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    virtual void setup(const std::string& message) = 0; // startup messages, always printed
    virtual int getLogLevel() = 0;
};
