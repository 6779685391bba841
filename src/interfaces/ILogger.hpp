#pragma once

#include <string>

#include "../config/AppConfig.hpp"

// Levels follow LogUtils::LogLevel: DEBUG < INFO < WARN < CERROR; setup() is always written.
class ILogger {
public:
    virtual ~ILogger() noexcept = default;
    virtual void info(const std::string& message) = 0;
    virtual void debug(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    virtual void setup(const std::string& message) = 0;
    virtual int getLogLevel() = 0;

    // Lets callers skip building debug strings nobody will see.
    bool isDebugEnabled() { return getLogLevel() <= LogUtils::LogLevel::DEBUG; }
};
