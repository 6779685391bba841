#pragma once

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

class ConsoleLogger : public ILogger {
public:
    // The first call creates the logger; later calls return it unchanged. Use setLogLevel()
    // once the configuration is known.
    static std::shared_ptr<ConsoleLogger> getInstance(LogUtils::LogLevel logLevel);
    ~ConsoleLogger() override = default;

    void info(const std::string& message) override;
    void debug(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;
    void setup(const std::string& message) override;
    int getLogLevel() override { return logLevel_.load(); }
    void setLogLevel(LogUtils::LogLevel logLevel) { logLevel_.store(logLevel); }

private:
    explicit ConsoleLogger(LogUtils::LogLevel logLevel) : logLevel_(logLevel) {}
    bool enabled(LogUtils::LogLevel level) const { return logLevel_.load() <= level; }
    void write(std::ostream& stream, const std::string& prefix, const std::string& message);

    std::atomic<int> logLevel_;
    std::mutex cout_mutex_; // Mutex to protect std::cout/std::cerr access

    static std::shared_ptr<ConsoleLogger> instance;
    static std::once_flag init_flag;

    // Delete copy/move operations
    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;
    ConsoleLogger(ConsoleLogger&&) = delete;
    ConsoleLogger& operator=(ConsoleLogger&&) = delete;
};
