#include <iostream>
#include <mutex>
#include <string>

#include "ConsoleLogger.hpp"

// Define static members
std::shared_ptr<ConsoleLogger> ConsoleLogger::instance = nullptr;
std::once_flag ConsoleLogger::init_flag;

std::shared_ptr<ConsoleLogger> ConsoleLogger::getInstance(LogUtils::LogLevel logLevel) {
    std::call_once(init_flag, [logLevel]() {
        instance.reset(new ConsoleLogger(logLevel));
    });
    return instance;
}

void ConsoleLogger::write(std::ostream& stream, const std::string& prefix, const std::string& message) {
    std::lock_guard<std::mutex> lock(cout_mutex_); // Lock before accessing the stream
    stream << prefix << message << std::endl;
}

void ConsoleLogger::info(const std::string& message) {
    if (enabled(LogUtils::LogLevel::INFO)) {
        write(std::cout, LogUtils::INFO_LOG_PREFIX, message);
    }
}

void ConsoleLogger::debug(const std::string& message) {
    if (enabled(LogUtils::LogLevel::DEBUG)) {
        write(std::cout, LogUtils::DEBUG_LOG_PREFIX, message);
    }
}

void ConsoleLogger::warn(const std::string& message) {
    if (enabled(LogUtils::LogLevel::WARN)) {
        write(std::cout, LogUtils::WARN_LOG_PREFIX, message);
    }
}

void ConsoleLogger::error(const std::string& message) {
    if (enabled(LogUtils::LogLevel::CERROR)) {
        // Use std::cerr for errors
        write(std::cerr, LogUtils::CERROR_LOG_PREFIX, message);
    }
}

void ConsoleLogger::setup(const std::string& message) {
    write(std::cout, LogUtils::SETUP_LOG_PREFIX, message);
}
