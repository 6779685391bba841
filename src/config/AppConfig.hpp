#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <iostream>
#include <optional>
#include <string>
#include <sstream>

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string CACHE_HIT = "memocache.hit";

    static std::string CACHE_MISS = "memocache.miss";

    static std::string CACHE_COALESCED = "memocache.coalesced";

    static std::string CACHE_EVICTION = "memocache.eviction";

    static std::string CACHE_EXPIRATION = "memocache.expiration";

    static std::string PRODUCER_ERROR = "memocache.producer_error";

    static std::string WAIT_TIMEOUT = "memocache.wait_timeout";

    // gauge
    static std::string CACHE_SIZE = "memocache.size";

    // timing
    static std::string PRODUCER_LATENCY = "memocache.producer_latency";
}

namespace Constants {
    static constexpr auto CONFIG_FILE_NAME = "memocache.config";
    static constexpr auto STATSD_ENV_VARIABLE = "STATSD_SERVER";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Cache configuration
    int cache_capacity;
    std::optional<int> cache_ttl_millis;      // nullopt: entries never expire
    std::optional<int> wait_timeout_millis;   // nullopt: joiners wait for the producer indefinitely
    int sweep_interval_millis;                // 0: no background purge

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    int metrics_batch_size;                   // bytes per StatsD datagram; 0 sends every line at once
    int metrics_send_interval_millis;

    // Demo workload
    int worker_threads;
    int demo_requests;
    int demo_key_space;
    int demo_producer_latency_millis;

    AppConfig() {
        // --- Set Defaults  ---
        cache_capacity = 1024;
        cache_ttl_millis = 60 * 1000;
        wait_timeout_millis = std::nullopt;
        sweep_interval_millis = 1000;
        log_level = LogUtils::LogLevel::CERROR; // Default log level
        metrics_batch_size = 100;
        metrics_send_interval_millis = 1000;

        worker_threads = 4;
        demo_requests = 200;
        demo_key_space = 16;
        demo_producer_latency_millis = 20;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << "cache_capacity: " << cache_capacity << std::endl
            << "cache_ttl_millis: " << optionalToString(cache_ttl_millis) << std::endl
            << "wait_timeout_millis: " << optionalToString(wait_timeout_millis) << std::endl
            << "sweep_interval_millis: " << sweep_interval_millis << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl  // Cast enum to int
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_millis: " << metrics_send_interval_millis << std::endl
            << "// --- Demo Workload --- //" << std::endl
            << "worker_threads: " << worker_threads << std::endl
            << "demo_requests: " << demo_requests << std::endl
            << "demo_key_space: " << demo_key_space << std::endl
            << "demo_producer_latency_millis: " << demo_producer_latency_millis << std::endl;
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }

private:
    static std::string optionalToString(const std::optional<int>& value) {
        return value ? std::to_string(*value) : "none";
    }
};

#endif // APPCONFIG_HPP
