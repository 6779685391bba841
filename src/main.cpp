#include <atomic>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/error.hpp>
#include <boost/asio/executor_work_guard.hpp> // For make_work_guard
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include <nlohmann/json.hpp>

#include "cache/CacheStats.hpp"
#include "cache/MemoizingEngine.hpp"
#include "clock/SystemClock.hpp"
#include "config/AppConfig.hpp"
#include "errors/CacheErrors.hpp"
#include "key/KeyCodec.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "utils/Utils.hpp"

using json = nlohmann::json;
namespace net = boost::asio;

using DemoEngine = MemoizingEngine<CacheKey, std::string>;

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    std::string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv(Constants::STATSD_ENV_VARIABLE);
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }

    if (statsd_server_endpoint.empty()) {
        logger_->setup("STATSD_SERVER not set. Using DummyStatsDClient.");
        return DummyStatsDClient::getInstance();
    }

    try {
        return StatsDClient::getInstance(config, logger_, statsd_server_endpoint);
    } catch (const std::exception& e) {
        logger_->error("StatsDClient could not be created: " + std::string(e.what()) + ". Using DummyStatsDClient.");
    }
    return DummyStatsDClient::getInstance();
}

// --- Helper Function to build the engine from config ---
std::unique_ptr<DemoEngine> initializeEngine(const AppConfig& config,
                                             std::shared_ptr<ILogger> logger_,
                                             std::shared_ptr<IStatsDClient> statsd_client) {
    std::optional<std::chrono::milliseconds> ttl;
    if (config.cache_ttl_millis) {
        ttl = std::chrono::milliseconds(*config.cache_ttl_millis);
    }
    return std::make_unique<DemoEngine>(
        static_cast<std::size_t>(config.cache_capacity), ttl, std::make_shared<SystemClock>(), logger_, statsd_client);
}

// Stand-in for an expensive lookup: sleeps, then renders a report for the item.
std::string slowReport(int item_id, int latency_millis) {
    std::this_thread::sleep_for(std::chrono::milliseconds(latency_millis));
    if (item_id % 13 == 12) {
        throw std::runtime_error("report backend unavailable for item " + std::to_string(item_id));
    }
    std::stringstream ss;
    ss << "report(item=" << item_id << ", squares=" << item_id * item_id << ")";
    return ss.str();
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        // Process command-line arguments.
        std::vector<std::string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        std::optional<std::map<std::string, std::string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        AppConfig config_ = Utils::loadConfiguration(*parsedArgsOpt);

        auto console_logger = ConsoleLogger::getInstance(config_.log_level);
        console_logger->setLogLevel(config_.log_level);
        std::shared_ptr<ILogger> logger_ = console_logger;
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);
        std::unique_ptr<DemoEngine> engine = initializeEngine(config_, logger_, statsd_client);

        std::optional<std::chrono::milliseconds> wait_timeout;
        if (config_.wait_timeout_millis) {
            wait_timeout = std::chrono::milliseconds(*config_.wait_timeout_millis);
        }

        // --- Setup Boost.Asio io_context and worker threads ---
        net::io_context ioc;
        auto work_guard = net::make_work_guard(ioc);

        // --- Periodic purge of expired entries ---
        net::steady_timer sweep_timer(ioc);
        std::function<void(const boost::system::error_code&)> arm_sweep;
        arm_sweep = [&](const boost::system::error_code& ec) {
            if (ec == net::error::operation_aborted) {
                logger_->debug("Sweep timer cancelled.");
                return;
            }
            engine->purgeExpired();
            sweep_timer.expires_after(std::chrono::milliseconds(config_.sweep_interval_millis));
            sweep_timer.async_wait(arm_sweep);
        };
        if (config_.sweep_interval_millis > 0 && config_.cache_ttl_millis) {
            sweep_timer.expires_after(std::chrono::milliseconds(config_.sweep_interval_millis));
            sweep_timer.async_wait(arm_sweep);
        }

        std::vector<std::thread> ioc_threads;
        logger_->setup("Starting " + std::to_string(config_.worker_threads) + " worker threads.");
        for (int i = 0; i < config_.worker_threads; ++i) {
            ioc_threads.emplace_back([&ioc, logger_, i]() {
                try {
                    ioc.run();
                } catch (const std::exception& e) {
                    logger_->error("Exception in worker thread " + std::to_string(i) + ": " + e.what());
                }
            });
        }

        // --- Issue overlapping requests ---
        KeyCodec report_keys("slowReport");
        std::atomic<int> remaining{config_.demo_requests};
        std::atomic<int> succeeded{0};
        std::atomic<int> failed{0};
        std::atomic<int> timed_out{0};
        std::promise<void> all_done;
        auto all_done_future = all_done.get_future();
        if (config_.demo_requests == 0) {
            all_done.set_value();
        }

        for (int request = 0; request < config_.demo_requests; ++request) {
            int item_id = request % config_.demo_key_space;
            net::post(ioc, [&, item_id]() {
                try {
                    CacheKey key = report_keys.encode(item_id);
                    std::string report = engine->getOrCompute(
                        key,
                        [item_id, &config_]() { return slowReport(item_id, config_.demo_producer_latency_millis); },
                        wait_timeout);
                    logger_->debug("item " + std::to_string(item_id) + " -> " + report);
                    ++succeeded;
                } catch (const TimeoutError& e) {
                    logger_->warn(e.what());
                    ++timed_out;
                } catch (const std::exception& e) {
                    logger_->warn("Request for item " + std::to_string(item_id) + " failed: " + e.what());
                    ++failed;
                }
                if (--remaining == 0) {
                    all_done.set_value();
                }
            });
        }

        all_done_future.wait();
        sweep_timer.cancel();
        work_guard.reset();
        ioc.stop();
        for (auto& t : ioc_threads) {
            if (t.joinable()) t.join();
        }
        statsd_client->flush();

        json summary;
        summary["requests"] = config_.demo_requests;
        summary["succeeded"] = succeeded.load();
        summary["failed"] = failed.load();
        summary["timed_out"] = timed_out.load();
        summary["stats"] = engine->stats();
        std::cout << summary.dump(2) << std::endl;
        return 0;
    } catch (const ConfigError& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Invalid configuration: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Unhandled exception: " + std::string(e.what()));
        return 1;
    }
}
