#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <cpp-statsd-client/UDPSender.hpp>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Plain-text StatsD client on top of Statsd::UDPSender. With metrics_batch_size > 0 lines are
// packed into datagrams of up to that many bytes and sent every metrics_send_interval_millis;
// flush() and the destructor push out whatever is still queued.
class StatsDClient : public IStatsDClient {
public:
    static std::shared_ptr<StatsDClient> getInstance(
        const AppConfig& config,
        std::shared_ptr<ILogger> logger,
        const std::string& stats_server_endpoint);

    // stats_server_endpoint is "<host>:<port>". Throws std::runtime_error if it is malformed
    // or the sender cannot be initialized.
    StatsDClient(
        const AppConfig& config,
        std::shared_ptr<ILogger> logger,
        const std::string& stats_server_endpoint);
    ~StatsDClient() override;

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;
    void set(const std::string& key, const std::string& value) override;
    void flush() override;

private:
    void send(const std::string& message);

    std::shared_ptr<ILogger> logger_;
    std::unique_ptr<Statsd::UDPSender> udp_sender_;

    static std::shared_ptr<StatsDClient> instance;
    static std::once_flag init_flag;

    // Delete copy and move operations
    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;
    StatsDClient(StatsDClient&&) = delete;
    StatsDClient& operator=(StatsDClient&&) = delete;
};
