#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "StatsDClient.hpp"

std::shared_ptr<StatsDClient> StatsDClient::instance = nullptr;
std::once_flag StatsDClient::init_flag;

std::shared_ptr<StatsDClient> StatsDClient::getInstance(
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& stats_server_endpoint) {
    std::call_once(init_flag, [&config, logger, &stats_server_endpoint]() {
        instance = std::make_shared<StatsDClient>(config, logger, stats_server_endpoint);
    });
    return instance;
}

StatsDClient::StatsDClient(
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& statsd_address) : logger_(logger), udp_sender_(nullptr) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDClient");
    }

    auto colon_pos = statsd_address.find(':');
    if (colon_pos == std::string::npos) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host = statsd_address.substr(0, colon_pos);
    if (host == "localhost") {
        host = "127.0.0.1";
    }

    std::uint16_t port;
    try {
        int parsed = std::stoi(statsd_address.substr(colon_pos + 1));
        if (parsed <= 0 || parsed > 65535) {
            throw std::out_of_range("port out of range");
        }
        port = static_cast<std::uint16_t>(parsed);
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + std::string(e.what()));
    }

    udp_sender_ = std::make_unique<Statsd::UDPSender>(
        host,
        port,
        static_cast<std::uint64_t>(config.metrics_batch_size),
        static_cast<std::uint64_t>(config.metrics_send_interval_millis));
    if (!udp_sender_->initialized()) {
        throw std::runtime_error("Failed to initialize UDPSender: " + udp_sender_->errorMessage());
    }
    logger_->setup("UDPSender initialized for " + host + ":" + std::to_string(port) +
                   ", batch size " + std::to_string(config.metrics_batch_size) + " bytes");
}

StatsDClient::~StatsDClient() {
    // UDPSender drops whatever is still queued when it stops its batching thread
    if (udp_sender_) {
        udp_sender_->flush();
    }
}

void StatsDClient::send(const std::string& message) {
    udp_sender_->send(message);
}

void StatsDClient::flush() {
    udp_sender_->flush();
}

void StatsDClient::increment(const std::string& key, int value) {
    std::stringstream ss;
    ss << key << ":" << value << "|c";
    send(ss.str());
}

void StatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

void StatsDClient::gauge(const std::string& key, double value) {
    std::stringstream ss;
    ss << key << ":" << value << "|g";
    send(ss.str());
}

void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    std::stringstream ss;
    ss << key << ":" << value.count() << "|ms";
    send(ss.str());
}

void StatsDClient::set(const std::string& key, const std::string& value) {
    std::stringstream ss;
    ss << key << ":" << value << "|s";
    send(ss.str());
}
