#include <sstream>
#include <stdexcept>

#include "StatsDClient.hpp"

std::shared_ptr<StatsDClient> StatsDClient::instance = nullptr;
std::once_flag StatsDClient::init_flag;

// Throws std::runtime_error when the endpoint is malformed. A failed first call
// is retried on the next one.
std::shared_ptr<StatsDClient> StatsDClient::getInstance(
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& stats_server_endpoint) {
    std::call_once(init_flag, [&config, &logger, &stats_server_endpoint]() {
        instance = std::shared_ptr<StatsDClient>(new StatsDClient(config, logger, stats_server_endpoint));
    });
    return instance;
}

StatsDClient::StatsDClient(
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& statsd_address) : logger_(logger), udp_sender_(nullptr) {
    auto colon_pos = statsd_address.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host = statsd_address.substr(0, colon_pos);
    if (host == "localhost") {
        host = "127.0.0.1";
    }

    int port;
    try {
        port = std::stoi(statsd_address.substr(colon_pos + 1));
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + std::string(e.what()));
    }
    if (port <= 0 || port > 65535) {
        throw std::runtime_error("STATSD_SERVER port out of range: " + std::to_string(port));
    }

    udp_sender_ = std::make_unique<Statsd::UDPSender>(
        host, static_cast<uint16_t>(port),
        static_cast<uint64_t>(config.metrics_batch_size),
        static_cast<uint64_t>(config.metrics_send_interval_in_millis));
    if (!udp_sender_->initialized()) {
        throw std::runtime_error("Failed to initialize UDPSender: " + udp_sender_->errorMessage());
    }
    logger_->setup("StatsD metrics go to " + host + ":" + std::to_string(port));
}

StatsDClient::~StatsDClient() = default;

void StatsDClient::send(const std::string& message) {
    if (!udp_sender_) {
        logger_->error("StatsDClient: UDPSender is not initialized, dropping " + message);
        return;
    }
    udp_sender_->send(message);
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
