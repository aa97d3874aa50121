#include "StatsDClient.hpp"

#include <sstream>
#include <stdexcept>

std::shared_ptr<StatsDClient> StatsDClient::instance = nullptr;
std::once_flag StatsDClient::init_flag;

std::shared_ptr<StatsDClient> StatsDClient::getInstance(
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& stats_server_endpoint) {
    std::call_once(init_flag, [&config, logger, &stats_server_endpoint]() {
        instance = std::shared_ptr<StatsDClient>(new StatsDClient(config, logger, stats_server_endpoint));
    });
    return instance;
}

StatsDClient::StatsDClient(
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& statsd_address) : logger_(logger), prefix_(config.metrics_prefix) {
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

    uint16_t port;
    try {
        port = static_cast<uint16_t>(std::stoi(statsd_address.substr(colon_pos + 1)));
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + std::string(e.what()));
    }

    udp_sender_ = std::make_unique<Statsd::UDPSender>(
        host, port,
        static_cast<uint64_t>(config.metrics_batch_size),
        static_cast<uint64_t>(config.metrics_send_interval_in_millis));
    if (!udp_sender_->initialized()) {
        throw std::runtime_error("Failed to initialize UDPSender: " + udp_sender_->errorMessage());
    }
    logger_->setup("UDPSender initialized for " + host + ":" + std::to_string(port));
}

StatsDClient::~StatsDClient() {
    if (udp_sender_) {
        udp_sender_->flush();
    }
}

void StatsDClient::send(const std::string& key, const std::string& value, const std::string& type) {
    std::string message;
    message.reserve(prefix_.size() + key.size() + value.size() + type.size() + 2);
    message.append(prefix_).append(key).append(":").append(value).append("|").append(type);
    udp_sender_->send(message);
}

void StatsDClient::increment(const std::string& key, int value) {
    send(key, std::to_string(value), "c");
}

void StatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

void StatsDClient::gauge(const std::string& key, double value) {
    std::ostringstream ss;
    ss << value;
    send(key, ss.str(), "g");
}

void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    send(key, std::to_string(value.count()), "ms");
}
