#include <cstdlib>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include "StatsDClient.hpp"

std::shared_ptr<StatsDClient> StatsDClient::instance = nullptr;
std::once_flag StatsDClient::init_flag;

std::shared_ptr<StatsDClient> StatsDClient::getInstance(
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& statsd_address) {
    std::call_once(init_flag, [&config, logger, &statsd_address]() {
        instance = std::shared_ptr<StatsDClient>(new StatsDClient(config, logger, statsd_address));
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

    uint16_t port;
    try {
        port = static_cast<uint16_t>(std::stoi(statsd_address.substr(colon_pos + 1)));
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + std::string(e.what()));
    }

    udp_sender_ = std::make_unique<Statsd::UDPSender>(
        host,
        port,
        static_cast<uint64_t>(config.metrics_batch_size),
        static_cast<uint64_t>(config.metrics_send_interval_in_millis));
    if (!udp_sender_->initialized()) {
        throw std::runtime_error("Failed to initialize UDPSender: " + udp_sender_->errorMessage());
    }
    logger_->setup("UDPSender initialized for " + host + ":" + std::to_string(port));
}

StatsDClient::~StatsDClient() {
    // UDPSender flushes its batch on destruction
    logger_->debug("StatsDClient destroyed.");
}

void StatsDClient::send(const std::string& message) {
    if (!udp_sender_) {
        logger_->error("StatsDClient: UDPSender is not initialized, cannot send message.");
        return;
    }
    udp_sender_->send(message);
    if (!udp_sender_->errorMessage().empty()) {
        logger_->error("StatsDClient: Failed to send UDP message: " + udp_sender_->errorMessage());
    }
}

void StatsDClient::increment(const std::string& key, int value) {
    std::stringstream ss;
    ss << key << ":" << value << "|c";
    send(ss.str());
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
