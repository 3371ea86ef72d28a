#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <cpp-statsd-client/UDPSender.hpp>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

class StatsDClient : public IStatsDClient {
public:
    // statsd_address is "<host>:<port>". Throws std::runtime_error when it is
    // malformed or the UDP sender cannot be set up.
    static std::shared_ptr<StatsDClient> getInstance(
        const AppConfig& config,
        std::shared_ptr<ILogger> logger,
        const std::string& statsd_address);
    ~StatsDClient() override;

    void increment(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;

private:
    StatsDClient(
        const AppConfig& config,
        std::shared_ptr<ILogger> logger,
        const std::string& statsd_address);
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
