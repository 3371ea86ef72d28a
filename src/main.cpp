#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "cache/InMemoryCache.hpp"
#include "cache/RedisCache.hpp"
#include "config/AppConfig.hpp"
#include "core/BeastHttpTransport.hpp"
#include "core/BreakerEngine.hpp"
#include "core/BreakerExceptions.hpp"
#include "core/MetricStore.hpp"
#include "core/RequestInterceptor.hpp"
#include "identifiers/DomainServiceIdentifier.hpp"
#include "identifiers/EndpointServiceIdentifier.hpp"
#include "identifiers/StandardFailureIdentifier.hpp"
#include "listeners/LoggingBreakerListener.hpp"
#include "listeners/MetricsBreakerListener.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "utils/Utils.hpp"

using namespace std;

// --- Helper Function to Initialize Cache ---
std::shared_ptr<CacheInterface> initializeCache(const AppConfig& config, std::shared_ptr<ILogger> logger) {
    if (config.use_redis) {
        auto redis_cache = std::make_shared<RedisCache>(config, logger);
        if (redis_cache->isConnected()) {
            logger->setup("Redis cache connected successfully.");
            return redis_cache;
        }
        logger->error("Redis unavailable, breaker stats will be kept in process memory only.");
    }
    logger->setup("Creating InMemoryCache.");
    return std::make_shared<InMemoryCache>(static_cast<size_t>(config.in_memory_cache_max_size));
}

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger) {
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value == nullptr || std::string(statsd_server_value).empty()) {
        logger->setup("STATSD_SERVER not set. Metrics disabled.");
        return DummyStatsDClient::getInstance();
    }

    try {
        return StatsDClient::getInstance(config, logger, statsd_server_value);
    } catch (const std::exception& e) {
        logger->error("StatsDClient could not be created: " + std::string(e.what()) + ". Metrics disabled.");
    }
    return DummyStatsDClient::getInstance();
}

std::shared_ptr<IServiceIdentifier> createServiceIdentifier(const AppConfig& config) {
    if (config.service_identifier == "domain") {
        return std::make_shared<DomainServiceIdentifier>();
    }
    return std::make_shared<EndpointServiceIdentifier>();
}

void printStatus(const BreakerEngine& engine, const std::string& service_identity) {
    StatCounter stats = engine.getStats(service_identity);
    json out = {
        {"service", service_identity},
        {"status", toString(BreakerEngine::computeStatus(stats, engine.getConfig()))},
        {"failure_ratio", stats.getFailureRatio()},
        {"stats", stats.to_json()}
    };
    std::cout << out.dump() << std::endl;
}

// Sends config.count requests, one at a time. Returns the number of requests
// that got a response.
int runProbe(const AppConfig& config, RequestInterceptor& interceptor, std::shared_ptr<ILogger> logger,
             std::shared_ptr<IStatsDClient> statsd_client) {
    const OutboundRequest request = Utils::makeRequest(config.method, config.url);
    const std::string service_identity = interceptor.identify(request);
    // leave the transport deadline room to fire first
    const auto wait = std::chrono::milliseconds(config.request_timeout_in_millis + 1000);

    int answered = 0;
    for (int i = 1; i <= config.count; ++i) {
        const auto started = std::chrono::steady_clock::now();
        try {
            auto response = interceptor.execute(request, wait);
            ++answered;
            std::cout << "#" << i << " " << response.result_int() << " " << response.reason() << std::endl;
        } catch (const OpenCircuitException& e) {
            std::cout << "#" << i << " rejected: " << e.what() << std::endl;
        } catch (const TransportException& e) {
            std::cout << "#" << i << " error: " << e.error().message() << std::endl;
        }
        statsd_client->timing(MetricsDefinitions::REQUEST_LATENCY,
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started));

        if (config.interval_in_millis > 0 && i < config.count) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config.interval_in_millis));
        }
    }
    logger->info(std::to_string(answered) + " of " + std::to_string(config.count) + " requests answered.");
    printStatus(*interceptor.engine(), service_identity);
    return answered;
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        vector<string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        AppConfig config = Utils::loadConfiguration(parsedArgsOpt.value());

        auto console_logger = ConsoleLogger::getInstance(config.log_level);
        console_logger->setLogLevel(config.log_level);
        std::shared_ptr<ILogger> logger = console_logger;
        logger->debug(config.to_string());

        if (config.url.empty()) {
            logger->error("Missing required argument url=<http://host[:port]/path>. Exiting.");
            return 1;
        }

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config, logger);
        std::shared_ptr<CacheInterface> cache = initializeCache(config, logger);

        BreakerConfig breaker_config;
        breaker_config.failure_threshold = config.failure_threshold;
        breaker_config.min_requests = static_cast<unsigned int>(config.min_requests);
        breaker_config.consideration_window = config.considerationWindow();
        breaker_config.enabled = config.breaker_enabled;

        auto store = std::make_shared<MetricStore>(cache, logger, config.cache_key_namespace, breaker_config.consideration_window);
        auto engine = std::make_shared<BreakerEngine>(store, breaker_config, logger,
            std::vector<std::shared_ptr<IBreakerListener>>{
                std::make_shared<LoggingBreakerListener>(logger),
                std::make_shared<MetricsBreakerListener>(statsd_client)});

        // --- Setup Boost.Asio io_context for the transport ---
        boost::asio::io_context ioc;
        auto work_guard = boost::asio::make_work_guard(ioc);
        std::vector<std::thread> ioc_threads;
        for (int i = 0; i < config.num_io_threads; ++i) {
            ioc_threads.emplace_back([&ioc, logger, i]() {
                try {
                    ioc.run();
                } catch (const std::exception& e) {
                    logger->error("Exception in I/O thread " + std::to_string(i) + ": " + e.what());
                }
            });
        }

        auto transport = std::make_shared<BeastHttpTransport>(ioc, std::chrono::milliseconds(config.request_timeout_in_millis), logger);
        RequestInterceptor interceptor(engine, createServiceIdentifier(config),
            std::make_shared<StandardFailureIdentifier>(), transport, logger);

        int exit_code = 0;
        try {
            if (config.mode == "status") {
                printStatus(*engine, interceptor.identify(Utils::makeRequest(config.method, config.url)));
            } else if (config.mode == "reset") {
                const std::string service_identity = interceptor.identify(Utils::makeRequest(config.method, config.url));
                engine->reset(service_identity);
                printStatus(*engine, service_identity);
            } else {
                runProbe(config, interceptor, logger, statsd_client);
            }
        } catch (const std::invalid_argument& e) {
            logger->error(e.what());
            exit_code = 1;
        }

        transport->cancelAll();
        work_guard.reset();
        ioc.stop();
        for (auto& t : ioc_threads) {
            if (t.joinable()) t.join();
        }
        return exit_code;
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Unhandled exception: " << e.what();
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(ss.str());
        return 1;
    }
}
