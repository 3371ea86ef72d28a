#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <chrono>
#include <iostream>
#include <regex>
#include <string>
#include <sstream>

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        CRITICAL = 4,
        SETUP = 5
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string CRITICAL_LOG_PREFIX = "[Critical] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string BREAKER_RESET = "circuitguard.breaker.reset";

    static std::string BREAKER_TRIPPED = "circuitguard.breaker.tripped";

    static std::string BREAKER_THEORETICALLY_TRIPPED = "circuitguard.breaker.theoretically_tripped";

    static std::string BREAKER_CLOSING = "circuitguard.breaker.closing";

    static std::string REQUEST_REJECTED = "circuitguard.request.rejected";

    static std::string REQUEST_THEORETICALLY_REJECTED = "circuitguard.request.theoretically_rejected";

    static std::string REQUEST_LATENCY = "circuitguard.request.latency";
}

namespace Constants {
    static constexpr auto TIME_FORMAT = "%Y-%m-%dT%H:%M:%S";
    // scheme, host, optional port, optional path (query and fragment dropped)
    static const std::regex url_regex(R"(^(https?):\/\/([^:\/?#]+)(?::(\d+))?(\/[^?#]*)?(?:[?#].*)?$)");
    static constexpr auto DEFAULT_CONFIG_FILE = "circuitguard.config";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Cache configuration
    bool use_redis;
    std::string redis_host;
    int redis_port;
    int in_memory_cache_max_size;
    std::string cache_key_namespace;

    // Breaker policy
    int failure_threshold;          // percent
    int min_requests;
    int consideration_window_in_seconds;
    bool breaker_enabled;
    std::string service_identifier; // "endpoint" or "domain"

    // Transport
    int request_timeout_in_millis;
    int num_io_threads;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    // Command-line tool
    std::string mode;
    std::string url;
    std::string method;
    int count;
    int interval_in_millis;

    AppConfig() {
        // --- Set Defaults  ---
        use_redis = false;
        redis_host = "localhost";
        redis_port = 6379;
        in_memory_cache_max_size = 10000;
        cache_key_namespace = "circuitguard";

        failure_threshold = 50;
        min_requests = 3;
        consideration_window_in_seconds = 15 * 60;
        breaker_enabled = true;
        service_identifier = "endpoint";

        request_timeout_in_millis = 2000;
        num_io_threads = 2;

        log_level = LogUtils::LogLevel::CERROR;

        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;

        mode = "probe";
        method = "GET";
        count = 1;
        interval_in_millis = 0;
    }

    std::chrono::seconds considerationWindow() const {
        return std::chrono::seconds(consideration_window_in_seconds);
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << "use_redis: " << std::boolalpha << use_redis << std::noboolalpha << std::endl
            << "redis_host: " << redis_host << std::endl
            << "redis_port: " << redis_port << std::endl
            << "in_memory_cache_max_size: " << in_memory_cache_max_size << std::endl
            << "cache_key_namespace: " << cache_key_namespace << std::endl
            << "// --- Breaker Policy --- //" << std::endl
            << "failure_threshold: " << failure_threshold << std::endl
            << "min_requests: " << min_requests << std::endl
            << "consideration_window: " << consideration_window_in_seconds << "s" << std::endl
            << "breaker_enabled: " << std::boolalpha << breaker_enabled << std::noboolalpha << std::endl
            << "service_identifier: " << service_identifier << std::endl
            << "// --- Transport --- //" << std::endl
            << "request_timeout_in_millis: " << request_timeout_in_millis << std::endl
            << "num_io_threads: " << num_io_threads << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl
            << "// --- Command --- //" << std::endl
            << "mode: " << mode << std::endl
            << "url: " << url << std::endl
            << "method: " << method << std::endl
            << "count: " << count << std::endl
            << "interval_in_millis: " << interval_in_millis << std::endl;
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
