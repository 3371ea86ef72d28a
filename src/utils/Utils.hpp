#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/beast/http.hpp>

#include "../config/AppConfig.hpp"
#include "../models/OutboundRequest.hpp"
#include "../models/ServiceEndpoint.hpp"

using namespace std;

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        if (level == "CRITICAL") return LogUtils::LogLevel::CRITICAL;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Function to parse key-value pairs from a string (using optional version)
    static optional<map<string, string>> parseArguments(const vector<string>& args) {
        map<string, string> argMap;
        for (const string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) { // Ensure key is not empty
                string key = arg.substr(0, delimiterPos);
                string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << endl;
                return nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    // Applies one configuration key. Returns false (after a warning on
    // stderr) when the key is unknown or the value invalid; config is then
    // left untouched for that key.
    static bool applySetting(AppConfig& config, const string& key, const string& value) {
        auto intIn = [&](int& target, int min, int max) {
            auto val = stringToInt(value);
            if (!val || *val < min || *val > max) {
                cerr << "Warning: Invalid value for " << key << ": '" << value << "'. Keeping " << target << "." << endl;
                return false;
            }
            target = *val;
            return true;
        };
        auto flag = [&](bool& target) {
            auto val = stringToInt(value);
            if (!val || (*val != 0 && *val != 1)) {
                cerr << "Warning: Invalid value for " << key << ": '" << value << "'. Expected 0 or 1." << endl;
                return false;
            }
            target = (*val == 1);
            return true;
        };

        if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
                return true;
            } catch (const std::invalid_argument& e) {
                cerr << "Warning: " << e.what() << endl;
                return false;
            }
        } else if (key == "use_redis") {
            return flag(config.use_redis);
        } else if (key == "redis_host") {
            config.redis_host = value;
            return true;
        } else if (key == "redis_port") {
            return intIn(config.redis_port, 1, 65535);
        } else if (key == "in_memory_cache_max_size") {
            return intIn(config.in_memory_cache_max_size, 1, 100000000);
        } else if (key == "cache_key_namespace") {
            if (value.empty()) {
                cerr << "Warning: cache_key_namespace cannot be empty." << endl;
                return false;
            }
            config.cache_key_namespace = value;
            return true;
        } else if (key == "failure_threshold") {
            return intIn(config.failure_threshold, 0, 100);
        } else if (key == "min_requests") {
            return intIn(config.min_requests, 0, 1000000);
        } else if (key == "consideration_window") {
            // value provided in seconds
            return intIn(config.consideration_window_in_seconds, 1, 7 * 24 * 3600);
        } else if (key == "breaker_enabled") {
            return flag(config.breaker_enabled);
        } else if (key == "service_identifier") {
            if (value != "endpoint" && value != "domain") {
                cerr << "Warning: service_identifier must be 'endpoint' or 'domain', got '" << value << "'." << endl;
                return false;
            }
            config.service_identifier = value;
            return true;
        } else if (key == "request_timeout_in_millis") {
            return intIn(config.request_timeout_in_millis, 1, 600000);
        } else if (key == "num_io_threads") {
            return intIn(config.num_io_threads, 1, 256);
        } else if (key == "metrics_batch_size") {
            return intIn(config.metrics_batch_size, 0, 100000);
        } else if (key == "metrics_send_interval") {
            // value provided in millis
            return intIn(config.metrics_send_interval_in_millis, 0, 3600000);
        } else if (key == "mode") {
            if (value != "probe" && value != "status" && value != "reset") {
                cerr << "Warning: mode must be one of probe, status, reset; got '" << value << "'." << endl;
                return false;
            }
            config.mode = value;
            return true;
        } else if (key == "url") {
            config.url = value;
            return true;
        } else if (key == "method") {
            string upper = value;
            transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
            if (boost::beast::http::string_to_verb(upper) == boost::beast::http::verb::unknown) {
                cerr << "Warning: Unknown HTTP method '" << value << "'." << endl;
                return false;
            }
            config.method = upper;
            return true;
        } else if (key == "count") {
            return intIn(config.count, 1, 1000000);
        } else if (key == "interval_in_millis") {
            return intIn(config.interval_in_millis, 0, 3600000);
        } else if (key == "config_file") {
            return true; // consumed by loadConfiguration
        }

        cerr << "Warning: Unknown configuration key '" << key << "' ignored." << endl;
        return false;
    }

    // Defaults, then the first config file found, then command-line arguments.
    static AppConfig loadConfiguration(const map<string, string>& startupArguments) {
        AppConfig config;

        std::vector<std::string> config_paths;
        auto explicit_path = startupArguments.find("config_file");
        if (explicit_path != startupArguments.end()) {
            config_paths.push_back(explicit_path->second);
        } else {
            config_paths = {
                Constants::DEFAULT_CONFIG_FILE,                          // Current directory
                std::string("../") + Constants::DEFAULT_CONFIG_FILE,     // Parent directory
                std::string("/etc/circuitguard/") + Constants::DEFAULT_CONFIG_FILE
            };
        }

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (!configFile.is_open()) {
                continue;
            }
            config_found = true;
            std::string line;
            while (getline(configFile, line)) {
                line = trim(line);
                if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                    continue;
                }
                size_t delimiterPos = line.find('=');
                if (delimiterPos != string::npos && delimiterPos > 0) {
                    applySetting(config, trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)));
                } else {
                    cerr << "Warning: Ignoring malformed line in " << config_path << ": '" << line << "'" << endl;
                }
            }
            break;
        }

        if (!config_found && explicit_path != startupArguments.end()) {
            cerr << "Warning: Configuration file '" << explicit_path->second << "' could not be opened." << endl;
        }

        for (const auto& pair : startupArguments) {
            applySetting(config, pair.first, pair.second);
        }
        return config;
    }

    static bool parseUrl(const std::string& url, ServiceEndpoint* endpoint) {
        std::smatch match;
        if (!std::regex_match(url, match, Constants::url_regex)) {
            std::cerr << "Error: URL format does not match expected pattern: " << url << std::endl;
            return false;
        }

        std::string scheme = match[1].str();
        bool is_https = (scheme == "https");
        int port = is_https ? 443 : 80;
        if (match[3].matched) { // Port is specified
            auto parsed = stringToInt(match[3].str());
            if (!parsed || *parsed <= 0 || *parsed > 65535) {
                std::cerr << "Warning: Invalid port number " << match[3].str() << " in URL " << url << std::endl;
                return false;
            }
            port = *parsed;
        }

        endpoint->url = url;
        endpoint->scheme = scheme;
        endpoint->host = match[2].str();
        endpoint->port = port;
        endpoint->path = match[4].length() > 0 ? match[4].str() : "/";
        endpoint->is_https = is_https;
        return true;
    }

    // Builds the request for an absolute URL. Throws std::invalid_argument on
    // a malformed URL or unknown method.
    static OutboundRequest makeRequest(const std::string& method, const std::string& url, const std::string& body = "") {
        OutboundRequest request;
        if (!parseUrl(url, &request.endpoint)) {
            throw std::invalid_argument("Invalid URL: " + url);
        }
        auto verb = boost::beast::http::string_to_verb(method);
        if (verb == boost::beast::http::verb::unknown) {
            throw std::invalid_argument("Unknown HTTP method: " + method);
        }

        // origin-form target keeps the query string
        std::string target = request.endpoint.path;
        auto query = url.find('?');
        if (query != std::string::npos) {
            target += url.substr(query, url.find('#', query) - query);
        }

        request.message.method(verb);
        request.message.target(target);
        request.message.version(11);
        if (!body.empty()) {
            request.message.body() = body;
        }
        request.message.prepare_payload();
        return request;
    }
};

#endif // UTILS_HPP
