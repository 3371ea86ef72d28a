#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>

// Test backend for the circuitguard CLI. Fails a configurable share of
// requests so the breaker can be watched tripping and recovering.
//
//   flaky_backend port=9001 failure_rate=60 delay_in_millis=0

// Function to parse key-value pairs from a string
// Returns std::nullopt if any argument is invalid
std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
    std::map<std::string, std::string> argMap;
    for (const std::string& arg : args) {
        size_t delimiterPos = arg.find('=');
        if (delimiterPos != std::string::npos && delimiterPos > 0) { // Ensure key is not empty
            argMap[arg.substr(0, delimiterPos)] = arg.substr(delimiterPos + 1);
        } else {
            std::cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << std::endl;
            return std::nullopt;
        }
    }
    return argMap;
}

int intArgument(std::map<std::string, std::string>& args, const std::string& key, int fallback, int min, int max) {
    if (!args.count(key)) {
        return fallback;
    }
    try {
        int value = std::stoi(args[key]);
        if (value >= min && value <= max) {
            return value;
        }
        std::cerr << "Warning: " << key << " '" << args[key] << "' out of range. Using " << fallback << "." << std::endl;
    } catch (const std::invalid_argument&) {
        std::cerr << "Warning: Invalid " << key << " format '" << args[key] << "'. Using " << fallback << "." << std::endl;
    } catch (const std::out_of_range&) {
        std::cerr << "Warning: " << key << " '" << args[key] << "' out of range. Using " << fallback << "." << std::endl;
    }
    return fallback;
}

int main(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }

    std::optional<std::map<std::string, std::string>> parsedArgsOpt = parseArguments(args);
    if (!parsedArgsOpt) {
        std::cerr << "Failed to parse command-line arguments. Exiting." << std::endl;
        return 1;
    }
    std::map<std::string, std::string> startupArguments = *parsedArgsOpt;

    const int port = intArgument(startupArguments, "port", 9001, 1, 65535);
    const int failure_rate = intArgument(startupArguments, "failure_rate", 50, 0, 100);   // percent
    const int delay_in_millis = intArgument(startupArguments, "delay_in_millis", 0, 0, 600000);

    std::atomic<unsigned long> served{0};
    std::atomic<unsigned long> failed{0};

    httplib::Server server;

    server.Get("/status", [&served, &failed](const httplib::Request&, httplib::Response& res) {
        std::stringstream ss;
        ss << R"({"served": )" << served.load() << R"(, "failed": )" << failed.load() << "}";
        res.set_content(ss.str(), "application/json");
    });

    // Every other path answers 200 or 503 at random.
    auto flaky = [&](const httplib::Request& req, httplib::Response& res) {
        thread_local std::mt19937 generator{std::random_device{}()};
        std::uniform_int_distribution<int> percent(0, 99);

        if (delay_in_millis > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_in_millis));
        }
        ++served;
        if (percent(generator) < failure_rate) {
            ++failed;
            std::cout << req.method << " " << req.path << " -> 503" << std::endl;
            res.status = 503;
            res.set_content(R"({"error": "service unavailable"})", "application/json");
            return;
        }
        std::cout << req.method << " " << req.path << " -> 200" << std::endl;
        res.status = 200;
        res.set_content(R"({"status": "ok"})", "application/json");
    };
    server.Get(".*", flaky);
    server.Post(".*", flaky);
    server.Put(".*", flaky);
    server.Delete(".*", flaky);

    std::cout << "Starting flaky backend on 0.0.0.0:" << port << " with failure rate " << failure_rate << "%..." << std::endl;
    if (!server.listen("0.0.0.0", port)) {
        std::cerr << "Failed to start server on port " << port << "." << std::endl;
        return 1;
    }

    std::cout << "Server stopped." << std::endl;
    return 0;
}
