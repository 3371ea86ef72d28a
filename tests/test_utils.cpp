// test/test_utils.cpp
#include <cstdio>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/utils/Utils.hpp"

// Captures std::cerr for the lifetime of the object.
class CerrCapture {
public:
    CerrCapture() : old_(std::cerr.rdbuf(captured_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(old_); }
    std::string str() const { return captured_.str(); }

private:
    std::ostringstream captured_;
    std::streambuf* old_;
};

// --- Tests for parseArguments ---

TEST(UtilsTest, ParseArgumentsValidMultiple) {
    std::vector<std::string> args = {"url=http://svc/x", "count=5"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 2u);
    EXPECT_EQ(result->at("url"), "http://svc/x");
    EXPECT_EQ(result->at("count"), "5");
}

TEST(UtilsTest, ParseArgumentsValueMayContainEquals) {
    std::vector<std::string> args = {"url=http://svc/x?a=b"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->at("url"), "http://svc/x?a=b");
}

TEST(UtilsTest, ParseArgumentsEmptyInput) {
    auto result = Utils::parseArguments({});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(UtilsTest, ParseArgumentsInvalid) {
    CerrCapture capture;
    EXPECT_FALSE(Utils::parseArguments({"keyvalue"}).has_value());
    EXPECT_FALSE(Utils::parseArguments({"=value"}).has_value());
    // The current implementation returns nullopt if *any* arg is invalid
    EXPECT_FALSE(Utils::parseArguments({"key1=value1", "invalid", "key2=value2"}).has_value());
}

// --- Tests for small helpers ---

TEST(UtilsTest, StringToInt) {
    EXPECT_EQ(Utils::stringToInt("42"), 42);
    EXPECT_EQ(Utils::stringToInt("-7"), -7);
    EXPECT_FALSE(Utils::stringToInt("42abc").has_value());
    EXPECT_FALSE(Utils::stringToInt("").has_value());
    EXPECT_FALSE(Utils::stringToInt("99999999999999").has_value());
}

TEST(UtilsTest, Trim) {
    EXPECT_EQ(Utils::trim("  key = value \t\r\n"), "key = value");
    EXPECT_EQ(Utils::trim(" \t "), "");
}

TEST(UtilsTest, StringToLogLevel) {
    EXPECT_EQ(Utils::stringToLogLevel("DEBUG"), LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(Utils::stringToLogLevel("WARNING"), LogUtils::LogLevel::WARN);
    EXPECT_EQ(Utils::stringToLogLevel("CRITICAL"), LogUtils::LogLevel::CRITICAL);
    EXPECT_THROW(Utils::stringToLogLevel("LOUD"), std::invalid_argument);
}

// --- Tests for loadConfiguration ---

TEST(UtilsTest, LoadConfigurationDefaults) {
    CerrCapture capture;
    AppConfig config = Utils::loadConfiguration({{"config_file", "/nonexistent/circuitguard.config"}});
    EXPECT_EQ(config.failure_threshold, 50);
    EXPECT_EQ(config.min_requests, 3);
    EXPECT_EQ(config.considerationWindow(), std::chrono::minutes(15));
    EXPECT_TRUE(config.breaker_enabled);
    EXPECT_FALSE(config.use_redis);
    EXPECT_EQ(config.cache_key_namespace, "circuitguard");
    EXPECT_EQ(config.service_identifier, "endpoint");
    EXPECT_EQ(config.mode, "probe");
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::CERROR);
    EXPECT_NE(capture.str().find("could not be opened"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationOverrides) {
    CerrCapture capture;
    AppConfig config = Utils::loadConfiguration({
        {"config_file", "/nonexistent/circuitguard.config"},
        {"failure_threshold", "75"},
        {"min_requests", "10"},
        {"consideration_window", "60"},
        {"breaker_enabled", "0"},
        {"service_identifier", "domain"},
        {"method", "post"},
        {"log_level", "DEBUG"}
    });
    EXPECT_EQ(config.failure_threshold, 75);
    EXPECT_EQ(config.min_requests, 10);
    EXPECT_EQ(config.considerationWindow(), std::chrono::seconds(60));
    EXPECT_FALSE(config.breaker_enabled);
    EXPECT_EQ(config.service_identifier, "domain");
    EXPECT_EQ(config.method, "POST");
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::DEBUG);
}

TEST(UtilsTest, InvalidValuesKeepDefaults) {
    AppConfig config;
    CerrCapture capture;
    EXPECT_FALSE(Utils::applySetting(config, "failure_threshold", "101"));
    EXPECT_FALSE(Utils::applySetting(config, "failure_threshold", "abc"));
    EXPECT_FALSE(Utils::applySetting(config, "consideration_window", "0"));
    EXPECT_FALSE(Utils::applySetting(config, "breaker_enabled", "yes"));
    EXPECT_FALSE(Utils::applySetting(config, "service_identifier", "host"));
    EXPECT_FALSE(Utils::applySetting(config, "mode", "explode"));
    EXPECT_FALSE(Utils::applySetting(config, "cache_key_namespace", ""));
    EXPECT_FALSE(Utils::applySetting(config, "no_such_key", "1"));
    EXPECT_EQ(config.failure_threshold, 50);
    EXPECT_EQ(config.consideration_window_in_seconds, 900);
    EXPECT_TRUE(config.breaker_enabled);
    EXPECT_EQ(config.service_identifier, "endpoint");
    EXPECT_EQ(config.mode, "probe");
    EXPECT_EQ(config.cache_key_namespace, "circuitguard");
    EXPECT_NE(capture.str().find("no_such_key"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationFileThenArguments) {
    const std::string path = ::testing::TempDir() + "circuitguard_test.config";
    {
        std::ofstream file(path);
        file << "# breaker policy\n"
             << "failure_threshold = 30\n"
             << "\n"
             << "min_requests=5\n"
             << "use_redis = 1\n"
             << "redis_host = cache.internal\n"
             << "not a setting\n";
    }

    CerrCapture capture;
    AppConfig config = Utils::loadConfiguration({{"config_file", path}, {"min_requests", "7"}});
    std::remove(path.c_str());

    EXPECT_EQ(config.failure_threshold, 30);
    EXPECT_EQ(config.min_requests, 7); // command line wins
    EXPECT_TRUE(config.use_redis);
    EXPECT_EQ(config.redis_host, "cache.internal");
    EXPECT_NE(capture.str().find("malformed line"), std::string::npos);
}

// --- Tests for parseUrl / makeRequest ---

TEST(UtilsTest, ParseUrlDefaultsPortAndPath) {
    ServiceEndpoint endpoint;
    ASSERT_TRUE(Utils::parseUrl("http://svc", &endpoint));
    EXPECT_EQ(endpoint.scheme, "http");
    EXPECT_EQ(endpoint.host, "svc");
    EXPECT_EQ(endpoint.port, 80);
    EXPECT_EQ(endpoint.path, "/");
    EXPECT_FALSE(endpoint.is_https);

    ASSERT_TRUE(Utils::parseUrl("https://svc/a/b", &endpoint));
    EXPECT_EQ(endpoint.port, 443);
    EXPECT_EQ(endpoint.path, "/a/b");
    EXPECT_TRUE(endpoint.is_https);
}

TEST(UtilsTest, ParseUrlExplicitPort) {
    ServiceEndpoint endpoint;
    ASSERT_TRUE(Utils::parseUrl("http://127.0.0.1:9001/status?x=1", &endpoint));
    EXPECT_EQ(endpoint.host, "127.0.0.1");
    EXPECT_EQ(endpoint.port, 9001);
    EXPECT_EQ(endpoint.path, "/status");
    EXPECT_EQ(endpoint.authority(), "127.0.0.1:9001");
}

TEST(UtilsTest, ParseUrlRejectsMalformed) {
    CerrCapture capture;
    ServiceEndpoint endpoint;
    EXPECT_FALSE(Utils::parseUrl("invalid-url", &endpoint));
    EXPECT_FALSE(Utils::parseUrl("ftp://svc/x", &endpoint));
    EXPECT_FALSE(Utils::parseUrl("http://svc:abc/x", &endpoint));
    EXPECT_FALSE(Utils::parseUrl("http://svc:70000/x", &endpoint));
}

TEST(UtilsTest, MakeRequestKeepsQueryInTarget) {
    OutboundRequest request = Utils::makeRequest("GET", "http://svc:8080/x/y?page=2#frag");
    EXPECT_EQ(request.message.target(), "/x/y?page=2");
    EXPECT_EQ(request.path(), "/x/y");
    EXPECT_EQ(request.method(), "GET");
    EXPECT_EQ(request.describe(), "GET http://svc:8080/x/y?page=2");
}

TEST(UtilsTest, MakeRequestWithBody) {
    OutboundRequest request = Utils::makeRequest("POST", "http://svc/items", R"({"a":1})");
    EXPECT_EQ(request.message.body(), R"({"a":1})");
    EXPECT_EQ(request.message[http::field::content_length], "7");
}

TEST(UtilsTest, MakeRequestRejectsBadInput) {
    CerrCapture capture;
    EXPECT_THROW(Utils::makeRequest("GET", "not a url"), std::invalid_argument);
    EXPECT_THROW(Utils::makeRequest("FETCH", "http://svc/"), std::invalid_argument);
}
