// tests/mocks/Mocks.hpp
#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"

#include "../../src/interfaces/CacheInterface.hpp"
#include "../../src/interfaces/IBreakerListener.hpp"
#include "../../src/interfaces/ILogger.hpp"
#include "../../src/interfaces/IStatsDClient.hpp"
#include "../../src/interfaces/ITransport.hpp"

// --- Mock Logger ---
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, critical, (const std::string& message), (override));
    MOCK_METHOD(void, setup, (const std::string& message), (override));
    MOCK_METHOD(int, getLogLevel, (), (override));
};

// --- Mock Cache ---
class MockCache : public CacheInterface {
public:
    MOCK_METHOD(bool, set, (const std::string& key, const std::string& value, std::chrono::seconds ttl), (override));
    MOCK_METHOD(std::optional<std::string>, get, (const std::string& key), (override));
    MOCK_METHOD(bool, remove, (const std::string& key), (override));
    MOCK_METHOD(bool, exists, (const std::string& key), (override));
};

// Mock class for StatsDClient
class MockStatsDClient : public IStatsDClient {
public:
    MOCK_METHOD(void, increment, (const std::string& key, int value), (override));
    MOCK_METHOD(void, gauge, (const std::string& key, double value), (override));
    MOCK_METHOD(void, timing, (const std::string& key, std::chrono::milliseconds value), (override));
};

// --- Mock Listener ---
class MockBreakerListener : public IBreakerListener {
public:
    MOCK_METHOD(void, onBreakerReset, (const std::string&, const StatCounter&, BreakerStatus), (override));
    MOCK_METHOD(void, onBreakerTripped, (const std::string&, const StatCounter&, BreakerStatus), (override));
    MOCK_METHOD(void, onBreakerTheoreticallyTripped, (const std::string&, const StatCounter&, BreakerStatus), (override));
    MOCK_METHOD(void, onRequestRejected, (const std::string&, const StatCounter&, const OutboundRequest&), (override));
    MOCK_METHOD(void, onRequestTheoreticallyRejected, (const std::string&, const StatCounter&, const OutboundRequest&), (override));
    MOCK_METHOD(void, onBreakerClosing, (const std::string&, const StatCounter&), (override));
};

// Transport that answers from a script, synchronously on the calling thread.
// An empty script answers 200.
class FakeTransport : public ITransport {
public:
    struct Outcome {
        unsigned status;
        boost::system::error_code error;
    };

    void push(unsigned status) { script_.push_back(Outcome{status, {}}); }
    void pushError(boost::system::error_code error) { script_.push_back(Outcome{0, error}); }

    void send(const OutboundRequest& request, Callback on_complete) override {
        Outcome outcome{200, {}};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sent_.push_back(request.describe());
            if (!script_.empty()) {
                outcome = script_.front();
                script_.pop_front();
            }
        }

        http::response<http::string_body> response;
        if (!outcome.error) {
            response.result(outcome.status);
            response.version(11);
            response.body() = "fake";
            response.prepare_payload();
        }
        on_complete(std::move(response), outcome.error);
    }

    void cancelAll() override {}

    size_t sentCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<Outcome> script_;
    std::vector<std::string> sent_;
};

// Silences a MockLogger; individual tests add EXPECT_CALLs on top.
inline void allowAnyLogging(MockLogger& logger) {
    using ::testing::_;
    using ::testing::AnyNumber;
    EXPECT_CALL(logger, debug(_)).Times(AnyNumber());
    EXPECT_CALL(logger, info(_)).Times(AnyNumber());
    EXPECT_CALL(logger, warn(_)).Times(AnyNumber());
    EXPECT_CALL(logger, error(_)).Times(AnyNumber());
    EXPECT_CALL(logger, critical(_)).Times(AnyNumber());
    EXPECT_CALL(logger, setup(_)).Times(AnyNumber());
}
