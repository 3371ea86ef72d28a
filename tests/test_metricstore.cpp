// test/test_metricstore.cpp
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "mocks/Mocks.hpp"
#include "../src/cache/InMemoryCache.hpp"
#include "../src/core/MetricStore.hpp"

using namespace std::chrono;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

class MetricStoreTest : public ::testing::Test {
protected:
    std::shared_ptr<steady_clock::time_point> now = std::make_shared<steady_clock::time_point>(steady_clock::now());
    std::shared_ptr<InMemoryCache> cache;
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    std::unique_ptr<MetricStore> store;

    void SetUp() override {
        auto clock = now;
        cache = std::make_shared<InMemoryCache>(100, [clock] { return *clock; });
        store = std::make_unique<MetricStore>(cache, logger, "circuitguard", seconds(60));
    }

    void advance(seconds s) { *now += s; }
};

TEST_F(MetricStoreTest, UnknownIdentityReadsAsZero) {
    EXPECT_EQ(store->get("GET http://api/users"), StatCounter());
}

TEST_F(MetricStoreTest, RecordEventIncrementsOneField) {
    const std::string id = "GET http://api/users";
    EXPECT_EQ(store->recordEvent(id, BreakerEvent::SUCCESS), StatCounter(1, 0, 0));
    EXPECT_EQ(store->recordEvent(id, BreakerEvent::FAILURE), StatCounter(1, 1, 0));
    EXPECT_EQ(store->recordEvent(id, BreakerEvent::REJECTION), StatCounter(1, 1, 1));
    EXPECT_EQ(store->recordEvent(id, BreakerEvent::FAILURE), StatCounter(1, 2, 1));
    EXPECT_EQ(store->get(id), StatCounter(1, 2, 1));
}

TEST_F(MetricStoreTest, IdentitiesAreIndependent) {
    store->recordEvent("a", BreakerEvent::FAILURE);
    store->recordEvent("b", BreakerEvent::SUCCESS);
    store->recordEvent("b", BreakerEvent::SUCCESS);
    EXPECT_EQ(store->get("a"), StatCounter(0, 1, 0));
    EXPECT_EQ(store->get("b"), StatCounter(2, 0, 0));
}

TEST_F(MetricStoreTest, StoredAsJsonUnderNamespacedKey) {
    store->recordEvent("GET http://api/users", BreakerEvent::FAILURE);

    EXPECT_EQ(store->cacheKey("GET http://api/users"), "circuitguard/GET http://api/users");
    auto raw = cache->get("circuitguard/GET http://api/users");
    ASSERT_TRUE(raw.has_value());
    json stored = json::parse(*raw);
    EXPECT_EQ(stored["successes"], 0);
    EXPECT_EQ(stored["failures"], 1);
    EXPECT_EQ(stored["rejections"], 0);
}

TEST_F(MetricStoreTest, WholeCounterExpiresAfterWindow) {
    store->recordEvent("svc", BreakerEvent::FAILURE);
    advance(seconds(61));
    EXPECT_EQ(store->get("svc"), StatCounter());
}

TEST_F(MetricStoreTest, EveryWriteSlidesTheWindow) {
    store->recordEvent("svc", BreakerEvent::FAILURE);
    advance(seconds(50));
    store->recordEvent("svc", BreakerEvent::SUCCESS);
    advance(seconds(50));
    // 100s after the first event, but only 50s after the last write
    EXPECT_EQ(store->get("svc"), StatCounter(1, 1, 0));
    advance(seconds(11));
    EXPECT_EQ(store->get("svc"), StatCounter());
}

TEST_F(MetricStoreTest, ResetDropsStats) {
    store->recordEvent("svc", BreakerEvent::FAILURE);
    store->reset("svc");
    EXPECT_EQ(store->get("svc"), StatCounter());
    EXPECT_FALSE(cache->exists("circuitguard/svc"));
}

TEST_F(MetricStoreTest, ResetOfUnknownIdentityIsHarmless) {
    EXPECT_NO_THROW(store->reset("never-seen"));
    EXPECT_EQ(store->get("never-seen"), StatCounter());
}

TEST_F(MetricStoreTest, ConsiderationWindowMustBePositive) {
    EXPECT_THROW(store->setConsiderationWindow(seconds(0)), std::invalid_argument);
    EXPECT_EQ(store->getConsiderationWindow(), seconds(60));
    store->setConsiderationWindow(seconds(5));
    EXPECT_EQ(store->getConsiderationWindow(), seconds(5));
}

TEST_F(MetricStoreTest, NewWindowAppliesToNextWrite) {
    store->setConsiderationWindow(seconds(5));
    store->recordEvent("svc", BreakerEvent::FAILURE);
    advance(seconds(6));
    EXPECT_EQ(store->get("svc"), StatCounter());
}

TEST_F(MetricStoreTest, CorruptEntryIsDiscardedWithWarning) {
    EXPECT_CALL(*logger, warn(HasSubstr("circuitguard/svc"))).Times(2);
    cache->set("circuitguard/svc", "{not json", seconds(60));

    EXPECT_EQ(store->get("svc"), StatCounter());
    EXPECT_EQ(store->recordEvent("svc", BreakerEvent::SUCCESS), StatCounter(1, 0, 0));
}

TEST_F(MetricStoreTest, ConcurrentWritersOnDifferentIdentities) {
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([this, t]() {
            for (int i = 0; i < 50; ++i) {
                store->recordEvent("svc-" + std::to_string(t), BreakerEvent::FAILURE);
            }
        });
    }
    for (auto& w : writers) {
        w.join();
    }
    for (int t = 0; t < 4; ++t) {
        EXPECT_EQ(store->get("svc-" + std::to_string(t)), StatCounter(0, 50, 0));
    }
}

TEST(MetricStoreConstructionTest, RejectsNullDependencies) {
    auto cache = std::make_shared<InMemoryCache>();
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    EXPECT_THROW(MetricStore(nullptr, logger, "ns", seconds(60)), std::invalid_argument);
    EXPECT_THROW(MetricStore(cache, nullptr, "ns", seconds(60)), std::invalid_argument);
    EXPECT_THROW(MetricStore(cache, logger, "ns", seconds(0)), std::invalid_argument);
}

TEST(MetricStoreCacheFailureTest, FailedWriteIsLoggedAndCounterStillReturned) {
    auto cache = std::make_shared<NiceMock<MockCache>>();
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    MetricStore store(cache, logger, "ns", seconds(30));

    EXPECT_CALL(*cache, get("ns/svc")).WillOnce(Return(std::optional<std::string>(R"({"successes":2,"failures":1,"rejections":0})")));
    EXPECT_CALL(*cache, set("ns/svc", _, seconds(30))).WillOnce(Return(false));
    EXPECT_CALL(*logger, error(HasSubstr("svc"))).Times(1);

    EXPECT_EQ(store.recordEvent("svc", BreakerEvent::FAILURE), StatCounter(2, 2, 0));
}
