#ifndef METRICSTORE_HPP
#define METRICSTORE_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/ILogger.hpp"
#include "../models/BreakerStatus.hpp"
#include "../models/StatCounter.hpp"

// One StatCounter per service identity, kept in the cache under
// "<namespace>/<identity>" as JSON.
//
// recordEvent is a read-modify-write without a transaction: two writers on
// the same identity can lose one increment. Different identities never
// interfere.
//
// A failed cache write is logged and the updated counter is still returned,
// so a caller may act on counts that were never stored; the next read sees
// the old counter.
class MetricStore {
public:
    MetricStore(std::shared_ptr<CacheInterface> cache,
                std::shared_ptr<ILogger> logger,
                std::string key_namespace,
                std::chrono::seconds consideration_window);

    // Adds one event and pushes the expiry of the whole counter to
    // now + consideration window. Returns the counter as written.
    StatCounter recordEvent(const std::string& service_identity, BreakerEvent event);

    // Zero counter when nothing is stored.
    StatCounter get(const std::string& service_identity) const;

    void reset(const std::string& service_identity);

    void setConsiderationWindow(std::chrono::seconds window);
    std::chrono::seconds getConsiderationWindow() const;

    const std::string& getKeyNamespace() const { return key_namespace_; }
    std::string cacheKey(const std::string& service_identity) const;

private:
    std::optional<StatCounter> load(const std::string& key) const;

    std::shared_ptr<CacheInterface> cache_;
    std::shared_ptr<ILogger> logger_;
    const std::string key_namespace_;
    std::atomic<std::chrono::seconds::rep> window_seconds_;
};

#endif // METRICSTORE_HPP
