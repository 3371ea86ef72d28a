#include "MetricStore.hpp"

#include <stdexcept>
#include <utility>

MetricStore::MetricStore(std::shared_ptr<CacheInterface> cache,
                         std::shared_ptr<ILogger> logger,
                         std::string key_namespace,
                         std::chrono::seconds consideration_window)
    : cache_(std::move(cache)),
      logger_(std::move(logger)),
      key_namespace_(std::move(key_namespace)),
      window_seconds_(0) {
    if (!cache_) {
        throw std::invalid_argument("Cache cannot be null for MetricStore");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for MetricStore");
    }
    setConsiderationWindow(consideration_window);
}

StatCounter MetricStore::recordEvent(const std::string& service_identity, BreakerEvent event) {
    const std::string key = cacheKey(service_identity);

    StatCounter counter = load(key).value_or(StatCounter{});
    counter.add(event, 1);

    if (!cache_->set(key, counter.to_json().dump(), getConsiderationWindow())) {
        logger_->error("Failed to store " + toString(event) + " event for service `" + service_identity
            + "`, stats: " + counter.to_string());
    }
    return counter;
}

StatCounter MetricStore::get(const std::string& service_identity) const {
    return load(cacheKey(service_identity)).value_or(StatCounter{});
}

void MetricStore::reset(const std::string& service_identity) {
    // false only means there was nothing stored
    if (!cache_->remove(cacheKey(service_identity))) {
        logger_->debug("Nothing to reset for service `" + service_identity + "`");
    }
}

void MetricStore::setConsiderationWindow(std::chrono::seconds window) {
    if (window < std::chrono::seconds(1)) {
        throw std::invalid_argument("Consideration window must be at least one second");
    }
    window_seconds_.store(window.count());
}

std::chrono::seconds MetricStore::getConsiderationWindow() const {
    return std::chrono::seconds(window_seconds_.load());
}

std::string MetricStore::cacheKey(const std::string& service_identity) const {
    return key_namespace_ + "/" + service_identity;
}

std::optional<StatCounter> MetricStore::load(const std::string& key) const {
    auto stored = cache_->get(key);
    if (!stored) {
        return std::nullopt;
    }
    try {
        return StatCounter::from_json(json::parse(*stored));
    } catch (const json::exception& e) {
        logger_->warn("Discarding unreadable stats at key '" + key + "': " + e.what());
        return std::nullopt;
    }
}
