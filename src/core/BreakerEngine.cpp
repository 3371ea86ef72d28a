#include "BreakerEngine.hpp"

#include <stdexcept>
#include <utility>

#include "BreakerExceptions.hpp"

BreakerEngine::BreakerEngine(std::shared_ptr<MetricStore> store,
                             BreakerConfig config,
                             std::shared_ptr<ILogger> logger,
                             std::vector<std::shared_ptr<IBreakerListener>> listeners)
    : store_(std::move(store)), logger_(std::move(logger)) {
    if (!store_) {
        throw std::invalid_argument("MetricStore cannot be null for BreakerEngine");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for BreakerEngine");
    }
    if (config.failure_threshold < 0 || config.failure_threshold > 100) {
        throw std::invalid_argument("Failure threshold must be between 0 and 100");
    }
    store_->setConsiderationWindow(config.consideration_window);
    config_ = config;
    setListeners(std::move(listeners));
}

BreakerStatus BreakerEngine::computeStatus(const StatCounter& stats, const BreakerConfig& config) {
    if (stats.getRequestsSentToService() >= config.min_requests
        && stats.getFailureRatio() >= config.failure_threshold) {
        return BreakerStatus::OPEN;
    }
    return BreakerStatus::CLOSED;
}

BreakerStatus BreakerEngine::getStatus(const std::string& service_identity) const {
    return computeStatus(loadStats(service_identity), getConfig());
}

StatCounter BreakerEngine::getStats(const std::string& service_identity) const {
    return loadStats(service_identity);
}

BreakerStatus BreakerEngine::decide(const std::string& service_identity, const OutboundRequest& request) {
    const BreakerConfig config = getConfig();
    const StatCounter stats = loadStats(service_identity);
    const BreakerStatus status = computeStatus(stats, config);

    if (status != BreakerStatus::OPEN) {
        return status;
    }

    if (config.enabled) {
        for (const auto& listener : listenersSnapshot()) {
            listener->onRequestRejected(service_identity, stats, request);
        }
        throw OpenCircuitException(service_identity, request);
    }

    for (const auto& listener : listenersSnapshot()) {
        listener->onRequestTheoreticallyRejected(service_identity, stats, request);
    }
    return status;
}

void BreakerEngine::recordOutcome(const std::string& service_identity, BreakerStatus previous_status, bool is_failure) {
    const BreakerConfig config = getConfig();

    StatCounter stats;
    try {
        stats = store_->recordEvent(service_identity, is_failure ? BreakerEvent::FAILURE : BreakerEvent::SUCCESS);
    } catch (const std::exception& e) {
        logger_->error("Could not record outcome for service `" + service_identity + "`: " + e.what());
        return;
    }

    const BreakerStatus new_status = computeStatus(stats, config);
    if (new_status == previous_status) {
        return;
    }

    logger_->debug("Breaker for service `" + service_identity + "` moved from " + toString(previous_status)
        + " to " + toString(new_status) + " (" + stats.to_string() + ")");
    notifyTransition(TransitionEvent{service_identity, previous_status, new_status, stats}, config.enabled);
}

void BreakerEngine::reset(const std::string& service_identity) {
    store_->reset(service_identity);
    logger_->info("Breaker stats for service `" + service_identity + "` were reset.");
}

bool BreakerEngine::isClosed(const std::string& service_identity) const {
    return getStatus(service_identity) == BreakerStatus::CLOSED;
}

bool BreakerEngine::isOpen(const std::string& service_identity) const {
    return getStatus(service_identity) == BreakerStatus::OPEN;
}

bool BreakerEngine::isClosing(const std::string& service_identity) const {
    return getStatus(service_identity) == BreakerStatus::CLOSING;
}

bool BreakerEngine::isAllowingRequests(const std::string& service_identity) const {
    return getStatus(service_identity) != BreakerStatus::OPEN;
}

bool BreakerEngine::isRejectingRequests(const std::string& service_identity) const {
    return isOpen(service_identity);
}

bool BreakerEngine::isTripped(const std::string& service_identity) const {
    return isOpen(service_identity);
}

void BreakerEngine::setEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_.enabled = enabled;
}

bool BreakerEngine::isEnabled() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_.enabled;
}

void BreakerEngine::setFailureThreshold(int percent) {
    if (percent < 0 || percent > 100) {
        throw std::invalid_argument("Failure threshold must be between 0 and 100, got " + std::to_string(percent));
    }
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_.failure_threshold = percent;
}

void BreakerEngine::setMinRequests(unsigned int min_requests) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_.min_requests = min_requests;
}

void BreakerEngine::setConsiderationWindow(std::chrono::seconds window) {
    store_->setConsiderationWindow(window);
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_.consideration_window = window;
}

BreakerConfig BreakerEngine::getConfig() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void BreakerEngine::addListener(std::shared_ptr<IBreakerListener> listener) {
    if (!listener) {
        throw std::invalid_argument("Listener cannot be null");
    }
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

void BreakerEngine::addListeners(const std::vector<std::shared_ptr<IBreakerListener>>& listeners) {
    for (const auto& listener : listeners) {
        addListener(listener);
    }
}

void BreakerEngine::setListeners(std::vector<std::shared_ptr<IBreakerListener>> listeners) {
    for (const auto& listener : listeners) {
        if (!listener) {
            throw std::invalid_argument("Listener cannot be null");
        }
    }
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_ = std::move(listeners);
}

StatCounter BreakerEngine::loadStats(const std::string& service_identity) const {
    try {
        return store_->get(service_identity);
    } catch (const std::exception& e) {
        logger_->error("Could not read stats for service `" + service_identity + "`, assuming CLOSED: " + e.what());
        return StatCounter{};
    }
}

std::vector<std::shared_ptr<IBreakerListener>> BreakerEngine::listenersSnapshot() const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_;
}

void BreakerEngine::notifyTransition(const TransitionEvent& event, bool enabled) const {
    for (const auto& listener : listenersSnapshot()) {
        switch (event.new_status) {
            case BreakerStatus::CLOSED:
                listener->onBreakerReset(event.service_identity, event.stats, event.previous_status);
                break;
            case BreakerStatus::OPEN:
                if (enabled) {
                    listener->onBreakerTripped(event.service_identity, event.stats, event.previous_status);
                } else {
                    listener->onBreakerTheoreticallyTripped(event.service_identity, event.stats, event.previous_status);
                }
                break;
            case BreakerStatus::CLOSING:
                listener->onBreakerClosing(event.service_identity, event.stats);
                break;
        }
    }
}
