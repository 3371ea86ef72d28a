#ifndef BREAKERENGINE_HPP
#define BREAKERENGINE_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "MetricStore.hpp"
#include "../interfaces/IBreakerListener.hpp"
#include "../interfaces/ILogger.hpp"
#include "../models/BreakerConfig.hpp"
#include "../models/BreakerStatus.hpp"
#include "../models/OutboundRequest.hpp"
#include "../models/StatCounter.hpp"
#include "../models/TransitionEvent.hpp"

// Derives the status of a service from its stats and the breaker policy, and
// tells listeners when that status changes.
//
// A service is OPEN once at least min_requests calls reached it and the
// failure ratio is at or above failure_threshold; otherwise CLOSED. Nothing
// moves a breaker out of OPEN on a timer: successes, reset() or expiry of the
// stats do.
class BreakerEngine {
public:
    BreakerEngine(std::shared_ptr<MetricStore> store,
                  BreakerConfig config,
                  std::shared_ptr<ILogger> logger,
                  std::vector<std::shared_ptr<IBreakerListener>> listeners = {});

    BreakerEngine(const BreakerEngine&) = delete;
    BreakerEngine& operator=(const BreakerEngine&) = delete;

    // Never returns CLOSING. A store failure is logged and reads as CLOSED.
    BreakerStatus getStatus(const std::string& service_identity) const;
    StatCounter getStats(const std::string& service_identity) const;

    // Pre-flight check. Returns the status seen, to be handed back to
    // recordOutcome. Throws OpenCircuitException when the breaker is OPEN and
    // enabled; an OPEN disabled breaker only notifies listeners.
    BreakerStatus decide(const std::string& service_identity, const OutboundRequest& request);

    void recordOutcome(const std::string& service_identity, BreakerStatus previous_status, bool is_failure);

    // Drops all stats of the service.
    void reset(const std::string& service_identity);

    bool isClosed(const std::string& service_identity) const;
    bool isOpen(const std::string& service_identity) const;
    bool isClosing(const std::string& service_identity) const;
    bool isAllowingRequests(const std::string& service_identity) const;
    bool isRejectingRequests(const std::string& service_identity) const;
    bool isTripped(const std::string& service_identity) const;

    // A disabled breaker keeps gathering stats and notifying, but never rejects.
    void setEnabled(bool enabled);
    bool isEnabled() const;
    void setFailureThreshold(int percent);
    void setMinRequests(unsigned int min_requests);
    void setConsiderationWindow(std::chrono::seconds window);
    BreakerConfig getConfig() const;

    void addListener(std::shared_ptr<IBreakerListener> listener);
    void addListeners(const std::vector<std::shared_ptr<IBreakerListener>>& listeners);
    void setListeners(std::vector<std::shared_ptr<IBreakerListener>> listeners);

    static BreakerStatus computeStatus(const StatCounter& stats, const BreakerConfig& config);

private:
    StatCounter loadStats(const std::string& service_identity) const;
    std::vector<std::shared_ptr<IBreakerListener>> listenersSnapshot() const;
    void notifyTransition(const TransitionEvent& event, bool enabled) const;

    std::shared_ptr<MetricStore> store_;
    std::shared_ptr<ILogger> logger_;

    mutable std::mutex config_mutex_;
    BreakerConfig config_;

    mutable std::mutex listeners_mutex_;
    std::vector<std::shared_ptr<IBreakerListener>> listeners_;
};

#endif // BREAKERENGINE_HPP
