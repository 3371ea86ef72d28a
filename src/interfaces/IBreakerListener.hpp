#ifndef IBREAKERLISTENER_HPP
#define IBREAKERLISTENER_HPP

#include <string>

#include "../models/BreakerStatus.hpp"
#include "../models/OutboundRequest.hpp"
#include "../models/StatCounter.hpp"

// Receives breaker events. Called synchronously on the thread that recorded
// the outcome or made the decision.
class IBreakerListener {
public:
    virtual ~IBreakerListener() = default;

    // The breaker closed again; requests are allowed.
    virtual void onBreakerReset(const std::string& service_identity,
                                const StatCounter& stats,
                                BreakerStatus previous_status) = 0;

    // The breaker opened; requests are rejected until it closes.
    virtual void onBreakerTripped(const std::string& service_identity,
                                  const StatCounter& stats,
                                  BreakerStatus previous_status) = 0;

    // The breaker would have opened but is disabled.
    virtual void onBreakerTheoreticallyTripped(const std::string& service_identity,
                                               const StatCounter& stats,
                                               BreakerStatus previous_status) = 0;

    virtual void onRequestRejected(const std::string& service_identity,
                                   const StatCounter& stats,
                                   const OutboundRequest& request) = 0;

    // The request would have been rejected but the breaker is disabled.
    virtual void onRequestTheoreticallyRejected(const std::string& service_identity,
                                                const StatCounter& stats,
                                                const OutboundRequest& request) = 0;

    virtual void onBreakerClosing(const std::string& service_identity,
                                  const StatCounter& stats) = 0;
};

#endif // IBREAKERLISTENER_HPP
