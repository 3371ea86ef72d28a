#pragma once

#include <memory>
#include <string>

#include "../interfaces/IBreakerListener.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Counts breaker events in StatsD, one counter per callback.
class MetricsBreakerListener : public IBreakerListener {
public:
    explicit MetricsBreakerListener(std::shared_ptr<IStatsDClient> statsd_client);

    void onBreakerReset(const std::string&, const StatCounter&, BreakerStatus) override;
    void onBreakerTripped(const std::string&, const StatCounter&, BreakerStatus) override;
    void onBreakerTheoreticallyTripped(const std::string&, const StatCounter&, BreakerStatus) override;
    void onRequestRejected(const std::string&, const StatCounter&, const OutboundRequest&) override;
    void onRequestTheoreticallyRejected(const std::string&, const StatCounter&, const OutboundRequest&) override;
    void onBreakerClosing(const std::string&, const StatCounter&) override;

private:
    std::shared_ptr<IStatsDClient> statsd_client_;
};
