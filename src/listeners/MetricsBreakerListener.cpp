#include "MetricsBreakerListener.hpp"

#include <stdexcept>
#include <utility>

#include "../config/AppConfig.hpp"

MetricsBreakerListener::MetricsBreakerListener(std::shared_ptr<IStatsDClient> statsd_client)
    : statsd_client_(std::move(statsd_client)) {
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for MetricsBreakerListener");
    }
}

void MetricsBreakerListener::onBreakerReset(const std::string&, const StatCounter&, BreakerStatus) {
    statsd_client_->increment(MetricsDefinitions::BREAKER_RESET);
}

void MetricsBreakerListener::onBreakerTripped(const std::string&, const StatCounter&, BreakerStatus) {
    statsd_client_->increment(MetricsDefinitions::BREAKER_TRIPPED);
}

void MetricsBreakerListener::onBreakerTheoreticallyTripped(const std::string&, const StatCounter&, BreakerStatus) {
    statsd_client_->increment(MetricsDefinitions::BREAKER_THEORETICALLY_TRIPPED);
}

void MetricsBreakerListener::onRequestRejected(const std::string&, const StatCounter&, const OutboundRequest&) {
    statsd_client_->increment(MetricsDefinitions::REQUEST_REJECTED);
}

void MetricsBreakerListener::onRequestTheoreticallyRejected(const std::string&, const StatCounter&, const OutboundRequest&) {
    statsd_client_->increment(MetricsDefinitions::REQUEST_THEORETICALLY_REJECTED);
}

void MetricsBreakerListener::onBreakerClosing(const std::string&, const StatCounter&) {
    statsd_client_->increment(MetricsDefinitions::BREAKER_CLOSING);
}
