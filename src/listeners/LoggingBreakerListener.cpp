#include "LoggingBreakerListener.hpp"

#include <stdexcept>
#include <utility>

namespace {
    // Identities and targets may carry bytes that are not valid UTF-8.
    std::string dumpContext(const json& ctx) {
        return ctx.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    std::string context(const std::string& service_identity, const StatCounter& stats) {
        json ctx = {
            {"identifier", service_identity},
            {"breaker_stats", stats.to_json()}
        };
        return dumpContext(ctx);
    }

    std::string context(const std::string& service_identity, const StatCounter& stats, BreakerStatus previous_status) {
        json ctx = {
            {"identifier", service_identity},
            {"previous_status", toString(previous_status)},
            {"breaker_stats", stats.to_json()}
        };
        return dumpContext(ctx);
    }

    std::string context(const std::string& service_identity, const StatCounter& stats, const OutboundRequest& request) {
        json ctx = {
            {"identifier", service_identity},
            {"request", request.describe()},
            {"breaker_stats", stats.to_json()}
        };
        return dumpContext(ctx);
    }
}

LoggingBreakerListener::LoggingBreakerListener(std::shared_ptr<ILogger> logger)
    : logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for LoggingBreakerListener");
    }
}

void LoggingBreakerListener::onBreakerReset(const std::string& service_identity,
                                            const StatCounter& stats,
                                            BreakerStatus previous_status) {
    logger_->info("The circuit breaker for service `" + service_identity
        + "` has been reset. Requests will be allowed to this service again. "
        + context(service_identity, stats, previous_status));
}

void LoggingBreakerListener::onBreakerTripped(const std::string& service_identity,
                                              const StatCounter& stats,
                                              BreakerStatus previous_status) {
    logger_->critical("The circuit breaker for service `" + service_identity
        + "` has been tripped! No further requests to this service will be allowed until the breaker is reset. "
        + context(service_identity, stats, previous_status));
}

void LoggingBreakerListener::onBreakerTheoreticallyTripped(const std::string& service_identity,
                                                           const StatCounter& stats,
                                                           BreakerStatus previous_status) {
    logger_->warn("The circuit breaker for service `" + service_identity
        + "` would have been tripped, but the breaker is not enabled. "
        + context(service_identity, stats, previous_status));
}

void LoggingBreakerListener::onRequestRejected(const std::string& service_identity,
                                               const StatCounter& stats,
                                               const OutboundRequest& request) {
    logger_->warn("A request to service `" + service_identity + "` has been rejected due to a tripped breaker. "
        + context(service_identity, stats, request));
}

void LoggingBreakerListener::onRequestTheoreticallyRejected(const std::string& service_identity,
                                                            const StatCounter& stats,
                                                            const OutboundRequest& request) {
    logger_->info("A request to service `" + service_identity
        + "` would have been rejected due to a tripped breaker, but the breaker is not enabled. "
        + context(service_identity, stats, request));
}

void LoggingBreakerListener::onBreakerClosing(const std::string& service_identity, const StatCounter& stats) {
    logger_->debug("The circuit breaker for service `" + service_identity
        + "` is closing. Some requests will be allowed to this service while it is tested. "
        + context(service_identity, stats));
}
