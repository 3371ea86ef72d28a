#ifndef LOGGINGBREAKERLISTENER_HPP
#define LOGGINGBREAKERLISTENER_HPP

#include <memory>
#include <string>

#include "../interfaces/IBreakerListener.hpp"
#include "../interfaces/ILogger.hpp"

// Writes every breaker event to the log. Trips are critical, rejections and
// would-be trips are warnings, the rest info/debug.
class LoggingBreakerListener : public IBreakerListener {
public:
    explicit LoggingBreakerListener(std::shared_ptr<ILogger> logger);

    void onBreakerReset(const std::string& service_identity,
                        const StatCounter& stats,
                        BreakerStatus previous_status) override;
    void onBreakerTripped(const std::string& service_identity,
                          const StatCounter& stats,
                          BreakerStatus previous_status) override;
    void onBreakerTheoreticallyTripped(const std::string& service_identity,
                                       const StatCounter& stats,
                                       BreakerStatus previous_status) override;
    void onRequestRejected(const std::string& service_identity,
                           const StatCounter& stats,
                           const OutboundRequest& request) override;
    void onRequestTheoreticallyRejected(const std::string& service_identity,
                                        const StatCounter& stats,
                                        const OutboundRequest& request) override;
    void onBreakerClosing(const std::string& service_identity,
                          const StatCounter& stats) override;

private:
    std::shared_ptr<ILogger> logger_;
};

#endif // LOGGINGBREAKERLISTENER_HPP
