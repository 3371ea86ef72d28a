#ifndef REQUESTINTERCEPTOR_HPP
#define REQUESTINTERCEPTOR_HPP

#include <chrono>
#include <functional>
#include <memory>

#include <boost/beast/http.hpp>
#include <boost/system/error_code.hpp>

#include "BreakerEngine.hpp"
#include "../interfaces/IFailureIdentifier.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IServiceIdentifier.hpp"
#include "../interfaces/ITransport.hpp"
#include "../models/OutboundRequest.hpp"

// Runs one request through the breaker: decide, send, record.
class RequestInterceptor {
public:
    using ResponseCallback = ITransport::Callback;

    RequestInterceptor(std::shared_ptr<BreakerEngine> engine,
                       std::shared_ptr<IServiceIdentifier> service_identifier,
                       std::shared_ptr<IFailureIdentifier> failure_identifier,
                       std::shared_ptr<ITransport> transport,
                       std::shared_ptr<ILogger> logger);

    // Throws OpenCircuitException before anything is sent when the breaker
    // rejects. Otherwise on_complete runs once the outcome is recorded and
    // any transition has been announced.
    void handle(const OutboundRequest& request, ResponseCallback on_complete);

    // Blocking form of handle. Throws OpenCircuitException, or
    // TransportException when no response arrives within wait. Must not be
    // called from a thread running the transport's io_context.
    http::response<http::string_body> execute(const OutboundRequest& request, std::chrono::milliseconds wait);

    const std::shared_ptr<BreakerEngine>& engine() const { return engine_; }
    std::string identify(const OutboundRequest& request) const;

private:
    void onTransportComplete(const std::string& service_identity,
                             BreakerStatus previous_status,
                             const http::response<http::string_body>& response,
                             const boost::system::error_code& ec) const;

    std::shared_ptr<BreakerEngine> engine_;
    std::shared_ptr<IServiceIdentifier> service_identifier_;
    std::shared_ptr<IFailureIdentifier> failure_identifier_;
    std::shared_ptr<ITransport> transport_;
    std::shared_ptr<ILogger> logger_;
};

#endif // REQUESTINTERCEPTOR_HPP
