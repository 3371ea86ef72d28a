#ifndef BREAKEREXCEPTIONS_HPP
#define BREAKEREXCEPTIONS_HPP

#include <stdexcept>
#include <string>

#include <boost/system/error_code.hpp>

#include "../models/OutboundRequest.hpp"

// A request did not produce a response.
class TransportException : public std::runtime_error {
public:
    TransportException(const std::string& service_identity,
                       const OutboundRequest& request,
                       boost::system::error_code error)
        : std::runtime_error("The request to `" + request.describe() + "` for service `" + service_identity
              + "` failed: " + error.message()),
          service_identity_(service_identity),
          request_(request),
          error_(error) {}

    const std::string& serviceIdentity() const { return service_identity_; }
    const OutboundRequest& request() const { return request_; }
    boost::system::error_code error() const { return error_; }

protected:
    TransportException(const std::string& message,
                       const std::string& service_identity,
                       const OutboundRequest& request,
                       boost::system::error_code error)
        : std::runtime_error(message),
          service_identity_(service_identity),
          request_(request),
          error_(error) {}

private:
    std::string service_identity_;
    OutboundRequest request_;
    boost::system::error_code error_;
};

// Thrown instead of sending the request when the breaker for its service is
// open and enabled. Do not retry through the same breaker until it closes.
class OpenCircuitException : public TransportException {
public:
    OpenCircuitException(const std::string& service_identity, const OutboundRequest& request)
        : TransportException(
              "The request to `" + request.describe() + "` was rejected due to an open circuit for service `"
                  + service_identity + "`.",
              service_identity,
              request,
              boost::system::errc::make_error_code(boost::system::errc::connection_refused)) {}
};

#endif // BREAKEREXCEPTIONS_HPP
