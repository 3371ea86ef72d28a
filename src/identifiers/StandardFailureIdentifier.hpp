#pragma once

#include "../interfaces/IFailureIdentifier.hpp"

// 5xx responses and transport errors count as failures. Cancellation does
// not: a request the caller gave up on says nothing about the service.
class StandardFailureIdentifier : public IFailureIdentifier {
public:
    bool isResponseFailure(
        const boost::beast::http::response<boost::beast::http::string_body>& response,
        const std::string& service_identity) const override;

    bool isErrorFailure(
        const boost::system::error_code& error,
        const std::string& service_identity) const override;
};
