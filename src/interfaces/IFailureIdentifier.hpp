#pragma once

#include <string>

#include <boost/beast/http.hpp>
#include <boost/system/error_code.hpp>

// Decides whether an outcome counts against the service.
class IFailureIdentifier {
public:
    virtual ~IFailureIdentifier() = default;

    virtual bool isResponseFailure(
        const boost::beast::http::response<boost::beast::http::string_body>& response,
        const std::string& service_identity) const = 0;

    // Returning false leaves the outcome unrecorded.
    virtual bool isErrorFailure(
        const boost::system::error_code& error,
        const std::string& service_identity) const = 0;
};
