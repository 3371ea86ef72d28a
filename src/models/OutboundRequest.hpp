#ifndef OUTBOUNDREQUEST_HPP
#define OUTBOUNDREQUEST_HPP

#include <string>

#include <boost/beast/http.hpp>

#include "ServiceEndpoint.hpp"

namespace http = boost::beast::http;

// A request about to leave the process: where it goes and what is sent.
// message.target() holds the origin-form target (path plus query).
struct OutboundRequest {
    ServiceEndpoint endpoint;
    http::request<http::string_body> message;

    std::string method() const {
        return std::string(message.method_string());
    }

    // Path component of the target, without query or fragment.
    std::string path() const {
        std::string target(message.target());
        auto cut = target.find_first_of("?#");
        if (cut != std::string::npos) {
            target.erase(cut);
        }
        return target.empty() ? "/" : target;
    }

    // "GET http://host:8080/path?x=1"
    std::string describe() const {
        return method() + " " + endpoint.scheme + "://" + endpoint.authority() + std::string(message.target());
    }
};

#endif // OUTBOUNDREQUEST_HPP
