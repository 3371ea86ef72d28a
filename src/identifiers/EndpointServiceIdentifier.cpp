#include "EndpointServiceIdentifier.hpp"

namespace {
    std::string trimRight(const std::string& value, char c) {
        size_t last = value.find_last_not_of(c);
        return last == std::string::npos ? std::string() : value.substr(0, last + 1);
    }

    std::string trim(const std::string& value, char c) {
        size_t first = value.find_first_not_of(c);
        if (first == std::string::npos) {
            return std::string();
        }
        size_t last = value.find_last_not_of(c);
        return value.substr(first, last - first + 1);
    }
}

std::string EndpointServiceIdentifier::identify(const OutboundRequest& request) const {
    return request.method() + " "
        + request.endpoint.scheme + "://"
        + trimRight(request.endpoint.host, '/') + "/"
        + trim(request.path(), '/');
}
