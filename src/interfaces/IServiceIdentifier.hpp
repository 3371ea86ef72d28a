#pragma once

#include <string>

#include "../models/OutboundRequest.hpp"

// Maps a request to the identity of the service behind it. Requests with the
// same identity share one set of breaker statistics.
class IServiceIdentifier {
public:
    virtual ~IServiceIdentifier() = default;
    virtual std::string identify(const OutboundRequest& request) const = 0;
};
