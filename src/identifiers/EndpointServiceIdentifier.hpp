#pragma once

#include "../interfaces/IServiceIdentifier.hpp"

// One breaker per method and path: "GET https://api.example.com/v1/users".
// Port, query string and surrounding slashes do not split identities.
class EndpointServiceIdentifier : public IServiceIdentifier {
public:
    std::string identify(const OutboundRequest& request) const override;
};
