#pragma once

#include "../interfaces/IServiceIdentifier.hpp"

// One breaker per host: "api.example.com".
class DomainServiceIdentifier : public IServiceIdentifier {
public:
    std::string identify(const OutboundRequest& request) const override;
};
