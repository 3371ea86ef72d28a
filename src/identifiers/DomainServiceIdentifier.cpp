#include "DomainServiceIdentifier.hpp"

std::string DomainServiceIdentifier::identify(const OutboundRequest& request) const {
    return request.endpoint.host;
}
