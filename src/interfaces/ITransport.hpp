#pragma once

#include <functional>

#include <boost/beast/http.hpp>
#include <boost/system/error_code.hpp>

#include "../models/OutboundRequest.hpp"

// Sends a request and reports the result exactly once. On error the
// response is default-constructed.
class ITransport {
public:
    using Callback = std::function<void(http::response<http::string_body>, boost::system::error_code)>;

    virtual ~ITransport() = default;
    virtual void send(const OutboundRequest& request, Callback on_complete) = 0;
    // In-flight requests complete with operation_aborted.
    virtual void cancelAll() = 0;
};
