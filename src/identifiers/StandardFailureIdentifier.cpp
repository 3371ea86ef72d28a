#include "StandardFailureIdentifier.hpp"

#include <boost/asio/error.hpp>

bool StandardFailureIdentifier::isResponseFailure(
    const boost::beast::http::response<boost::beast::http::string_body>& response,
    const std::string& /* service_identity */) const {
    const unsigned status = response.result_int();
    return status >= 500 && status <= 599;
}

bool StandardFailureIdentifier::isErrorFailure(
    const boost::system::error_code& error,
    const std::string& /* service_identity */) const {
    if (!error) {
        return false;
    }
    return error != boost::asio::error::operation_aborted;
}
