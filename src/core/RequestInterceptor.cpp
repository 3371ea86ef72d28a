#include "RequestInterceptor.hpp"

#include <future>
#include <stdexcept>
#include <utility>

#include "BreakerExceptions.hpp"

RequestInterceptor::RequestInterceptor(std::shared_ptr<BreakerEngine> engine,
                                       std::shared_ptr<IServiceIdentifier> service_identifier,
                                       std::shared_ptr<IFailureIdentifier> failure_identifier,
                                       std::shared_ptr<ITransport> transport,
                                       std::shared_ptr<ILogger> logger)
    : engine_(std::move(engine)),
      service_identifier_(std::move(service_identifier)),
      failure_identifier_(std::move(failure_identifier)),
      transport_(std::move(transport)),
      logger_(std::move(logger)) {
    if (!engine_) {
        throw std::invalid_argument("BreakerEngine cannot be null for RequestInterceptor");
    }
    if (!service_identifier_) {
        throw std::invalid_argument("Service identifier cannot be null for RequestInterceptor");
    }
    if (!failure_identifier_) {
        throw std::invalid_argument("Failure identifier cannot be null for RequestInterceptor");
    }
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null for RequestInterceptor");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RequestInterceptor");
    }
}

std::string RequestInterceptor::identify(const OutboundRequest& request) const {
    return service_identifier_->identify(request);
}

void RequestInterceptor::handle(const OutboundRequest& request, ResponseCallback on_complete) {
    const std::string service_identity = identify(request);
    const BreakerStatus status = engine_->decide(service_identity, request);

    transport_->send(request,
        [this, service_identity, status, on_complete = std::move(on_complete)](
            http::response<http::string_body> response, boost::system::error_code ec) {
            onTransportComplete(service_identity, status, response, ec);
            on_complete(std::move(response), ec);
        });
}

void RequestInterceptor::onTransportComplete(const std::string& service_identity,
                                             BreakerStatus previous_status,
                                             const http::response<http::string_body>& response,
                                             const boost::system::error_code& ec) const {
    if (!ec) {
        const bool is_failure = failure_identifier_->isResponseFailure(response, service_identity);
        engine_->recordOutcome(service_identity, previous_status, is_failure);
        return;
    }

    if (failure_identifier_->isErrorFailure(ec, service_identity)) {
        engine_->recordOutcome(service_identity, previous_status, true);
    } else {
        logger_->debug("Not recording error for service `" + service_identity + "`: " + ec.message());
    }
}

http::response<http::string_body> RequestInterceptor::execute(const OutboundRequest& request,
                                                              std::chrono::milliseconds wait) {
    using Result = std::pair<http::response<http::string_body>, boost::system::error_code>;
    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();

    handle(request, [promise](http::response<http::string_body> response, boost::system::error_code ec) {
        promise->set_value(Result{std::move(response), ec});
    });

    if (future.wait_for(wait) == std::future_status::timeout) {
        throw TransportException(identify(request), request,
            boost::system::errc::make_error_code(boost::system::errc::timed_out));
    }

    Result result = future.get();
    if (result.second) {
        throw TransportException(identify(request), request, result.second);
    }
    return std::move(result.first);
}
