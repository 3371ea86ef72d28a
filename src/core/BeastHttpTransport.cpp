#include "BeastHttpTransport.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

BeastHttpTransport::BeastHttpTransport(net::io_context& ioc,
                                       std::chrono::milliseconds timeout,
                                       std::shared_ptr<ILogger> logger)
    : ioc_(ioc), timeout_(timeout), logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for BeastHttpTransport");
    }
    if (timeout_ <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Transport timeout must be positive");
    }
}

void BeastHttpTransport::send(const OutboundRequest& request, Callback on_complete) {
    if (request.endpoint.is_https) {
        throw std::invalid_argument("HTTPS is not supported by BeastHttpTransport: " + request.endpoint.url);
    }

    // The session removes itself from the active set once it reports.
    auto holder = std::make_shared<std::shared_ptr<AsyncHttpClientSession>>();
    auto session = std::make_shared<AsyncHttpClientSession>(
        ioc_,
        request,
        timeout_,
        [this, holder, on_complete = std::move(on_complete)](http::response<http::string_body> res, beast::error_code ec) {
            {
                std::lock_guard<std::mutex> lock(active_sessions_mutex_);
                active_sessions_.erase(*holder);
            }
            holder->reset();
            on_complete(std::move(res), ec);
        },
        logger_);
    *holder = session;

    {
        std::lock_guard<std::mutex> lock(active_sessions_mutex_);
        active_sessions_.insert(session);
    }
    logger_->debug("Sending " + request.describe());
    session->run();
}

void BeastHttpTransport::cancelAll() {
    std::vector<std::shared_ptr<AsyncHttpClientSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(active_sessions_mutex_);
        sessions.assign(active_sessions_.begin(), active_sessions_.end());
    }
    logger_->info("Cancelling " + std::to_string(sessions.size()) + " in-flight request(s).");
    for (const auto& session : sessions) {
        session->cancel();
    }
}

size_t BeastHttpTransport::activeSessions() const {
    std::lock_guard<std::mutex> lock(active_sessions_mutex_);
    return active_sessions_.size();
}
