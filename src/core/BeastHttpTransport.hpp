#ifndef BEASTHTTPTRANSPORT_HPP
#define BEASTHTTPTRANSPORT_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_set>

#include <boost/asio/io_context.hpp>

#include "AsyncHttpClientSession.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/ITransport.hpp"

// ITransport over Boost.Beast. Callbacks run on the io_context threads.
class BeastHttpTransport : public ITransport {
public:
    BeastHttpTransport(net::io_context& ioc,
                       std::chrono::milliseconds timeout,
                       std::shared_ptr<ILogger> logger);
    ~BeastHttpTransport() override = default;

    BeastHttpTransport(const BeastHttpTransport&) = delete;
    BeastHttpTransport& operator=(const BeastHttpTransport&) = delete;

    // Throws std::invalid_argument for https endpoints; TLS is not supported.
    void send(const OutboundRequest& request, Callback on_complete) override;
    void cancelAll() override;

    size_t activeSessions() const;

private:
    net::io_context& ioc_;
    const std::chrono::milliseconds timeout_;
    std::shared_ptr<ILogger> logger_;
    mutable std::mutex active_sessions_mutex_;
    std::unordered_set<std::shared_ptr<AsyncHttpClientSession>> active_sessions_;
};

#endif // BEASTHTTPTRANSPORT_HPP
