#ifndef ASYNC_HTTP_CLIENT_SESSION_HPP
#define ASYNC_HTTP_CLIENT_SESSION_HPP

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "../interfaces/ILogger.hpp"
#include "../models/OutboundRequest.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// One plain-HTTP request: resolve, connect, write, read, under one overall
// deadline. on_complete runs exactly once, with timed_out on deadline and
// operation_aborted after cancel().
class AsyncHttpClientSession : public std::enable_shared_from_this<AsyncHttpClientSession> {
public:
    using Callback = std::function<void(http::response<http::string_body>, beast::error_code)>;

    AsyncHttpClientSession(
        net::io_context& ioc,
        const OutboundRequest& request,
        std::chrono::milliseconds timeout,
        Callback on_complete,
        std::shared_ptr<ILogger> logger)
        : strand_(net::make_strand(ioc)),
          resolver_(strand_),
          stream_(strand_),
          timer_(strand_),
          host_(request.endpoint.host),
          port_(std::to_string(request.endpoint.port)),
          description_(request.describe()),
          req_(request.message),
          on_complete_(std::move(on_complete)),
          logger_(std::move(logger)) {
        req_.version(11); // HTTP/1.1
        req_.set(http::field::host, request.endpoint.authority());
        if (req_.find(http::field::user_agent) == req_.end()) {
            req_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        }
        req_.keep_alive(false);
        req_.prepare_payload();

        timer_.expires_after(timeout);
    }

    void run() {
        net::dispatch(strand_, [self = shared_from_this()]() {
            self->timer_.async_wait(beast::bind_front_handler(&AsyncHttpClientSession::on_timeout, self));
            self->do_resolve();
        });
    }

    void cancel() {
        net::dispatch(strand_, [self = shared_from_this()]() {
            self->finish({}, net::error::operation_aborted);
        });
    }

    bool completed() const { return completed_.load(); }

private:
    // Reports once, then tears the connection down so pending handlers
    // return quickly.
    void finish(http::response<http::string_body> res, beast::error_code ec) {
        if (completed_.exchange(true)) {
            return;
        }
        timer_.cancel();
        resolver_.cancel();
        beast::error_code close_ec;
        stream_.socket().close(close_ec);

        Callback callback = std::move(on_complete_);
        on_complete_ = nullptr;
        callback(std::move(res), ec);
    }

    void on_timeout(beast::error_code ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (logger_) logger_->warn("Request timed out: " + description_);
        finish({}, beast::errc::make_error_code(beast::errc::timed_out));
    }

    void do_resolve() {
        resolver_.async_resolve(
            host_,
            port_,
            beast::bind_front_handler(&AsyncHttpClientSession::on_resolve, shared_from_this()));
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return finish({}, ec);
        stream_.async_connect(
            results,
            beast::bind_front_handler(&AsyncHttpClientSession::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return finish({}, ec);
        http::async_write(stream_, req_,
            beast::bind_front_handler(&AsyncHttpClientSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);
        if (ec) return finish({}, ec);
        http::async_read(stream_, buffer_, res_,
            beast::bind_front_handler(&AsyncHttpClientSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        beast::error_code shut_ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, shut_ec);
        if (shut_ec && shut_ec != beast::errc::not_connected && logger_) {
            logger_->debug("AsyncHttpClientSession shutdown error: " + shut_ec.message());
        }

        // end_of_stream here means the peer closed before a response was parsed
        if (ec) {
            return finish({}, ec);
        }
        finish(std::move(res_), {});
    }

    net::strand<net::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    net::steady_timer timer_;
    beast::flat_buffer buffer_; // Must persist for reads
    std::string host_;
    std::string port_;
    std::string description_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    Callback on_complete_;
    std::shared_ptr<ILogger> logger_;
    std::atomic<bool> completed_{false};
};

#endif // ASYNC_HTTP_CLIENT_SESSION_HPP
