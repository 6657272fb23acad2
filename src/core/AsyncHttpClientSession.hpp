#ifndef ASYNC_HTTP_CLIENT_SESSION_HPP
#define ASYNC_HTTP_CLIENT_SESSION_HPP

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "../models/SourceUrlInfo.hpp"
#include "../interfaces/ILogger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// One GET against the upstream source. The completion handler runs exactly once,
// with timed_out after the deadline and operation_aborted after cancel().
class AsyncHttpClientSession : public std::enable_shared_from_this<AsyncHttpClientSession> {
public:
    using CompletionHandler = std::function<void(http::response<http::string_body>, beast::error_code)>;

private:
    net::strand<net::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_; // Must persist for reads
    http::request<http::empty_body> req_;
    http::response<http::string_body> res_;
    const SourceUrlInfo source_;
    CompletionHandler on_complete_;
    std::shared_ptr<ILogger> logger_;
    net::steady_timer timer_;
    bool completed_;

public:
    AsyncHttpClientSession(
        net::io_context& ioc,
        SourceUrlInfo source,
        const std::string& target,
        std::chrono::milliseconds timeout,
        CompletionHandler on_complete,
        std::shared_ptr<ILogger> logger = nullptr)
        : strand_(net::make_strand(ioc)),
          resolver_(strand_),
          stream_(strand_),
          source_(std::move(source)),
          on_complete_(std::move(on_complete)),
          logger_(logger),
          timer_(strand_),
          completed_(false) {
        req_.version(11); // HTTP/1.1
        req_.method(http::verb::get);
        req_.target(target);
        req_.set(http::field::host, source_.host);
        req_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req_.set(http::field::accept, "text/html");
        req_.set(http::field::connection, "close");

        timer_.expires_after(timeout);
    }

    void run() {
        net::post(strand_, [self = shared_from_this()]() {
            self->timer_.async_wait(beast::bind_front_handler(&AsyncHttpClientSession::on_timeout, self));
            self->do_resolve();
        });
    }

    // Safe from any thread.
    void cancel() {
        net::post(strand_, [self = shared_from_this()]() {
            self->finish({}, net::error::operation_aborted);
        });
    }

private:
    void finish(http::response<http::string_body> response, beast::error_code ec) {
        if (completed_) {
            return;
        }
        completed_ = true;
        timer_.cancel();
        resolver_.cancel();
        beast::error_code close_ec;
        stream_.socket().close(close_ec);
        on_complete_(std::move(response), ec);
    }

    void on_timeout(beast::error_code ec) {
        if (ec == net::error::operation_aborted || completed_) {
            return;
        }
        if (logger_) logger_->error("AsyncHttpClientSession timeout for " + source_.url);
        finish({}, beast::errc::make_error_code(beast::errc::timed_out));
    }

    void do_resolve() {
        resolver_.async_resolve(
            source_.host,
            std::to_string(source_.port),
            beast::bind_front_handler(&AsyncHttpClientSession::on_resolve, shared_from_this()));
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (completed_) return;
        if (ec) return finish({}, ec);
        stream_.async_connect(
            results,
            beast::bind_front_handler(&AsyncHttpClientSession::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (completed_) return;
        if (ec) return finish({}, ec);
        http::async_write(stream_, req_,
            beast::bind_front_handler(&AsyncHttpClientSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t /* bytes_transferred */) {
        if (completed_) return;
        if (ec) return finish({}, ec);
        http::async_read(stream_, buffer_, res_,
            beast::bind_front_handler(&AsyncHttpClientSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t /* bytes_transferred */) {
        if (completed_) return;

        beast::error_code shut_ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, shut_ec);
        if (shut_ec && shut_ec != beast::errc::not_connected) {
            if (logger_) logger_->debug("AsyncHttpClientSession shutdown error: " + shut_ec.message());
        }

        finish(std::move(res_), ec == http::error::end_of_stream ? beast::error_code{} : ec);
    }
};

#endif // ASYNC_HTTP_CLIENT_SESSION_HPP
