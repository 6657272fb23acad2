#ifndef BEAST_HTTP_SERVER_HPP
#define BEAST_HTTP_SERVER_HPP

#include <boost/beast/core.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "../interfaces/ILogger.hpp"
#include "../config/AppConfig.hpp"
#include "HttpServerSession.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class Vitify;

class BeastHttpServer : public std::enable_shared_from_this<BeastHttpServer> {
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<Vitify> vitify_service_;
    std::shared_ptr<ILogger> logger_;
    const AppConfig& config_;
    std::mutex sessions_mutex_;
    std::unordered_set<std::shared_ptr<HttpServerSession>> active_sessions_;

    void fail(const std::string& what, const beast::error_code& ec) {
        logger_->error("BeastHttpServer " + what + " error: " + ec.message());
        throw std::runtime_error("Failed to " + what + ": " + ec.message());
    }

public:
    BeastHttpServer(
        net::io_context& ioc,
        tcp::endpoint endpoint,
        std::shared_ptr<Vitify> service,
        std::shared_ptr<ILogger> logger,
        const AppConfig& config)
        : ioc_(ioc),
          acceptor_(ioc),
          vitify_service_(service),
          logger_(logger),
          config_(config) {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) fail("open acceptor", ec);

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) fail("set_option", ec);

        acceptor_.bind(endpoint, ec);
        if (ec) fail("bind", ec);

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) fail("listen", ec);
    }

    void run() {
        do_accept();
    }

    // Stops accepting and closes every open session.
    void stop() {
        logger_->info("BeastHttpServer stopping...");
        beast::error_code ec;
        acceptor_.cancel(ec);
        if (ec) logger_->error("BeastHttpServer acceptor cancel error: " + ec.message());
        acceptor_.close(ec);
        if (ec) logger_->error("BeastHttpServer acceptor close error: " + ec.message());

        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& session_ptr : active_sessions_) {
            if (session_ptr) session_ptr->stop();
        }
        active_sessions_.clear();
        logger_->info("BeastHttpServer stopped.");
    }

    size_t activeSessionCount() {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        return active_sessions_.size();
    }

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
    void on_session_finish(std::shared_ptr<HttpServerSession> session);
};

#endif // BEAST_HTTP_SERVER_HPP
