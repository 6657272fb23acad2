#include "BeastHttpServer.hpp"
#include "HttpServerSession.hpp"
#include "Vitify.hpp"

void BeastHttpServer::do_accept() {
    // Each session gets its own strand so worker-thread responses can be posted back safely
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(
            &BeastHttpServer::on_accept,
            shared_from_this()));
}

void BeastHttpServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        logger_->error("BeastHttpServer accept error: " + ec.message());
        return do_accept();
    }

    auto session = std::make_shared<HttpServerSession>(
        std::move(socket),
        vitify_service_,
        logger_,
        config_,
        [self = shared_from_this()](std::shared_ptr<HttpServerSession> finished) {
            self->on_session_finish(finished);
        });

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        active_sessions_.insert(session);
    }

    session->run();
    do_accept();
}

void BeastHttpServer::on_session_finish(std::shared_ptr<HttpServerSession> session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    active_sessions_.erase(session);
    logger_->debug("BeastHttpServer session finished. Active sessions: " + std::to_string(active_sessions_.size()));
}
