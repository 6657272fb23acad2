#include "HttpServerSession.hpp"
#include "Vitify.hpp"

void HttpServerSession::handle_request(http::request<http::string_body>&& req) {
    current_target_ = std::string(req.target());
    current_keep_alive_ = req.keep_alive();
    logger_->debug("HttpServerSession " + id() + " " + std::string(req.method_string()) + " " + current_target_);

    if (!vitify_service_) {
        logger_->error("HttpServerSession " + id() + ": Vitify service is null.");
        http::response<http::string_body> res{http::status::internal_server_error, req.version()};
        res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        res.set(http::field::content_type, "text/plain");
        res.keep_alive(req.keep_alive());
        res.body() = "Internal server error: service not available.";
        res.prepare_payload();
        return send_response(std::move(res));
    }

    // The service may answer from a worker thread; hop back onto the strand before touching the queue.
    vitify_service_->route(std::move(req),
        [self = shared_from_this()](std::optional<http::response<http::string_body>> opt_res) {
            net::post(self->stream_.get_executor(),
                [self, res = std::move(opt_res)]() mutable {
                    self->send_response(std::move(res));
                });
        });
}

void HttpServerSession::send_response(std::optional<http::response<http::string_body>>&& opt_res) {
    if (!opt_res) {
        logger_->warn("HttpServerSession " + id() + " dropping request for '" + current_target_ + "' without a response");
        if (write_in_progress_) {
            return;
        }
        if (current_keep_alive_) {
            return do_read();
        }
        return do_close();
    }

    // The front entry is owned by an in-flight async_write while write_in_progress_ is set
    const size_t first_discardable = write_in_progress_ ? 1 : 0;
    if (response_queue_.size() >= config_.max_response_queue_size && response_queue_.size() > first_discardable) {
        auto oldest = response_queue_.begin() + first_discardable;
        logger_->warn("HttpServerSession " + id() + " response queue full (" +
            std::to_string(response_queue_.size()) + "). Discarding oldest response (status " +
            std::to_string((*oldest)->result_int()) + ").");
        response_queue_.erase(oldest);
    }

    response_queue_.push_back(std::make_shared<http::response<http::string_body>>(std::move(*opt_res)));
    if (!write_in_progress_) {
        do_write();
    }
}
