#include <atomic>
#include <chrono>
#include <future>
#include <utility>

#include "LiveFetcher.hpp"
#include "../parsers/HtmlTableParser.hpp"
#include "../utils/Utils.hpp"

namespace {
    using FetchResponse = std::pair<http::response<http::string_body>, beast::error_code>;

    // Extra wait on the future so the session's own deadline normally fires first
    constexpr std::chrono::milliseconds FUTURE_GRACE{500};
}

// The waiting worker's side of one fetch. Settled once, either by the session's completion
// on the io_context or by cancelAll() from the shutdown path, whichever comes first.
struct LiveFetcher::PendingFetch {
    std::promise<FetchResponse> promise;
    std::atomic<bool> settled{false};

    void complete(http::response<http::string_body> response, beast::error_code ec) {
        if (settled.exchange(true)) {
            return;
        }
        promise.set_value(std::make_pair(std::move(response), ec));
    }
};

LiveFetcher::LiveFetcher(net::io_context& ioc,
                         const AppConfig& config,
                         std::shared_ptr<ILogger> logger,
                         std::shared_ptr<IStatsDClient> statsd_client)
    : ioc_(ioc),
      config_(config),
      logger_(logger),
      statsd_client_(statsd_client),
      stopping_(false) {
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient pointer cannot be null");
    }
    circuit_breaker_ = std::make_unique<CircuitBreaker>(logger_, statsd_client_);
}

std::string LiveFetcher::buildTarget(const SourceUrlInfo& source,
                                     const EndpointMapping& mapping,
                                     const std::map<std::string, std::string>& params) {
    std::string target = source.path.empty() ? "/" : source.path;
    target += "?opcao=" + Utils::urlEncode(mapping.opcao);

    auto year = params.find("year");
    if (year != params.end() && !year->second.empty()) {
        target += "&ano=" + Utils::urlEncode(year->second);
    }
    auto sub_option = params.find("sub_option");
    if (sub_option != params.end() && !sub_option->second.empty()) {
        target += "&subopcao=" + Utils::urlEncode(sub_option->second);
    }
    return target;
}

FetchResult LiveFetcher::fetch(const std::string& endpoint, const std::map<std::string, std::string>& params) {
    if (stopping_) {
        return FetchResult::failure(FetchErrorKind::CANCELLED, "service is shutting down");
    }

    const EndpointMapping* mapping = EndpointCatalog::find(endpoint);
    if (mapping == nullptr) {
        return FetchResult::failure(FetchErrorKind::NETWORK, "no upstream mapping for endpoint " + endpoint);
    }
    const SourceUrlInfo& source = config_.source;
    if (source.is_https) {
        return FetchResult::failure(FetchErrorKind::NETWORK, "https sources are not supported: " + source.url);
    }
    if (circuit_breaker_->isTripped(source.host)) {
        return FetchResult::failure(FetchErrorKind::CIRCUIT_OPEN, "source " + source.host + " is cooling off");
    }

    const std::string target = buildTarget(source, *mapping, params);
    const auto timeout = std::chrono::milliseconds(config_.fetch_timeout_in_millis);
    logger_->debug("Live fetch http://" + source.host + ":" + std::to_string(source.port) + target);

    auto pending = std::make_shared<PendingFetch>();
    std::future<FetchResponse> future = pending->promise.get_future();

    auto session = std::make_shared<AsyncHttpClientSession>(
        ioc_, source, target, timeout,
        [pending](http::response<http::string_body> response, beast::error_code ec) {
            pending->complete(std::move(response), ec);
        },
        logger_);

    {
        std::lock_guard<std::mutex> lock(active_sessions_mutex_);
        // cancelAll() may have run between the check above and here
        if (stopping_) {
            return FetchResult::failure(FetchErrorKind::CANCELLED, "service is shutting down");
        }
        active_sessions_.emplace(session, pending);
    }
    session->run();

    const bool ready = future.wait_for(timeout + FUTURE_GRACE) == std::future_status::ready;
    {
        std::lock_guard<std::mutex> lock(active_sessions_mutex_);
        active_sessions_.erase(session);
    }
    if (!ready) {
        session->cancel();
        return FetchResult::failure(FetchErrorKind::TIMEOUT,
                                    "no answer within " + std::to_string(timeout.count()) + "ms");
    }

    FetchResponse outcome = future.get();
    const beast::error_code& ec = outcome.second;
    if (ec) {
        if (ec == beast::errc::timed_out) {
            return FetchResult::failure(FetchErrorKind::TIMEOUT, ec.message());
        }
        if (ec == net::error::operation_aborted) {
            return FetchResult::failure(FetchErrorKind::CANCELLED, ec.message());
        }
        return FetchResult::failure(FetchErrorKind::NETWORK, ec.message());
    }

    const int status = outcome.first.result_int();
    if (status >= 500) {
        handleServerError(status);
        return FetchResult::failure(FetchErrorKind::HTTP_STATUS, "source answered " + std::to_string(status), status);
    }
    if (status < 200 || status >= 300) {
        return FetchResult::failure(FetchErrorKind::HTTP_STATUS, "source answered " + std::to_string(status), status);
    }

    TableParseOutcome parsed = HtmlTableParser::parse(outcome.first.body());
    if (!parsed.ok()) {
        return FetchResult::failure(FetchErrorKind::PARSE, parsed.error);
    }
    return FetchResult::success(std::move(*parsed.record));
}

// Waiting workers are released right away: the io_context may be stopped before the
// sessions' posted cancels ever run.
void LiveFetcher::cancelAll() {
    std::lock_guard<std::mutex> lock(active_sessions_mutex_);
    stopping_ = true;
    logger_->info("Cancelling " + std::to_string(active_sessions_.size()) + " in-flight live fetches");
    for (const auto& active : active_sessions_) {
        active.second->complete({}, net::error::operation_aborted);
        active.first->cancel();
    }
}

void LiveFetcher::handleServerError(int status) {
    logger_->error("Source " + config_.source.host + " answered " + std::to_string(status));
    circuit_breaker_->trip(config_.source.host,
                           std::chrono::milliseconds(config_.source_circuit_breaker_cool_off_duration_in_millis));
}
