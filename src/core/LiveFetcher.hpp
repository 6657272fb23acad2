#ifndef LIVEFETCHER_HPP
#define LIVEFETCHER_HPP

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "AsyncHttpClientSession.hpp"
#include "CircuitBreaker.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/ILiveFetcher.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/EndpointMapping.hpp"

namespace net = boost::asio;

// Live fetch against the upstream statistics site. The HTTP exchange runs on the shared
// io_context; the calling worker waits on a future bounded by fetch_timeout_in_millis.
class LiveFetcher : public ILiveFetcher {
public:
    LiveFetcher(net::io_context& ioc,
                const AppConfig& config,
                std::shared_ptr<ILogger> logger,
                std::shared_ptr<IStatsDClient> statsd_client);

    LiveFetcher(const LiveFetcher&) = delete;
    LiveFetcher& operator=(const LiveFetcher&) = delete;

    FetchResult fetch(const std::string& endpoint, const std::map<std::string, std::string>& params) override;
    void cancelAll() override;

    // "<path>?opcao=opt_02&ano=2023&subopcao=..." with absent parameters omitted.
    static std::string buildTarget(const SourceUrlInfo& source,
                                   const EndpointMapping& mapping,
                                   const std::map<std::string, std::string>& params);

private:
    struct PendingFetch;

    void handleServerError(int status);

    net::io_context& ioc_;
    const AppConfig& config_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::unique_ptr<CircuitBreaker> circuit_breaker_;
    std::atomic<bool> stopping_;
    std::mutex active_sessions_mutex_;
    std::unordered_map<std::shared_ptr<AsyncHttpClientSession>, std::shared_ptr<PendingFetch>> active_sessions_;
};

#endif // LIVEFETCHER_HPP
