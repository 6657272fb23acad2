#ifndef VITIFY_HPP
#define VITIFY_HPP

#include <boost/beast/http.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "BasicAuthenticator.hpp"
#include "ThreadPoolQueue.hpp"
#include "TieredCacheCoordinator.hpp"
#include "../cache/StaticFallbackStore.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/ILiveFetcher.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../interfaces/IVolatileStore.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

using json = nlohmann::json;

// Request handling for the public data endpoints and the operational endpoints.
// Handlers that touch Redis or the upstream site run on the worker pool; the
// callback is invoked exactly once per request from a worker thread.
class Vitify {
public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using ResponseCallback = std::function<void(std::optional<Response>)>;

    Vitify(std::shared_ptr<IVolatileStore> store,
           std::shared_ptr<StaticFallbackStore> static_store,
           std::shared_ptr<ILiveFetcher> fetcher,
           std::shared_ptr<TieredCacheCoordinator> coordinator,
           std::shared_ptr<ThreadPoolQueue> workers,
           std::shared_ptr<IStatsDClient> statsd_client,
           const AppConfig& config,
           std::shared_ptr<ILogger> logger);

    virtual ~Vitify() = default;

    Vitify(const Vitify&) = delete;
    Vitify& operator=(const Vitify&) = delete;
    Vitify(Vitify&&) = delete;
    Vitify& operator=(Vitify&&) = delete;

    // Entry point used by HttpServerSession.
    void route(Request req, ResponseCallback send_response_cb) const;

    void processDataRequest(const std::string& endpoint, Request req, ResponseCallback send_response_cb) const;
    void processHeartbeatRequest(Request req, ResponseCallback send_response_cb) const;
    void processCacheStatsRequest(Request req, ResponseCallback send_response_cb) const;
    void processCacheClearRequest(Request req, ResponseCallback send_response_cb) const;

    void cancel_active_fetches() const;

    // Builders are synchronous and may block on the volatile store.
    Response buildDataResponse(const std::string& endpoint, const Request& req) const;
    Response buildHeartbeatResponse(const Request& req) const;
    Response buildCacheStatsResponse(const Request& req) const;
    Response buildCacheClearResponse(const Request& req) const;

    // Returns an error message, or nullopt when the parameters are acceptable.
    static std::optional<std::string> validateParameters(const std::string& endpoint,
                                                         const std::map<std::string, std::string>& params);

    static Response makeJsonResponse(http::status status, const json& body, const Request& req);

private:
    std::shared_ptr<IVolatileStore> store_;
    std::shared_ptr<StaticFallbackStore> static_store_;
    std::shared_ptr<ILiveFetcher> fetcher_;
    std::shared_ptr<TieredCacheCoordinator> coordinator_;
    std::shared_ptr<ThreadPoolQueue> workers_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    const AppConfig& config_;
    std::shared_ptr<ILogger> logger_;
    BasicAuthenticator authenticator_;

    // Runs build on the worker pool and hands its result to send_response_cb.
    void dispatch(Request req,
                  ResponseCallback send_response_cb,
                  std::function<Response(const Request&)> build) const;

    std::optional<Response> checkAuthorization(const Request& req) const;
    Response unavailableResponse(const std::string& endpoint,
                                 const std::map<std::string, std::string>& params,
                                 const Resolution& resolution,
                                 const Request& req) const;
    json systemStatus() const;
    std::string volatileStoreStatus() const;
};

#endif // VITIFY_HPP
