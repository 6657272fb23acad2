#include "Vitify.hpp"

#include <boost/beast/version.hpp>

#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "../models/EndpointMapping.hpp"
#include "../utils/Utils.hpp"

namespace {
    const std::string HEARTBEAT_PATH = "/heartbeat";
    const std::string CACHE_STATS_PATH = "/cache/stats";
    const std::string CACHE_PATH = "/cache";
    const std::string AUTH_REALM = "Basic realm=\"Authentication Required\"";

    std::pair<std::string, std::map<std::string, std::string>> splitTarget(const Vitify::Request& req) {
        std::string target(req.target());
        size_t query_pos = target.find('?');
        if (query_pos == std::string::npos) {
            return {target, {}};
        }
        return {target.substr(0, query_pos), Utils::parseQueryString(target.substr(query_pos + 1))};
    }

    // Only year and sub_option are forwarded; blank values count as absent.
    std::map<std::string, std::string> dataParams(const std::map<std::string, std::string>& query) {
        std::map<std::string, std::string> params;
        for (const char* name : {"year", "sub_option"}) {
            auto it = query.find(name);
            if (it != query.end()) {
                std::string value = Utils::trim(it->second);
                if (!value.empty()) {
                    params[name] = value;
                }
            }
        }
        return params;
    }

    json paramsJson(const std::map<std::string, std::string>& params) {
        json out = {{"year", nullptr}, {"sub_option", nullptr}};
        for (const auto& [name, value] : params) {
            out[name] = value;
        }
        return out;
    }

    std::string joinSubOptions(const EndpointMapping& mapping) {
        std::string joined;
        for (const auto& [sub_option, file] : mapping.sub_options) {
            if (!joined.empty()) joined += ", ";
            joined += sub_option;
        }
        return joined;
    }
}

Vitify::Vitify(std::shared_ptr<IVolatileStore> store,
               std::shared_ptr<StaticFallbackStore> static_store,
               std::shared_ptr<ILiveFetcher> fetcher,
               std::shared_ptr<TieredCacheCoordinator> coordinator,
               std::shared_ptr<ThreadPoolQueue> workers,
               std::shared_ptr<IStatsDClient> statsd_client,
               const AppConfig& config,
               std::shared_ptr<ILogger> logger)
    : store_(store),
      static_store_(static_store),
      fetcher_(fetcher),
      coordinator_(coordinator),
      workers_(workers),
      statsd_client_(statsd_client),
      config_(config),
      logger_(logger),
      authenticator_(config.users) {
    if (!store_) {
        throw std::invalid_argument("Volatile store pointer cannot be null");
    }
    if (!static_store_) {
        throw std::invalid_argument("Static fallback store pointer cannot be null");
    }
    if (!fetcher_) {
        throw std::invalid_argument("Live fetcher pointer cannot be null");
    }
    if (!coordinator_) {
        throw std::invalid_argument("Coordinator pointer cannot be null");
    }
    if (!workers_) {
        throw std::invalid_argument("Worker pool pointer cannot be null");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (!authenticator_.hasUsers()) {
        logger_->warn("No users configured; every authenticated endpoint will answer 401");
    }
    logger_->debug("Vitify initialized");
}

void Vitify::route(Request req, ResponseCallback send_response_cb) const {
    const std::string path = splitTarget(req).first;

    auto methodNotAllowed = [&](const std::string& allowed) {
        json body = {
            {"error", "Method not allowed"},
            {"path", path},
            {"allowed_methods", allowed},
            {"status", "method_error"}
        };
        Response res = makeJsonResponse(http::status::method_not_allowed, body, req);
        res.set(http::field::allow, allowed);
        send_response_cb(std::move(res));
    };

    if (!path.empty() && path.front() == '/' && EndpointCatalog::find(path.substr(1)) != nullptr) {
        if (req.method() != http::verb::get) {
            return methodNotAllowed("GET");
        }
        return processDataRequest(path.substr(1), std::move(req), std::move(send_response_cb));
    }
    if (path == HEARTBEAT_PATH) {
        if (req.method() != http::verb::get) {
            return methodNotAllowed("GET");
        }
        return processHeartbeatRequest(std::move(req), std::move(send_response_cb));
    }
    if (path == CACHE_STATS_PATH) {
        if (req.method() != http::verb::get) {
            return methodNotAllowed("GET");
        }
        return processCacheStatsRequest(std::move(req), std::move(send_response_cb));
    }
    if (path == CACHE_PATH) {
        if (req.method() != http::verb::delete_) {
            return methodNotAllowed("DELETE");
        }
        return processCacheClearRequest(std::move(req), std::move(send_response_cb));
    }

    logger_->debug("Unhandled " + std::string(req.method_string()) + " request for " + path);
    json body = {
        {"error", "Not Found"},
        {"path", path},
        {"available_endpoints", EndpointCatalog::endpointNames()},
        {"status", "not_found"}
    };
    send_response_cb(makeJsonResponse(http::status::not_found, body, req));
}

void Vitify::processDataRequest(const std::string& endpoint, Request req, ResponseCallback send_response_cb) const {
    dispatch(std::move(req), std::move(send_response_cb), [this, endpoint](const Request& r) {
        return buildDataResponse(endpoint, r);
    });
}

void Vitify::processHeartbeatRequest(Request req, ResponseCallback send_response_cb) const {
    dispatch(std::move(req), std::move(send_response_cb), [this](const Request& r) {
        return buildHeartbeatResponse(r);
    });
}

void Vitify::processCacheStatsRequest(Request req, ResponseCallback send_response_cb) const {
    dispatch(std::move(req), std::move(send_response_cb), [this](const Request& r) {
        return buildCacheStatsResponse(r);
    });
}

void Vitify::processCacheClearRequest(Request req, ResponseCallback send_response_cb) const {
    dispatch(std::move(req), std::move(send_response_cb), [this](const Request& r) {
        return buildCacheClearResponse(r);
    });
}

void Vitify::cancel_active_fetches() const {
    logger_->info("Cancelling active upstream fetches");
    fetcher_->cancelAll();
}

void Vitify::dispatch(Request req,
                      ResponseCallback send_response_cb,
                      std::function<Response(const Request&)> build) const {
    auto shared_req = std::make_shared<Request>(std::move(req));
    auto shared_cb = std::make_shared<ResponseCallback>(std::move(send_response_cb));

    bool queued = workers_->enqueue([this, shared_req, shared_cb, build]() {
        Response res;
        try {
            res = build(*shared_req);
        } catch (const std::exception& e) {
            logger_->error("Unexpected exception handling " + std::string(shared_req->target()) + ": " + e.what());
            statsd_client_->increment(MetricsDefinitions::CODE_EXCEPTION);
            json body = {
                {"error", "Internal server error"},
                {"message", "An unexpected error occurred while processing your request"},
                {"status", "critical_error"}
            };
            res = makeJsonResponse(http::status::internal_server_error, body, *shared_req);
        }
        (*shared_cb)(std::move(res));
    });

    if (!queued) {
        json body = {
            {"error", "Service shutting down"},
            {"status", "service_unavailable"}
        };
        (*shared_cb)(makeJsonResponse(http::status::service_unavailable, body, *shared_req));
    }
}

std::optional<Vitify::Response> Vitify::checkAuthorization(const Request& req) const {
    std::string header;
    auto it = req.find(http::field::authorization);
    if (it != req.end()) {
        header = std::string(it->value());
    }

    AuthResult result = authenticator_.authenticate(header);
    if (result.authenticated) {
        return std::nullopt;
    }

    logger_->warn("Rejected request for " + std::string(req.target()) + ": " + result.error);
    json body = {
        {"error", "Unauthorized access"},
        {"status", "authentication_error"}
    };
    Response res = makeJsonResponse(http::status::unauthorized, body, req);
    res.set(http::field::www_authenticate, AUTH_REALM);
    return res;
}

std::optional<std::string> Vitify::validateParameters(const std::string& endpoint,
                                                      const std::map<std::string, std::string>& params) {
    auto year_it = params.find("year");
    if (year_it != params.end()) {
        std::optional<int> year = Utils::stringToInt(year_it->second);
        if (!year) {
            return std::string("Year must be a valid integer.");
        }
        if (*year < EndpointCatalog::MIN_YEAR || *year > EndpointCatalog::MAX_YEAR) {
            return "Invalid year. Must be between " + std::to_string(EndpointCatalog::MIN_YEAR) +
                   " and " + std::to_string(EndpointCatalog::MAX_YEAR) + ".";
        }
    }

    auto sub_option_it = params.find("sub_option");
    const EndpointMapping* mapping = EndpointCatalog::find(endpoint);
    if (sub_option_it != params.end() && mapping != nullptr && !mapping->sub_options.empty()) {
        if (!mapping->hasSubOption(sub_option_it->second)) {
            return "Invalid sub_option for " + endpoint + ". Valid options: " + joinSubOptions(*mapping);
        }
    }
    return std::nullopt;
}

Vitify::Response Vitify::buildDataResponse(const std::string& endpoint, const Request& req) const {
    if (auto denied = checkAuthorization(req)) {
        return std::move(*denied);
    }

    const auto params = dataParams(splitTarget(req).second);
    logger_->info("Processing " + endpoint + " request: " + paramsJson(params).dump());

    if (auto validation_error = validateParameters(endpoint, params)) {
        logger_->warn("Parameter validation failed for " + endpoint + ": " + *validation_error);
        const EndpointMapping* mapping = EndpointCatalog::find(endpoint);
        json sub_options = json::array();
        if (mapping != nullptr) {
            for (const auto& [sub_option, file] : mapping->sub_options) {
                sub_options.push_back(sub_option);
            }
        }
        json body = {
            {"error", *validation_error},
            {"endpoint", endpoint},
            {"provided_params", paramsJson(params)},
            {"allowed_values", {
                {"year", {{"min", EndpointCatalog::MIN_YEAR}, {"max", EndpointCatalog::MAX_YEAR}}},
                {"sub_option", sub_options}
            }},
            {"status", "parameter_error"}
        };
        return makeJsonResponse(http::status::bad_request, body, req);
    }

    Resolution resolution = coordinator_->resolve(endpoint, params, [this, endpoint, params]() {
        return fetcher_->fetch(endpoint, params);
    });
    if (!resolution.ok()) {
        return unavailableResponse(endpoint, params, resolution, req);
    }

    const CacheEntry& entry = *resolution.entry;
    json year = "unknown";
    auto year_it = params.find("year");
    if (year_it != params.end()) {
        year = Utils::stringToInt(year_it->second).value_or(0);
    }

    json body = {
        {"data", *entry.payload},
        {"cached", ProvenanceUtils::toCachedFlag(entry.provenance)},
        {"endpoint", endpoint},
        {"status", "success"},
        {"year", year},
        {"data_source", ProvenanceUtils::dataSource(entry.provenance)},
        {"freshness", ProvenanceUtils::freshness(entry.provenance)},
        {"stored_at", Utils::formatUtc(entry.stored_at)},
        {"cache_info", {
            {"active_cache_layer", ProvenanceUtils::toString(entry.provenance)},
            {"ttl_seconds", {
                {"short_cache", config_.short_cache_ttl},
                {"fallback_cache", config_.fallback_cache_ttl},
                {"csv_fallback", "indefinite"}
            }}
        }}
    };
    logger_->info("Served " + endpoint + " (source: " + ProvenanceUtils::dataSource(entry.provenance) + ")");
    return makeJsonResponse(http::status::ok, body, req);
}

Vitify::Response Vitify::unavailableResponse(const std::string& endpoint,
                                             const std::map<std::string, std::string>& params,
                                             const Resolution& resolution,
                                             const Request& req) const {
    json body = {
        {"error", "Data temporarily unavailable"},
        {"message", "All data sources (web scraping, cache, and local files) are currently unavailable. Please try again later."},
        {"endpoint", endpoint},
        {"requested_params", paramsJson(params)},
        {"status", "data_unavailable"},
        {"attempts", resolution.attemptsJson()},
        {"troubleshooting", {
            {"retry_suggestion", "Try again in a few minutes"},
            {"alternative_years", "Try different year parameters"},
            {"contact_support", "If the issue persists, contact support"}
        }},
        {"system_status", systemStatus()},
        {"timestamp", Utils::formatUtc(std::chrono::system_clock::now())}
    };
    return makeJsonResponse(http::status::service_unavailable, body, req);
}

Vitify::Response Vitify::buildHeartbeatResponse(const Request& req) const {
    json body = {
        {"status", "healthy"},
        {"timestamp", Utils::formatUtc(std::chrono::system_clock::now())},
        {"redis", volatileStoreStatus()},
        {"csv_fallback", static_store_->directoryAvailable() ? "available" : "unavailable"}
    };
    return makeJsonResponse(http::status::ok, body, req);
}

Vitify::Response Vitify::buildCacheStatsResponse(const Request& req) const {
    if (auto denied = checkAuthorization(req)) {
        return std::move(*denied);
    }

    auto count = [this](const std::string& prefix) -> json {
        std::optional<long long> keys = store_->countByPrefix(prefix);
        if (!keys) {
            return nullptr;
        }
        return *keys;
    };

    const std::string store_status = volatileStoreStatus();
    json inventory = static_store_->validateInventory();
    const bool healthy = store_status != "disconnected" && inventory.value("overall_status", "invalid") == "valid";

    json body = {
        {"timestamp", Utils::formatUtc(std::chrono::system_clock::now())},
        {"tiers", coordinator_->statistics()->snapshot()},
        {"volatile_store", {
            {"backend", store_->name()},
            {"status", store_status},
            {"keys", {
                {"short_term", count(Constants::SHORT_CACHE_PREFIX)},
                {"fallback", count(Constants::FALLBACK_CACHE_PREFIX)}
            }},
            {"ttl_seconds", {
                {"short_term", config_.short_cache_ttl},
                {"fallback", config_.fallback_cache_ttl}
            }}
        }},
        {"static_cache", static_store_->cacheStats().to_json()},
        {"csv_validation", inventory},
        {"overall_status", {
            {"health", healthy ? "healthy" : "degraded"},
            {"resolution_order", {"short_term", "live_fetch", "fallback", "csv_fallback"}}
        }}
    };
    return makeJsonResponse(http::status::ok, body, req);
}

Vitify::Response Vitify::buildCacheClearResponse(const Request& req) const {
    if (auto denied = checkAuthorization(req)) {
        return std::move(*denied);
    }

    const auto query = splitTarget(req).second;
    std::string endpoint;
    std::string type = "all";
    if (auto it = query.find("endpoint"); it != query.end()) {
        endpoint = Utils::toLower(Utils::trim(it->second));
    }
    if (auto it = query.find("type"); it != query.end() && !Utils::trim(it->second).empty()) {
        type = Utils::toLower(Utils::trim(it->second));
    }

    if (!endpoint.empty() && EndpointCatalog::find(endpoint) == nullptr) {
        json body = {
            {"error", "Unknown endpoint '" + endpoint + "'"},
            {"allowed_values", {{"endpoint", EndpointCatalog::endpointNames()}}},
            {"status", "parameter_error"}
        };
        return makeJsonResponse(http::status::bad_request, body, req);
    }
    if (type != "short" && type != "fallback" && type != "all") {
        json body = {
            {"error", "Invalid type '" + type + "'"},
            {"allowed_values", {{"type", {"short", "fallback", "all"}}}},
            {"status", "parameter_error"}
        };
        return makeJsonResponse(http::status::bad_request, body, req);
    }

    const std::string scope = endpoint.empty() ? "" : endpoint + ":";
    std::vector<std::pair<std::string, std::string>> targets;
    if (type == "short" || type == "all") {
        targets.emplace_back("short_term", Constants::SHORT_CACHE_PREFIX + scope);
    }
    if (type == "fallback" || type == "all") {
        targets.emplace_back("fallback", Constants::FALLBACK_CACHE_PREFIX + scope);
    }

    json removed = json::object();
    long long total = 0;
    for (const auto& [tier, prefix] : targets) {
        std::optional<long long> count = store_->removeByPrefix(prefix);
        if (!count) {
            logger_->warn("Cache clear for " + prefix + "* failed: " + store_->name() + " unavailable");
            json body = {
                {"error", "Volatile store unavailable"},
                {"removed", removed},
                {"status", "store_unavailable"}
            };
            return makeJsonResponse(http::status::service_unavailable, body, req);
        }
        removed[tier] = *count;
        total += *count;
    }

    logger_->info("Cleared " + std::to_string(total) + " cache entries (endpoint=" +
                  (endpoint.empty() ? "all" : endpoint) + ", type=" + type + ")");
    json body = {
        {"status", "success"},
        {"endpoint", endpoint.empty() ? "all" : endpoint},
        {"type", type},
        {"removed", removed},
        {"total_removed", total}
    };
    return makeJsonResponse(http::status::ok, body, req);
}

json Vitify::systemStatus() const {
    std::string csv_status = "unavailable";
    if (static_store_->directoryAvailable()) {
        csv_status = static_store_->validateInventory().value("overall_status", "invalid");
    }
    return json{
        {"volatile_store", volatileStoreStatus()},
        {"csv_fallback_status", csv_status}
    };
}

// "disabled" when the process-local store stands in for Redis.
std::string Vitify::volatileStoreStatus() const {
    if (store_->name() != "redis") {
        return "disabled";
    }
    return store_->ping() ? "connected" : "disconnected";
}

Vitify::Response Vitify::makeJsonResponse(http::status status, const json& body, const Request& req) {
    Response res{status, req.version()};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "application/json; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}
