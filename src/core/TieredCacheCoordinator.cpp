#include <stdexcept>

#include "TieredCacheCoordinator.hpp"
#include "KeyBuilder.hpp"
#include "../utils/Utils.hpp"

json TierAttempt::to_json() const {
    json attempt = {
        {"tier", TieredCacheCoordinator::stepName(step)},
        {"outcome", TieredCacheCoordinator::outcomeName(outcome)}
    };
    if (!detail.empty()) {
        attempt["detail"] = detail;
    }
    return attempt;
}

json Resolution::attemptsJson() const {
    json list = json::array();
    for (const auto& attempt : attempts) {
        list.push_back(attempt.to_json());
    }
    return list;
}

TieredCacheCoordinator::TieredCacheCoordinator(std::shared_ptr<IVolatileStore> store,
                                               std::shared_ptr<StaticFallbackStore> static_store,
                                               std::shared_ptr<CacheStatistics> statistics,
                                               const AppConfig& config,
                                               std::shared_ptr<ILogger> logger,
                                               std::shared_ptr<IStatsDClient> statsd_client)
    : store_(store),
      static_store_(static_store),
      statistics_(statistics),
      config_(config),
      logger_(logger),
      statsd_client_(statsd_client) {
    if (!store_) {
        throw std::invalid_argument("Volatile store pointer cannot be null");
    }
    if (!static_store_) {
        throw std::invalid_argument("Static fallback store pointer cannot be null");
    }
    if (!statistics_) {
        throw std::invalid_argument("Statistics pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient pointer cannot be null");
    }
}

Resolution TieredCacheCoordinator::resolve(const std::string& endpoint,
                                           const std::map<std::string, std::string>& params,
                                           const FetchFunction& fetch) {
    const auto started = std::chrono::steady_clock::now();
    Resolution resolution;
    resolution.cache_key = KeyBuilder::buildKey(endpoint, params);

    for (ResolutionStep step : RESOLUTION_ORDER) {
        std::optional<CacheEntry> entry;
        switch (step) {
            case ResolutionStep::SHORT_TERM:
            case ResolutionStep::LONG_TERM:
                entry = readVolatileTier(step, resolution.cache_key, resolution);
                break;
            case ResolutionStep::LIVE_FETCH:
                entry = runLiveFetch(resolution.cache_key, fetch, resolution);
                break;
            case ResolutionStep::STATIC_FALLBACK:
                entry = readStaticFallback(endpoint, params, resolution);
                break;
        }
        if (entry) {
            resolution.entry = std::move(entry);
            break;
        }
    }

    statsd_client_->timing(MetricsDefinitions::RESOLVE_TIME,
                           std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started));

    if (resolution.ok()) {
        logger_->info("Resolved " + endpoint + " from " + ProvenanceUtils::toString(resolution.entry->provenance));
    } else {
        CacheStatistics::bump(statistics_->unavailable_outcomes);
        statsd_client_->increment(MetricsDefinitions::DATA_UNAVAILABLE);
        logger_->error("All tiers exhausted for " + endpoint + " (" + resolution.cache_key + "): " + resolution.attemptsJson().dump());
    }
    return resolution;
}

std::optional<CacheEntry> TieredCacheCoordinator::readVolatileTier(ResolutionStep step,
                                                                   const std::string& key,
                                                                   Resolution& resolution) {
    const bool short_term = step == ResolutionStep::SHORT_TERM;
    const std::string full_key = (short_term ? Constants::SHORT_CACHE_PREFIX : Constants::FALLBACK_CACHE_PREFIX) + key;
    auto& hits = short_term ? statistics_->short_term_hits : statistics_->long_term_hits;
    auto& misses = short_term ? statistics_->short_term_misses : statistics_->long_term_misses;
    const std::string& hit_metric = short_term ? MetricsDefinitions::SHORT_TERM_HIT : MetricsDefinitions::LONG_TERM_HIT;
    const std::string& miss_metric = short_term ? MetricsDefinitions::SHORT_TERM_MISS : MetricsDefinitions::LONG_TERM_MISS;

    StoreLookup lookup = store_->get(full_key);
    if (lookup.status == StoreStatus::UNAVAILABLE) {
        CacheStatistics::bump(misses);
        CacheStatistics::bump(statistics_->store_unavailable);
        statsd_client_->increment(miss_metric);
        logger_->warn("Volatile store " + store_->name() + " unavailable reading " + full_key);
        resolution.attempts.push_back({step, AttemptOutcome::UNAVAILABLE, store_->name() + " unavailable"});
        return std::nullopt;
    }
    if (lookup.status == StoreStatus::MISS) {
        CacheStatistics::bump(misses);
        statsd_client_->increment(miss_metric);
        resolution.attempts.push_back({step, AttemptOutcome::MISS, ""});
        return std::nullopt;
    }

    auto decoded = decodePayload(lookup.value);
    if (!decoded) {
        CacheStatistics::bump(misses);
        CacheStatistics::bump(statistics_->corrupt_payloads);
        statsd_client_->increment(miss_metric);
        logger_->warn("Discarding undecodable payload under " + full_key);
        resolution.attempts.push_back({step, AttemptOutcome::MISS, "corrupt payload"});
        return std::nullopt;
    }

    CacheStatistics::bump(hits);
    statsd_client_->increment(hit_metric);
    resolution.attempts.push_back({step, AttemptOutcome::HIT, ""});
    return CacheEntry{
        std::make_shared<const TableRecord>(std::move(decoded->first)),
        short_term ? Provenance::SHORT_TERM : Provenance::LONG_TERM,
        decoded->second
    };
}

std::optional<CacheEntry> TieredCacheCoordinator::runLiveFetch(const std::string& key,
                                                               const FetchFunction& fetch,
                                                               Resolution& resolution) {
    FetchResult result = fetch ? fetch() : FetchResult::failure(FetchErrorKind::NETWORK, "no fetcher configured");
    if (!result.ok()) {
        std::string detail = result.error ? result.error->to_string() : "fetch returned no record";
        CacheStatistics::bump(statistics_->fetch_failures);
        statsd_client_->increment(MetricsDefinitions::LIVE_FETCH_FAILURE);
        logger_->error("Live fetch failed for " + key + ": " + detail);
        resolution.attempts.push_back({ResolutionStep::LIVE_FETCH, AttemptOutcome::FAILED, detail});
        return std::nullopt;
    }

    CacheStatistics::bump(statistics_->fetch_successes);
    statsd_client_->increment(MetricsDefinitions::LIVE_FETCH_SUCCESS);
    resolution.attempts.push_back({ResolutionStep::LIVE_FETCH, AttemptOutcome::HIT, ""});

    CacheEntry entry{result.record, Provenance::FRESH, std::chrono::system_clock::now()};
    warmVolatileTiers(key, entry);
    return entry;
}

void TieredCacheCoordinator::warmVolatileTiers(const std::string& key, const CacheEntry& entry) {
    const std::string value = encodePayload(*entry.payload, entry.stored_at);
    const std::pair<std::string, int> writes[] = {
        {Constants::SHORT_CACHE_PREFIX + key, config_.short_cache_ttl},
        {Constants::FALLBACK_CACHE_PREFIX + key, config_.fallback_cache_ttl}
    };
    for (const auto& [full_key, ttl] : writes) {
        if (!store_->set(full_key, value, ttl)) {
            CacheStatistics::bump(statistics_->store_write_failures);
            logger_->warn("Could not write " + full_key + " to " + store_->name());
        }
    }
}

std::optional<CacheEntry> TieredCacheCoordinator::readStaticFallback(const std::string& endpoint,
                                                                     const std::map<std::string, std::string>& params,
                                                                     Resolution& resolution) {
    const auto normalized = KeyBuilder::normalizeParams(endpoint, params);
    auto sub_option_it = normalized.find("sub_option");
    std::optional<std::string> sub_option;
    if (sub_option_it != normalized.end()) {
        sub_option = sub_option_it->second;
    }

    auto record = static_store_->lookup(endpoint, sub_option);
    if (!record) {
        CacheStatistics::bump(statistics_->static_misses);
        statsd_client_->increment(MetricsDefinitions::STATIC_FALLBACK_MISS);
        resolution.attempts.push_back({ResolutionStep::STATIC_FALLBACK, AttemptOutcome::MISS,
                                       "no usable snapshot in " + static_store_->directory()});
        return std::nullopt;
    }

    CacheStatistics::bump(statistics_->static_hits);
    statsd_client_->increment(MetricsDefinitions::STATIC_FALLBACK_HIT);
    resolution.attempts.push_back({ResolutionStep::STATIC_FALLBACK, AttemptOutcome::HIT, ""});
    return CacheEntry{record, Provenance::STATIC_FALLBACK, std::chrono::system_clock::now()};
}

std::string TieredCacheCoordinator::encodePayload(const TableRecord& record,
                                                  std::chrono::system_clock::time_point stored_at) {
    json value = {
        {"data", record},
        {"timestamp", Utils::formatUtc(stored_at)},
        {"cached", true}
    };
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<std::pair<TableRecord, std::chrono::system_clock::time_point>>
TieredCacheCoordinator::decodePayload(const std::string& value) {
    json parsed = json::parse(value, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("data") || !parsed["data"].is_object()) {
        return std::nullopt;
    }

    TableRecord record;
    try {
        record = parsed["data"].get<TableRecord>();
    } catch (const json::exception&) {
        return std::nullopt;
    }

    auto stored_at = std::chrono::system_clock::now();
    if (parsed.contains("timestamp") && parsed["timestamp"].is_string()) {
        if (auto ts = Utils::parseUtc(parsed["timestamp"].get<std::string>())) {
            stored_at = *ts;
        }
    }
    return std::make_pair(std::move(record), stored_at);
}

std::string TieredCacheCoordinator::stepName(ResolutionStep step) {
    switch (step) {
        case ResolutionStep::SHORT_TERM: return "short_term";
        case ResolutionStep::LIVE_FETCH: return "live_fetch";
        case ResolutionStep::LONG_TERM: return "fallback";
        case ResolutionStep::STATIC_FALLBACK: return "csv_fallback";
    }
    return "unknown";
}

std::string TieredCacheCoordinator::outcomeName(AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::HIT: return "hit";
        case AttemptOutcome::MISS: return "miss";
        case AttemptOutcome::UNAVAILABLE: return "unavailable";
        case AttemptOutcome::FAILED: return "failed";
    }
    return "unknown";
}
