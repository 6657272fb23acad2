#ifndef TIEREDCACHECOORDINATOR_HPP
#define TIEREDCACHECOORDINATOR_HPP

#include <array>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "CacheStatistics.hpp"
#include "../cache/StaticFallbackStore.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../interfaces/IVolatileStore.hpp"
#include "../models/CacheEntry.hpp"
#include "../models/FetchResult.hpp"

using json = nlohmann::json;

// Tiers in the order they are consulted.
enum class ResolutionStep {
    SHORT_TERM,
    LIVE_FETCH,
    LONG_TERM,
    STATIC_FALLBACK
};

enum class AttemptOutcome {
    HIT,
    MISS,
    UNAVAILABLE,
    FAILED
};

struct TierAttempt {
    ResolutionStep step;
    AttemptOutcome outcome;
    std::string detail;

    json to_json() const;
};

// Either an entry or, when every tier missed, only the attempt trace.
struct Resolution {
    std::optional<CacheEntry> entry;
    std::vector<TierAttempt> attempts;
    std::string cache_key;

    bool ok() const { return entry.has_value(); }
    json attemptsJson() const;
};

class TieredCacheCoordinator {
public:
    using FetchFunction = std::function<FetchResult()>;

    static constexpr std::array<ResolutionStep, 4> RESOLUTION_ORDER = {
        ResolutionStep::SHORT_TERM,
        ResolutionStep::LIVE_FETCH,
        ResolutionStep::LONG_TERM,
        ResolutionStep::STATIC_FALLBACK
    };

    TieredCacheCoordinator(std::shared_ptr<IVolatileStore> store,
                           std::shared_ptr<StaticFallbackStore> static_store,
                           std::shared_ptr<CacheStatistics> statistics,
                           const AppConfig& config,
                           std::shared_ptr<ILogger> logger,
                           std::shared_ptr<IStatsDClient> statsd_client);

    // Never throws for store or fetch failures; exhaustion is a Resolution without entry.
    Resolution resolve(const std::string& endpoint,
                       const std::map<std::string, std::string>& params,
                       const FetchFunction& fetch);

    // Volatile tier value: {"data": <record>, "timestamp": "<UTC>", "cached": true}
    static std::string encodePayload(const TableRecord& record, std::chrono::system_clock::time_point stored_at);
    static std::optional<std::pair<TableRecord, std::chrono::system_clock::time_point>> decodePayload(const std::string& value);

    static std::string stepName(ResolutionStep step);
    static std::string outcomeName(AttemptOutcome outcome);

    std::shared_ptr<CacheStatistics> statistics() const { return statistics_; }

private:
    std::optional<CacheEntry> readVolatileTier(ResolutionStep step, const std::string& key, Resolution& resolution);
    std::optional<CacheEntry> runLiveFetch(const std::string& key, const FetchFunction& fetch, Resolution& resolution);
    std::optional<CacheEntry> readStaticFallback(const std::string& endpoint,
                                                 const std::map<std::string, std::string>& params,
                                                 Resolution& resolution);
    void warmVolatileTiers(const std::string& key, const CacheEntry& entry);

    std::shared_ptr<IVolatileStore> store_;
    std::shared_ptr<StaticFallbackStore> static_store_;
    std::shared_ptr<CacheStatistics> statistics_;
    const AppConfig& config_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
};

#endif // TIEREDCACHECOORDINATOR_HPP
