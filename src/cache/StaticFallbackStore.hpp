#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "BoundedResultCache.hpp"
#include "../models/TableRecord.hpp"

using json = nlohmann::json;

class ILogger;

// Read-only last-resort tier backed by CSV snapshots in a local directory.
// Parsed tables are kept in a BoundedResultCache keyed by (endpoint, sub-option).
class StaticFallbackStore {
public:
    StaticFallbackStore(std::string directory,
                        size_t max_cache_size,
                        std::chrono::milliseconds cache_ttl,
                        std::shared_ptr<ILogger> logger);

    // Empty pointer for unknown endpoints and for missing or unusable files.
    std::shared_ptr<const TableRecord> lookup(const std::string& endpoint,
                                              const std::optional<std::string>& sub_option);

    // {"overall_status": "valid" | "partial" | "invalid", "endpoints": {...}, ...}
    json validateInventory() const;

    bool directoryAvailable() const;
    BoundedResultCacheStats cacheStats() const;
    void clearCache();
    const std::string& directory() const { return directory_; }

private:
    std::string pathFor(const std::string& file_name) const;

    const std::string directory_;
    BoundedResultCache cache_;
    std::shared_ptr<ILogger> logger_;
};
