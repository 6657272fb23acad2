#ifndef BOUNDEDRESULTCACHE_HPP
#define BOUNDEDRESULTCACHE_HPP

#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "../models/TableRecord.hpp"

using json = nlohmann::json;

struct BoundedResultCacheStats {
    size_t hits = 0;
    size_t misses = 0;
    size_t evictions = 0;
    size_t expired = 0;
    size_t size = 0;
    size_t capacity = 0;

    json to_json() const {
        return json{
            {"hits", hits},
            {"misses", misses},
            {"evictions", evictions},
            {"expired", expired},
            {"size", size},
            {"max_size", capacity}
        };
    }
};

// LRU cache of parsed records with a fixed TTL per entry. Expired entries are
// dropped when touched. Payloads are shared read-only; only the bookkeeping is locked.
class BoundedResultCache {
public:
    using Payload = std::shared_ptr<const TableRecord>;

    BoundedResultCache(size_t capacity, std::chrono::milliseconds ttl);

    // Empty pointer on miss or expiry.
    Payload get(const std::string& key);
    void put(const std::string& key, Payload payload);
    bool contains(const std::string& key) const;
    void clear();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    BoundedResultCacheStats stats() const;

private:
    struct Slot {
        Payload payload;
        std::chrono::steady_clock::time_point expiry;
        std::list<std::string>::iterator lru_position;
    };

    void eraseLocked(std::unordered_map<std::string, Slot>::iterator it);

    const size_t capacity_;
    const std::chrono::milliseconds ttl_;

    std::unordered_map<std::string, Slot> slots_;
    std::list<std::string> lru_list_;    // front = most recently used

    size_t hits_;
    size_t misses_;
    size_t evictions_;
    size_t expired_;

    mutable std::mutex mutex_;
};

#endif // BOUNDEDRESULTCACHE_HPP
