#ifndef INMEMORYSTORE_HPP
#define INMEMORYSTORE_HPP

#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "../interfaces/IVolatileStore.hpp"

// Process-local stand-in for Redis when use_redis=0. Never reports UNAVAILABLE.
class InMemoryStore : public IVolatileStore {
private:
    struct StoredValue {
        std::string value;
        std::chrono::time_point<std::chrono::steady_clock> expiry;
    };

    std::unordered_map<std::string, StoredValue> store_;  // key -> {value, expiry}
    std::list<std::string> lru_list_;                     // front = most recent
    std::unordered_map<std::string, std::list<std::string>::iterator> lru_map_;

    mutable std::mutex mutex_;
    const int default_ttl_seconds_;
    const size_t max_size_;

    void removeExpiredLocked();
    void eraseLocked(const std::string& key);
    void evictIfNeededLocked();

public:
    explicit InMemoryStore(int default_ttl_seconds = 3600 * 24, size_t max_size = 10000);
    ~InMemoryStore() override = default;

    StoreLookup get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value, int ttl_seconds) override;
    bool remove(const std::string& key) override;
    std::optional<long long> removeByPrefix(const std::string& prefix) override;
    std::optional<long long> countByPrefix(const std::string& prefix) override;
    bool ping() override { return true; }
    std::string name() const override { return "in_memory"; }

    size_t size() const;
};

#endif // INMEMORYSTORE_HPP
