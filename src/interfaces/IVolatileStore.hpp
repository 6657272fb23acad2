#pragma once

#include <optional>
#include <string>

// Outcome of a lookup against a volatile key-value store.
enum class StoreStatus {
    HIT,
    MISS,
    UNAVAILABLE
};

struct StoreLookup {
    StoreStatus status = StoreStatus::MISS;
    std::string value;

    bool hit() const { return status == StoreStatus::HIT; }
};

// Shared key-value store with per-key expiry. Both cache tiers live in one store,
// separated by key prefix. Implementations must be safe to call from many threads.
class IVolatileStore {
public:
    virtual ~IVolatileStore() = default;

    virtual StoreLookup get(const std::string& key) = 0;
    virtual bool set(const std::string& key, const std::string& value, int ttl_seconds) = 0;
    virtual bool remove(const std::string& key) = 0;

    // Both return std::nullopt when the store cannot be reached.
    virtual std::optional<long long> removeByPrefix(const std::string& prefix) = 0;
    virtual std::optional<long long> countByPrefix(const std::string& prefix) = 0;

    virtual bool ping() = 0;
    virtual std::string name() const = 0;
};
