#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"
#include "../interfaces/IVolatileStore.hpp"

// Forward declarations
struct redisContext;
struct redisReply;
class ILogger;

// Redis-backed volatile store. A failed connection or command marks the store
// unavailable; the next call after the reconnect interval tries again.
class RedisStore : public IVolatileStore {
public:
    explicit RedisStore(const AppConfig& config, std::shared_ptr<ILogger> logger);
    ~RedisStore() override;

    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    StoreLookup get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value, int ttl_seconds) override;
    bool remove(const std::string& key) override;
    std::optional<long long> removeByPrefix(const std::string& prefix) override;
    std::optional<long long> countByPrefix(const std::string& prefix) override;
    bool ping() override;
    std::string name() const override { return "redis"; }

    bool isConnected() const;

private:
    struct ReplyDeleter {
        void operator()(redisReply* reply) const;
    };
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

    bool ensureConnectedLocked();
    bool connectLocked();
    void dropConnectionLocked(const std::string& reason);
    ReplyPtr executeLocked(const std::vector<std::string>& args);
    std::optional<long long> scanByPrefix(const std::string& prefix, bool unlink_keys);

    static std::string globEscape(const std::string& prefix);

    const AppConfig& config_;
    std::shared_ptr<ILogger> logger_;
    redisContext* redis_context_;
    std::chrono::steady_clock::time_point next_connect_attempt_;
    mutable std::mutex mutex_;
};
