#include <sys/time.h>

#include <unordered_set>

#include <hiredis/hiredis.h>

#include "RedisStore.hpp"
#include "../interfaces/ILogger.hpp"

namespace {
    constexpr auto SCAN_BATCH = "200";
}

void RedisStore::ReplyDeleter::operator()(redisReply* reply) const {
    if (reply) {
        freeReplyObject(reply);
    }
}

RedisStore::RedisStore(const AppConfig& config, std::shared_ptr<ILogger> logger)
    : config_(config), logger_(logger), redis_context_(nullptr),
      next_connect_attempt_(std::chrono::steady_clock::now()) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectLocked();
}

RedisStore::~RedisStore() {
    if (redis_context_) {
        redisFree(redis_context_);
    }
}

bool RedisStore::connectLocked() {
    next_connect_attempt_ = std::chrono::steady_clock::now()
        + std::chrono::milliseconds(config_.redis_reconnect_interval_in_millis);

    struct timeval timeout;
    timeout.tv_sec = config_.redis_connect_timeout_in_millis / 1000;
    timeout.tv_usec = (config_.redis_connect_timeout_in_millis % 1000) * 1000;

    redis_context_ = redisConnectWithTimeout(config_.redis_host.c_str(), config_.redis_port, timeout);
    if (redis_context_ == nullptr || redis_context_->err) {
        std::string error_msg;
        if (redis_context_) {
            error_msg = "Redis connection error: " + std::string(redis_context_->errstr);
            redisFree(redis_context_);
            redis_context_ = nullptr;
        } else {
            error_msg = "Redis connection error: can't allocate redis context";
        }
        logger_->error(error_msg);
        return false;
    }
    redisSetTimeout(redis_context_, timeout);

    if (!config_.redis_password.empty()) {
        ReplyPtr reply(static_cast<redisReply*>(
            redisCommand(redis_context_, "AUTH %s", config_.redis_password.c_str())));
        if (!reply || reply->type == REDIS_REPLY_ERROR) {
            dropConnectionLocked("AUTH rejected");
            return false;
        }
    }
    if (config_.redis_db != 0) {
        ReplyPtr reply(static_cast<redisReply*>(
            redisCommand(redis_context_, "SELECT %d", config_.redis_db)));
        if (!reply || reply->type == REDIS_REPLY_ERROR) {
            dropConnectionLocked("SELECT " + std::to_string(config_.redis_db) + " rejected");
            return false;
        }
    }

    logger_->info("Connected to Redis at " + config_.redis_host + ":" + std::to_string(config_.redis_port)
                  + " db " + std::to_string(config_.redis_db));
    return true;
}

bool RedisStore::ensureConnectedLocked() {
    if (redis_context_) {
        return true;
    }
    if (std::chrono::steady_clock::now() < next_connect_attempt_) {
        return false;
    }
    return connectLocked();
}

void RedisStore::dropConnectionLocked(const std::string& reason) {
    logger_->warn("Redis unavailable: " + reason);
    if (redis_context_) {
        redisFree(redis_context_);
        redis_context_ = nullptr;
    }
}

RedisStore::ReplyPtr RedisStore::executeLocked(const std::vector<std::string>& args) {
    if (!ensureConnectedLocked()) {
        return ReplyPtr();
    }

    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
        argvlen.push_back(arg.size());
    }

    ReplyPtr reply(static_cast<redisReply*>(
        redisCommandArgv(redis_context_, static_cast<int>(argv.size()), argv.data(), argvlen.data())));
    if (!reply) {
        // hiredis leaves the context unusable after an I/O error
        std::string reason = redis_context_->err ? std::string(redis_context_->errstr) : "no reply";
        dropConnectionLocked(args.front() + " failed: " + reason);
        return ReplyPtr();
    }
    return reply;
}

StoreLookup RedisStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReplyPtr reply = executeLocked({"GET", key});
    if (!reply) {
        return StoreLookup{StoreStatus::UNAVAILABLE, ""};
    }

    if (reply->type == REDIS_REPLY_STRING) {
        return StoreLookup{StoreStatus::HIT, std::string(reply->str, reply->len)};
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        logger_->error("Redis GET error for key " + key + ": " + std::string(reply->str, reply->len));
        return StoreLookup{StoreStatus::UNAVAILABLE, ""};
    }
    return StoreLookup{StoreStatus::MISS, ""};
}

bool RedisStore::set(const std::string& key, const std::string& value, int ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReplyPtr reply = ttl_seconds > 0
        ? executeLocked({"SETEX", key, std::to_string(ttl_seconds), value})
        : executeLocked({"SET", key, value});
    if (!reply) {
        return false;
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        logger_->error("Redis SET error for key " + key + ": " + std::string(reply->str, reply->len));
        return false;
    }
    return true;
}

bool RedisStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReplyPtr reply = executeLocked({"DEL", key});
    return reply && reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

std::string RedisStore::globEscape(const std::string& prefix) {
    std::string escaped;
    for (char c : prefix) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

// Walks the keys under prefix one SCAN page at a time. The mutex is held per page
// only, so get/set from request handlers interleave with a long walk.
std::optional<long long> RedisStore::scanByPrefix(const std::string& prefix, bool unlink_keys) {
    const std::string pattern = globEscape(prefix) + "*";
    std::unordered_set<std::string> seen;
    long long removed = 0;
    std::string cursor = "0";
    do {
        std::lock_guard<std::mutex> lock(mutex_);
        ReplyPtr reply = executeLocked({"SCAN", cursor, "MATCH", pattern, "COUNT", SCAN_BATCH});
        if (!reply || reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
            return std::nullopt;
        }
        redisReply* next_cursor = reply->element[0];
        redisReply* batch = reply->element[1];
        cursor.assign(next_cursor->str, next_cursor->len);

        std::vector<std::string> page;
        page.reserve(batch->elements + 1);
        if (unlink_keys) {
            page.emplace_back("UNLINK");
        }
        for (size_t i = 0; i < batch->elements; ++i) {
            std::string key(batch->element[i]->str, batch->element[i]->len);
            // SCAN may hand back a key more than once
            if (seen.insert(key).second) {
                page.push_back(std::move(key));
            }
        }

        if (unlink_keys && page.size() > 1) {
            ReplyPtr unlinked = executeLocked(page);
            if (!unlinked) {
                return std::nullopt;
            }
            if (unlinked->type == REDIS_REPLY_INTEGER) {
                removed += unlinked->integer;
            } else if (unlinked->type == REDIS_REPLY_ERROR) {
                logger_->error("Redis UNLINK error: " + std::string(unlinked->str, unlinked->len));
                return std::nullopt;
            }
        }
    } while (cursor != "0");
    return unlink_keys ? removed : static_cast<long long>(seen.size());
}

std::optional<long long> RedisStore::removeByPrefix(const std::string& prefix) {
    return scanByPrefix(prefix, true);
}

std::optional<long long> RedisStore::countByPrefix(const std::string& prefix) {
    return scanByPrefix(prefix, false);
}

bool RedisStore::ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    ReplyPtr reply = executeLocked({"PING"});
    return reply && reply->type != REDIS_REPLY_ERROR;
}

bool RedisStore::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_context_ != nullptr;
}
