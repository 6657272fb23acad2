#include "BoundedResultCache.hpp"

using namespace std::chrono;

BoundedResultCache::BoundedResultCache(size_t capacity, milliseconds ttl)
    : capacity_(capacity > 0 ? capacity : 1), ttl_(ttl),
      hits_(0), misses_(0), evictions_(0), expired_(0) {}

BoundedResultCache::Payload BoundedResultCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = slots_.find(key);
    if (it == slots_.end()) {
        ++misses_;
        return nullptr;
    }
    if (it->second.expiry <= steady_clock::now()) {
        eraseLocked(it);
        ++expired_;
        ++misses_;
        return nullptr;
    }

    lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_position);
    ++hits_;
    return it->second.payload;
}

void BoundedResultCache::put(const std::string& key, Payload payload) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = slots_.find(key);
    if (it != slots_.end()) {
        it->second.payload = std::move(payload);
        it->second.expiry = steady_clock::now() + ttl_;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_position);
        return;
    }

    while (slots_.size() >= capacity_ && !lru_list_.empty()) {
        auto oldest = slots_.find(lru_list_.back());
        if (oldest == slots_.end()) {
            lru_list_.pop_back();
            continue;
        }
        eraseLocked(oldest);
        ++evictions_;
    }

    lru_list_.push_front(key);
    slots_.emplace(key, Slot{std::move(payload), steady_clock::now() + ttl_, lru_list_.begin()});
}

// Does not touch recency or counters
bool BoundedResultCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    return it != slots_.end() && it->second.expiry > steady_clock::now();
}

void BoundedResultCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.clear();
    lru_list_.clear();
}

size_t BoundedResultCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

BoundedResultCacheStats BoundedResultCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BoundedResultCacheStats snapshot;
    snapshot.hits = hits_;
    snapshot.misses = misses_;
    snapshot.evictions = evictions_;
    snapshot.expired = expired_;
    snapshot.size = slots_.size();
    snapshot.capacity = capacity_;
    return snapshot;
}

void BoundedResultCache::eraseLocked(std::unordered_map<std::string, Slot>::iterator it) {
    lru_list_.erase(it->second.lru_position);
    slots_.erase(it);
}
