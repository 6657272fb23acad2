#include "InMemoryStore.hpp"

using namespace std::chrono;

InMemoryStore::InMemoryStore(int default_ttl_seconds, size_t max_size)
    : default_ttl_seconds_(default_ttl_seconds), max_size_(max_size > 0 ? max_size : 1) {}

bool InMemoryStore::set(const std::string& key, const std::string& value, int ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);

    int effective_ttl = (ttl_seconds > 0) ? ttl_seconds : default_ttl_seconds_;
    StoredValue stored{value, steady_clock::now() + seconds(effective_ttl)};

    auto lru_it = lru_map_.find(key);
    if (lru_it != lru_map_.end()) {
        lru_list_.erase(lru_it->second);
    } else {
        evictIfNeededLocked();
    }

    store_[key] = std::move(stored);
    lru_list_.push_front(key);
    lru_map_[key] = lru_list_.begin();
    return true;
}

StoreLookup InMemoryStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = store_.find(key);
    if (it == store_.end()) {
        return StoreLookup{StoreStatus::MISS, ""};
    }
    if (it->second.expiry <= steady_clock::now()) {
        eraseLocked(key);
        return StoreLookup{StoreStatus::MISS, ""};
    }

    auto lru_it = lru_map_.find(key);
    if (lru_it != lru_map_.end()) {
        lru_list_.splice(lru_list_.begin(), lru_list_, lru_it->second);
    }
    return StoreLookup{StoreStatus::HIT, it->second.value};
}

bool InMemoryStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (store_.count(key) == 0) {
        return false;
    }
    eraseLocked(key);
    return true;
}

std::optional<long long> InMemoryStore::removeByPrefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    removeExpiredLocked();

    long long removed = 0;
    for (auto it = store_.begin(); it != store_.end(); ) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            auto lru_it = lru_map_.find(it->first);
            if (lru_it != lru_map_.end()) {
                lru_list_.erase(lru_it->second);
                lru_map_.erase(lru_it);
            }
            it = store_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::optional<long long> InMemoryStore::countByPrefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    removeExpiredLocked();

    long long count = 0;
    for (const auto& [key, stored] : store_) {
        if (key.compare(0, prefix.size(), prefix) == 0) {
            ++count;
        }
    }
    return count;
}

size_t InMemoryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.size();
}

// Callers hold mutex_
void InMemoryStore::eraseLocked(const std::string& key) {
    auto lru_it = lru_map_.find(key);
    if (lru_it != lru_map_.end()) {
        lru_list_.erase(lru_it->second);
        lru_map_.erase(lru_it);
    }
    store_.erase(key);
}

void InMemoryStore::removeExpiredLocked() {
    auto now = steady_clock::now();
    for (auto it = store_.begin(); it != store_.end(); ) {
        if (it->second.expiry <= now) {
            auto lru_it = lru_map_.find(it->first);
            if (lru_it != lru_map_.end()) {
                lru_list_.erase(lru_it->second);
                lru_map_.erase(lru_it);
            }
            it = store_.erase(it);
        } else {
            ++it;
        }
    }
}

void InMemoryStore::evictIfNeededLocked() {
    removeExpiredLocked();
    while (lru_map_.size() >= max_size_ && !lru_list_.empty()) {
        std::string oldest_key = lru_list_.back();
        lru_list_.pop_back();
        lru_map_.erase(oldest_key);
        store_.erase(oldest_key);
    }
}
