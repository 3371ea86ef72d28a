#include "InMemoryCache.hpp"

#include <stdexcept>
#include <utility>

using namespace std::chrono;

InMemoryCache::InMemoryCache(size_t max_size, Clock clock)
    : max_size_(max_size), clock_(std::move(clock)) {
    if (max_size_ == 0) {
        throw std::invalid_argument("InMemoryCache max_size must be positive");
    }
    if (!clock_) {
        throw std::invalid_argument("InMemoryCache clock cannot be empty");
    }
}

bool InMemoryCache::set(const std::string& key, const std::string& value, seconds ttl) {
    if (ttl <= seconds::zero()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();

    auto it = cache_.find(key);
    if (it != cache_.end()) {
        it->second.value = value;
        it->second.expiry = now + ttl;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_position);
        return true;
    }

    removeExpired(now);
    evictIfNeeded();

    lru_list_.push_front(key);
    cache_.emplace(key, CacheEntry{value, now + ttl, lru_list_.begin()});
    return true;
}

std::optional<std::string> InMemoryCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    if (it->second.expiry <= clock_()) {
        erase(it);
        return std::nullopt;
    }

    lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_position);
    return it->second.value;
}

bool InMemoryCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return false;
    }
    erase(it);
    return true;
}

bool InMemoryCache::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    return it != cache_.end() && it->second.expiry > clock_();
}

size_t InMemoryCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

void InMemoryCache::removeExpired(steady_clock::time_point now) {
    for (auto it = cache_.begin(); it != cache_.end(); ) {
        if (it->second.expiry <= now) {
            lru_list_.erase(it->second.lru_position);
            it = cache_.erase(it);
        } else {
            ++it;
        }
    }
}

void InMemoryCache::evictIfNeeded() {
    while (cache_.size() >= max_size_ && !lru_list_.empty()) {
        cache_.erase(lru_list_.back());
        lru_list_.pop_back();
    }
}

void InMemoryCache::erase(std::unordered_map<std::string, CacheEntry>::iterator it) {
    lru_list_.erase(it->second.lru_position);
    cache_.erase(it);
}
