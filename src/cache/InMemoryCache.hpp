#ifndef INMEMORYCACHE_HPP
#define INMEMORYCACHE_HPP

#include <chrono>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "../interfaces/CacheInterface.hpp"

// Process-local cache: LRU-bounded, each entry expires independently.
class InMemoryCache : public CacheInterface {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit InMemoryCache(size_t max_size = 10000,
                           Clock clock = [] { return std::chrono::steady_clock::now(); });
    ~InMemoryCache() override = default;

    bool set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    std::optional<std::string> get(const std::string& key) override;
    bool remove(const std::string& key) override;
    bool exists(const std::string& key) override;

    size_t size() const;

private:
    struct CacheEntry {
        std::string value;
        std::chrono::steady_clock::time_point expiry;
        std::list<std::string>::iterator lru_position;
    };

    // Callers hold mutex_.
    void removeExpired(std::chrono::steady_clock::time_point now);
    void evictIfNeeded();
    void erase(std::unordered_map<std::string, CacheEntry>::iterator it);

    std::unordered_map<std::string, CacheEntry> cache_;
    std::list<std::string> lru_list_; // front = most recently used

    mutable std::mutex mutex_;
    const size_t max_size_;
    Clock clock_;
};

#endif // INMEMORYCACHE_HPP
