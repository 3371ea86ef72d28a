#ifndef CACHEINTERFACE_HPP
#define CACHEINTERFACE_HPP

#include <chrono>
#include <optional>
#include <string>

// Key/value store with per-key expiry. Implementations report failures
// through return values rather than exceptions.
class CacheInterface {
public:
    virtual ~CacheInterface() = default;
    // Stores value under key; the entry expires ttl after this call.
    virtual bool set(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;
    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual bool remove(const std::string& key) = 0;
    virtual bool exists(const std::string& key) = 0;
};

#endif // CACHEINTERFACE_HPP
