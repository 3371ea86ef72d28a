#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/CacheInterface.hpp"

// Forward declarations
struct redisContext;
struct redisReply;
class ILogger;

// Shared cache backed by Redis. A lost connection is logged and re-opened on
// the next command; until then calls report failure.
class RedisCache : public CacheInterface {
public:
    RedisCache(const AppConfig& config, std::shared_ptr<ILogger> logger);
    ~RedisCache() override;

    bool set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    std::optional<std::string> get(const std::string& key) override;
    bool remove(const std::string& key) override;
    bool exists(const std::string& key) override;

    bool isConnected();

private:
    struct ReplyDeleter {
        void operator()(redisReply* reply) const;
    };
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

    // Both expect mutex_ to be held.
    bool ensureConnected();
    ReplyPtr command(const char* description, const std::string& key, const char* format, ...);

    const std::string host_;
    const int port_;
    std::shared_ptr<ILogger> logger_;
    redisContext* redis_context_;
    std::mutex mutex_;

    RedisCache(const RedisCache&) = delete;
    RedisCache& operator=(const RedisCache&) = delete;
};
