#include <cstdarg>
#include <stdexcept>

#include <hiredis/hiredis.h>

#include "RedisCache.hpp"
#include "../interfaces/ILogger.hpp"

namespace {
    const struct timeval CONNECT_TIMEOUT = {1, 0};
}

void RedisCache::ReplyDeleter::operator()(redisReply* reply) const {
    if (reply) {
        freeReplyObject(reply);
    }
}

RedisCache::RedisCache(const AppConfig& config, std::shared_ptr<ILogger> logger)
    : host_(config.redis_host), port_(config.redis_port), logger_(logger), redis_context_(nullptr) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisCache");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ensureConnected();
}

RedisCache::~RedisCache() {
    if (redis_context_) {
        redisFree(redis_context_);
    }
}

bool RedisCache::ensureConnected() {
    if (redis_context_ && redis_context_->err == 0) {
        return true;
    }
    if (redis_context_) {
        logger_->warn("Redis connection lost (" + std::string(redis_context_->errstr) + "), reconnecting.");
        redisFree(redis_context_);
        redis_context_ = nullptr;
    }

    redis_context_ = redisConnectWithTimeout(host_.c_str(), port_, CONNECT_TIMEOUT);
    if (redis_context_ == nullptr || redis_context_->err) {
        std::string error_msg;
        if (redis_context_) {
            error_msg = "Redis connection error: " + std::string(redis_context_->errstr);
            redisFree(redis_context_);
            redis_context_ = nullptr;
        } else {
            error_msg = "Redis connection error: can't allocate redis context";
        }
        logger_->error(error_msg + " (" + host_ + ":" + std::to_string(port_) + ")");
        return false;
    }
    return true;
}

RedisCache::ReplyPtr RedisCache::command(const char* description, const std::string& key, const char* format, ...) {
    if (!ensureConnected()) {
        logger_->error(std::string("Redis not connected. Cannot ") + description + " key: " + key);
        return nullptr;
    }

    va_list args;
    va_start(args, format);
    ReplyPtr reply(static_cast<redisReply*>(redisvCommand(redis_context_, format, args)));
    va_end(args);

    if (!reply) {
        logger_->error(std::string("Redis ") + description + " failed for key " + key + ": " + redis_context_->errstr);
        return nullptr;
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        logger_->error(std::string("Redis ") + description + " error for key " + key + ": "
            + std::string(reply->str, reply->len));
        return nullptr;
    }
    return reply;
}

bool RedisCache::set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    if (ttl <= std::chrono::seconds::zero()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = command("SET", key, "SET %s %b EX %lld",
        key.c_str(), value.data(), value.size(), static_cast<long long>(ttl.count()));
    return reply != nullptr;
}

std::optional<std::string> RedisCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = command("GET", key, "GET %s", key.c_str());
    if (!reply || reply->type != REDIS_REPLY_STRING) {
        return std::nullopt;
    }
    return std::string(reply->str, reply->len);
}

bool RedisCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = command("DEL", key, "DEL %s", key.c_str());
    return reply && reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

bool RedisCache::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = command("EXISTS", key, "EXISTS %s", key.c_str());
    return reply && reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

bool RedisCache::isConnected() {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_context_ != nullptr && redis_context_->err == 0;
}
