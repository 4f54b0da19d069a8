#include "redis_client.h"

#include "errors.h"

#include <hiredis.h>

#include <memory>

namespace drinkd {

namespace {

struct timeval to_timeval(int ms) {
  struct timeval tv;
  tv.tv_sec = ms / 1000;
  tv.tv_usec = (ms % 1000) * 1000;
  return tv;
}

struct ReplyDeleter {
  void operator()(redisReply* reply) const { freeReplyObject(reply); }
};
using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

}  // namespace

RedisOptions RedisOptions::FromOptions(const ResourceOptions& options) {
  RedisOptions out;
  out.host = option_string(options, "host", out.host);
  out.port = static_cast<int>(option_int(options, "port", out.port));
  out.db = static_cast<int>(option_int(options, "db", out.db));
  out.password = option_string(options, "password");
  out.connect_timeout_ms = static_cast<int>(
      option_int(options, "connect_timeout_ms", out.connect_timeout_ms));
  out.request_timeout_ms = static_cast<int>(
      option_int(options, "request_timeout_ms", out.request_timeout_ms));

  if (out.port <= 0 || out.port > 65535) {
    throw ConfigurationError("redis: port out of range: " +
                             std::to_string(out.port));
  }
  if (out.db < 0) {
    throw ConfigurationError("redis: db must be >= 0");
  }
  if (out.connect_timeout_ms <= 0 || out.request_timeout_ms <= 0) {
    throw ConfigurationError("redis: timeouts must be > 0");
  }
  return out;
}

RedisClient::RedisClient(RedisOptions options) : options_(std::move(options)) {}

RedisClient::~RedisClient() { disconnect(); }

void RedisClient::disconnect() {
  if (ctx_) {
    redisFree(ctx_);
    ctx_ = nullptr;
  }
}

void RedisClient::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnect();
}

bool RedisClient::connected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ctx_ != nullptr;
}

std::expected<void, std::string> RedisClient::ensure_connected() {
  if (ctx_ != nullptr) {
    return {};
  }

  ctx_ = redisConnectWithTimeout(options_.host.c_str(), options_.port,
                                 to_timeval(options_.connect_timeout_ms));
  if (ctx_ == nullptr) {
    return std::unexpected(std::string("redis: failed to allocate context"));
  }
  if (ctx_->err) {
    std::string error = "redis: connect failed: " + std::string(ctx_->errstr);
    disconnect();
    return std::unexpected(error);
  }

  if (redisSetTimeout(ctx_, to_timeval(options_.request_timeout_ms)) !=
      REDIS_OK) {
    disconnect();
    return std::unexpected(std::string("redis: failed to set timeout"));
  }

  if (options_.password) {
    ReplyPtr reply(static_cast<redisReply*>(
        redisCommand(ctx_, "AUTH %s", options_.password->c_str())));
    if (!reply || reply->type == REDIS_REPLY_ERROR) {
      std::string error = reply ? std::string(reply->str, reply->len)
                                : std::string(ctx_->errstr);
      disconnect();
      return std::unexpected("redis: AUTH failed: " + error);
    }
  }

  if (options_.db != 0) {
    ReplyPtr reply(
        static_cast<redisReply*>(redisCommand(ctx_, "SELECT %d", options_.db)));
    if (!reply || reply->type == REDIS_REPLY_ERROR) {
      std::string error = reply ? std::string(reply->str, reply->len)
                                : std::string(ctx_->errstr);
      disconnect();
      return std::unexpected("redis: SELECT failed: " + error);
    }
  }

  return {};
}

std::expected<void, std::string> RedisClient::ping() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto conn = ensure_connected(); !conn) {
    return std::unexpected(conn.error());
  }

  ReplyPtr reply(static_cast<redisReply*>(redisCommand(ctx_, "PING")));
  if (!reply) {
    std::string error = "redis: PING failed: " + std::string(ctx_->errstr);
    disconnect();  // Connection may be broken
    return std::unexpected(error);
  }
  if (reply->type != REDIS_REPLY_STATUS) {
    return std::unexpected("redis: PING unexpected reply type: " +
                           std::to_string(reply->type));
  }
  return {};
}

std::expected<std::optional<std::string>, std::string> RedisClient::get(
    const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto conn = ensure_connected(); !conn) {
    return std::unexpected(conn.error());
  }

  ReplyPtr reply(
      static_cast<redisReply*>(redisCommand(ctx_, "GET %b", key.data(),
                                            key.size())));
  if (!reply) {
    std::string error = "redis: GET failed: " + std::string(ctx_->errstr);
    disconnect();
    return std::unexpected(error);
  }

  switch (reply->type) {
    case REDIS_REPLY_NIL:
      return std::optional<std::string>{};
    case REDIS_REPLY_STRING:
      return std::optional<std::string>(std::string(reply->str, reply->len));
    case REDIS_REPLY_ERROR:
      return std::unexpected("redis: GET error: " +
                             std::string(reply->str, reply->len));
    default:
      return std::unexpected("redis: GET unexpected reply type: " +
                             std::to_string(reply->type));
  }
}

std::expected<void, std::string> RedisClient::setex(const std::string& key,
                                                    int64_t ttl_seconds,
                                                    const std::string& value) {
  if (ttl_seconds <= 0) {
    return std::unexpected(std::string("redis: SETEX ttl must be > 0"));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto conn = ensure_connected(); !conn) {
    return std::unexpected(conn.error());
  }

  ReplyPtr reply(static_cast<redisReply*>(
      redisCommand(ctx_, "SETEX %b %lld %b", key.data(), key.size(),
                   static_cast<long long>(ttl_seconds), value.data(),
                   value.size())));
  if (!reply) {
    std::string error = "redis: SETEX failed: " + std::string(ctx_->errstr);
    disconnect();
    return std::unexpected(error);
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    return std::unexpected("redis: SETEX error: " +
                           std::string(reply->str, reply->len));
  }
  return {};
}

std::expected<std::vector<std::string>, std::string> RedisClient::lrange(
    const std::string& key, int64_t start, int64_t stop) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto conn = ensure_connected(); !conn) {
    return std::unexpected(conn.error());
  }

  ReplyPtr reply(static_cast<redisReply*>(
      redisCommand(ctx_, "LRANGE %b %lld %lld", key.data(), key.size(),
                   static_cast<long long>(start),
                   static_cast<long long>(stop))));
  if (!reply) {
    std::string error = "redis: LRANGE failed: " + std::string(ctx_->errstr);
    disconnect();
    return std::unexpected(error);
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    return std::unexpected("redis: LRANGE error: " +
                           std::string(reply->str, reply->len));
  }
  if (reply->type != REDIS_REPLY_ARRAY) {
    return std::unexpected("redis: LRANGE unexpected reply type: " +
                           std::to_string(reply->type));
  }

  std::vector<std::string> result;
  result.reserve(reply->elements);
  for (size_t i = 0; i < reply->elements; ++i) {
    redisReply* elem = reply->element[i];
    if (elem->type == REDIS_REPLY_STRING || elem->type == REDIS_REPLY_STATUS) {
      result.emplace_back(elem->str, elem->len);
    } else {
      result.emplace_back("");  // nil -> empty string
    }
  }
  return result;
}

std::expected<std::unordered_map<std::string, std::string>, std::string>
RedisClient::hgetall(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto conn = ensure_connected(); !conn) {
    return std::unexpected(conn.error());
  }

  ReplyPtr reply(static_cast<redisReply*>(
      redisCommand(ctx_, "HGETALL %b", key.data(), key.size())));
  if (!reply) {
    std::string error = "redis: HGETALL failed: " + std::string(ctx_->errstr);
    disconnect();
    return std::unexpected(error);
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    return std::unexpected("redis: HGETALL error: " +
                           std::string(reply->str, reply->len));
  }
  // Field, value, field, value, ...
  if (reply->type != REDIS_REPLY_ARRAY || reply->elements % 2 != 0) {
    return std::unexpected(std::string("redis: HGETALL malformed reply"));
  }

  std::unordered_map<std::string, std::string> result;
  for (size_t i = 0; i < reply->elements; i += 2) {
    redisReply* field = reply->element[i];
    redisReply* value = reply->element[i + 1];
    std::string field_str;
    std::string value_str;
    if (field->type == REDIS_REPLY_STRING) {
      field_str.assign(field->str, field->len);
    }
    if (value->type == REDIS_REPLY_STRING) {
      value_str.assign(value->str, value->len);
    }
    result[std::move(field_str)] = std::move(value_str);
  }
  return result;
}

}  // namespace drinkd
