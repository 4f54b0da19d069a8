#pragma once

#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "driver_config.h"

// Forward declaration for hiredis
struct redisContext;

namespace drinkd {

struct RedisOptions {
  std::string host = "localhost";
  int port = 6379;
  int db = 0;
  std::optional<std::string> password;
  int connect_timeout_ms = 50;
  int request_timeout_ms = 20;

  // Read the "redis" option map. Throws ConfigurationError on bad values.
  static RedisOptions FromOptions(const ResourceOptions& options);
};

// Redis client wrapper using hiredis
// Uses std::expected for error handling (C++23)
class RedisClient {
 public:
  explicit RedisClient(RedisOptions options);
  ~RedisClient();

  RedisClient(const RedisClient&) = delete;
  RedisClient& operator=(const RedisClient&) = delete;

  // PING - true on PONG
  std::expected<void, std::string> ping();

  // GET key - nullopt when the key does not exist
  std::expected<std::optional<std::string>, std::string> get(
      const std::string& key);

  // SETEX key ttl value
  std::expected<void, std::string> setex(const std::string& key,
                                         int64_t ttl_seconds,
                                         const std::string& value);

  // LRANGE key start stop - get list elements
  std::expected<std::vector<std::string>, std::string> lrange(
      const std::string& key, int64_t start, int64_t stop);

  // HGETALL key - get all hash fields and values
  std::expected<std::unordered_map<std::string, std::string>, std::string>
  hgetall(const std::string& key);

  // Drop the connection; the next command reconnects.
  void close();

  bool connected() const;

  const RedisOptions& options() const { return options_; }

 private:
  // Lazy connect on first command; runs AUTH and SELECT when configured
  std::expected<void, std::string> ensure_connected();
  void disconnect();

  const RedisOptions options_;
  mutable std::mutex mutex_;
  redisContext* ctx_ = nullptr;
};

}  // namespace drinkd
