#include "drivers.h"

#include "errors.h"
#include "logging.h"
#include "mongo_client.h"
#include "resource_container.h"

namespace drinkd {

namespace {

constexpr long kHealthCheckTimeoutMs = 5000;

}  // namespace

// =====================================================
// httpx
// =====================================================

std::shared_ptr<HttpClient> HttpxDriver::initialize(
    const ResourceOptions& options) {
  auto http = HttpOptions::FromOptions(options);
  get_logger("httpx")->info(
      "Creating HTTP client (timeout {}s, max_connections {}, max_keepalive {})",
      http.timeout_s, http.max_connections, http.max_keepalive);
  return std::make_shared<HttpClient>(std::move(http));
}

void HttpxDriver::cleanup(HttpClient& instance) {
  instance.close();
  get_logger("httpx")->info("HTTP client closed");
}

bool HttpxDriver::health_check(HttpClient& instance) {
  auto log = get_logger("httpx");
  for (const auto& url : instance.options().health_check_urls) {
    HttpRequest request;
    request.url = url;
    request.timeout_ms = kHealthCheckTimeoutMs;
    auto response = instance.send(request);
    if (response && response->status == 200) {
      log->debug("Health check passed via {}", url);
      return true;
    }
    log->debug("Health check via {} failed: {}", url,
               response ? "status " + std::to_string(response->status)
                        : response.error());
  }
  log->warn("All health check URLs failed");
  return false;
}

// =====================================================
// storage
// =====================================================

std::shared_ptr<StorageClient> StorageDriver::initialize(
    const ResourceOptions& options) {
  auto storage = StorageOptions::FromOptions(options);
  auto log = get_logger("storage");
  log->info("Initializing storage client: {} (default_bucket: {})",
            storage.project, storage.default_bucket.value_or("none"));

  auto client = std::make_shared<StorageClient>(std::move(storage));
  auto buckets = client->list_buckets();
  if (buckets) {
    log->debug("Connection test successful (found {} buckets)",
               buckets->size());
  } else {
    log->warn("Connectivity test failed (this may be normal): {}",
              buckets.error());
  }
  return client;
}

void StorageDriver::cleanup(StorageClient& instance) {
  instance.close();
  get_logger("storage")->info("Storage client closed");
}

bool StorageDriver::health_check(StorageClient& instance) {
  auto buckets = instance.list_buckets();
  if (!buckets) {
    get_logger("storage")->debug("Health check failed: {}", buckets.error());
    return false;
  }
  return true;
}

// =====================================================
// mongo
// =====================================================

std::shared_ptr<DocumentStore> MongoDriver::initialize(
    const ResourceOptions& options) {
  auto mongo = MongoOptions::FromOptions(options);
  auto log = get_logger("mongo");
  log->info("Connecting to document store at {} (database: {})",
            mongo.endpoint(), mongo.database.value_or("test"));

  auto client = std::make_shared<MongoClient>(std::move(mongo));
  auto pong = client->try_ping();
  if (!pong) {
    client->close();
    throw InitializationError("mongo: ping failed: " + pong.error());
  }
  log->info("Document store connection established");
  return client;
}

void MongoDriver::cleanup(DocumentStore& instance) {
  instance.close();
  get_logger("mongo")->info("Document store connection closed");
}

bool MongoDriver::health_check(DocumentStore& instance) {
  return instance.ping();
}

// =====================================================
// redis
// =====================================================

std::shared_ptr<RedisClient> RedisDriver::initialize(
    const ResourceOptions& options) {
  auto redis = RedisOptions::FromOptions(options);
  get_logger("redis")->info("Connecting to redis at {}:{} (db {})", redis.host,
                            redis.port, redis.db);

  auto client = std::make_shared<RedisClient>(std::move(redis));
  if (auto pong = client->ping(); !pong) {
    throw InitializationError(pong.error());
  }
  return client;
}

void RedisDriver::cleanup(RedisClient& instance) {
  instance.close();
  get_logger("redis")->info("Redis connection closed");
}

bool RedisDriver::health_check(RedisClient& instance) {
  return instance.ping().has_value();
}

void register_default_drivers(ResourceContainer& container) {
  const auto& config = container.config();
  auto log = get_logger("container");

  if (config.enabled("httpx")) {
    container.register_driver<HttpClient>("httpx",
                                          std::make_shared<HttpxDriver>());
  }
  if (config.enabled("storage")) {
    container.register_driver<StorageClient>("storage",
                                             std::make_shared<StorageDriver>());
  }
  if (config.enabled("mongo")) {
    container.register_driver<DocumentStore>("mongo",
                                             std::make_shared<MongoDriver>());
  }
  if (config.enabled("redis")) {
    container.register_driver<RedisClient>("redis",
                                           std::make_shared<RedisDriver>());
  }
  log->debug("Default drivers registered: {}",
             container.registered_names().size());
}

std::map<std::string, bool> default_drivers_health(ResourceContainer& container) {
  auto log = get_logger("container");
  const auto names = container.registered_names();
  for (const auto& name : names) {
    try {
      if (name == "httpx") {
        container.get_instance<HttpClient>(name);
      } else if (name == "storage") {
        container.get_instance<StorageClient>(name);
      } else if (name == "mongo") {
        container.get_instance<DocumentStore>(name);
      } else if (name == "redis") {
        container.get_instance<RedisClient>(name);
      }
    } catch (const ConfigurationError& e) {
      log->error("Resource '{}' is misconfigured: {}", name, e.what());
    } catch (const InitializationError& e) {
      log->error("Resource '{}' failed to start: {}", name, e.what());
    }
  }

  std::map<std::string, bool> status;
  for (const auto& name : names) {
    status[name] = false;
  }
  for (const auto& [name, healthy] : container.health_check_all()) {
    status[name] = healthy;
  }
  return status;
}

}  // namespace drinkd
