#pragma once

#include <map>
#include <memory>
#include <string>

#include "document_store.h"
#include "http_client.h"
#include "redis_client.h"
#include "resource_driver.h"
#include "storage_client.h"

namespace drinkd {

class ResourceContainer;

// Pooled HTTP client. Healthy when any health_check_urls entry answers 200.
class HttpxDriver : public ResourceDriver<HttpClient> {
 public:
  std::shared_ptr<HttpClient> initialize(const ResourceOptions& options) override;
  void cleanup(HttpClient& instance) override;
  bool health_check(HttpClient& instance) override;
};

// Object storage. A failed connectivity check at initialize only warns.
class StorageDriver : public ResourceDriver<StorageClient> {
 public:
  std::shared_ptr<StorageClient> initialize(
      const ResourceOptions& options) override;
  void cleanup(StorageClient& instance) override;
  bool health_check(StorageClient& instance) override;
};

// Document store. Initialize pings and fails with InitializationError when
// the store does not answer.
class MongoDriver : public ResourceDriver<DocumentStore> {
 public:
  std::shared_ptr<DocumentStore> initialize(
      const ResourceOptions& options) override;
  void cleanup(DocumentStore& instance) override;
  bool health_check(DocumentStore& instance) override;
};

class RedisDriver : public ResourceDriver<RedisClient> {
 public:
  std::shared_ptr<RedisClient> initialize(const ResourceOptions& options) override;
  void cleanup(RedisClient& instance) override;
  bool health_check(RedisClient& instance) override;
};

// Register httpx, storage, mongo and redis on `container`, skipping any
// resource whose options say "enabled": false.
void register_default_drivers(ResourceContainer& container);

// Initialize each registered default resource, then health check them all.
// Every registered name is reported; one that fails to initialize, for bad
// options or an unreachable backend, reports false without stopping the rest.
std::map<std::string, bool> default_drivers_health(ResourceContainer& container);

}  // namespace drinkd
