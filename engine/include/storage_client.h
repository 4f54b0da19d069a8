#pragma once

#include <expected>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "driver_config.h"
#include "http_client.h"

namespace drinkd {

struct StorageOptions {
  std::string project;
  std::optional<std::string> default_bucket;
  std::string api_root = "https://storage.googleapis.com";
  std::optional<std::string> access_token;
  double timeout_s = 60.0;

  // Read the "storage" option map. Throws ConfigurationError when
  // project is missing.
  static StorageOptions FromOptions(const ResourceOptions& options);
};

/**
 * StorageClient - object storage over the JSON API.
 *
 * Object operations take an optional bucket; when omitted the configured
 * default bucket is used, and with neither ConfigurationError is thrown.
 * Transport and HTTP failures come back as the expected's error.
 */
class StorageClient {
 public:
  explicit StorageClient(StorageOptions options);
  ~StorageClient();

  StorageClient(const StorageClient&) = delete;
  StorageClient& operator=(const StorageClient&) = delete;

  // Bucket resources of the configured project.
  std::expected<std::vector<nlohmann::json>, std::string> list_buckets();

  std::expected<std::vector<nlohmann::json>, std::string> list_objects(
      const std::optional<std::string>& bucket = std::nullopt,
      const std::string& prefix = "");

  std::expected<nlohmann::json, std::string> get_object_metadata(
      const std::string& object_name,
      const std::optional<std::string>& bucket = std::nullopt);

  // Raw object bytes.
  std::expected<std::string, std::string> download(
      const std::string& object_name,
      const std::optional<std::string>& bucket = std::nullopt);

  // Returns the created object's metadata.
  std::expected<nlohmann::json, std::string> upload(
      const std::string& object_name, const std::string& data,
      const std::string& content_type = "application/octet-stream",
      const std::optional<std::string>& bucket = std::nullopt);

  std::expected<void, std::string> delete_object(
      const std::string& object_name,
      const std::optional<std::string>& bucket = std::nullopt);

  std::expected<nlohmann::json, std::string> copy(
      const std::string& source_object, const std::string& destination_object,
      const std::optional<std::string>& source_bucket = std::nullopt,
      const std::optional<std::string>& destination_bucket = std::nullopt);

  void close();

  const StorageOptions& options() const { return options_; }

  // Explicit bucket, else the default. Throws ConfigurationError.
  std::string resolve_bucket(const std::optional<std::string>& bucket) const;

 private:
  std::expected<HttpResponse, std::string> request(
      const std::string& method, const std::string& url,
      std::string body = "", const std::string& content_type = "");

  std::expected<nlohmann::json, std::string> request_json(
      const std::string& method, const std::string& url);

  std::string object_url(const std::string& bucket,
                         const std::string& object_name) const;

  const StorageOptions options_;
  std::unique_ptr<HttpClient> http_;
};

}  // namespace drinkd
