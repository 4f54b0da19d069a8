#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>

#include "document_store.h"
#include "driver_config.h"
#include "http_client.h"

namespace drinkd {

struct MongoOptions {
  std::string host = "localhost";
  int port = 27017;
  std::optional<std::string> database;
  std::optional<std::string> username;
  std::optional<std::string> password;
  std::optional<std::string> api_key;
  std::optional<std::string> connection_string;
  std::string data_source = "Cluster0";
  std::string server_api = "1";
  std::string ping_collection = "store";
  int connect_timeout_ms = 120000;
  int socket_timeout_ms = 120000;

  // Read the "mongo" option map.
  // Throws ConfigurationError when neither database nor connection_string
  // is given, or on a malformed value.
  static MongoOptions FromOptions(const ResourceOptions& options);

  // Base URL of the store's data endpoint. An explicit connection_string
  // wins; otherwise hosted clusters (*.mongodb.net) use https://host and
  // anything else http://host:port.
  std::string endpoint() const;

  // "user:password" when both are set and no connection_string is given,
  // for basic auth.
  std::optional<std::string> credentials() const;
};

/**
 * MongoClient - document store client over the store's HTTP data endpoint.
 *
 * Every aggregation is a POST to {endpoint}/action/aggregate with body
 * {dataSource, database, collection, pipeline}; the reply carries the
 * result set under "documents". Elapsed time per call is logged.
 *
 * Thread safety: aggregate() may be called concurrently (pooled transport).
 */
class MongoClient : public DocumentStore {
 public:
  explicit MongoClient(MongoOptions options);
  ~MongoClient() override;

  MongoClient(const MongoClient&) = delete;
  MongoClient& operator=(const MongoClient&) = delete;

  std::vector<nlohmann::json> aggregate(std::string_view collection,
                                        const nlohmann::json& pipeline) override;

  // One-document aggregation on ping_collection.
  bool ping() override;
  // Like ping(), but reports why it failed.
  std::expected<void, std::string> try_ping();

  void close() override;

  const MongoOptions& options() const { return options_; }
  const std::string& database() const { return database_; }

 private:
  std::expected<nlohmann::json, std::string> call(
      std::string_view action, const nlohmann::json& body);

  const MongoOptions options_;
  const std::string database_;
  std::unique_ptr<HttpClient> http_;
};

}  // namespace drinkd
