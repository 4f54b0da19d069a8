#include "mongo_client.h"

#include "errors.h"
#include "logging.h"

#include <chrono>

namespace drinkd {

MongoOptions MongoOptions::FromOptions(const ResourceOptions& options) {
  MongoOptions out;
  out.host = option_string(options, "host", out.host);
  out.port = static_cast<int>(option_int(options, "port", out.port));
  out.database = option_string(options, "database");
  out.username = option_string(options, "username");
  out.password = option_string(options, "password");
  out.api_key = option_string(options, "api_key");
  out.connection_string = option_string(options, "connection_string");
  out.data_source = option_string(options, "data_source", out.data_source);
  out.server_api = option_string(options, "server_api", out.server_api);
  out.ping_collection =
      option_string(options, "ping_collection", out.ping_collection);
  out.connect_timeout_ms = static_cast<int>(
      option_int(options, "connect_timeout_ms", out.connect_timeout_ms));
  out.socket_timeout_ms = static_cast<int>(
      option_int(options, "socket_timeout_ms", out.socket_timeout_ms));

  if (!out.database && !out.connection_string) {
    throw ConfigurationError(
        "mongo: either database or connection_string is required");
  }
  if (out.port <= 0 || out.port > 65535) {
    throw ConfigurationError("mongo: port out of range: " +
                             std::to_string(out.port));
  }
  if (out.connect_timeout_ms <= 0 || out.socket_timeout_ms <= 0) {
    throw ConfigurationError("mongo: timeouts must be > 0");
  }
  return out;
}

std::string MongoOptions::endpoint() const {
  std::string base;
  if (connection_string) {
    base = *connection_string;
  } else if (host.find("mongodb.net") != std::string::npos) {
    base = "https://" + host;
  } else {
    base = "http://" + host + ":" + std::to_string(port);
  }
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base;
}

std::optional<std::string> MongoOptions::credentials() const {
  // A connection string carries its own authentication
  if (connection_string) {
    return std::nullopt;
  }
  if (username && password) {
    return *username + ":" + *password;
  }
  return std::nullopt;
}

MongoClient::MongoClient(MongoOptions options)
    : options_(std::move(options)),
      database_(options_.database.value_or("test")) {
  HttpOptions http;
  http.timeout_s = options_.socket_timeout_ms / 1000.0;
  http.connect_timeout_s = options_.connect_timeout_ms / 1000.0;
  http.retry = 1;
  http_ = std::make_unique<HttpClient>(std::move(http));
}

MongoClient::~MongoClient() { close(); }

void MongoClient::close() {
  if (http_) {
    http_->close();
  }
}

std::expected<nlohmann::json, std::string> MongoClient::call(
    std::string_view action, const nlohmann::json& body) {
  HttpRequest request;
  request.method = "POST";
  request.url = options_.endpoint() + "/action/" + std::string(action);
  request.body = body.dump();
  request.headers = {"Content-Type: application/json",
                     "Accept: application/json",
                     "X-Server-Api-Version: " + options_.server_api};
  if (options_.api_key) {
    request.headers.push_back("apiKey: " + *options_.api_key);
  }
  request.userpwd = options_.credentials();

  auto response = http_->send(request);
  if (!response) {
    return std::unexpected(response.error());
  }
  if (!response->ok()) {
    std::string detail = response->body.substr(0, 256);
    return std::unexpected("status " + std::to_string(response->status) +
                           ": " + detail);
  }

  auto parsed = nlohmann::json::parse(response->body, nullptr, false);
  if (parsed.is_discarded()) {
    return std::unexpected(std::string("malformed JSON reply"));
  }
  return parsed;
}

std::vector<nlohmann::json> MongoClient::aggregate(
    std::string_view collection, const nlohmann::json& pipeline) {
  if (!pipeline.is_array()) {
    throw QueryError("aggregate: pipeline must be an array");
  }

  nlohmann::json body = {{"dataSource", options_.data_source},
                         {"database", database_},
                         {"collection", std::string(collection)},
                         {"pipeline", pipeline}};

  auto start = std::chrono::steady_clock::now();
  auto reply = call("aggregate", body);
  auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start)
                        .count();

  auto log = get_logger("mongo");
  if (!reply) {
    log->error("aggregate on '{}' failed after {}ms: {}", collection,
               elapsed_ms, reply.error());
    throw QueryError("aggregate on '" + std::string(collection) +
                     "' failed: " + reply.error());
  }

  auto it = reply->find("documents");
  if (it == reply->end() || !it->is_array()) {
    throw QueryError("aggregate on '" + std::string(collection) +
                     "': reply has no documents array");
  }

  std::vector<nlohmann::json> documents;
  documents.reserve(it->size());
  for (auto& doc : *it) {
    documents.push_back(std::move(doc));
  }
  log->debug("aggregate on '{}' ({} stages) returned {} documents in {}ms",
             collection, pipeline.size(), documents.size(), elapsed_ms);
  return documents;
}

std::expected<void, std::string> MongoClient::try_ping() {
  nlohmann::json body = {{"dataSource", options_.data_source},
                         {"database", database_},
                         {"collection", options_.ping_collection},
                         {"pipeline", nlohmann::json::array({{{"$limit", 1}}})}};
  auto reply = call("aggregate", body);
  if (!reply) {
    return std::unexpected(reply.error());
  }
  return {};
}

bool MongoClient::ping() { return try_ping().has_value(); }

}  // namespace drinkd
