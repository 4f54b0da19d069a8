#include "storage_client.h"

#include "errors.h"
#include "logging.h"

namespace drinkd {

namespace {

std::vector<nlohmann::json> items_of(const nlohmann::json& page) {
  std::vector<nlohmann::json> items;
  auto it = page.find("items");
  if (it != page.end() && it->is_array()) {
    items.assign(it->begin(), it->end());
  }
  return items;
}

}  // namespace

StorageOptions StorageOptions::FromOptions(const ResourceOptions& options) {
  StorageOptions out;
  auto project = option_string(options, "project");
  if (!project) {
    throw ConfigurationError("storage: project is required");
  }
  out.project = *project;
  out.default_bucket = option_string(options, "default_bucket");
  out.api_root = option_string(options, "api_root", out.api_root);
  out.access_token = option_string(options, "access_token");
  out.timeout_s = option_double(options, "timeout", out.timeout_s);
  while (!out.api_root.empty() && out.api_root.back() == '/') {
    out.api_root.pop_back();
  }
  if (out.timeout_s <= 0) {
    throw ConfigurationError("storage: timeout must be > 0");
  }
  return out;
}

StorageClient::StorageClient(StorageOptions options)
    : options_(std::move(options)) {
  HttpOptions http;
  http.timeout_s = options_.timeout_s;
  http.max_connections = 10;
  http.max_keepalive = 4;
  http_ = std::make_unique<HttpClient>(std::move(http));
}

StorageClient::~StorageClient() { close(); }

void StorageClient::close() {
  if (http_) {
    http_->close();
  }
}

std::string StorageClient::resolve_bucket(
    const std::optional<std::string>& bucket) const {
  if (bucket && !bucket->empty()) {
    return *bucket;
  }
  if (options_.default_bucket) {
    return *options_.default_bucket;
  }
  throw ConfigurationError(
      "storage: bucket name is required or default_bucket must be configured");
}

std::string StorageClient::object_url(const std::string& bucket,
                                      const std::string& object_name) const {
  return options_.api_root + "/storage/v1/b/" + url_encode(bucket) + "/o/" +
         url_encode(object_name);
}

std::expected<HttpResponse, std::string> StorageClient::request(
    const std::string& method, const std::string& url, std::string body,
    const std::string& content_type) {
  HttpRequest req;
  req.method = method;
  req.url = url;
  req.body = std::move(body);
  if (options_.access_token) {
    req.headers.push_back("Authorization: Bearer " + *options_.access_token);
  }
  if (!content_type.empty()) {
    req.headers.push_back("Content-Type: " + content_type);
  }

  auto response = http_->send(req);
  if (!response) {
    return std::unexpected(response.error());
  }
  if (!response->ok()) {
    return std::unexpected("storage: " + method + " " + url + " returned " +
                           std::to_string(response->status));
  }
  return response;
}

std::expected<nlohmann::json, std::string> StorageClient::request_json(
    const std::string& method, const std::string& url) {
  auto response = request(method, url);
  if (!response) {
    return std::unexpected(response.error());
  }
  auto parsed = nlohmann::json::parse(response->body, nullptr, false);
  if (parsed.is_discarded()) {
    return std::unexpected("storage: malformed JSON from " + url);
  }
  return parsed;
}

std::expected<std::vector<nlohmann::json>, std::string>
StorageClient::list_buckets() {
  auto page = request_json("GET", options_.api_root + "/storage/v1/b?project=" +
                                      url_encode(options_.project));
  if (!page) {
    return std::unexpected(page.error());
  }
  return items_of(*page);
}

std::expected<std::vector<nlohmann::json>, std::string>
StorageClient::list_objects(const std::optional<std::string>& bucket,
                            const std::string& prefix) {
  std::string url = options_.api_root + "/storage/v1/b/" +
                    url_encode(resolve_bucket(bucket)) + "/o";
  if (!prefix.empty()) {
    url += "?prefix=" + url_encode(prefix);
  }
  auto page = request_json("GET", url);
  if (!page) {
    return std::unexpected(page.error());
  }
  return items_of(*page);
}

std::expected<nlohmann::json, std::string> StorageClient::get_object_metadata(
    const std::string& object_name, const std::optional<std::string>& bucket) {
  return request_json("GET", object_url(resolve_bucket(bucket), object_name));
}

std::expected<std::string, std::string> StorageClient::download(
    const std::string& object_name, const std::optional<std::string>& bucket) {
  auto response =
      request("GET", object_url(resolve_bucket(bucket), object_name) +
                         "?alt=media");
  if (!response) {
    return std::unexpected(response.error());
  }
  return std::move(response->body);
}

std::expected<nlohmann::json, std::string> StorageClient::upload(
    const std::string& object_name, const std::string& data,
    const std::string& content_type, const std::optional<std::string>& bucket) {
  std::string url = options_.api_root + "/upload/storage/v1/b/" +
                    url_encode(resolve_bucket(bucket)) +
                    "/o?uploadType=media&name=" + url_encode(object_name);
  auto response = request("POST", url, data, content_type);
  if (!response) {
    return std::unexpected(response.error());
  }
  auto parsed = nlohmann::json::parse(response->body, nullptr, false);
  if (parsed.is_discarded()) {
    return std::unexpected("storage: malformed upload reply for " +
                           object_name);
  }
  get_logger("storage")->debug("Uploaded {} ({} bytes)", object_name,
                               data.size());
  return parsed;
}

std::expected<void, std::string> StorageClient::delete_object(
    const std::string& object_name, const std::optional<std::string>& bucket) {
  auto response =
      request("DELETE", object_url(resolve_bucket(bucket), object_name));
  if (!response) {
    return std::unexpected(response.error());
  }
  return {};
}

std::expected<nlohmann::json, std::string> StorageClient::copy(
    const std::string& source_object, const std::string& destination_object,
    const std::optional<std::string>& source_bucket,
    const std::optional<std::string>& destination_bucket) {
  std::string url = object_url(resolve_bucket(source_bucket), source_object) +
                    "/copyTo/b/" + url_encode(resolve_bucket(destination_bucket)) +
                    "/o/" + url_encode(destination_object);
  auto response = request("POST", url);
  if (!response) {
    return std::unexpected(response.error());
  }
  auto parsed = nlohmann::json::parse(response->body, nullptr, false);
  if (parsed.is_discarded()) {
    return std::unexpected("storage: malformed copy reply for " +
                           destination_object);
  }
  return parsed;
}

}  // namespace drinkd
