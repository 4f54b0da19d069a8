#pragma once

#include <condition_variable>
#include <expected>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "driver_config.h"

// Forward declaration for libcurl
typedef void CURL;

namespace drinkd {

struct HttpOptions {
  double timeout_s = 240.0;
  double connect_timeout_s = 0.0;  // 0 = libcurl default
  int max_keepalive = 20;
  int max_connections = 100;
  double keepalive_expiry_s = 5.0;
  int retry = 3;
  std::vector<std::string> health_check_urls;

  // Read the "httpx" option map. Throws ConfigurationError on bad values.
  static HttpOptions FromOptions(const ResourceOptions& options);
};

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  std::string body;
  std::vector<std::string> headers;      // "Name: value"
  std::optional<std::string> userpwd;    // basic auth "user:password"
  std::optional<long> timeout_ms;        // overrides HttpOptions::timeout_s
};

struct HttpResponse {
  long status = 0;
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

/**
 * HttpClient - pooled libcurl client.
 *
 * Keeps up to max_keepalive idle easy handles so connections are reused,
 * and never runs more than max_connections requests at once (callers
 * block for a free slot). Connect/resolve failures are retried `retry`
 * times; every other failure is returned to the caller as-is.
 *
 * Thread safety: send() may be called concurrently.
 */
class HttpClient {
 public:
  explicit HttpClient(HttpOptions options);
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  // Returns the response (any status) or a transport error message.
  std::expected<HttpResponse, std::string> send(const HttpRequest& request);

  std::expected<HttpResponse, std::string> get(
      const std::string& url, const std::vector<std::string>& headers = {});

  std::expected<HttpResponse, std::string> post_json(
      const std::string& url, const nlohmann::json& body,
      const std::vector<std::string>& headers = {});

  // Release idle handles and refuse new requests. In-flight requests finish.
  void close();
  bool closed() const;

  const HttpOptions& options() const { return options_; }

 private:
  CURL* acquire_handle();
  void release_handle(CURL* handle);
  std::expected<HttpResponse, std::string> perform(CURL* handle,
                                                   const HttpRequest& request);

  const HttpOptions options_;

  mutable std::mutex mutex_;
  std::condition_variable slot_cv_;
  std::vector<CURL*> idle_;
  int in_use_ = 0;
  bool closed_ = false;
};

// Percent-encode a URL component with curl_easy_escape (RFC 3986
// unreserved characters kept).
std::string url_encode(std::string_view value);

}  // namespace drinkd
