#include "http_client.h"

#include "errors.h"
#include "logging.h"

#include <curl/curl.h>
#include <memory>
#include <stdexcept>

namespace drinkd {

namespace {

void ensure_curl_global_init() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t write_callback(char* data, size_t size, size_t nmemb, void* userp) {
  auto* body = static_cast<std::string*>(userp);
  body->append(data, size * nmemb);
  return size * nmemb;
}

bool is_retryable(CURLcode code) {
  return code == CURLE_COULDNT_CONNECT || code == CURLE_COULDNT_RESOLVE_HOST;
}

}  // namespace

HttpOptions HttpOptions::FromOptions(const ResourceOptions& options) {
  HttpOptions out;
  out.timeout_s = option_double(options, "timeout", out.timeout_s);
  out.connect_timeout_s =
      option_double(options, "connect_timeout", out.connect_timeout_s);
  out.max_keepalive = static_cast<int>(
      option_int(options, "max_keepalive", out.max_keepalive));
  out.max_connections = static_cast<int>(
      option_int(options, "max_connections", out.max_connections));
  out.keepalive_expiry_s =
      option_double(options, "keepalive_expiry", out.keepalive_expiry_s);
  out.retry = static_cast<int>(option_int(options, "retry", out.retry));
  out.health_check_urls =
      option_string_list(options, "health_check_urls", out.health_check_urls);

  if (out.timeout_s <= 0) {
    throw ConfigurationError("httpx: timeout must be > 0");
  }
  if (out.max_connections <= 0) {
    throw ConfigurationError("httpx: max_connections must be > 0");
  }
  if (out.max_keepalive < 0 || out.retry < 0) {
    throw ConfigurationError("httpx: max_keepalive and retry must be >= 0");
  }
  return out;
}

HttpClient::HttpClient(HttpOptions options) : options_(std::move(options)) {
  ensure_curl_global_init();
}

HttpClient::~HttpClient() { close(); }

void HttpClient::close() {
  std::vector<CURL*> idle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    idle.swap(idle_);
  }
  slot_cv_.notify_all();
  for (CURL* handle : idle) {
    curl_easy_cleanup(handle);
  }
}

bool HttpClient::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

CURL* HttpClient::acquire_handle() {
  std::unique_lock<std::mutex> lock(mutex_);
  slot_cv_.wait(lock, [this] {
    return closed_ || in_use_ < options_.max_connections;
  });
  if (closed_) {
    return nullptr;
  }
  ++in_use_;
  if (!idle_.empty()) {
    CURL* handle = idle_.back();
    idle_.pop_back();
    return handle;
  }
  lock.unlock();

  CURL* handle = curl_easy_init();
  if (!handle) {
    std::lock_guard<std::mutex> relock(mutex_);
    --in_use_;
    slot_cv_.notify_one();
  }
  return handle;
}

void HttpClient::release_handle(CURL* handle) {
  bool keep = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --in_use_;
    if (!closed_ && static_cast<int>(idle_.size()) < options_.max_keepalive) {
      curl_easy_reset(handle);  // keeps the connection cache
      idle_.push_back(handle);
      keep = true;
    }
  }
  slot_cv_.notify_one();
  if (!keep) {
    curl_easy_cleanup(handle);
  }
}

std::expected<HttpResponse, std::string> HttpClient::perform(
    CURL* handle, const HttpRequest& request) {
  HttpResponse response;
  char errbuf[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(handle, CURLOPT_MAXAGE_CONN,
                   static_cast<long>(options_.keepalive_expiry_s));

  long timeout_ms = request.timeout_ms.value_or(
      static_cast<long>(options_.timeout_s * 1000));
  curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, timeout_ms);
  if (options_.connect_timeout_s > 0) {
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options_.connect_timeout_s * 1000));
  }

  if (request.method == "GET") {
    curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
  } else if (request.method == "POST") {
    curl_easy_setopt(handle, CURLOPT_POST, 1L);
    curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(request.body.size()));
  } else {
    curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    if (!request.body.empty()) {
      curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE,
                       static_cast<long>(request.body.size()));
    }
  }

  if (request.userpwd) {
    curl_easy_setopt(handle, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(handle, CURLOPT_USERPWD, request.userpwd->c_str());
  }

  struct curl_slist* headers = nullptr;
  for (const auto& h : request.headers) {
    headers = curl_slist_append(headers, h.c_str());
  }
  if (headers) {
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers);
  }

  CURLcode code = CURLE_OK;
  for (int attempt = 0; attempt <= options_.retry; ++attempt) {
    response.body.clear();
    code = curl_easy_perform(handle);
    if (!is_retryable(code)) break;
    if (attempt < options_.retry) {
      get_logger("httpx")->debug("{} {} failed ({}), retry {}/{}",
                                 request.method, request.url,
                                 curl_easy_strerror(code), attempt + 1,
                                 options_.retry);
    }
  }
  curl_slist_free_all(headers);

  if (code != CURLE_OK) {
    std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(code);
    return std::unexpected("http: " + request.method + " " + request.url +
                           " failed: " + detail);
  }

  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

std::expected<HttpResponse, std::string> HttpClient::send(
    const HttpRequest& request) {
  CURL* handle = acquire_handle();
  if (!handle) {
    return std::unexpected(std::string(closed() ? "http: client is closed"
                                                : "http: curl_easy_init failed"));
  }
  auto result = perform(handle, request);
  release_handle(handle);
  return result;
}

std::expected<HttpResponse, std::string> HttpClient::get(
    const std::string& url, const std::vector<std::string>& headers) {
  HttpRequest request;
  request.url = url;
  request.headers = headers;
  return send(request);
}

std::expected<HttpResponse, std::string> HttpClient::post_json(
    const std::string& url, const nlohmann::json& body,
    const std::vector<std::string>& headers) {
  HttpRequest request;
  request.method = "POST";
  request.url = url;
  request.body = body.dump();
  request.headers = headers;
  request.headers.push_back("Content-Type: application/json");
  request.headers.push_back("Accept: application/json");
  return send(request);
}

std::string url_encode(std::string_view value) {
  // A zero length makes curl fall back to strlen
  if (value.empty()) {
    return "";
  }
  ensure_curl_global_init();
  std::unique_ptr<char, decltype(&curl_free)> escaped(
      curl_easy_escape(nullptr, value.data(), static_cast<int>(value.size())),
      &curl_free);
  if (!escaped) {
    throw std::runtime_error("curl_easy_escape failed");
  }
  return std::string(escaped.get());
}

}  // namespace drinkd
