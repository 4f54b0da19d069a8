#include "driver_config.h"

#include "errors.h"
#include <fstream>

namespace drinkd {

namespace {

const ResourceOptions& empty_options() {
  static const ResourceOptions kEmpty = ResourceOptions::object();
  return kEmpty;
}

const nlohmann::json* find_option(const ResourceOptions& options,
                                  std::string_view key) {
  if (!options.is_object()) return nullptr;
  auto it = options.find(std::string(key));
  if (it == options.end() || it->is_null()) return nullptr;
  return &*it;
}

[[noreturn]] void throw_type_error(std::string_view key,
                                   std::string_view expected,
                                   const nlohmann::json& value) {
  throw ConfigurationError("option '" + std::string(key) + "' must be " +
                           std::string(expected) + ", got " +
                           value.type_name());
}

}  // namespace

DriverConfig DriverConfig::Defaults() {
  DriverConfig config;
  config.resources_["httpx"] = {
      {"timeout", 240.0},
      {"max_keepalive", 20},
      {"max_connections", 100},
      {"keepalive_expiry", 5.0},
      {"retry", 3},
      {"health_check_urls",
       {"https://httpbin.org/status/200", "https://www.google.com/",
        "https://httpstat.us/200"}},
  };
  config.resources_["storage"] = {
      {"project", "your-gcp-project"},
      {"default_bucket", "your-default-bucket"},
      {"access_token", nullptr},
      {"api_root", nullptr},
      {"timeout", 60.0},
  };
  config.resources_["mongo"] = {
      {"host", "localhost"},
      {"port", 27017},
      {"database", "test"},
      {"username", nullptr},
      {"password", nullptr},
      {"connection_string", nullptr},
      {"data_source", "Cluster0"},
      {"server_api", "1"},
      {"connect_timeout_ms", 120000},
      {"socket_timeout_ms", 120000},
  };
  // Off unless a config file turns it on.
  config.resources_["redis"] = {
      {"enabled", false},
      {"host", "localhost"},
      {"port", 6379},
      {"db", 0},
      {"password", nullptr},
      {"connect_timeout_ms", 50},
      {"request_timeout_ms", 20},
      {"drink_tag_ttl_s", 600},
  };
  return config;
}

std::variant<DriverConfig, std::string> DriverConfig::LoadFromJson(
    const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    return "Failed to open driver config: " + path;
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(file);
  } catch (const std::exception& e) {
    return "Failed to parse driver config JSON: " + std::string(e.what());
  }
  return FromJson(j);
}

std::variant<DriverConfig, std::string> DriverConfig::FromJson(
    const nlohmann::json& j) {
  if (!j.is_object()) {
    return "Driver config must be a JSON object";
  }
  if (!j.contains("schema_version") || !j["schema_version"].is_number()) {
    return "Missing or invalid schema_version";
  }
  if (j["schema_version"].get<int>() != 1) {
    return "Unsupported schema_version: " +
           std::to_string(j["schema_version"].get<int>());
  }

  DriverConfig config = Defaults();
  if (!j.contains("resources")) {
    return config;
  }
  if (!j["resources"].is_object()) {
    return "resources must be an object";
  }

  for (auto it = j["resources"].begin(); it != j["resources"].end(); ++it) {
    if (it.key().empty()) {
      return "Resource name must not be empty";
    }
    if (!it->is_object()) {
      return "Resource '" + it.key() + "' options must be an object";
    }
    auto& target = config.resources_[it.key()];
    if (!target.is_object()) {
      target = ResourceOptions::object();
    }
    for (auto opt = it->begin(); opt != it->end(); ++opt) {
      target[opt.key()] = opt.value();
    }
  }
  return config;
}

const ResourceOptions& DriverConfig::options_for(std::string_view name) const {
  auto it = resources_.find(name);
  if (it == resources_.end()) {
    return empty_options();
  }
  return it->second;
}

bool DriverConfig::enabled(std::string_view name) const {
  return option_bool(options_for(name), "enabled", true);
}

std::vector<std::string> DriverConfig::names() const {
  std::vector<std::string> out;
  out.reserve(resources_.size());
  for (const auto& [name, _] : resources_) {
    out.push_back(name);
  }
  return out;
}

DriverConfig DriverConfig::with_options(
    const std::string& name, const ResourceOptions& overrides) const {
  DriverConfig copy = *this;
  auto& target = copy.resources_[name];
  if (!target.is_object()) {
    target = ResourceOptions::object();
  }
  for (auto it = overrides.begin(); it != overrides.end(); ++it) {
    target[it.key()] = it.value();
  }
  return copy;
}

std::optional<std::string> option_string(const ResourceOptions& options,
                                         std::string_view key) {
  const auto* value = find_option(options, key);
  if (!value) return std::nullopt;
  if (!value->is_string()) throw_type_error(key, "a string", *value);
  auto s = value->get<std::string>();
  if (s.empty()) return std::nullopt;
  return s;
}

std::string option_string(const ResourceOptions& options, std::string_view key,
                          const std::string& fallback) {
  return option_string(options, key).value_or(fallback);
}

int64_t option_int(const ResourceOptions& options, std::string_view key,
                   int64_t fallback) {
  const auto* value = find_option(options, key);
  if (!value) return fallback;
  if (value->is_number_integer()) return value->get<int64_t>();
  // Allow integral floats such as 27017.0 written by other tools
  if (value->is_number_float()) {
    double d = value->get<double>();
    if (d == static_cast<double>(static_cast<int64_t>(d))) {
      return static_cast<int64_t>(d);
    }
  }
  throw_type_error(key, "an integer", *value);
}

double option_double(const ResourceOptions& options, std::string_view key,
                     double fallback) {
  const auto* value = find_option(options, key);
  if (!value) return fallback;
  if (!value->is_number()) throw_type_error(key, "a number", *value);
  return value->get<double>();
}

bool option_bool(const ResourceOptions& options, std::string_view key,
                 bool fallback) {
  const auto* value = find_option(options, key);
  if (!value) return fallback;
  if (!value->is_boolean()) throw_type_error(key, "a boolean", *value);
  return value->get<bool>();
}

std::vector<std::string> option_string_list(
    const ResourceOptions& options, std::string_view key,
    const std::vector<std::string>& fallback) {
  const auto* value = find_option(options, key);
  if (!value) return fallback;
  if (!value->is_array()) throw_type_error(key, "an array of strings", *value);
  std::vector<std::string> out;
  out.reserve(value->size());
  for (const auto& elem : *value) {
    if (!elem.is_string()) throw_type_error(key, "an array of strings", *value);
    out.push_back(elem.get<std::string>());
  }
  return out;
}

}  // namespace drinkd
