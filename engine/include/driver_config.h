#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace drinkd {

// Per-resource option map (always a JSON object).
using ResourceOptions = nlohmann::json;

/**
 * DriverConfig - immutable per-resource option maps.
 *
 * Built once at startup (defaults merged with an optional JSON file) and
 * then passed by const reference. Layout of the file:
 *
 *   {
 *     "schema_version": 1,
 *     "resources": {
 *       "mongo": {"connection_string": "https://...", "database": "drink"},
 *       "redis": {"enabled": true, "host": "127.0.0.1"}
 *     }
 *   }
 *
 * File values override defaults option by option; unknown resource names
 * are kept so custom drivers can read them.
 */
class DriverConfig {
 public:
  // Built-in defaults for httpx, storage, mongo and redis.
  static DriverConfig Defaults();

  // Load from a JSON file and merge over Defaults().
  // Returns either a valid config or an error message.
  static std::variant<DriverConfig, std::string> LoadFromJson(
      const std::string& path);

  // Same as LoadFromJson, from an already-parsed document.
  static std::variant<DriverConfig, std::string> FromJson(
      const nlohmann::json& j);

  // Options for a resource; an empty object when the name is unknown.
  const ResourceOptions& options_for(std::string_view name) const;

  // False when the resource sets "enabled": false.
  bool enabled(std::string_view name) const;

  // Sorted resource names.
  std::vector<std::string> names() const;

  // Copy of this config with `overrides` merged into one resource.
  DriverConfig with_options(const std::string& name,
                            const ResourceOptions& overrides) const;

 private:
  std::map<std::string, ResourceOptions, std::less<>> resources_;
};

// =====================================================
// Typed option accessors
//
// Missing and null values yield the fallback. A value of the wrong
// type throws ConfigurationError naming the key.
// =====================================================

// Empty strings are treated as absent.
std::optional<std::string> option_string(const ResourceOptions& options,
                                         std::string_view key);
std::string option_string(const ResourceOptions& options, std::string_view key,
                          const std::string& fallback);
int64_t option_int(const ResourceOptions& options, std::string_view key,
                   int64_t fallback);
double option_double(const ResourceOptions& options, std::string_view key,
                     double fallback);
bool option_bool(const ResourceOptions& options, std::string_view key,
                 bool fallback);
std::vector<std::string> option_string_list(
    const ResourceOptions& options, std::string_view key,
    const std::vector<std::string>& fallback);

}  // namespace drinkd
