#include <catch2/catch_test_macros.hpp>
#include <fstream>
#include <nlohmann/json.hpp>

#include "driver_config.h"
#include "errors.h"

using namespace drinkd;

// Helper to write temp JSON file for testing
static std::string write_temp_json(const std::string& body, const std::string& suffix) {
  static int counter = 0;
  std::string path = "/tmp/drinkd_config_test_" + std::to_string(counter++) + "_" + suffix + ".json";
  std::ofstream f(path);
  f << body;
  return path;
}

TEST_CASE("Defaults carry every built-in resource", "[driver_config]") {
  auto config = DriverConfig::Defaults();
  REQUIRE(config.names() ==
          std::vector<std::string>{"httpx", "mongo", "redis", "storage"});

  const auto& mongo = config.options_for("mongo");
  REQUIRE(option_string(mongo, "host", "") == "localhost");
  REQUIRE(option_int(mongo, "port", 0) == 27017);
  REQUIRE_FALSE(option_string(mongo, "connection_string").has_value());

  REQUIRE(config.enabled("mongo"));
  REQUIRE_FALSE(config.enabled("redis"));
  REQUIRE(config.options_for("unknown").empty());
}

TEST_CASE("LoadFromJson merges file values over defaults", "[driver_config]") {
  auto path = write_temp_json(R"({
    "schema_version": 1,
    "resources": {
      "mongo": {"database": "drink", "port": 27018.0},
      "redis": {"enabled": true},
      "search": {"endpoint": "http://search:9200"}
    }
  })", "merge");

  auto loaded = DriverConfig::LoadFromJson(path);
  REQUIRE(std::holds_alternative<DriverConfig>(loaded));
  const auto& config = std::get<DriverConfig>(loaded);

  const auto& mongo = config.options_for("mongo");
  REQUIRE(option_string(mongo, "database", "") == "drink");
  REQUIRE(option_int(mongo, "port", 0) == 27018);
  // Untouched defaults survive
  REQUIRE(option_string(mongo, "host", "") == "localhost");

  REQUIRE(config.enabled("redis"));
  REQUIRE(option_string(config.options_for("search"), "endpoint", "") ==
          "http://search:9200");
}

TEST_CASE("LoadFromJson rejects malformed documents", "[driver_config]") {
  SECTION("missing file") {
    auto loaded = DriverConfig::LoadFromJson("/tmp/drinkd_config_missing.json");
    REQUIRE(std::holds_alternative<std::string>(loaded));
    REQUIRE(std::get<std::string>(loaded).find("Failed to open") !=
            std::string::npos);
  }

  SECTION("invalid JSON") {
    auto loaded = DriverConfig::LoadFromJson(write_temp_json("{not json", "bad"));
    REQUIRE(std::holds_alternative<std::string>(loaded));
  }

  SECTION("wrong schema version") {
    auto loaded = DriverConfig::FromJson({{"schema_version", 2}});
    REQUIRE(std::get<std::string>(loaded) == "Unsupported schema_version: 2");
  }

  SECTION("missing schema version") {
    auto loaded = DriverConfig::FromJson({{"resources", nlohmann::json::object()}});
    REQUIRE(std::holds_alternative<std::string>(loaded));
  }

  SECTION("resource options must be an object") {
    auto loaded = DriverConfig::FromJson(
        {{"schema_version", 1}, {"resources", {{"mongo", 5}}}});
    REQUIRE(std::get<std::string>(loaded) ==
            "Resource 'mongo' options must be an object");
  }
}

TEST_CASE("with_options overrides one resource", "[driver_config]") {
  auto base = DriverConfig::Defaults();
  auto config = base.with_options("mongo", {{"database", "drink"}});

  REQUIRE(option_string(config.options_for("mongo"), "database", "") == "drink");
  REQUIRE(option_string(base.options_for("mongo"), "database", "") == "test");
}

TEST_CASE("typed accessors apply fallbacks and check types", "[driver_config]") {
  ResourceOptions options = {{"name", "drink"},
                             {"empty", ""},
                             {"count", 3},
                             {"ratio", 0.5},
                             {"flag", true},
                             {"urls", {"a", "b"}},
                             {"nothing", nullptr}};

  REQUIRE(option_string(options, "name", "x") == "drink");
  REQUIRE(option_string(options, "empty", "x") == "x");
  REQUIRE(option_string(options, "nothing", "x") == "x");
  REQUIRE(option_int(options, "count", 0) == 3);
  REQUIRE(option_int(options, "missing", 9) == 9);
  REQUIRE(option_double(options, "ratio", 0.0) == 0.5);
  REQUIRE(option_double(options, "count", 0.0) == 3.0);
  REQUIRE(option_bool(options, "flag", false));
  REQUIRE(option_string_list(options, "urls", {}) ==
          std::vector<std::string>{"a", "b"});

  REQUIRE_THROWS_AS(option_int(options, "name", 0), ConfigurationError);
  REQUIRE_THROWS_AS(option_int(options, "ratio", 0), ConfigurationError);
  REQUIRE_THROWS_AS(option_bool(options, "count", false), ConfigurationError);
  REQUIRE_THROWS_AS(option_string(options, "count"), ConfigurationError);
  REQUIRE_THROWS_AS(option_string_list(options, "name", {}), ConfigurationError);
}
