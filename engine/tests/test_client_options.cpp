#include <catch2/catch_test_macros.hpp>

#include "driver_config.h"
#include "errors.h"
#include "http_client.h"
#include "mongo_client.h"
#include "redis_client.h"
#include "storage_client.h"

using namespace drinkd;

TEST_CASE("MongoOptions requires a database or connection string",
          "[mongo]") {
  REQUIRE_THROWS_AS(MongoOptions::FromOptions({{"host", "localhost"}}),
                    ConfigurationError);
  REQUIRE_NOTHROW(MongoOptions::FromOptions({{"database", "drink"}}));
  REQUIRE_NOTHROW(
      MongoOptions::FromOptions({{"connection_string", "https://data.example"}}));
  // Empty strings count as absent
  REQUIRE_THROWS_AS(MongoOptions::FromOptions({{"database", ""}}),
                    ConfigurationError);
}

TEST_CASE("MongoOptions rejects malformed values", "[mongo]") {
  REQUIRE_THROWS_AS(
      MongoOptions::FromOptions({{"database", "drink"}, {"port", 0}}),
      ConfigurationError);
  REQUIRE_THROWS_AS(
      MongoOptions::FromOptions({{"database", "drink"}, {"port", "27017"}}),
      ConfigurationError);
  REQUIRE_THROWS_AS(MongoOptions::FromOptions(
                        {{"database", "drink"}, {"socket_timeout_ms", -1}}),
                    ConfigurationError);
}

TEST_CASE("MongoOptions endpoint resolution", "[mongo]") {
  SECTION("connection string wins") {
    auto options = MongoOptions::FromOptions(
        {{"host", "cluster0.abcde.mongodb.net"},
         {"connection_string", "https://data.example/app/v1/"}});
    REQUIRE(options.endpoint() == "https://data.example/app/v1");
  }

  SECTION("hosted cluster") {
    auto options = MongoOptions::FromOptions(
        {{"host", "cluster0.abcde.mongodb.net"}, {"database", "drink"}});
    REQUIRE(options.endpoint() == "https://cluster0.abcde.mongodb.net");
  }

  SECTION("plain host and port") {
    auto options = MongoOptions::FromOptions(
        {{"host", "db.internal"}, {"port", 8080}, {"database", "drink"}});
    REQUIRE(options.endpoint() == "http://db.internal:8080");
  }

  SECTION("defaults") {
    auto options =
        MongoOptions::FromOptions(DriverConfig::Defaults().options_for("mongo"));
    REQUIRE(options.endpoint() == "http://localhost:27017");
    REQUIRE(options.data_source == "Cluster0");
    REQUIRE(options.ping_collection == "store");
  }
}

TEST_CASE("MongoOptions credentials need both halves", "[mongo]") {
  auto user_only = MongoOptions::FromOptions(
      {{"database", "drink"}, {"username", "reader"}});
  REQUIRE_FALSE(user_only.credentials().has_value());

  auto both = MongoOptions::FromOptions(
      {{"database", "drink"}, {"username", "reader"}, {"password", "s3cret"}});
  REQUIRE(both.credentials() == "reader:s3cret");
}

TEST_CASE("MongoOptions connection string overrides discrete credentials",
          "[mongo]") {
  auto options = MongoOptions::FromOptions(
      {{"connection_string", "https://data.example/app/v1"},
       {"host", "db.internal"},
       {"username", "reader"},
       {"password", "s3cret"}});
  REQUIRE(options.endpoint() == "https://data.example/app/v1");
  REQUIRE_FALSE(options.credentials().has_value());
}

TEST_CASE("RedisOptions validation", "[redis]") {
  auto defaults =
      RedisOptions::FromOptions(DriverConfig::Defaults().options_for("redis"));
  REQUIRE(defaults.host == "localhost");
  REQUIRE(defaults.port == 6379);
  REQUIRE(defaults.db == 0);
  REQUIRE_FALSE(defaults.password.has_value());

  REQUIRE_THROWS_AS(RedisOptions::FromOptions({{"port", 70000}}),
                    ConfigurationError);
  REQUIRE_THROWS_AS(RedisOptions::FromOptions({{"db", -1}}),
                    ConfigurationError);
  REQUIRE_THROWS_AS(RedisOptions::FromOptions({{"request_timeout_ms", 0}}),
                    ConfigurationError);
}

TEST_CASE("StorageOptions requires a project", "[storage]") {
  REQUIRE_THROWS_AS(StorageOptions::FromOptions({{"default_bucket", "b"}}),
                    ConfigurationError);

  auto options = StorageOptions::FromOptions(
      {{"project", "drink"}, {"api_root", "http://gcs.local:4443/"}});
  REQUIRE(options.api_root == "http://gcs.local:4443");
  REQUIRE_FALSE(options.default_bucket.has_value());
  REQUIRE_THROWS_AS(StorageOptions::FromOptions({{"project", "drink"}, {"timeout", 0}}),
                    ConfigurationError);
}

TEST_CASE("StorageClient resolves the bucket before any request",
          "[storage]") {
  SECTION("explicit bucket wins over the default") {
    StorageClient client(StorageOptions::FromOptions(
        {{"project", "drink"}, {"default_bucket", "menus"}}));
    REQUIRE(client.resolve_bucket(std::nullopt) == "menus");
    REQUIRE(client.resolve_bucket("photos") == "photos");
  }

  SECTION("no bucket at all") {
    StorageClient client(StorageOptions::FromOptions({{"project", "drink"}}));
    REQUIRE_THROWS_AS(client.resolve_bucket(std::nullopt), ConfigurationError);
    REQUIRE_THROWS_AS(client.list_objects(), ConfigurationError);
    REQUIRE_THROWS_AS(client.download("menu.json"), ConfigurationError);
  }
}

TEST_CASE("url_encode escapes everything but unreserved characters",
          "[http]") {
  REQUIRE(url_encode("") == "");
  REQUIRE(url_encode("menu-1_v2.json~") == "menu-1_v2.json~");
  REQUIRE(url_encode("menus/2024 spring.json") == "menus%2F2024%20spring.json");
  REQUIRE(url_encode("a+b&c=d?") == "a%2Bb%26c%3Dd%3F");
  REQUIRE(url_encode("茶") == "%E8%8C%B6");
  // Only the given bytes are encoded
  REQUIRE(url_encode(std::string_view("bucket-name", 6)) == "bucket");
}
