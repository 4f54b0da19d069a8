#include <catch2/catch_test_macros.hpp>

#include "drink_service.h"
#include "drivers.h"
#include "errors.h"
#include "fake_document_store.h"
#include "resource_container.h"

using namespace drinkd;
using drinkd::testing::FakeDocumentStore;
using json = nlohmann::json;

namespace {

// Hands out one scripted store in place of the real "mongo" resource
class FakeStoreDriver : public ResourceDriver<DocumentStore> {
 public:
  explicit FakeStoreDriver(std::shared_ptr<FakeDocumentStore> store)
      : store_(std::move(store)) {}

  std::shared_ptr<DocumentStore> initialize(const ResourceOptions&) override {
    ++initialized;
    return store_;
  }
  void cleanup(DocumentStore& instance) override { instance.close(); }
  bool health_check(DocumentStore& instance) override {
    return instance.ping();
  }

  int initialized = 0;

 private:
  std::shared_ptr<FakeDocumentStore> store_;
};

struct ServiceFixture {
  ServiceFixture() : ServiceFixture(DriverConfig::Defaults()) {}

  explicit ServiceFixture(DriverConfig config)
      : store(std::make_shared<FakeDocumentStore>()),
        driver(std::make_shared<FakeStoreDriver>(store)),
        container(std::move(config)) {
    container.register_driver<DocumentStore>("mongo", driver);
  }

  std::shared_ptr<FakeDocumentStore> store;
  std::shared_ptr<FakeStoreDriver> driver;
  ResourceContainer container;
};

}  // namespace

TEST_CASE("parse_list_store_payload reads every field", "[service]") {
  auto query = parse_list_store_payload({{"location", {121.56, 25.04}},
                                         {"drink_tags", {"青茶", "烏龍"}},
                                         {"brands", {"50嵐"}},
                                         {"review_count_range", {10, 500}},
                                         {"rating_range", {4.0, 5.0}},
                                         {"distance_range", {0, 3000}},
                                         {"platform", "foodpanda"}});
  REQUIRE(query.longitude == 121.56);
  REQUIRE(query.latitude == 25.04);
  REQUIRE(query.drink_tags == std::vector<std::string>{"青茶", "烏龍"});
  REQUIRE(query.brands == std::vector<std::string>{"50嵐"});
  REQUIRE(query.review_count_range->max == 500);
  REQUIRE(query.rating_range->min == 4.0);
  REQUIRE(query.distance_range->max == 3000);
  REQUIRE(query.platform == "foodpanda");
  REQUIRE(search_radius_km(query) == 3.0);
}

TEST_CASE("parse_list_store_payload platform defaults", "[service]") {
  SECTION("absent means ubereats") {
    auto query = parse_list_store_payload({{"location", {121.5, 25.0}}});
    REQUIRE(query.platform == "ubereats");
    REQUIRE(query.drink_tags.empty());
    REQUIRE_FALSE(query.distance_range.has_value());
    REQUIRE(search_radius_km(query) == kDefaultRadiusKm);
  }

  SECTION("null means every platform") {
    auto query = parse_list_store_payload(
        {{"location", {121.5, 25.0}}, {"platform", nullptr}});
    REQUIRE_FALSE(query.platform.has_value());
  }
}

TEST_CASE("parse_list_store_payload rejects malformed payloads",
          "[service]") {
  REQUIRE_THROWS_AS(parse_list_store_payload(json::array()),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(parse_list_store_payload({{"drink_tags", {"青茶"}}}),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(parse_list_store_payload({{"location", {121.5}}}),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(
      parse_list_store_payload({{"location", {121.5, 25.0}}, {"platform", "grab"}}),
      std::invalid_argument);
  REQUIRE_THROWS_AS(parse_list_store_payload(
                        {{"location", {121.5, 25.0}}, {"drink_tags", "青茶"}}),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(parse_list_store_payload({{"location", {121.5, 25.0}},
                                              {"rating_range", {5.0, 1.0}}}),
                    std::invalid_argument);
}

TEST_CASE("list_drinks applies the default limit", "[service]") {
  ServiceFixture fx;
  fx.store->reply("store", {{{"store_id", "A"}, {"platform", "ubereats"},
                             {"name", "Store A"}}});
  DrinkService service(fx.container);

  auto query = parse_list_store_payload({{"location", {121.5, 25.0}}});
  REQUIRE(service.list_drinks(query).empty());

  auto calls = fx.store->calls();
  REQUIRE(calls.size() == 2);
  REQUIRE(calls[1].collection == "menu_item");
  REQUIRE(calls[1].pipeline.back() == json{{"$limit", kDefaultDrinkLimit}});
  REQUIRE(fx.driver->initialized == 1);
}

TEST_CASE("list_simplified_drinks reduces each drink", "[service]") {
  ServiceFixture fx;
  fx.store->reply("store", {{{"store_id", "A"}, {"platform", "ubereats"},
                             {"name", "Store A"}}});
  fx.store->reply("menu_item", {{{"store_id", "A"},
                                 {"platform", "ubereats"},
                                 {"item_id", 1},
                                 {"name", "冬瓜檸檬"},
                                 {"price", 45},
                                 {"image_url", "https://img.example/1.jpg"}}});
  DrinkService service(fx.container);

  auto drinks = service.list_simplified_drinks(
      parse_list_store_payload({{"location", {121.5, 25.0}}}));
  REQUIRE(drinks.size() == 1);
  REQUIRE(drinks[0].name == "冬瓜檸檬");
  REQUIRE(drinks[0].store_name == "Store A");
  REQUIRE_FALSE(drinks[0].image_url.has_value());

  // No limit stage without an explicit limit
  REQUIRE_FALSE(fx.store->calls()[1].pipeline.back().contains("$limit"));
}

TEST_CASE("list_drink_tags filters, then orders by name length",
          "[service]") {
  ServiceFixture fx;
  fx.store->reply("drink_tag", {{{"name", "珍珠奶茶"}, {"count", 40}},
                                {{"name", "青茶"}, {"count", 30}},
                                {{"name", "多多"}, {"count", 8}}});
  DrinkService service(fx.container);

  auto tags = service.list_drink_tags();
  REQUIRE(tags.size() == 3);
  REQUIRE(tags[0].name == "青茶");
  REQUIRE(tags[1].name == "多多");
  REQUIRE(tags[2].name == "珍珠奶茶");

  auto stages = fx.store->calls()[0].pipeline;
  REQUIRE(stages[0] ==
          json{{"$match", {{"count", {{"$gt", kMinDrinkTagCount}}}}}});
  REQUIRE(stages[1] == json{{"$sort", {{"count", -1}}}});
  REQUIRE(stages[2] == json{{"$limit", kCatalogLimit}});
}

TEST_CASE("an unreachable drink tag cache falls back to the store",
          "[service]") {
  auto config = DriverConfig::Defaults().with_options(
      "redis", {{"enabled", true},
                {"host", "127.0.0.1"},
                {"port", 1},
                {"connect_timeout_ms", 50}});
  ServiceFixture fx(config);
  fx.container.register_driver<RedisClient>("redis",
                                            std::make_shared<RedisDriver>());
  fx.store->reply("drink_tag", {{{"name", "青茶"}, {"count", 30}}});
  DrinkService service(fx.container);

  auto tags = service.list_drink_tags();
  REQUIRE(tags.size() == 1);
  REQUIRE(fx.store->calls_to("drink_tag") == 1);
}

TEST_CASE("list_brands and list_companies", "[service]") {
  ServiceFixture fx;
  fx.store->reply("brand", {{{"name", "50嵐"}, {"has_chain", true},
                             {"chain_count", 120}}});
  fx.store->reply("company", {{{"alias", "hq"}, {"name", "總公司"},
                               {"address", "台北市信義區"}}});
  DrinkService service(fx.container);

  auto brands = service.list_brands();
  REQUIRE(brands.size() == 1);
  REQUIRE(brands[0].chain_count == 120);
  auto brand_match = fx.store->calls()[0].pipeline[0]["$match"];
  REQUIRE(brand_match["has_chain"] == true);
  REQUIRE(brand_match["chain_count"]["$gt"] == 1);
  REQUIRE(brand_match["platforms"] == "ubereats");

  auto companies = service.list_companies();
  REQUIRE(companies.size() == 1);
  REQUIRE(companies[0].alias == "hq");
  REQUIRE_FALSE(companies[0].location.has_value());
}

TEST_CASE("store failures reach the caller as QueryError", "[service]") {
  ServiceFixture fx;
  fx.store->fail_with("socket timeout");
  DrinkService service(fx.container);

  REQUIRE_THROWS_AS(
      service.list_stores(parse_list_store_payload({{"location", {121.5, 25.0}}})),
      QueryError);
}

TEST_CASE("register_default_drivers honors enabled flags", "[service]") {
  ResourceContainer container(DriverConfig::Defaults());
  register_default_drivers(container);
  REQUIRE(container.registered_names() ==
          std::vector<std::string>{"httpx", "mongo", "storage"});
  // Registration alone connects nothing
  REQUIRE(container.state("mongo") == ResourceState::Registered);
}

TEST_CASE("a misconfigured resource reports unhealthy without stopping the rest",
          "[drivers]") {
  auto config = DriverConfig::Defaults()
                    .with_options("mongo", {{"enabled", false}})
                    .with_options("storage", {{"project", ""}})
                    .with_options("httpx", {{"health_check_urls", json::array()}});
  ResourceContainer container(config);
  register_default_drivers(container);
  REQUIRE(container.registered_names() ==
          std::vector<std::string>{"httpx", "storage"});

  std::map<std::string, bool> status;
  REQUIRE_NOTHROW(status = default_drivers_health(container));
  REQUIRE(status.size() == 2);
  REQUIRE(status.at("storage") == false);
  REQUIRE(status.at("httpx") == false);
  REQUIRE(container.state("storage") == ResourceState::Registered);
  REQUIRE(container.state("httpx") == ResourceState::Ready);
}
