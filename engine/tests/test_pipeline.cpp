#include <catch2/catch_test_macros.hpp>

#include "errors.h"
#include "pipeline.h"

using namespace drinkd;
using json = nlohmann::json;

TEST_CASE("validate accepts geo or text only as the first stage",
          "[pipeline]") {
  auto geo = pipeline::geo_near(121.5, 25.0, 5.0);
  auto text = pipeline::text_search({"奶茶"});
  auto project = pipeline::project_store();

  REQUIRE_NOTHROW(pipeline::validate(pipeline::make({geo, project})));
  REQUIRE_NOTHROW(pipeline::validate(pipeline::make({text, project})));
  REQUIRE_NOTHROW(pipeline::validate(json::array()));

  REQUIRE_THROWS_AS(pipeline::validate(pipeline::make({project, geo})),
                    QueryError);
  REQUIRE_THROWS_AS(pipeline::validate(pipeline::make({geo, text})),
                    QueryError);
  REQUIRE_THROWS_AS(pipeline::validate(pipeline::make({text, text})),
                    QueryError);

  json both = geo;
  both["$match"] = text["$match"];
  REQUIRE_THROWS_AS(pipeline::validate(json::array({both})), QueryError);

  REQUIRE_THROWS_AS(pipeline::validate(json::object()), QueryError);
}

TEST_CASE("stage classification", "[pipeline]") {
  REQUIRE(pipeline::is_geo_stage(pipeline::geo_near(0, 0, 1)));
  REQUIRE(pipeline::is_text_stage(pipeline::text_search({"紅茶", "綠茶"})));
  REQUIRE_FALSE(pipeline::is_text_stage(pipeline::price_at_least(20)));
  REQUIRE_FALSE(pipeline::is_geo_stage(json("$geoNear")));
}

TEST_CASE("text_search joins tags and degrades to a tautology",
          "[pipeline]") {
  auto stage = pipeline::text_search({"紅茶", "綠茶"});
  REQUIRE(stage["$match"]["$text"]["$search"] == "紅茶 綠茶");

  auto empty = pipeline::text_search({});
  REQUIRE(empty == json{{"$match", {{"$expr", true}}}});
  REQUIRE_FALSE(pipeline::is_text_stage(empty));
}

TEST_CASE("store_attributes builds range filters", "[pipeline]") {
  DrinkQuery query;
  REQUIRE(pipeline::store_attributes(query) ==
          json{{"$match", {{"$expr", true}}}});

  query.platform = "foodpanda";
  query.rating_range = Range<double>{4.0, 5.0};
  query.review_count_range = Range<int64_t>{50, 1000};
  auto stage = pipeline::store_attributes(query);
  const auto& match = stage["$match"];
  REQUIRE(match["$or"] == json::array({{{"platform", "foodpanda"}},
                                       {{"platforms", "foodpanda"}}}));
  REQUIRE(match["rating.value"]["$gte"].get<double>() == 4.0);
  REQUIRE(match["rating.value"]["$lte"].get<double>() == 5.0);
  REQUIRE(match["rating.review_count"]["$gte"].get<int64_t>() == 50);
  REQUIRE(match["rating.review_count"]["$lte"].get<int64_t>() == 1000);
}

TEST_CASE("brand_match quotes brand text", "[pipeline]") {
  REQUIRE_FALSE(pipeline::brand_match({}).has_value());

  auto stage = pipeline::brand_match({"50嵐", "Coco(都可)"});
  REQUIRE(stage.has_value());
  const auto& any = (*stage)["$match"]["$or"];
  REQUIRE(any.size() == 2);
  REQUIRE(any[0]["name"]["$regex"] == "50嵐");
  REQUIRE(any[1]["name"]["$regex"] == "Coco\\(都可\\)");
  REQUIRE(any[1]["name"]["$options"] == "i");
}

TEST_CASE("restrict_to_stores matches pairs", "[pipeline]") {
  auto none = pipeline::restrict_to_stores({});
  REQUIRE(none == json{{"$match", {{"$expr", false}}}});

  auto stage = pipeline::restrict_to_stores(
      {StoreKey{"A", "ubereats"}, StoreKey{"A", "foodpanda"}});
  const auto& any = stage["$match"]["$or"];
  REQUIRE(any.size() == 2);
  REQUIRE(any[0]["store_id"] == "A");
  REQUIRE(any[0]["$or"][0] == json{{"platform", "ubereats"}});
  REQUIRE(any[1]["store_id"] == "A");
  REQUIRE(any[1]["$or"][0] == json{{"platform", "foodpanda"}});
}

TEST_CASE("menu projection keeps the score only when asked", "[pipeline]") {
  REQUIRE(pipeline::project_menu_item(true)["$project"].contains("text_score"));
  REQUIRE_FALSE(
      pipeline::project_menu_item(false)["$project"].contains("text_score"));
  REQUIRE(pipeline::project_store()["$project"]["_id"] == 0);
}

TEST_CASE("group_store_keys emits group then project", "[pipeline]") {
  auto stages = pipeline::group_store_keys();
  REQUIRE(stages.size() == 2);
  REQUIRE(stages[0]["$group"]["_id"]["store_id"] == "$store_id");
  REQUIRE(stages[0]["$group"]["_id"]["platform"]["$ifNull"] ==
          json::array({"$platform", "$platforms"}));
  REQUIRE(stages[1]["$project"]["store_id"] == "$_id.store_id");
  REQUIRE(stages[1]["$project"]["platform"] == "$_id.platform");
}

TEST_CASE("platform predicates also match legacy platforms rows",
          "[pipeline]") {
  auto predicate = pipeline::platform_is("ubereats");
  REQUIRE(predicate == json{{"$or", json::array({{{"platform", "ubereats"}},
                                                 {{"platforms", "ubereats"}}})}});
  REQUIRE(pipeline::match_platform("ubereats") == json{{"$match", predicate}});

  // Pair restriction keeps the store id beside the platform alternatives
  auto stage = pipeline::restrict_to_stores({StoreKey{"7", "ubereats"}});
  const auto& pair = stage["$match"]["$or"][0];
  REQUIRE(pair["store_id"] == "7");
  REQUIRE(pair["$or"] == predicate["$or"]);

  auto menu = pipeline::menu_name_match("tea", {"7"}, std::string("ubereats"));
  REQUIRE(menu["$match"]["$or"] == predicate["$or"]);
  REQUIRE_FALSE(menu["$match"].contains("platform"));
}
