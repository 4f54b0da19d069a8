#include "pipeline.h"

#include "errors.h"

#include <re2/re2.h>

using json = nlohmann::json;

namespace drinkd::pipeline {

namespace {

const json& tautology() {
  static const json kTautology = {{"$match", {{"$expr", true}}}};
  return kTautology;
}

std::string join_tags(const std::vector<std::string>& tags) {
  std::string out;
  for (const auto& tag : tags) {
    if (!out.empty()) out += ' ';
    out += tag;
  }
  return out;
}

}  // namespace

json platform_is(const std::string& platform) {
  return {{"$or",
           json::array({{{"platform", platform}}, {{"platforms", platform}}})}};
}

Stage match_platform(const std::string& platform) {
  return {{"$match", platform_is(platform)}};
}

Stage geo_near(double longitude, double latitude, double radius_km) {
  return {{"$geoNear",
           {{"near",
             {{"type", "Point"},
              {"coordinates", json::array({longitude, latitude})}}},
            {"distanceField", "distance_in_meter"},
            {"maxDistance", radius_km * 1000.0},
            {"spherical", true}}}};
}

Stage text_search(const std::vector<std::string>& tags) {
  if (tags.empty()) {
    return tautology();
  }
  return {{"$match", {{"$text", {{"$search", join_tags(tags)}}}}}};
}

Stage store_attributes(const DrinkQuery& query) {
  json filter = json::object();
  if (query.platform && !query.platform->empty()) {
    filter.update(platform_is(*query.platform));
  }
  if (query.rating_range) {
    filter["rating.value"] = {{"$gte", query.rating_range->min},
                              {"$lte", query.rating_range->max}};
  }
  if (query.review_count_range) {
    filter["rating.review_count"] = {{"$gte", query.review_count_range->min},
                                     {"$lte", query.review_count_range->max}};
  }
  if (filter.empty()) {
    return tautology();
  }
  return {{"$match", filter}};
}

std::optional<Stage> brand_match(const std::vector<std::string>& brands) {
  if (brands.empty()) {
    return std::nullopt;
  }
  json any = json::array();
  for (const auto& brand : brands) {
    any.push_back(
        {{"name", {{"$regex", RE2::QuoteMeta(brand)}, {"$options", "i"}}}});
  }
  return Stage{{"$match", {{"$or", any}}}};
}

Stage restrict_to_stores(const std::vector<StoreKey>& keys) {
  if (keys.empty()) {
    // $or rejects an empty array
    return {{"$match", {{"$expr", false}}}};
  }
  json any = json::array();
  for (const auto& key : keys) {
    json pair = platform_is(key.platform);
    pair["store_id"] = key.store_id;
    any.push_back(std::move(pair));
  }
  return {{"$match", {{"$or", any}}}};
}

Stage price_at_least(double min_price) {
  return {{"$match", {{"price", {{"$gte", min_price}}}}}};
}

Stage add_text_score() {
  return {{"$addFields", {{"text_score", {{"$meta", "textScore"}}}}}};
}

Stage sort_by_text_score() {
  return {{"$sort", {{"text_score", {{"$meta", "textScore"}}}}}};
}

Stage limit(int64_t n) { return {{"$limit", n}}; }

Stage project_store() {
  return {{"$project",
           {{"_id", 0},
            {"store_id", 1},
            {"platform", 1},
            {"platforms", 1},
            {"name", 1},
            {"brand", 1},
            {"address", 1},
            {"location", 1},
            {"rating", 1},
            {"cuisines", 1},
            {"source_url", 1},
            {"distance_in_meter", 1}}}};
}

Stage project_menu_item(bool with_text_score) {
  json fields = {{"_id", 0},         {"item_id", 1},     {"store_id", 1},
                 {"platform", 1},    {"platforms", 1},   {"name", 1},
                 {"category", 1},    {"description", 1}, {"price", 1},
                 {"image_url", 1},   {"keywords", 1},    {"is_popular", 1}};
  if (with_text_score) {
    fields["text_score"] = 1;
  }
  return {{"$project", fields}};
}

std::vector<Stage> group_store_keys() {
  std::vector<Stage> stages;
  json id = {{"store_id", "$store_id"},
             {"platform",
              {{"$ifNull", json::array({"$platform", "$platforms"})}}}};
  stages.push_back({{"$group", {{"_id", id}}}});
  stages.push_back({{"$project",
                     {{"_id", 0},
                      {"store_id", "$_id.store_id"},
                      {"platform", "$_id.platform"}}}});
  return stages;
}

Stage menu_name_match(const std::string& term,
                      const std::vector<std::string>& store_ids,
                      const std::optional<std::string>& platform) {
  json filter = {
      {"name", {{"$regex", RE2::QuoteMeta(term)}, {"$options", "i"}}}};
  if (!store_ids.empty()) {
    filter["store_id"] = {{"$in", store_ids}};
  }
  if (platform && !platform->empty()) {
    filter.update(platform_is(*platform));
  }
  return {{"$match", filter}};
}

bool is_geo_stage(const Stage& stage) {
  return stage.is_object() && stage.contains("$geoNear");
}

bool is_text_stage(const Stage& stage) {
  if (!stage.is_object()) return false;
  auto match = stage.find("$match");
  return match != stage.end() && match->is_object() &&
         match->contains("$text");
}

void validate(const json& stages) {
  if (!stages.is_array()) {
    throw QueryError("pipeline must be an array of stages");
  }
  for (size_t i = 0; i < stages.size(); ++i) {
    const auto& stage = stages[i];
    const bool geo = is_geo_stage(stage);
    const bool text = is_text_stage(stage);
    if (!geo && !text) continue;
    if (i != 0) {
      throw QueryError(std::string(geo ? "$geoNear" : "$text") +
                       " stage must be the first stage, found at index " +
                       std::to_string(i));
    }
    if (geo && text) {
      throw QueryError("$geoNear and $text cannot share a stage");
    }
  }
}

json make(std::vector<Stage> stages) {
  json out = json::array();
  for (auto& stage : stages) {
    out.push_back(std::move(stage));
  }
  return out;
}

}  // namespace drinkd::pipeline
