#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "documents.h"
#include "drink_query.h"

namespace drinkd::pipeline {

using Stage = nlohmann::json;

// Rows written before the platform field existed carry "platforms"
// instead, so every platform predicate matches either field.

// {$or: [{platform: p}, {platforms: p}]}, for use inside a $match.
nlohmann::json platform_is(const std::string& platform);

Stage match_platform(const std::string& platform);

// $geoNear on store.location; writes distance_in_meter.
Stage geo_near(double longitude, double latitude, double radius_km);

// $match {$text: {$search: "tag1 tag2"}}; tautology when tags is empty.
Stage text_search(const std::vector<std::string>& tags);

// platform equality, rating.value and rating.review_count ranges.
// Tautology ({$match: {$expr: true}}) when none is set.
Stage store_attributes(const DrinkQuery& query);

// $or of case-insensitive substring matches on store name, one per brand.
// Brand text is matched literally. Returns nullopt for no brands.
std::optional<Stage> brand_match(const std::vector<std::string>& brands);

// $or of (store_id, platform) pairs. An empty key list matches nothing.
Stage restrict_to_stores(const std::vector<StoreKey>& keys);

Stage price_at_least(double min_price);

// Adds text_score from the text search relevance.
Stage add_text_score();
Stage sort_by_text_score();

Stage limit(int64_t n);

// Output shapes. Both drop _id; the menu projection keeps text_score
// when asked.
Stage project_store();
Stage project_menu_item(bool with_text_score);

// Group menu items to their distinct (store_id, platform) pairs, taking
// the platform from "platforms" when "platform" is missing.
std::vector<Stage> group_store_keys();

// Case-insensitive literal match of `term` on menu item name, optionally
// restricted to store ids and a platform.
Stage menu_name_match(const std::string& term,
                      const std::vector<std::string>& store_ids,
                      const std::optional<std::string>& platform);

bool is_geo_stage(const Stage& stage);
bool is_text_stage(const Stage& stage);

// Geo and text stages may only sit at index 0, at most once, never both.
// Throws QueryError otherwise, or when the pipeline is not an array.
void validate(const nlohmann::json& stages);

// Build an array pipeline from stages.
nlohmann::json make(std::vector<Stage> stages);

}  // namespace drinkd::pipeline
