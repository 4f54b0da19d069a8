#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "document_store.h"
#include "documents.h"
#include "drink_query.h"

namespace drinkd {

inline constexpr std::string_view kStoreCollection = "store";
inline constexpr std::string_view kMenuItemCollection = "menu_item";

// A menu item with its text-search relevance. The score only orders
// results; it never reaches the caller.
struct ScoredMenuItem {
  MenuItemDoc item;
  double text_score = 0.0;
};

/**
 * GeoTextQueryEngine - drink and store discovery over `store` and
 * `menu_item`.
 *
 * The store cannot combine a geo-nearest stage and a text-search stage in
 * one pipeline (both must come first), so each operation runs as
 * sequential phases, each a single validated pipeline, and joins,
 * deduplicates and ranks the phases' rows in memory by (store_id, platform).
 *
 * Every failure (malformed pipeline, transport, unreadable row) surfaces
 * as QueryError; an operation never returns partial results.
 *
 * Thread safety: stateless apart from the store handle; operations may
 * run concurrently if the DocumentStore allows it.
 */
class GeoTextQueryEngine {
 public:
  explicit GeoTextQueryEngine(std::shared_ptr<DocumentStore> store);

  // Stores near the query point with their menus. With drink tags only
  // stores selling a matching item are returned, ordered by how many
  // matching items each sells, and their menus hold only the matches.
  std::vector<StoreWithMenu> find_drink_stores_with_menu(
      const DrinkQuery& query);

  // Menu items (price >= kMinDrinkPrice) from stores near the query
  // point, with store display fields. With drink tags, ordered by
  // relevance.
  std::vector<Drink> find_drinks(const DrinkQuery& query);

  std::vector<StoreWithMenu> find_nearby_stores(
      double longitude, double latitude, double radius_km = kDefaultRadiusKm,
      std::optional<int64_t> limit = std::nullopt);

  std::vector<MenuItemDoc> search_menu_items(
      const std::string& term, const std::vector<std::string>& store_ids = {},
      const std::optional<std::string>& platform = std::nullopt,
      std::optional<int64_t> limit = std::nullopt);

  // =====================================================
  // Phases
  // =====================================================

  // Distinct stores selling an item that matches the drink tags.
  std::vector<StoreKey> stores_matching_tags(const DrinkQuery& query);

  // Stores within the search radius that pass the attribute and brand
  // filters, optionally restricted to `only`. Deduplicated by key.
  std::vector<StoreWithMenu> stores_near(
      const DrinkQuery& query,
      const std::optional<std::vector<StoreKey>>& only = std::nullopt);

  // Menu items of `stores`; text-matched and scored when tags are given.
  std::vector<ScoredMenuItem> menu_items_of(
      const std::vector<StoreKey>& stores,
      const std::vector<std::string>& drink_tags);

  // Drink candidates of `stores` for find_drinks.
  std::vector<ScoredMenuItem> drinks_of(const std::vector<StoreKey>& stores,
                                        const DrinkQuery& query);

 private:
  // Validate, execute, and turn any failure into QueryError.
  std::vector<nlohmann::json> run(std::string_view collection,
                                  const nlohmann::json& pipeline);

  std::shared_ptr<DocumentStore> store_;
};

// =====================================================
// In-memory join and ranking
// =====================================================

// Attach each item to the store with the same key. When `rank_by_hits`,
// stores are stable-sorted by descending number of attached items.
// Items of unknown stores are dropped.
std::vector<StoreWithMenu> join_menus(std::vector<StoreWithMenu> stores,
                                      std::vector<ScoredMenuItem> items,
                                      bool rank_by_hits);

// Attach store display fields to each item; orphans are dropped. When
// `rank_by_score`, drinks are stable-sorted by descending text score,
// otherwise item order is kept.
std::vector<Drink> join_drinks(const std::vector<StoreWithMenu>& stores,
                               std::vector<ScoredMenuItem> items,
                               bool rank_by_score);

std::vector<StoreKey> keys_of(const std::vector<StoreWithMenu>& stores);

// Keep the first item per (platform, store_id, item_id, name).
std::vector<ScoredMenuItem> dedup_menu_items(std::vector<ScoredMenuItem> items);

}  // namespace drinkd
