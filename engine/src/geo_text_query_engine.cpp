#include "geo_text_query_engine.h"

#include "errors.h"
#include "logging.h"
#include "pipeline.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

using json = nlohmann::json;

namespace drinkd {

namespace {

StoreWithMenu parse_store_row(const json& row) {
  StoreWithMenu out;
  out.store = parse_store(row);
  auto it = row.find("distance_in_meter");
  if (it != row.end() && it->is_number()) {
    out.distance_in_meter = it->get<double>();
  }
  out.distance_in_km = round_km(out.distance_in_meter);
  return out;
}

ScoredMenuItem parse_scored_item(const json& row) {
  ScoredMenuItem out;
  out.item = parse_menu_item(row);
  auto it = row.find("text_score");
  if (it != row.end() && it->is_number()) {
    out.text_score = it->get<double>();
  }
  return out;
}

std::vector<StoreWithMenu> dedup_stores(std::vector<StoreWithMenu> stores) {
  std::unordered_set<StoreKey, StoreKeyHash> seen;
  std::vector<StoreWithMenu> out;
  out.reserve(stores.size());
  for (auto& store : stores) {
    if (seen.insert(store_key(store.store)).second) {
      out.push_back(std::move(store));
    }
  }
  return out;
}

std::vector<ScoredMenuItem> parse_items(const std::vector<json>& rows) {
  std::vector<ScoredMenuItem> items;
  items.reserve(rows.size());
  for (const auto& row : rows) {
    items.push_back(parse_scored_item(row));
  }
  return dedup_menu_items(std::move(items));
}

}  // namespace

GeoTextQueryEngine::GeoTextQueryEngine(std::shared_ptr<DocumentStore> store)
    : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("GeoTextQueryEngine: null document store");
  }
}

std::vector<json> GeoTextQueryEngine::run(std::string_view collection,
                                          const json& pipeline) {
  pipeline::validate(pipeline);
  try {
    return store_->aggregate(collection, pipeline);
  } catch (const QueryError&) {
    throw;
  } catch (const std::exception& e) {
    get_logger("engine")->error("aggregate on '{}' failed: {}", collection,
                                e.what());
    throw QueryError("aggregate on '" + std::string(collection) +
                     "' failed: " + e.what());
  }
}

// =====================================================
// Phases
// =====================================================

std::vector<StoreKey> GeoTextQueryEngine::stores_matching_tags(
    const DrinkQuery& query) {
  std::vector<pipeline::Stage> stages;
  stages.push_back(pipeline::text_search(query.drink_tags));
  if (query.platform && !query.platform->empty()) {
    stages.push_back(pipeline::match_platform(*query.platform));
  }
  for (auto& stage : pipeline::group_store_keys()) {
    stages.push_back(std::move(stage));
  }

  auto rows = run(kMenuItemCollection, pipeline::make(std::move(stages)));

  std::unordered_set<StoreKey, StoreKeyHash> seen;
  std::vector<StoreKey> keys;
  for (const auto& row : rows) {
    auto item = parse_menu_item(row);
    StoreKey key = store_key(item);
    if (seen.insert(key).second) {
      keys.push_back(std::move(key));
    }
  }
  return keys;
}

std::vector<StoreWithMenu> GeoTextQueryEngine::stores_near(
    const DrinkQuery& query, const std::optional<std::vector<StoreKey>>& only) {
  std::vector<pipeline::Stage> stages;
  stages.push_back(pipeline::geo_near(query.longitude, query.latitude,
                                      search_radius_km(query)));
  stages.push_back(pipeline::store_attributes(query));
  if (only) {
    stages.push_back(pipeline::restrict_to_stores(*only));
  }
  if (auto brands = pipeline::brand_match(query.brands)) {
    stages.push_back(std::move(*brands));
  }
  stages.push_back(pipeline::project_store());

  auto rows = run(kStoreCollection, pipeline::make(std::move(stages)));

  std::vector<StoreWithMenu> stores;
  stores.reserve(rows.size());
  for (const auto& row : rows) {
    stores.push_back(parse_store_row(row));
  }
  return dedup_stores(std::move(stores));
}

std::vector<ScoredMenuItem> GeoTextQueryEngine::menu_items_of(
    const std::vector<StoreKey>& stores,
    const std::vector<std::string>& drink_tags) {
  const bool scored = !drink_tags.empty();
  std::vector<pipeline::Stage> stages;
  if (scored) {
    stages.push_back(pipeline::text_search(drink_tags));
  }
  stages.push_back(pipeline::restrict_to_stores(stores));
  if (scored) {
    stages.push_back(pipeline::add_text_score());
  }
  stages.push_back(pipeline::project_menu_item(scored));
  if (scored) {
    stages.push_back(pipeline::sort_by_text_score());
  }

  return parse_items(run(kMenuItemCollection, pipeline::make(std::move(stages))));
}

std::vector<ScoredMenuItem> GeoTextQueryEngine::drinks_of(
    const std::vector<StoreKey>& stores, const DrinkQuery& query) {
  const bool scored = !query.drink_tags.empty();
  std::vector<pipeline::Stage> stages;
  if (scored) {
    stages.push_back(pipeline::text_search(query.drink_tags));
  }
  stages.push_back(pipeline::price_at_least(kMinDrinkPrice));
  stages.push_back(pipeline::restrict_to_stores(stores));
  if (scored) {
    stages.push_back(pipeline::add_text_score());
  }
  stages.push_back(pipeline::project_menu_item(scored));
  if (scored) {
    stages.push_back(pipeline::sort_by_text_score());
  }
  if (query.limit && *query.limit > 0) {
    stages.push_back(pipeline::limit(*query.limit));
  }

  return parse_items(run(kMenuItemCollection, pipeline::make(std::move(stages))));
}

// =====================================================
// Operations
// =====================================================

std::vector<StoreWithMenu> GeoTextQueryEngine::find_drink_stores_with_menu(
    const DrinkQuery& query) {
  auto log = get_logger("engine");
  const bool tagged = !query.drink_tags.empty();

  std::optional<std::vector<StoreKey>> candidates;
  if (tagged) {
    candidates = stores_matching_tags(query);
    if (candidates->empty()) {
      log->debug("No menu item matches tags; skipping store lookup");
      return {};
    }
  }

  auto stores = stores_near(query, candidates);
  if (stores.empty()) {
    return {};
  }

  auto items = menu_items_of(keys_of(stores), query.drink_tags);
  auto result = join_menus(std::move(stores), std::move(items), tagged);

  if (query.limit && *query.limit > 0 &&
      result.size() > static_cast<size_t>(*query.limit)) {
    result.resize(static_cast<size_t>(*query.limit));
  }
  log->debug("find_drink_stores_with_menu: {} stores", result.size());
  return result;
}

std::vector<Drink> GeoTextQueryEngine::find_drinks(const DrinkQuery& query) {
  auto stores = stores_near(query);
  if (stores.empty()) {
    return {};
  }
  auto items = drinks_of(keys_of(stores), query);
  auto drinks =
      join_drinks(stores, std::move(items), !query.drink_tags.empty());
  get_logger("engine")->debug("find_drinks: {} drinks from {} stores",
                              drinks.size(), stores.size());
  return drinks;
}

std::vector<StoreWithMenu> GeoTextQueryEngine::find_nearby_stores(
    double longitude, double latitude, double radius_km,
    std::optional<int64_t> limit) {
  if (radius_km <= 0) {
    throw QueryError("find_nearby_stores: radius must be > 0");
  }
  std::vector<pipeline::Stage> stages;
  stages.push_back(pipeline::geo_near(longitude, latitude, radius_km));
  stages.push_back(pipeline::project_store());
  if (limit && *limit > 0) {
    stages.push_back(pipeline::limit(*limit));
  }

  auto rows = run(kStoreCollection, pipeline::make(std::move(stages)));
  std::vector<StoreWithMenu> stores;
  stores.reserve(rows.size());
  for (const auto& row : rows) {
    stores.push_back(parse_store_row(row));
  }
  return dedup_stores(std::move(stores));
}

std::vector<MenuItemDoc> GeoTextQueryEngine::search_menu_items(
    const std::string& term, const std::vector<std::string>& store_ids,
    const std::optional<std::string>& platform, std::optional<int64_t> limit) {
  std::vector<pipeline::Stage> stages;
  stages.push_back(pipeline::menu_name_match(term, store_ids, platform));
  stages.push_back(pipeline::project_menu_item(false));
  if (limit && *limit > 0) {
    stages.push_back(pipeline::limit(*limit));
  }

  auto items =
      parse_items(run(kMenuItemCollection, pipeline::make(std::move(stages))));
  std::vector<MenuItemDoc> out;
  out.reserve(items.size());
  for (auto& scored : items) {
    out.push_back(std::move(scored.item));
  }
  return out;
}

// =====================================================
// In-memory join and ranking
// =====================================================

std::vector<StoreKey> keys_of(const std::vector<StoreWithMenu>& stores) {
  std::vector<StoreKey> keys;
  keys.reserve(stores.size());
  for (const auto& store : stores) {
    keys.push_back(store_key(store.store));
  }
  return keys;
}

std::vector<ScoredMenuItem> dedup_menu_items(std::vector<ScoredMenuItem> items) {
  std::unordered_set<std::string> seen;
  std::vector<ScoredMenuItem> out;
  out.reserve(items.size());
  for (auto& scored : items) {
    const auto& item = scored.item;
    std::string key = item.platform + '\x1f' + item.store_id + '\x1f' +
                      item.item_id + '\x1f' + item.name;
    if (seen.insert(std::move(key)).second) {
      out.push_back(std::move(scored));
    }
  }
  return out;
}

std::vector<StoreWithMenu> join_menus(std::vector<StoreWithMenu> stores,
                                      std::vector<ScoredMenuItem> items,
                                      bool rank_by_hits) {
  std::unordered_map<StoreKey, size_t, StoreKeyHash> index;
  for (size_t i = 0; i < stores.size(); ++i) {
    index.emplace(store_key(stores[i].store), i);
  }

  std::vector<size_t> hits(stores.size(), 0);
  for (auto& scored : items) {
    auto it = index.find(store_key(scored.item));
    if (it == index.end()) continue;
    stores[it->second].menu.push_back(std::move(scored.item));
    ++hits[it->second];
  }

  if (!rank_by_hits) {
    return stores;
  }

  std::vector<size_t> order(stores.size());
  for (size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::stable_sort(order.begin(), order.end(),
                   [&hits](size_t a, size_t b) { return hits[a] > hits[b]; });

  std::vector<StoreWithMenu> ranked;
  ranked.reserve(stores.size());
  for (size_t i : order) {
    ranked.push_back(std::move(stores[i]));
  }
  return ranked;
}

std::vector<Drink> join_drinks(const std::vector<StoreWithMenu>& stores,
                               std::vector<ScoredMenuItem> items,
                               bool rank_by_score) {
  std::unordered_map<StoreKey, const StoreDoc*, StoreKeyHash> index;
  for (const auto& store : stores) {
    index.emplace(store_key(store.store), &store.store);
  }

  // Orphans (no phase-1 store) are dropped
  std::vector<ScoredMenuItem> joined;
  joined.reserve(items.size());
  for (auto& scored : items) {
    if (index.contains(store_key(scored.item))) {
      joined.push_back(std::move(scored));
    }
  }

  if (rank_by_score) {
    std::stable_sort(joined.begin(), joined.end(),
                     [](const ScoredMenuItem& a, const ScoredMenuItem& b) {
                       return a.text_score > b.text_score;
                     });
  }

  std::vector<Drink> drinks;
  drinks.reserve(joined.size());
  for (auto& scored : joined) {
    const StoreDoc& store = *index.at(store_key(scored.item));
    Drink drink;
    drink.store_name = store.name;
    drink.store_url = store.source_url.empty()
                          ? build_store_url(store.store_id, store.platform)
                          : store.source_url;
    drink.brand_name = store.brand;
    drink.item = std::move(scored.item);
    drinks.push_back(std::move(drink));
  }
  return drinks;
}

}  // namespace drinkd
