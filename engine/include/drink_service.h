#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "documents.h"
#include "drink_query.h"
#include "geo_text_query_engine.h"

namespace drinkd {

class ResourceContainer;
class RedisClient;

inline constexpr int64_t kDefaultDrinkLimit = 100;
inline constexpr int64_t kCatalogLimit = 1000;
inline constexpr int64_t kMinDrinkTagCount = 5;
inline constexpr std::string_view kDrinkTagCacheKey = "drinkd:drink_tags";

// Parse a list-store request body:
//   {"location": [lon, lat], "drink_tags": [...], "brands": [...],
//    "review_count_range": [min, max], "rating_range": [min, max],
//    "distance_range": [min, max], "platform": "ubereats" | "foodpanda" | null}
// platform defaults to "ubereats" when the key is absent.
// Throws std::invalid_argument describing the first violation.
DrinkQuery parse_list_store_payload(const nlohmann::json& payload);

/**
 * DrinkService - the listing operations served to clients.
 *
 * Resolves the "mongo" resource from the container on every call, so the
 * first request pays for the connection and later ones reuse it. Drink tags
 * are cached in redis when a "redis" resource is registered; the cache is
 * best-effort and its failures are only logged.
 */
class DrinkService {
 public:
  explicit DrinkService(ResourceContainer& container);

  std::vector<StoreWithMenu> list_stores(const DrinkQuery& query);

  // `limit` overrides query.limit; nullopt means unlimited.
  std::vector<Drink> list_drinks(
      const DrinkQuery& query,
      std::optional<int64_t> limit = kDefaultDrinkLimit);

  std::vector<SimplifiedDrink> list_simplified_drinks(
      const DrinkQuery& query, std::optional<int64_t> limit = std::nullopt);

  // Tags seen more than kMinDrinkTagCount times, shortest name first.
  std::vector<DrinkTagDoc> list_drink_tags();

  // Chain brands present on ubereats, most stores first.
  std::vector<BrandDoc> list_brands();

  std::vector<CompanyDoc> list_companies();

 private:
  std::shared_ptr<DocumentStore> store();
  std::shared_ptr<RedisClient> cache();

  std::vector<DrinkTagDoc> load_drink_tags();

  ResourceContainer& container_;
};

}  // namespace drinkd
