#include "drink_service.h"

#include "errors.h"
#include "logging.h"
#include "redis_client.h"
#include "resource_container.h"

#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace drinkd {

namespace {

constexpr int64_t kDefaultDrinkTagTtlSeconds = 600;

std::vector<std::string> string_list(const json& payload, const char* key) {
  std::vector<std::string> out;
  auto it = payload.find(key);
  if (it == payload.end() || it->is_null()) {
    return out;
  }
  if (!it->is_array()) {
    throw std::invalid_argument(std::string(key) + " must be a list of strings");
  }
  for (const auto& elem : *it) {
    if (!elem.is_string()) {
      throw std::invalid_argument(std::string(key) +
                                  " must be a list of strings");
    }
    out.push_back(elem.get<std::string>());
  }
  return out;
}

template <typename T>
std::optional<Range<T>> range(const json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_array() || it->size() != 2 || !(*it)[0].is_number() ||
      !(*it)[1].is_number()) {
    throw std::invalid_argument(std::string(key) +
                                " must be a [min, max] pair of numbers");
  }
  Range<T> out{(*it)[0].get<T>(), (*it)[1].get<T>()};
  if (out.min > out.max) {
    throw std::invalid_argument(std::string(key) + ": min must be <= max");
  }
  return out;
}

}  // namespace

DrinkQuery parse_list_store_payload(const json& payload) {
  if (!payload.is_object()) {
    throw std::invalid_argument("payload must be a JSON object");
  }

  DrinkQuery query;
  auto location = payload.find("location");
  if (location == payload.end() || !location->is_array() ||
      location->size() != 2 || !(*location)[0].is_number() ||
      !(*location)[1].is_number()) {
    throw std::invalid_argument("location must be [longitude, latitude]");
  }
  query.longitude = (*location)[0].get<double>();
  query.latitude = (*location)[1].get<double>();

  query.drink_tags = string_list(payload, "drink_tags");
  query.brands = string_list(payload, "brands");
  query.review_count_range = range<int64_t>(payload, "review_count_range");
  query.rating_range = range<double>(payload, "rating_range");
  query.distance_range = range<int64_t>(payload, "distance_range");

  auto platform = payload.find("platform");
  if (platform == payload.end()) {
    query.platform = "ubereats";
  } else if (!platform->is_null()) {
    if (!platform->is_string()) {
      throw std::invalid_argument("platform must be a string or null");
    }
    auto value = platform->get<std::string>();
    if (value != "ubereats" && value != "foodpanda") {
      throw std::invalid_argument("platform must be ubereats or foodpanda, got " +
                                  value);
    }
    query.platform = std::move(value);
  }
  return query;
}

DrinkService::DrinkService(ResourceContainer& container)
    : container_(container) {}

std::shared_ptr<DocumentStore> DrinkService::store() {
  return container_.get_instance<DocumentStore>("mongo");
}

std::shared_ptr<RedisClient> DrinkService::cache() {
  if (!container_.is_registered("redis")) {
    return nullptr;
  }
  try {
    return container_.get_instance<RedisClient>("redis");
  } catch (const InitializationError& e) {
    get_logger("service")->warn("Drink tag cache unavailable: {}", e.what());
    return nullptr;
  }
}

std::vector<StoreWithMenu> DrinkService::list_stores(const DrinkQuery& query) {
  GeoTextQueryEngine engine(store());
  return engine.find_drink_stores_with_menu(query);
}

std::vector<Drink> DrinkService::list_drinks(const DrinkQuery& query,
                                             std::optional<int64_t> limit) {
  DrinkQuery limited = query;
  limited.limit = limit;
  GeoTextQueryEngine engine(store());
  return engine.find_drinks(limited);
}

std::vector<SimplifiedDrink> DrinkService::list_simplified_drinks(
    const DrinkQuery& query, std::optional<int64_t> limit) {
  auto drinks = list_drinks(query, limit);
  std::vector<SimplifiedDrink> out;
  out.reserve(drinks.size());
  for (const auto& drink : drinks) {
    out.push_back(simplify(drink));
  }
  return out;
}

std::vector<DrinkTagDoc> DrinkService::load_drink_tags() {
  auto rows = store()->find(
      "drink_tag", {{"count", {{"$gt", kMinDrinkTagCount}}}},
      {{"count", -1}}, kCatalogLimit);

  std::vector<DrinkTagDoc> tags;
  tags.reserve(rows.size());
  for (const auto& row : rows) {
    tags.push_back(parse_drink_tag(row));
  }
  std::stable_sort(tags.begin(), tags.end(),
                   [](const DrinkTagDoc& a, const DrinkTagDoc& b) {
                     return utf8_length(a.name) < utf8_length(b.name);
                   });
  return tags;
}

std::vector<DrinkTagDoc> DrinkService::list_drink_tags() {
  auto log = get_logger("service");
  auto redis = cache();
  const std::string key(kDrinkTagCacheKey);

  if (redis) {
    auto cached = redis->get(key);
    if (!cached) {
      log->warn("Drink tag cache read failed: {}", cached.error());
    } else if (cached->has_value()) {
      auto parsed = json::parse(**cached, nullptr, false);
      try {
        if (parsed.is_discarded() || !parsed.is_array()) {
          throw QueryError("not a JSON array");
        }
        std::vector<DrinkTagDoc> tags;
        for (const auto& row : parsed) {
          tags.push_back(parse_drink_tag(row));
        }
        log->debug("Drink tags served from cache ({})", tags.size());
        return tags;
      } catch (const QueryError& e) {
        log->warn("Ignoring malformed drink tag cache entry: {}", e.what());
      }
    }
  }

  auto tags = load_drink_tags();

  if (redis) {
    int64_t ttl = option_int(container_.config().options_for("redis"),
                             "drink_tag_ttl_s", kDefaultDrinkTagTtlSeconds);
    if (auto stored = redis->setex(key, ttl, to_json_array(tags).dump());
        !stored) {
      log->warn("Drink tag cache write failed: {}", stored.error());
    }
  }
  return tags;
}

std::vector<BrandDoc> DrinkService::list_brands() {
  auto rows = store()->find("brand",
                            {{"has_chain", true},
                             {"chain_count", {{"$gt", 1}}},
                             {"platforms", "ubereats"}},
                            {{"chain_count", -1}}, kCatalogLimit);
  std::vector<BrandDoc> brands;
  brands.reserve(rows.size());
  for (const auto& row : rows) {
    brands.push_back(parse_brand(row));
  }
  return brands;
}

std::vector<CompanyDoc> DrinkService::list_companies() {
  auto rows = store()->find("company");
  std::vector<CompanyDoc> companies;
  companies.reserve(rows.size());
  for (const auto& row : rows) {
    companies.push_back(parse_company(row));
  }
  return companies;
}

}  // namespace drinkd
