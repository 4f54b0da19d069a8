#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drinkd {

// GeoJSON point, stored as [longitude, latitude].
struct GeoPoint {
  double longitude = 0.0;
  double latitude = 0.0;
};

struct Rating {
  double value = 0.0;
  int64_t review_count = 0;
};

struct StoreDoc {
  std::string store_id;
  std::string platform;
  std::string name;
  std::string brand;
  std::string address;
  std::optional<GeoPoint> location;
  std::optional<Rating> rating;
  std::vector<std::string> cuisines;
  std::string source_url;
};

struct MenuItemDoc {
  std::string item_id;  // numeric ids are kept as their decimal text
  std::string store_id;
  std::string platform;
  std::string name;
  std::string category;
  std::string description;
  double price = 0.0;
  std::string image_url;
  std::vector<std::string> keywords;
  bool is_popular = false;
};

// Composite store identity. Menu items reference stores by this pair.
struct StoreKey {
  std::string store_id;
  std::string platform;

  bool operator==(const StoreKey& other) const = default;
};

struct StoreKeyHash {
  size_t operator()(const StoreKey& key) const {
    size_t h = std::hash<std::string>{}(key.store_id);
    return h ^ (std::hash<std::string>{}(key.platform) + 0x9e3779b97f4a7c15ULL +
                (h << 6) + (h >> 2));
  }
};

struct StoreWithMenu {
  StoreDoc store;
  double distance_in_meter = 0.0;
  double distance_in_km = 0.0;  // 2 decimals
  std::vector<MenuItemDoc> menu;
};

// A menu item with its owning store's display fields.
struct Drink {
  MenuItemDoc item;
  std::string store_name;
  std::string store_url;
  std::string brand_name;
};

// Reduced drink shape for prompt-size-sensitive consumers.
struct SimplifiedDrink {
  std::string name;
  std::string description;
  std::optional<std::string> image_url;
  std::string store_name;
  std::string store_id;
  std::string store_url;
};

struct DrinkTagDoc {
  std::string name;
  int64_t count = 0;
};

struct BrandDoc {
  std::string name;
  bool has_chain = false;
  int64_t chain_count = 0;
};

struct CompanyDoc {
  std::string alias;
  std::string name;
  std::optional<GeoPoint> location;
  std::string address;
};

// =====================================================
// Row parsing
//
// Rows come from the document store; absent or null fields take their
// defaults. A row without its identity (store_id, or name for catalog
// documents) or with a field of the wrong type throws QueryError.
// =====================================================

StoreDoc parse_store(const nlohmann::json& row);
MenuItemDoc parse_menu_item(const nlohmann::json& row);
DrinkTagDoc parse_drink_tag(const nlohmann::json& row);
BrandDoc parse_brand(const nlohmann::json& row);
CompanyDoc parse_company(const nlohmann::json& row);

StoreKey store_key(const StoreDoc& store);
StoreKey store_key(const MenuItemDoc& item);

// =====================================================
// Serialization
// =====================================================

nlohmann::json to_json(const GeoPoint& point);
nlohmann::json to_json(const StoreDoc& store);
nlohmann::json to_json(const MenuItemDoc& item);
nlohmann::json to_json(const StoreWithMenu& store);
nlohmann::json to_json(const Drink& drink);
nlohmann::json to_json(const SimplifiedDrink& drink);
nlohmann::json to_json(const DrinkTagDoc& tag);
nlohmann::json to_json(const BrandDoc& brand);
nlohmann::json to_json(const CompanyDoc& company);

template <typename T>
nlohmann::json to_json_array(const std::vector<T>& values) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& v : values) {
    out.push_back(to_json(v));
  }
  return out;
}

// =====================================================
// Helpers
// =====================================================

// Public store page for a platform; "" for an unknown platform.
std::string build_store_url(std::string_view store_id,
                            std::string_view platform);

// Meters to kilometers rounded to 2 decimals.
double round_km(double meters);

// Number of UTF-8 code points (invalid lead bytes count as one each).
size_t utf8_length(std::string_view text);

SimplifiedDrink simplify(const Drink& drink);

}  // namespace drinkd
