#include "documents.h"

#include "errors.h"

#include <cmath>

using json = nlohmann::json;

namespace drinkd {

namespace {

const json* field(const json& row, const char* key) {
  auto it = row.find(key);
  if (it == row.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

std::string get_string(const json& row, const char* key) {
  const json* v = field(row, key);
  if (!v) return "";
  if (!v->is_string()) {
    throw QueryError(std::string("field '") + key + "' must be a string");
  }
  return v->get<std::string>();
}

// Ids arrive as strings or integers
std::string get_id(const json& row, const char* key) {
  const json* v = field(row, key);
  if (!v) return "";
  if (v->is_string()) return v->get<std::string>();
  if (v->is_number_integer()) return std::to_string(v->get<int64_t>());
  throw QueryError(std::string("field '") + key +
                   "' must be a string or integer");
}

double get_double(const json& row, const char* key, double fallback = 0.0) {
  const json* v = field(row, key);
  if (!v) return fallback;
  if (!v->is_number()) {
    throw QueryError(std::string("field '") + key + "' must be a number");
  }
  return v->get<double>();
}

int64_t get_int(const json& row, const char* key) {
  const json* v = field(row, key);
  if (!v) return 0;
  if (!v->is_number()) {
    throw QueryError(std::string("field '") + key + "' must be a number");
  }
  return v->is_number_float() ? static_cast<int64_t>(v->get<double>())
                              : v->get<int64_t>();
}

bool get_bool(const json& row, const char* key) {
  const json* v = field(row, key);
  if (!v) return false;
  if (!v->is_boolean()) {
    throw QueryError(std::string("field '") + key + "' must be a boolean");
  }
  return v->get<bool>();
}

std::vector<std::string> get_string_list(const json& row, const char* key) {
  std::vector<std::string> out;
  const json* v = field(row, key);
  if (!v) return out;
  if (!v->is_array()) {
    throw QueryError(std::string("field '") + key + "' must be an array");
  }
  for (const auto& elem : *v) {
    if (elem.is_string()) {
      out.push_back(elem.get<std::string>());
    }
  }
  return out;
}

// Older rows carry the platform under "platforms"
std::string get_platform(const json& row) {
  std::string platform = get_string(row, "platform");
  if (platform.empty()) {
    const json* legacy = field(row, "platforms");
    if (legacy && legacy->is_string()) {
      platform = legacy->get<std::string>();
    }
  }
  return platform;
}

std::optional<GeoPoint> get_point(const json& row, const char* key) {
  const json* v = field(row, key);
  if (!v) return std::nullopt;
  auto coords = v->find("coordinates");
  if (!v->is_object() || coords == v->end() || !coords->is_array() ||
      coords->size() != 2 || !(*coords)[0].is_number() ||
      !(*coords)[1].is_number()) {
    throw QueryError(std::string("field '") + key +
                     "' must be a GeoJSON point");
  }
  return GeoPoint{(*coords)[0].get<double>(), (*coords)[1].get<double>()};
}

std::optional<Rating> get_rating(const json& row) {
  const json* v = field(row, "rating");
  if (!v) return std::nullopt;
  if (!v->is_object()) {
    throw QueryError("field 'rating' must be an object");
  }
  return Rating{get_double(*v, "value"), get_int(*v, "review_count")};
}

void require_object(const json& row, const char* what) {
  if (!row.is_object()) {
    throw QueryError(std::string(what) + " row is not an object");
  }
}

}  // namespace

StoreDoc parse_store(const json& row) {
  require_object(row, "store");
  StoreDoc store;
  store.store_id = get_id(row, "store_id");
  if (store.store_id.empty()) {
    throw QueryError("store row without store_id");
  }
  store.platform = get_platform(row);
  store.name = get_string(row, "name");
  store.brand = get_string(row, "brand");
  store.address = get_string(row, "address");
  store.location = get_point(row, "location");
  store.rating = get_rating(row);
  store.cuisines = get_string_list(row, "cuisines");
  store.source_url = get_string(row, "source_url");
  return store;
}

MenuItemDoc parse_menu_item(const json& row) {
  require_object(row, "menu_item");
  MenuItemDoc item;
  item.store_id = get_id(row, "store_id");
  if (item.store_id.empty()) {
    throw QueryError("menu_item row without store_id");
  }
  item.item_id = get_id(row, "item_id");
  item.platform = get_platform(row);
  item.name = get_string(row, "name");

  if (const json* category = field(row, "category");
      category && category->is_object()) {
    item.category = get_string(*category, "name");
  } else {
    item.category = get_string(row, "category");
  }

  item.description = get_string(row, "description");
  item.price = get_double(row, "price");
  item.image_url = get_string(row, "image_url");
  item.keywords = get_string_list(row, "keywords");
  item.is_popular = get_bool(row, "is_popular");
  return item;
}

DrinkTagDoc parse_drink_tag(const json& row) {
  require_object(row, "drink_tag");
  DrinkTagDoc tag;
  tag.name = get_string(row, "name");
  if (tag.name.empty()) {
    throw QueryError("drink_tag row without name");
  }
  tag.count = get_int(row, "count");
  return tag;
}

BrandDoc parse_brand(const json& row) {
  require_object(row, "brand");
  BrandDoc brand;
  brand.name = get_string(row, "name");
  if (brand.name.empty()) {
    throw QueryError("brand row without name");
  }
  brand.has_chain = get_bool(row, "has_chain");
  brand.chain_count = get_int(row, "chain_count");
  return brand;
}

CompanyDoc parse_company(const json& row) {
  require_object(row, "company");
  CompanyDoc company;
  company.alias = get_string(row, "alias");
  company.name = get_string(row, "name");
  if (company.name.empty()) {
    throw QueryError("company row without name");
  }
  company.location = get_point(row, "location");
  company.address = get_string(row, "address");
  return company;
}

StoreKey store_key(const StoreDoc& store) {
  return StoreKey{store.store_id, store.platform};
}

StoreKey store_key(const MenuItemDoc& item) {
  return StoreKey{item.store_id, item.platform};
}

json to_json(const GeoPoint& point) {
  return json{{"type", "Point"},
              {"coordinates", json::array({point.longitude, point.latitude})}};
}

json to_json(const StoreDoc& store) {
  json j = {{"store_id", store.store_id}, {"platform", store.platform},
            {"name", store.name},         {"brand", store.brand},
            {"address", store.address},   {"cuisines", store.cuisines},
            {"source_url", store.source_url}};
  j["location"] = store.location ? to_json(*store.location) : json(nullptr);
  if (store.rating) {
    j["rating"] = {{"value", store.rating->value},
                   {"review_count", store.rating->review_count}};
  } else {
    j["rating"] = nullptr;
  }
  return j;
}

json to_json(const MenuItemDoc& item) {
  return json{{"item_id", item.item_id},
              {"store_id", item.store_id},
              {"platform", item.platform},
              {"name", item.name},
              {"category", item.category},
              {"description", item.description},
              {"price", item.price},
              {"image_url", item.image_url},
              {"keywords", item.keywords},
              {"is_popular", item.is_popular}};
}

json to_json(const StoreWithMenu& store) {
  json j = to_json(store.store);
  j["distance_in_meter"] = store.distance_in_meter;
  j["distance_in_km"] = store.distance_in_km;
  j["menu"] = to_json_array(store.menu);
  return j;
}

json to_json(const Drink& drink) {
  json j = to_json(drink.item);
  j["store_name"] = drink.store_name;
  j["store_url"] = drink.store_url;
  j["brand_name"] = drink.brand_name;
  return j;
}

json to_json(const SimplifiedDrink& drink) {
  return json{{"name", drink.name},
              {"description", drink.description},
              {"image_url", drink.image_url ? json(*drink.image_url)
                                            : json(nullptr)},
              {"store_name", drink.store_name},
              {"store_id", drink.store_id},
              {"store_url", drink.store_url}};
}

json to_json(const DrinkTagDoc& tag) {
  return json{{"name", tag.name}, {"count", tag.count}};
}

json to_json(const BrandDoc& brand) {
  return json{{"name", brand.name},
              {"has_chain", brand.has_chain},
              {"chain_count", brand.chain_count}};
}

json to_json(const CompanyDoc& company) {
  return json{{"alias", company.alias},
              {"name", company.name},
              {"location", company.location ? to_json(*company.location)
                                            : json(nullptr)},
              {"address", company.address}};
}

std::string build_store_url(std::string_view store_id,
                            std::string_view platform) {
  if (platform == "ubereats") {
    return "https://www.ubereats.com/tw/store/" + std::string(store_id);
  }
  if (platform == "foodpanda") {
    return "https://www.foodpanda.com.tw/restaurant/" + std::string(store_id);
  }
  return "";
}

double round_km(double meters) { return std::round(meters / 10.0) / 100.0; }

size_t utf8_length(std::string_view text) {
  size_t count = 0;
  for (unsigned char c : text) {
    // Continuation bytes are 10xxxxxx
    if ((c & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

SimplifiedDrink simplify(const Drink& drink) {
  SimplifiedDrink out;
  out.name = drink.item.name;
  out.description = drink.item.description;
  out.store_name = drink.store_name;
  out.store_id = drink.item.store_id;
  out.store_url = drink.store_url.empty()
                      ? build_store_url(drink.item.store_id, drink.item.platform)
                      : drink.store_url;
  return out;
}

}  // namespace drinkd
