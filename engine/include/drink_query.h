#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace drinkd {

// Closed interval [min, max].
template <typename T>
struct Range {
  T min{};
  T max{};
};

inline constexpr double kDefaultRadiusKm = 5.0;

// Menu items cheaper than this are add-ons (toppings, bags), not drinks.
inline constexpr double kMinDrinkPrice = 20.0;

struct DrinkQuery {
  double longitude = 0.0;
  double latitude = 0.0;
  std::vector<std::string> drink_tags;
  std::vector<std::string> brands;
  std::optional<Range<int64_t>> review_count_range;
  std::optional<Range<double>> rating_range;
  std::optional<Range<int64_t>> distance_range;  // meters
  std::optional<std::string> platform;
  std::optional<int64_t> limit;
};

// Search radius in km: the upper bound of distance_range, else the default.
// The lower bound is not applied.
inline double search_radius_km(const DrinkQuery& query) {
  if (!query.distance_range) {
    return kDefaultRadiusKm;
  }
  return static_cast<double>(query.distance_range->max) / 1000.0;
}

}  // namespace drinkd
