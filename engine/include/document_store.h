#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string_view>
#include <vector>

namespace drinkd {

/**
 * DocumentStore - the aggregation capability the query engine consumes.
 *
 * aggregate() runs one pipeline (a JSON array of stages) against a
 * collection and returns every resulting document. Any transport, server
 * or decoding failure throws QueryError; a result is never partial.
 *
 * MongoClient is the production implementation; tests inject fakes.
 */
class DocumentStore {
 public:
  virtual ~DocumentStore() = default;

  virtual std::vector<nlohmann::json> aggregate(
      std::string_view collection, const nlohmann::json& pipeline) = 0;

  // Cheap round trip proving the store answers. Default: always true.
  virtual bool ping() { return true; }

  // Release connections. Default: nothing to release.
  virtual void close() {}

  // find() expressed as a pipeline: $match, then optional $sort and $limit.
  std::vector<nlohmann::json> find(
      std::string_view collection,
      const nlohmann::json& filter = nlohmann::json::object(),
      const nlohmann::json& sort = nullptr, int64_t limit = 0) {
    nlohmann::json pipeline = nlohmann::json::array();
    pipeline.push_back({{"$match", filter.is_null()
                                       ? nlohmann::json::object()
                                       : filter}});
    if (sort.is_object() && !sort.empty()) {
      pipeline.push_back({{"$sort", sort}});
    }
    if (limit > 0) {
      pipeline.push_back({{"$limit", limit}});
    }
    return aggregate(collection, pipeline);
  }
};

}  // namespace drinkd
