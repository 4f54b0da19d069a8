#pragma once

#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "document_store.h"

namespace drinkd::testing {

// Scripted DocumentStore: every aggregate() call is recorded and answered
// with the next queued reply for that collection (empty when none queued).
class FakeDocumentStore : public DocumentStore {
 public:
  struct Call {
    std::string collection;
    nlohmann::json pipeline;
  };

  std::vector<nlohmann::json> aggregate(std::string_view collection,
                                        const nlohmann::json& pipeline) override {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back({std::string(collection), pipeline});
    if (fail_with_) {
      throw std::runtime_error(*fail_with_);
    }
    for (auto it = replies_.begin(); it != replies_.end(); ++it) {
      if (it->collection == collection) {
        auto rows = std::move(it->rows);
        replies_.erase(it);
        return rows;
      }
    }
    return {};
  }

  bool ping() override { return healthy_; }
  void close() override { ++closes_; }

  void reply(std::string collection, std::vector<nlohmann::json> rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    replies_.push_back({std::move(collection), std::move(rows)});
  }

  void fail_with(std::string message) { fail_with_ = std::move(message); }
  void set_healthy(bool healthy) { healthy_ = healthy; }

  std::vector<Call> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  size_t calls_to(std::string_view collection) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& call : calls_) {
      if (call.collection == collection) ++n;
    }
    return n;
  }

  int closes() const { return closes_; }

 private:
  struct Reply {
    std::string collection;
    std::vector<nlohmann::json> rows;
  };

  mutable std::mutex mutex_;
  std::vector<Call> calls_;
  std::deque<Reply> replies_;
  std::optional<std::string> fail_with_;
  bool healthy_ = true;
  int closes_ = 0;
};

}  // namespace drinkd::testing
