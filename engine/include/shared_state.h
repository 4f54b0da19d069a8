#pragma once

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace drinkd {

// Well-known shared-state slot for a resource name.
// httpx/storage/mongo publish as "<name>_driver", redis as "redis_pool";
// any other name falls back to "<name>_driver".
std::string slot_key_for(std::string_view resource_name);

// An instance published into a slot, tagged with its concrete type.
struct SharedInstance {
  std::shared_ptr<void> instance;
  std::type_index type;
};

/**
 * SharedState - process-wide hand-off table for initialized resources.
 *
 * Several ResourceContainers (one per worker, sidecar, test fixture...) can
 * hold the same SharedState. Whichever container initializes a resource
 * first publishes it; the others find it here and never initialize again.
 *
 * Each slot is write-once-then-stable. Slot values are atomic shared_ptrs,
 * so readers never block each other; the slot map itself is guarded by a
 * reader/writer lock that writers only take when a new key appears.
 */
class SharedState {
 public:
  SharedState() = default;
  SharedState(const SharedState&) = delete;
  SharedState& operator=(const SharedState&) = delete;

  // Current slot value, or nullptr if nothing has been published.
  std::shared_ptr<const SharedInstance> load(std::string_view key) const;

  // Publish `value` if the slot is empty. Returns whatever the slot holds
  // afterwards: `value` itself, or the earlier publisher's instance.
  std::shared_ptr<const SharedInstance> publish(
      const std::string& key, std::shared_ptr<const SharedInstance> value);

  // Clear the slot only if it still holds `instance`. Returns true if cleared.
  bool withdraw(std::string_view key, const std::shared_ptr<void>& instance);

  // Keys that currently hold an instance (sorted).
  std::vector<std::string> keys() const;

  // Typed helpers for callers that seed or inspect slots directly.
  template <typename T>
  std::shared_ptr<T> get(std::string_view key) const {
    auto current = load(key);
    if (!current) return nullptr;
    if (current->type != std::type_index(typeid(T))) {
      throw std::logic_error("SharedState: slot '" + std::string(key) +
                             "' holds a different type");
    }
    return std::static_pointer_cast<T>(current->instance);
  }

  template <typename T>
  std::shared_ptr<T> set(const std::string& key, std::shared_ptr<T> instance) {
    auto value = std::make_shared<const SharedInstance>(
        SharedInstance{instance, std::type_index(typeid(T))});
    auto winner = publish(key, std::move(value));
    if (winner->type != std::type_index(typeid(T))) {
      throw std::logic_error("SharedState: slot '" + key +
                             "' holds a different type");
    }
    return std::static_pointer_cast<T>(winner->instance);
  }

 private:
  using Slot = std::atomic<std::shared_ptr<const SharedInstance>>;

  Slot* find_slot(std::string_view key) const;
  Slot& slot(const std::string& key);

  mutable std::shared_mutex mutex_;
  // unique_ptr: std::atomic is neither copyable nor movable
  std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};

}  // namespace drinkd
