#include "shared_state.h"

#include <algorithm>
#include <mutex>

namespace drinkd {

std::string slot_key_for(std::string_view resource_name) {
  static const std::unordered_map<std::string_view, std::string_view>
      kSlotKeys = {
          {"httpx", "httpx_driver"},
          {"storage", "storage_driver"},
          {"mongo", "mongo_driver"},
          {"redis", "redis_pool"},
      };
  auto it = kSlotKeys.find(resource_name);
  if (it != kSlotKeys.end()) {
    return std::string(it->second);
  }
  return std::string(resource_name) + "_driver";
}

SharedState::Slot* SharedState::find_slot(std::string_view key) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = slots_.find(std::string(key));
  if (it == slots_.end()) return nullptr;
  return it->second.get();
}

SharedState::Slot& SharedState::slot(const std::string& key) {
  if (auto* existing = find_slot(key)) {
    return *existing;
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto& entry = slots_[key];
  if (!entry) {
    entry = std::make_unique<Slot>();
  }
  return *entry;
}

std::shared_ptr<const SharedInstance> SharedState::load(
    std::string_view key) const {
  auto* s = find_slot(key);
  if (!s) return nullptr;
  return s->load(std::memory_order_acquire);
}

std::shared_ptr<const SharedInstance> SharedState::publish(
    const std::string& key, std::shared_ptr<const SharedInstance> value) {
  if (!value || !value->instance) {
    throw std::invalid_argument("SharedState::publish: empty instance for '" +
                                key + "'");
  }
  auto& s = slot(key);
  std::shared_ptr<const SharedInstance> expected;
  if (s.compare_exchange_strong(expected, value, std::memory_order_acq_rel)) {
    return value;
  }
  // Lost the race: `expected` now holds the earlier publisher's value
  return expected;
}

bool SharedState::withdraw(std::string_view key,
                           const std::shared_ptr<void>& instance) {
  auto* s = find_slot(key);
  if (!s) return false;
  auto current = s->load(std::memory_order_acquire);
  while (current && current->instance == instance) {
    if (s->compare_exchange_weak(current, nullptr,
                                 std::memory_order_acq_rel)) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> SharedState::keys() const {
  std::vector<std::string> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [key, s] : slots_) {
      if (s->load(std::memory_order_acquire)) {
        out.push_back(key);
      }
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace drinkd
