#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "driver_config.h"
#include "resource_driver.h"
#include "shared_state.h"

namespace drinkd {

class LifecyclePool;

enum class ResourceState { Unregistered, Registered, Initializing, Ready, Closed };

std::string_view resource_state_to_string(ResourceState state);

/**
 * ResourceContainer - lazily initialized, shared service clients.
 *
 * Owns the named drivers, their option maps and the instances this
 * container created. Instances are mirrored into a SharedState so that
 * other containers holding the same SharedState reuse them instead of
 * connecting again.
 *
 * get_instance() is single-flight per name: however many threads ask for
 * an unready resource at once, the driver's initialize() runs exactly once
 * and every caller receives the same instance (or the same error). Callers
 * of other names never wait on it. Ready lookups take only a reader lock
 * on the registry and an atomic load.
 *
 * Thread safety: all public methods are thread-safe.
 */
class ResourceContainer {
 public:
  // `shared` may be null for a container that shares nothing.
  // `pool` defaults to GetLifecyclePool().
  explicit ResourceContainer(DriverConfig config,
                             std::shared_ptr<SharedState> shared = nullptr,
                             LifecyclePool* pool = nullptr);

  // Cleans up whatever is still cached.
  ~ResourceContainer();

  // Non-copyable, non-movable (has mutexes, entries hold atomics)
  ResourceContainer(const ResourceContainer&) = delete;
  ResourceContainer& operator=(const ResourceContainer&) = delete;

  /**
   * Register a driver under `name`. Options come from the container's
   * DriverConfig for that name and are frozen here.
   *
   * @throws ConfigurationError if `name` is already registered
   * @throws std::invalid_argument on an empty name or null driver
   */
  template <typename T>
  void register_driver(const std::string& name,
                       std::shared_ptr<ResourceDriver<T>> driver) {
    if (!driver) {
      throw std::invalid_argument("register_driver: null driver for '" +
                                  name + "'");
    }
    auto entry = std::make_unique<Entry>(name, std::type_index(typeid(T)));
    entry->initialize = [driver](const ResourceOptions& options) {
      return std::static_pointer_cast<void>(driver->initialize(options));
    };
    entry->cleanup = [driver](void* instance) {
      driver->cleanup(*static_cast<T*>(instance));
    };
    entry->health_check = [driver](void* instance) {
      return driver->health_check(*static_cast<T*>(instance));
    };
    add_entry(std::move(entry));
  }

  /**
   * Get the ready instance for `name`, initializing it on first use.
   *
   * @throws NotRegisteredError for an unknown name
   * @throws std::logic_error when T is not the driver's instance type
   * @throws ConfigurationError / InitializationError from initialize();
   *         nothing is cached, so the next call retries
   */
  template <typename T>
  std::shared_ptr<T> get_instance(std::string_view name) {
    return std::static_pointer_cast<T>(
        get_erased(name, std::type_index(typeid(T))));
  }

  // Cleanup every instance this container created, concurrently on the
  // pool. One failing cleanup never stops the others. Never throws.
  void cleanup_all();

  // name -> healthy, for every instance this container created.
  // A throwing health_check reports false for that name only.
  std::map<std::string, bool> health_check_all();

  ResourceState state(std::string_view name) const;
  bool is_registered(std::string_view name) const;
  std::vector<std::string> registered_names() const;

  const DriverConfig& config() const { return config_; }
  const std::shared_ptr<SharedState>& shared_state() const { return shared_; }

 private:
  struct Entry {
    Entry(std::string n, std::type_index t)
        : name(std::move(n)), slot_key(slot_key_for(name)), type(t) {}

    const std::string name;
    const std::string slot_key;
    const std::type_index type;
    ResourceOptions options;

    std::function<std::shared_ptr<void>(const ResourceOptions&)> initialize;
    std::function<void(void*)> cleanup;
    std::function<bool(void*)> health_check;

    // Instance created by this container (null when adopted or not ready)
    std::atomic<std::shared_ptr<void>> instance;
    std::atomic<ResourceState> state{ResourceState::Registered};

    // Single-flight: guards `in_flight`; held only to check/start a flight
    std::mutex flight_mutex;
    std::optional<std::shared_future<std::shared_ptr<void>>> in_flight;
  };

  void add_entry(std::unique_ptr<Entry> entry);
  Entry* find_entry(std::string_view name) const;
  std::shared_ptr<void> get_erased(std::string_view name, std::type_index type);
  std::shared_ptr<void> lookup_ready(const Entry& entry) const;
  std::shared_ptr<void> initialize_entry(Entry& entry);
  void cleanup_entry(Entry& entry, const std::shared_ptr<void>& instance);

  const DriverConfig config_;
  const std::shared_ptr<SharedState> shared_;
  LifecyclePool* pool_;

  mutable std::shared_mutex entries_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

}  // namespace drinkd
