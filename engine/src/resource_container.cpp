#include "resource_container.h"

#include "errors.h"
#include "logging.h"
#include "lifecycle_pool.h"

#include <algorithm>

namespace drinkd {

std::string_view resource_state_to_string(ResourceState state) {
  switch (state) {
    case ResourceState::Unregistered:
      return "unregistered";
    case ResourceState::Registered:
      return "registered";
    case ResourceState::Initializing:
      return "initializing";
    case ResourceState::Ready:
      return "ready";
    case ResourceState::Closed:
      return "closed";
  }
  return "unknown";
}

ResourceContainer::ResourceContainer(DriverConfig config,
                                     std::shared_ptr<SharedState> shared,
                                     LifecyclePool* pool)
    : config_(std::move(config)),
      shared_(std::move(shared)),
      pool_(pool ? pool : &GetLifecyclePool()) {}

ResourceContainer::~ResourceContainer() { cleanup_all(); }

void ResourceContainer::add_entry(std::unique_ptr<Entry> entry) {
  if (entry->name.empty()) {
    throw std::invalid_argument("register_driver: empty resource name");
  }
  entry->options = config_.options_for(entry->name);

  const std::string name = entry->name;
  {
    std::unique_lock<std::shared_mutex> lock(entries_mutex_);
    if (entries_.contains(name)) {
      get_logger("container")->error("Driver '{}' is already registered", name);
      throw ConfigurationError("driver already registered: " + name);
    }
    entries_.emplace(name, std::move(entry));
  }
  get_logger("container")->info("Registered driver: {}", name);
}

ResourceContainer::Entry* ResourceContainer::find_entry(
    std::string_view name) const {
  std::shared_lock<std::shared_mutex> lock(entries_mutex_);
  auto it = entries_.find(std::string(name));
  if (it == entries_.end()) return nullptr;
  // Entries are never erased, so the pointer outlives the lock
  return it->second.get();
}

std::shared_ptr<void> ResourceContainer::lookup_ready(const Entry& entry) const {
  if (shared_) {
    if (auto published = shared_->load(entry.slot_key)) {
      if (published->type != entry.type) {
        throw std::logic_error("shared slot '" + entry.slot_key +
                               "' holds a different type than driver '" +
                               entry.name + "'");
      }
      return published->instance;
    }
  }
  return entry.instance.load(std::memory_order_acquire);
}

std::shared_ptr<void> ResourceContainer::get_erased(std::string_view name,
                                                    std::type_index type) {
  Entry* entry = find_entry(name);
  if (!entry) {
    throw NotRegisteredError("driver not registered: " + std::string(name));
  }
  if (entry->type != type) {
    throw std::logic_error("get_instance: wrong instance type requested for '" +
                           entry->name + "'");
  }

  // Fast path: already published or cached, no lock
  if (auto ready = lookup_ready(*entry)) {
    return ready;
  }

  std::shared_future<std::shared_ptr<void>> flight;
  std::promise<std::shared_ptr<void>> promise;
  bool leader = false;
  {
    std::lock_guard<std::mutex> lock(entry->flight_mutex);
    // Double-check: a concurrent caller may have finished meanwhile
    if (auto ready = lookup_ready(*entry)) {
      return ready;
    }
    if (entry->in_flight) {
      flight = *entry->in_flight;
    } else {
      leader = true;
      flight = promise.get_future().share();
      entry->in_flight = flight;
      entry->state.store(ResourceState::Initializing);
    }
  }

  if (!leader) {
    // Rethrows the leader's error if initialization failed
    return flight.get();
  }

  try {
    auto instance = initialize_entry(*entry);
    {
      std::lock_guard<std::mutex> lock(entry->flight_mutex);
      entry->in_flight.reset();
    }
    promise.set_value(instance);
    return instance;
  } catch (...) {
    {
      std::lock_guard<std::mutex> lock(entry->flight_mutex);
      entry->in_flight.reset();
      entry->state.store(ResourceState::Registered);
    }
    // Hand the same error to every waiter, then to our own caller
    promise.set_exception(std::current_exception());
    throw;
  }
}

std::shared_ptr<void> ResourceContainer::initialize_entry(Entry& entry) {
  auto log = get_logger("container");
  log->info("Initializing driver: {}", entry.name);

  std::shared_ptr<void> instance;
  try {
    instance = entry.initialize(entry.options);
  } catch (const ConfigurationError& e) {
    log->error("Failed to initialize driver '{}': {}", entry.name, e.what());
    throw;
  } catch (const InitializationError& e) {
    log->error("Failed to initialize driver '{}': {}", entry.name, e.what());
    throw;
  } catch (const std::exception& e) {
    log->error("Failed to initialize driver '{}': {}", entry.name, e.what());
    throw InitializationError("failed to initialize '" + entry.name +
                              "': " + e.what());
  }
  if (!instance) {
    throw InitializationError("driver '" + entry.name +
                              "' returned no instance");
  }

  if (shared_) {
    auto value = std::make_shared<const SharedInstance>(
        SharedInstance{instance, entry.type});
    auto winner = shared_->publish(entry.slot_key, value);
    if (winner->instance != instance) {
      // Another container published first; keep exactly one live instance
      log->info("Driver '{}' already published as '{}', adopting it",
                entry.name, entry.slot_key);
      try {
        entry.cleanup(instance.get());
      } catch (const std::exception& e) {
        log->warn("Discarding duplicate '{}' instance failed: {}", entry.name,
                  e.what());
      } catch (...) {
        log->warn("Discarding duplicate '{}' instance failed", entry.name);
      }
      if (winner->type != entry.type) {
        throw std::logic_error("shared slot '" + entry.slot_key +
                               "' holds a different type than driver '" +
                               entry.name + "'");
      }
      entry.state.store(ResourceState::Ready);
      return winner->instance;
    }
    log->info("Stored instance for '{}' to shared state as '{}'", entry.name,
              entry.slot_key);
  }

  entry.instance.store(instance, std::memory_order_release);
  entry.state.store(ResourceState::Ready);
  log->info("Driver '{}' initialized successfully", entry.name);
  return instance;
}

void ResourceContainer::cleanup_entry(Entry& entry,
                                      const std::shared_ptr<void>& instance) {
  auto log = get_logger("container");
  try {
    entry.cleanup(instance.get());
    log->info("Driver '{}' cleaned up successfully", entry.name);
  } catch (const std::exception& e) {
    log->error("Failed to cleanup driver '{}': {}", entry.name, e.what());
  } catch (...) {
    log->error("Failed to cleanup driver '{}': non-standard exception",
               entry.name);
  }
  if (shared_) {
    shared_->withdraw(entry.slot_key, instance);
  }
  entry.state.store(ResourceState::Closed);
}

void ResourceContainer::cleanup_all() {
  std::vector<Entry*> entries;
  {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    entries.reserve(entries_.size());
    for (const auto& [_, entry] : entries_) {
      entries.push_back(entry.get());
    }
  }

  std::vector<std::future<void>> pending;
  for (Entry* entry : entries) {
    auto instance = entry->instance.exchange(nullptr);
    if (!instance) continue;
    try {
      pending.push_back(pool_->run(
          entry->name,
          [this, entry, instance] { cleanup_entry(*entry, instance); }));
    } catch (const std::runtime_error& e) {
      // Pool already stopping (process teardown): clean up inline
      get_logger("container")->warn("Cleanup of '{}' runs inline: {}",
                                    entry->name, e.what());
      cleanup_entry(*entry, instance);
    }
  }

  for (auto& f : pending) {
    try {
      f.get();
    } catch (const std::exception& e) {
      get_logger("container")->error("Cleanup task failed: {}", e.what());
    } catch (...) {
      get_logger("container")->error("Cleanup task failed: non-standard exception");
    }
  }

  if (!pending.empty()) {
    get_logger("container")->info("All driver instances cleaned up");
  }
}

std::map<std::string, bool> ResourceContainer::health_check_all() {
  std::vector<Entry*> entries;
  {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    for (const auto& [_, entry] : entries_) {
      entries.push_back(entry.get());
    }
  }

  std::map<std::string, bool> status;
  for (Entry* entry : entries) {
    auto instance = entry->instance.load(std::memory_order_acquire);
    if (!instance) continue;
    try {
      status[entry->name] = entry->health_check(instance.get());
    } catch (const std::exception& e) {
      get_logger("container")->error("Health check failed for '{}': {}",
                                     entry->name, e.what());
      status[entry->name] = false;
    }
  }
  return status;
}

ResourceState ResourceContainer::state(std::string_view name) const {
  const Entry* entry = find_entry(name);
  if (!entry) return ResourceState::Unregistered;
  return entry->state.load();
}

bool ResourceContainer::is_registered(std::string_view name) const {
  return find_entry(name) != nullptr;
}

std::vector<std::string> ResourceContainer::registered_names() const {
  std::vector<std::string> names;
  {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    for (const auto& [name, _] : entries_) {
      names.push_back(name);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace drinkd
