#pragma once

#include <memory>

#include "driver_config.h"

namespace drinkd {

/**
 * ResourceDriver<T> - lifecycle contract for one kind of backing service.
 *
 * A driver knows how to build an instance of T from its option map, how
 * to release it, and how to check its health. Drivers hold no per-instance state;
 * the ResourceContainer owns the instances and decides when each hook runs.
 *
 *   initialize  - build a ready instance. Throws ConfigurationError for bad
 *                 options and InitializationError for transport/auth failure.
 *   cleanup     - release the instance. May throw; the container logs it.
 *   health_check- true when the instance can serve requests. May throw;
 *                 the container reports false.
 */
template <typename T>
class ResourceDriver {
 public:
  using instance_type = T;

  virtual ~ResourceDriver() = default;

  virtual std::shared_ptr<T> initialize(const ResourceOptions& options) = 0;
  virtual void cleanup(T& instance) = 0;
  virtual bool health_check(T& instance) = 0;
};

}  // namespace drinkd
