#pragma once

#include <stdexcept>
#include <string>

namespace drinkd {

// Missing or invalid option (e.g. no database and no connection string).
// Fatal for the resource; never cached.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::runtime_error(what) {}
};

// Transport/auth failure while a driver initializes its instance.
// The resource stays Registered, so a later get_instance retries.
class InitializationError : public std::runtime_error {
 public:
  explicit InitializationError(const std::string& what)
      : std::runtime_error(what) {}
};

// get_instance() for a name nobody registered.
class NotRegisteredError : public std::runtime_error {
 public:
  explicit NotRegisteredError(const std::string& what)
      : std::runtime_error(what) {}
};

// Malformed pipeline, transport failure mid-operation, or an unreadable reply.
// Partial results are never returned alongside it.
class QueryError : public std::runtime_error {
 public:
  explicit QueryError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace drinkd
