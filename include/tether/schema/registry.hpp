#pragma once
#include <tether/schema/entity.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::schema {

/// Resolves a model name to its schema. Throws schema_resolution_error for
/// unknown names. This is the only way the codec reaches the catalog.
using schema_resolver_t =
    std::function<entity_schema(const std::string_view model)>;

/// In-memory catalog of entity schemas.
class schema_registry final {
 public:
  /// Register (or replace) a schema.
  ///
  /// Field ids must be unique and match [A-Za-z0-9_]*; otherwise
  /// configuration_error is thrown and the catalog is left untouched.
  void add(entity_schema schema);

  /// Return the schema registered under `model`, or std::nullopt.
  std::optional<entity_schema> find(std::string_view model) const;

  /// Return the schema registered under `model` or throw
  /// schema_resolution_error.
  entity_schema resolve(std::string_view model) const;

  std::vector<std::string> names() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, entity_schema, std::less<>> schemas_;
};

/// Resolver bound to a shared registry.
schema_resolver_t make_resolver(std::shared_ptr<const schema_registry> registry);

}  // namespace tether::schema
