#include <tether/common/error.hpp>
#include <tether/schema/identifier.hpp>
#include <tether/schema/registry.hpp>

#include <spdlog/spdlog.h>

#include <set>
#include <utility>

namespace tether::schema {

void schema_registry::add(entity_schema schema) {
  if (schema.name.empty()) {
    throw tether::common::configuration_error{"schema name must not be empty"};
  }
  auto seen = std::set<std::string_view>{};
  for (const auto& field : schema.fields) {
    if (field.id.empty() || !is_identifier(field.id)) {
      throw tether::common::configuration_error{
          "schema '" + schema.name + "' declares field '" + field.id +
          "' which is not a valid identifier"};
    }
    if (!seen.insert(field.id).second) {
      throw tether::common::configuration_error{
          "schema '" + schema.name + "' declares field '" + field.id +
          "' twice"};
    }
  }

  auto lock = std::scoped_lock{mutex_};
  spdlog::debug("Registering schema '{}' with {} field(s)", schema.name,
                schema.fields.size());
  auto name = schema.name;
  schemas_.insert_or_assign(std::move(name), std::move(schema));
}

std::optional<entity_schema> schema_registry::find(
    const std::string_view model) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = schemas_.find(model);
  if (it == std::end(schemas_)) {
    return std::nullopt;
  }
  return it->second;
}

entity_schema schema_registry::resolve(const std::string_view model) const {
  auto schema = find(model);
  if (!schema) {
    spdlog::warn("Schema '{}' is not registered", model);
    throw tether::common::schema_resolution_error{std::string{model}};
  }
  return *schema;
}

std::vector<std::string> schema_registry::names() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<std::string>{};
  out.reserve(schemas_.size());
  for (const auto& [name, schema] : schemas_) {
    out.push_back(name);
  }
  return out;
}

schema_resolver_t make_resolver(
    std::shared_ptr<const schema_registry> registry) {
  if (!registry) {
    throw tether::common::configuration_error{"schema registry is not set"};
  }
  return [registry = std::move(registry)](const std::string_view model) {
    return registry->resolve(model);
  };
}

}  // namespace tether::schema
