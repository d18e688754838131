#pragma once
#include <tether/schema/field_definition.hpp>
#include <tether/schema/value.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::schema {

struct entity_schema final {
  std::string name;
  /// Declaration order. Partition fields precede clustering fields in the
  /// primary key regardless of where they are declared.
  std::vector<field_definition> fields;

  /// Partition fields then clustering fields, each in declaration order.
  std::vector<field_definition> primary_key() const;
  const field_definition* find(std::string_view id) const;
};

/// A live row of some entity, keyed by field id.
struct entity_instance final {
  std::string schema_name;
  std::map<std::string, value_t> values;

  const value_t* find(std::string_view id) const;
};

}  // namespace tether::schema
