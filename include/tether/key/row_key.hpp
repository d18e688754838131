#pragma once
#include <tether/schema/entity.hpp>
#include <tether/schema/value.hpp>

#include <string>
#include <string_view>

namespace tether::key {

inline constexpr auto kTableKeyPrefix = std::string_view{"TABLE|"};

/// `TABLE|<schema>|` shared by every row of a schema.
tether::schema::bytes_t make_table_prefix(std::string_view schema_name);

/// Row key of an entity: the table prefix followed by each primary-key
/// component in native wire form. Throws missing_field_error when a
/// component is absent or null.
tether::schema::bytes_t make_row_key(
    const tether::schema::entity_schema& schema,
    const tether::schema::composite_key_t& key);

tether::schema::bytes_t make_row_key(
    const tether::schema::entity_schema& schema,
    const tether::schema::entity_instance& entity);

}  // namespace tether::key
