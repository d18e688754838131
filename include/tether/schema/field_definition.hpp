#pragma once

#include <tether/schema/enum_string.hpp>
#include <tether/schema/logical_type.hpp>
#include <tether/schema/value.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tether::schema {

enum class key_role_t : uint8_t { regular = 0, partition = 1, clustering = 2 };

inline constexpr auto kKeyRoleMappings = std::array{
    std::pair<std::string_view, key_role_t>{"regular", key_role_t::regular},
    std::pair<std::string_view, key_role_t>{"partition",
                                            key_role_t::partition},
    std::pair<std::string_view, key_role_t>{"clustering",
                                            key_role_t::clustering},
};

template <>
inline std::optional<key_role_t> try_from_string<key_role_t>(
    const std::string_view value) {
  return from_string(value, kKeyRoleMappings);
}

inline constexpr std::string_view to_string(const key_role_t value) {
  return to_string(value, kKeyRoleMappings).value_or("unknown");
}

struct field_definition final {
  std::string id;
  logical_type_t logical_type{logical_type_t::text};
  key_role_t role{key_role_t::regular};
};

/// Convert a typed value into what the storage driver writes for this
/// field's type. Throws type_coercion_error when the value does not fit.
wire_value_t encode_native(const field_definition& field, const value_t& value);

/// Convert what the storage driver reads back into a typed value. Every
/// string-castable type also accepts its own textual form here, except
/// timestamps, which the driver only ever returns as seconds.
value_t decode_native(const field_definition& field,
                      const wire_value_t& value);

}  // namespace tether::schema
