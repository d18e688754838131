#pragma once

#include <tether/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: logical type.
// Column type tag carried by every field definition; names follow the CQL
// type names.
namespace tether::schema {

enum class logical_type_t : uint8_t {
  text = 0,
  ascii = 1,
  uuid = 2,
  timeuuid = 3,
  integer = 4,
  big_integer = 5,
  boolean = 6,
  timestamp = 7,
  floating = 8,
  blob = 9
};

inline constexpr auto kLogicalTypeMappings = std::array{
    std::pair<std::string_view, logical_type_t>{"text", logical_type_t::text},
    std::pair<std::string_view, logical_type_t>{"ascii", logical_type_t::ascii},
    std::pair<std::string_view, logical_type_t>{"uuid", logical_type_t::uuid},
    std::pair<std::string_view, logical_type_t>{"timeuuid",
                                                logical_type_t::timeuuid},
    std::pair<std::string_view, logical_type_t>{"int",
                                                logical_type_t::integer},
    std::pair<std::string_view, logical_type_t>{"bigint",
                                                logical_type_t::big_integer},
    std::pair<std::string_view, logical_type_t>{"boolean",
                                                logical_type_t::boolean},
    std::pair<std::string_view, logical_type_t>{"timestamp",
                                                logical_type_t::timestamp},
    std::pair<std::string_view, logical_type_t>{"double",
                                                logical_type_t::floating},
    std::pair<std::string_view, logical_type_t>{"blob", logical_type_t::blob},
};

template <>
inline std::optional<logical_type_t> try_from_string<logical_type_t>(
    const std::string_view value) {
  return from_string(value, kLogicalTypeMappings);
}

inline constexpr std::string_view to_string(const logical_type_t value) {
  return to_string(value, kLogicalTypeMappings).value_or("unknown");
}

/// Types whose wire form survives a round trip through text. Only these may
/// be components of a flattened composite key.
inline constexpr bool is_string_castable(const logical_type_t value) {
  switch (value) {
    case logical_type_t::text:
    case logical_type_t::ascii:
    case logical_type_t::uuid:
    case logical_type_t::timeuuid:
    case logical_type_t::integer:
    case logical_type_t::big_integer:
    case logical_type_t::boolean:
    case logical_type_t::timestamp:
      return true;
    case logical_type_t::floating:
    case logical_type_t::blob:
      return false;
  }
  return false;
}

}  // namespace tether::schema
