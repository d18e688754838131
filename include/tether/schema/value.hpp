#pragma once
#include <tether/schema/primitives.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace tether::schema {

/// Typed value of a single field, as the application sees it.
using value_t = std::variant<std::monostate,
                             std::string,
                             uuid_t,
                             int32_t,
                             int64_t,
                             bool,
                             timestamp_t,
                             double,
                             bytes_t>;

/// What the storage driver writes or hands back for a field. Timestamps are
/// written as integer milliseconds and read back as double seconds.
using wire_value_t = std::variant<std::monostate,
                                  std::string,
                                  int64_t,
                                  double,
                                  bool,
                                  uuid_t,
                                  bytes_t>;

/// Primary-key field id -> typed value.
using composite_key_t = std::map<std::string, value_t>;

/// Primary-key field id -> canonical text. This is the stored shape.
using flat_mapping_t = std::map<std::string, std::optional<std::string>>;

std::string to_display_string(const value_t& value);
std::string to_display_string(const wire_value_t& value);

}  // namespace tether::schema
