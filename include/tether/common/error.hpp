#pragma once

#include <tether/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tether::common {

enum class error_code : uint32_t {
  configuration = 1,
  schema_resolution = 2,
  missing_field = 3,
  type_coercion = 4,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"configuration",
                                            error_code::configuration},
    std::pair<std::string_view, error_code>{"schema_resolution",
                                            error_code::schema_resolution},
    std::pair<std::string_view, error_code>{"missing_field",
                                            error_code::missing_field},
    std::pair<std::string_view, error_code>{"type_coercion",
                                            error_code::type_coercion},
};

inline constexpr std::string_view to_string(const error_code value) {
  return tether::schema::to_string(value, kErrorCodeMappings)
      .value_or("unknown");
}

/// Base of every recoverable error raised by tether.
///
/// None of these are retried internally; they surface to whoever touched
/// the reference column.
class error : public std::runtime_error {
 public:
  error(const error_code code, const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  error_code code() const noexcept { return code_; }

 private:
  error_code code_;
};

/// Column definition cannot be satisfied. Raised at definition time.
class configuration_error final : public error {
 public:
  explicit configuration_error(const std::string& message)
      : error{error_code::configuration, message} {}
};

class schema_resolution_error final : public error {
 public:
  explicit schema_resolution_error(std::string model)
      : error{error_code::schema_resolution,
              "unknown schema '" + model + "'"},
        model_{std::move(model)} {}

  const std::string& model() const noexcept { return model_; }

 private:
  std::string model_;
};

/// A composite key or stored mapping lacks one of the primary-key fields.
class missing_field_error final : public error {
 public:
  explicit missing_field_error(std::string field_id)
      : error{error_code::missing_field,
              "missing primary key field '" + field_id + "'"},
        field_id_{std::move(field_id)} {}

  const std::string& field_id() const noexcept { return field_id_; }

 private:
  std::string field_id_;
};

class type_coercion_error final : public error {
 public:
  type_coercion_error(std::string field_id, const std::string& reason)
      : error{error_code::type_coercion,
              "field '" + field_id + "': " + reason},
        field_id_{std::move(field_id)} {}

  const std::string& field_id() const noexcept { return field_id_; }

 private:
  std::string field_id_;
};

}  // namespace tether::common
