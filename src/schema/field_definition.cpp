#include <tether/common/error.hpp>
#include <tether/schema/field_definition.hpp>
#include <tether/schema/identifier.hpp>

#include <boost/uuid/uuid.hpp>

#include <array>
#include <charconv>
#include <chrono>
#include <limits>
#include <string>
#include <system_error>

namespace tether::schema {

namespace {

constexpr auto kValueKinds =
    std::array<std::string_view, std::variant_size_v<value_t>>{
        "null", "text",      "uuid",   "int",  "bigint",
        "boolean", "timestamp", "double", "blob"};

constexpr auto kWireKinds =
    std::array<std::string_view, std::variant_size_v<wire_value_t>>{
        "null", "text", "integer", "double", "boolean", "uuid", "blob"};

[[noreturn]] void reject(const field_definition& field,
                         const std::string_view kind) {
  throw tether::common::type_coercion_error{
      field.id, std::string{kind} + " cannot be stored in a " +
                    std::string{to_string(field.logical_type)} + " column"};
}

template <typename T>
std::optional<T> parse_integer(const std::string_view text) {
  auto value = T{};
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end || text.empty()) {
    return std::nullopt;
  }
  return value;
}

bool fits_integer(const int64_t value) {
  return value >= std::numeric_limits<int32_t>::min() &&
         value <= std::numeric_limits<int32_t>::max();
}

uuid_t require_uuid_version(const field_definition& field, const uuid_t& uuid) {
  if (field.logical_type == logical_type_t::timeuuid &&
      uuid.version() != boost::uuids::uuid::version_time_based) {
    throw tether::common::type_coercion_error{
        field.id, "timeuuid requires a version 1 uuid"};
  }
  return uuid;
}

}  // namespace

wire_value_t encode_native(const field_definition& field,
                           const value_t& value) {
  if (std::holds_alternative<std::monostate>(value)) {
    return std::monostate{};
  }
  const auto kind = kValueKinds[value.index()];

  switch (field.logical_type) {
    case logical_type_t::text:
      if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
      }
      break;
    case logical_type_t::ascii:
      if (const auto* text = std::get_if<std::string>(&value)) {
        if (!is_ascii(*text)) {
          reject(field, "non-ascii text");
        }
        return *text;
      }
      break;
    case logical_type_t::uuid:
    case logical_type_t::timeuuid:
      if (const auto* uuid = std::get_if<uuid_t>(&value)) {
        return require_uuid_version(field, *uuid);
      }
      if (const auto* text = std::get_if<std::string>(&value)) {
        auto parsed = try_make_uuid(*text);
        if (!parsed) {
          reject(field, "malformed uuid text");
        }
        return require_uuid_version(field, *parsed);
      }
      break;
    case logical_type_t::integer:
      if (const auto* number = std::get_if<int32_t>(&value)) {
        return int64_t{*number};
      }
      if (const auto* number = std::get_if<int64_t>(&value)) {
        if (!fits_integer(*number)) {
          reject(field, "out of range bigint");
        }
        return *number;
      }
      break;
    case logical_type_t::big_integer:
      if (const auto* number = std::get_if<int32_t>(&value)) {
        return int64_t{*number};
      }
      if (const auto* number = std::get_if<int64_t>(&value)) {
        return *number;
      }
      break;
    case logical_type_t::boolean:
      if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag;
      }
      break;
    case logical_type_t::timestamp:
      if (const auto* timestamp = std::get_if<timestamp_t>(&value)) {
        return int64_t{to_milliseconds(*timestamp)};
      }
      break;
    case logical_type_t::floating:
      if (const auto* number = std::get_if<double>(&value)) {
        return *number;
      }
      break;
    case logical_type_t::blob:
      if (const auto* bytes = std::get_if<bytes_t>(&value)) {
        return *bytes;
      }
      break;
  }
  reject(field, kind);
}

value_t decode_native(const field_definition& field,
                      const wire_value_t& value) {
  if (std::holds_alternative<std::monostate>(value)) {
    return std::monostate{};
  }
  const auto kind = kWireKinds[value.index()];
  const auto* text = std::get_if<std::string>(&value);

  switch (field.logical_type) {
    case logical_type_t::text:
      if (text != nullptr) {
        return *text;
      }
      break;
    case logical_type_t::ascii:
      if (text != nullptr) {
        if (!is_ascii(*text)) {
          reject(field, "non-ascii text");
        }
        return *text;
      }
      break;
    case logical_type_t::uuid:
    case logical_type_t::timeuuid:
      if (const auto* uuid = std::get_if<uuid_t>(&value)) {
        return require_uuid_version(field, *uuid);
      }
      if (text != nullptr) {
        auto parsed = try_make_uuid(*text);
        if (!parsed) {
          reject(field, "malformed uuid text");
        }
        return require_uuid_version(field, *parsed);
      }
      break;
    case logical_type_t::integer:
      if (const auto* number = std::get_if<int64_t>(&value)) {
        if (!fits_integer(*number)) {
          reject(field, "out of range integer");
        }
        return static_cast<int32_t>(*number);
      }
      if (text != nullptr) {
        auto parsed = parse_integer<int32_t>(*text);
        if (!parsed) {
          reject(field, "malformed int text");
        }
        return *parsed;
      }
      break;
    case logical_type_t::big_integer:
      if (const auto* number = std::get_if<int64_t>(&value)) {
        return *number;
      }
      if (text != nullptr) {
        auto parsed = parse_integer<int64_t>(*text);
        if (!parsed) {
          reject(field, "malformed bigint text");
        }
        return *parsed;
      }
      break;
    case logical_type_t::boolean:
      if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag;
      }
      if (text != nullptr) {
        if (*text == "true") {
          return true;
        }
        if (*text == "false") {
          return false;
        }
        reject(field, "malformed boolean text");
      }
      break;
    case logical_type_t::timestamp:
      // The driver hands timestamps back as seconds since the epoch.
      if (const auto* seconds = std::get_if<double>(&value)) {
        auto timestamp = try_from_seconds(*seconds);
        if (!timestamp) {
          reject(field, "out of range seconds");
        }
        return *timestamp;
      }
      if (const auto* seconds = std::get_if<int64_t>(&value)) {
        if (*seconds > kMaxTimestampMilliseconds / 1000 ||
            *seconds < -kMaxTimestampMilliseconds / 1000) {
          reject(field, "out of range seconds");
        }
        return timestamp_t{std::chrono::seconds{*seconds}};
      }
      break;
    case logical_type_t::floating:
      if (const auto* number = std::get_if<double>(&value)) {
        return *number;
      }
      break;
    case logical_type_t::blob:
      if (const auto* bytes = std::get_if<bytes_t>(&value)) {
        return *bytes;
      }
      break;
  }
  reject(field, kind);
}

}  // namespace tether::schema
