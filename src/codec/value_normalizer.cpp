#include <tether/codec/value_normalizer.hpp>
#include <tether/common/error.hpp>

#include <charconv>
#include <string_view>
#include <system_error>

using namespace tether::schema;

namespace tether::codec {

namespace {

void require_string_castable(const field_definition& field) {
  if (!is_string_castable(field.logical_type)) {
    throw tether::common::type_coercion_error{
        field.id, std::string{to_string(field.logical_type)} +
                      " is not supported as a composite key component"};
  }
}

timestamp_milliseconds_t parse_milliseconds(const field_definition& field,
                                            const std::string_view text) {
  auto value = timestamp_milliseconds_t{};
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (text.empty() || ec != std::errc{} || ptr != end) {
    throw tether::common::type_coercion_error{
        field.id, "'" + std::string{text} +
                      "' is not a millisecond timestamp"};
  }
  if (!try_from_milliseconds(value)) {
    throw tether::common::type_coercion_error{
        field.id, "'" + std::string{text} +
                      "' is outside the representable timestamp range"};
  }
  return value;
}

std::optional<std::string> stringify(const field_definition& field,
                                     const wire_value_t& wire) {
  return std::visit(
      overloaded{
          [](const std::monostate&) -> std::optional<std::string> {
            return std::nullopt;
          },
          [](const std::string& arg) -> std::optional<std::string> {
            return arg;
          },
          [](const int64_t arg) -> std::optional<std::string> {
            return std::to_string(arg);
          },
          [](const bool arg) -> std::optional<std::string> {
            return std::string{arg ? "true" : "false"};
          },
          [](const uuid_t& arg) -> std::optional<std::string> {
            return tether::schema::to_string(arg);
          },
          [&field](const double&) -> std::optional<std::string> {
            throw tether::common::type_coercion_error{
                field.id, "double does not round-trip through text"};
          },
          [&field](const bytes_t&) -> std::optional<std::string> {
            throw tether::common::type_coercion_error{
                field.id, "blob does not round-trip through text"};
          }},
      wire);
}

}  // namespace

std::optional<std::string> normalize(const field_definition& field,
                                     const value_t& value) {
  require_string_castable(field);

  if (const auto* text = std::get_if<std::string>(&value)) {
    if (text->empty()) {
      return std::nullopt;
    }
    // Stored in the same form a typed value of the field would produce.
    if (field.logical_type == logical_type_t::timestamp) {
      return std::to_string(parse_milliseconds(field, *text));
    }
    return stringify(field,
                     encode_native(field, decode_native(field, wire_value_t{*text})));
  }

  auto text = stringify(field, encode_native(field, value));
  if (text && text->empty()) {
    return std::nullopt;
  }
  return text;
}

value_t denormalize(const field_definition& field,
                    const std::optional<std::string>& stored) {
  require_string_castable(field);

  if (!stored) {
    return std::monostate{};
  }
  if (field.logical_type == logical_type_t::timestamp) {
    auto milliseconds = parse_milliseconds(field, *stored);
    return decode_native(
        field, wire_value_t{static_cast<double>(milliseconds) / 1000.0});
  }
  return decode_native(field, wire_value_t{*stored});
}

}  // namespace tether::codec
