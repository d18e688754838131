#include <tether/schema/value.hpp>

namespace tether::schema {

std::string to_display_string(const value_t& value) {
  return std::visit(
      overloaded{
          [](const std::monostate&) { return std::string{"null"}; },
          [](const std::string& arg) { return arg; },
          [](const uuid_t& arg) { return tether::schema::to_string(arg); },
          [](const int32_t arg) { return std::to_string(arg); },
          [](const int64_t arg) { return std::to_string(arg); },
          [](const bool arg) {
            return arg ? std::string{"true"} : std::string{"false"};
          },
          [](const timestamp_t& arg) { return format_timestamp(arg); },
          [](const double arg) { return std::to_string(arg); },
          [](const bytes_t& arg) {
            return "0x" + to_hex(make_bytes_view(arg));
          }},
      value);
}

std::string to_display_string(const wire_value_t& value) {
  return std::visit(
      overloaded{
          [](const std::monostate&) { return std::string{"null"}; },
          [](const std::string& arg) { return arg; },
          [](const int64_t arg) { return std::to_string(arg); },
          [](const double arg) { return std::to_string(arg); },
          [](const bool arg) {
            return arg ? std::string{"true"} : std::string{"false"};
          },
          [](const uuid_t& arg) { return tether::schema::to_string(arg); },
          [](const bytes_t& arg) {
            return "0x" + to_hex(make_bytes_view(arg));
          }},
      value);
}

}  // namespace tether::schema
