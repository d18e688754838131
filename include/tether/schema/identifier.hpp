#pragma once

#include <string_view>

namespace tether::schema {

/// True when every character is in [A-Za-z0-9_]. Map keys of a composite
/// reference double as query-language identifiers, so they must match.
constexpr bool is_identifier(const std::string_view value) {
  for (const auto ch : value) {
    const auto alpha = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
    const auto digit = ch >= '0' && ch <= '9';
    if (!alpha && !digit && ch != '_') {
      return false;
    }
  }
  return true;
}

constexpr bool is_ascii(const std::string_view value) {
  for (const auto ch : value) {
    if (static_cast<unsigned char>(ch) > 0x7Fu) {
      return false;
    }
  }
  return true;
}

}  // namespace tether::schema
