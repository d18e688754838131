#pragma once

#include <algorithm>
#include <array>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tether::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto it = std::ranges::find(mappings, value,
                              &std::pair<std::string_view, Enum>::first);
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->second;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto it = std::ranges::find(mappings, value,
                              &std::pair<std::string_view, Enum>::second);
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->first;
}

/// "a, b, c" over every mapped name, for diagnostics.
template <typename Enum, std::size_t N>
std::string join_names(const enum_mappings_t<Enum, N>& mappings) {
  auto out = std::string{};
  for (const auto& [name, enum_value] : mappings) {
    if (!out.empty()) {
      out += ", ";
    }
    out += name;
  }
  return out;
}

// Specialized next to each enum that has a textual form.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace tether::schema
