#pragma once
#include <tether/schema/primitives.hpp>
#include <tether/schema/value.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace tether::key {

struct builder final {
  tether::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const tether::schema::uuid_t& uuid);
  /// Tag byte per alternative, then a length-prefixed or fixed-width body.
  builder& write(const tether::schema::wire_value_t& value);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    using unsigned_t = std::make_unsigned_t<T>;
    auto bits = static_cast<unsigned_t>(value);
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((bits >> (i * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace tether::key
