#pragma once
#include <tether/common/critical.hpp>
#include <tether/common/error.hpp>
#include <tether/schema/encoding/encoder.hpp>
#include <scale/scale.hpp>

#include <string>
#include <utility>

namespace tether::schema::encoding {

struct scale_encoder_tag {};

/// SCALE codec for map column entries, stored references and table rows.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  tether::schema::bytes_t encode(const T& obj) {
    auto encoded = ::scale::impl::memory::encode(obj);
    if (!encoded) {
      tether::common::critical("SCALE encoding failed");
    }
    return std::move(encoded.value());
  }

  template <typename T>
  std::optional<T> try_decode(const tether::schema::bytes_view_t& bytes) {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  }

  template <typename T>
  T decode(const tether::schema::bytes_view_t& bytes,
           const std::string& field_id) {
    auto decoded = try_decode<T>(bytes);
    if (!decoded) {
      throw tether::common::type_coercion_error{
          field_id, "stored bytes are malformed (" +
                        std::to_string(bytes.size()) + " bytes)"};
    }
    return std::move(*decoded);
  }
};

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace tether::schema::encoding
