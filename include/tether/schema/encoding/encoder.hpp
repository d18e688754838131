#pragma once
#include <tether/schema/primitives.hpp>
#include <optional>
#include <span>
#include <string>

namespace tether::schema::encoding {

// Serialization backend is picked at build time through the tag; columns
// and tables only see this interface.
template <typename Library>
struct encoder {
  template <typename T>
  tether::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const tether::schema::bytes_view_t& bytes);

  /// Throws type_coercion_error attributed to `field_id` when `bytes` do not
  /// hold a T.
  template <typename T>
  T decode(const tether::schema::bytes_view_t& bytes,
           const std::string& field_id);
};

}  // namespace tether::schema::encoding
