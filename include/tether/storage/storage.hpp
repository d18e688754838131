#pragma once
#include <tether/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace tether::storage {

/// (row key, encoded row)
using key_value_entry_t =
    std::pair<tether::schema::bytes_t, tether::schema::bytes_t>;

/// Ordered byte-keyed store underneath every table. Specialized per backend
/// tag; the primary template is never defined.
template <typename Library>
struct storage {
  std::optional<tether::schema::bytes_t> get(
      const tether::schema::bytes_view_t& key) const;

  /// Insert or overwrite.
  void put(const tether::schema::bytes_view_t& key,
           const tether::schema::bytes_view_t& value) const;

  /// Entries whose key starts with `prefix`, in key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const tether::schema::bytes_view_t& prefix) const;
};

template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tether::storage
