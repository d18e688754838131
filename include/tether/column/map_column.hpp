#pragma once
#include <tether/schema/encoding/scale/encoder.hpp>
#include <tether/schema/logical_type.hpp>
#include <tether/schema/value.hpp>

namespace tether::column {

/// Generic map column of primitive keys and values.
///
/// Only `ascii` and `text` are accepted for either side; the stored form is a
/// SCALE-encoded list of (key, optional value) pairs in key order.
class map_column final {
 public:
  /// Throws configuration_error for unsupported key or value types.
  map_column(tether::schema::logical_type_t key_type,
             tether::schema::logical_type_t value_type,
             bool index = false);

  tether::schema::logical_type_t key_type() const { return key_type_; }
  tether::schema::logical_type_t value_type() const { return value_type_; }
  bool index() const { return index_; }

  /// Returns the mapping unchanged or throws type_coercion_error for empty
  /// keys, keys or values outside the declared types, and empty values.
  tether::schema::flat_mapping_t validate(
      const tether::schema::flat_mapping_t& value) const;

  tether::schema::bytes_t to_database(
      const tether::schema::flat_mapping_t& value) const;
  tether::schema::flat_mapping_t from_database(
      const tether::schema::bytes_view_t& bytes) const;

 private:
  tether::schema::logical_type_t key_type_;
  tether::schema::logical_type_t value_type_;
  bool index_;
};

}  // namespace tether::column
