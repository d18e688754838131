#pragma once
#include <rocksdb/db.h>
#include <tether/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace tether::storage {

struct rocksdb_storage_tag {};

/// RocksDB-backed key-value store. Keys are compared bytewise, so every row
/// of a table is contiguous under its `TABLE|<schema>|` prefix.
template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<tether::schema::bytes_t> get(
      const tether::schema::bytes_view_t& key) const;
  void put(const tether::schema::bytes_view_t& key,
           const tether::schema::bytes_view_t& value) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const tether::schema::bytes_view_t& prefix) const;

 private:
  ROCKSDB_NAMESPACE::DB& require_database() const;
};

/// Opens (creating when missing) the database at `path`. Failure to open is
/// fatal.
template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace tether::storage
