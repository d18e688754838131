#pragma once
#include <tether/codec/composite_key_codec.hpp>
#include <tether/column/reference_column.hpp>
#include <tether/schema/entity.hpp>
#include <tether/schema/registry.hpp>
#include <tether/storage/rocksdb/storage.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tether::storage {

/// Reference columns a table carries next to its schema fields.
struct table_definition final {
  std::string schema_name;
  std::vector<std::pair<std::string, tether::column::reference_column>>
      relations;
};

/// One row: the entity's own fields plus the value of each reference column.
struct record final {
  tether::schema::entity_instance entity;
  std::map<std::string, tether::codec::reference_value_t> relations;
};

/// Rows of one entity schema, keyed by their primary key.
///
/// Rows are read back the way the driver returns them, so timestamps are
/// truncated to milliseconds.
class table final {
 public:
  table(storage<rocksdb_storage_tag>& storage,
        const tether::schema::schema_resolver_t& resolver,
        table_definition definition);

  const tether::schema::entity_schema& schema() const { return schema_; }
  const table_definition& definition() const { return definition_; }

  /// Insert or overwrite the row addressed by the entity's primary key.
  void insert(const record& row);

  /// Look a row up by its primary key values.
  std::optional<record> get(const tether::schema::composite_key_t& key) const;

  std::vector<record> list() const;

 private:
  const tether::column::reference_column* find_relation(
      const std::string& id) const;
  tether::schema::bytes_t encode_row(const record& row) const;
  record decode_row(const tether::schema::bytes_view_t& bytes) const;

  storage<rocksdb_storage_tag>& storage_;
  tether::schema::entity_schema schema_;
  table_definition definition_;
};

}  // namespace tether::storage
