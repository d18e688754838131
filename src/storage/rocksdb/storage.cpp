#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <tether/common/critical.hpp>
#include <tether/storage/rocksdb/storage.hpp>

#include <filesystem>
#include <string>
#include <system_error>

namespace tether::storage {

namespace {

ROCKSDB_NAMESPACE::Slice to_slice(const tether::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

tether::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return tether::schema::make_bytes(
      std::string_view{slice.data(), slice.size()});
}

void create_parent_directories(const std::string_view path) {
  auto parent = std::filesystem::path{path}.parent_path();
  if (parent.empty()) {
    return;
  }
  auto error = std::error_code{};
  std::filesystem::create_directories(parent, error);
  if (error) {
    spdlog::warn("Could not create {}: {}", parent.string(), error.message());
  }
}

}  // namespace

ROCKSDB_NAMESPACE::DB& storage<rocksdb_storage_tag>::require_database() const {
  if (!database) {
    tether::common::critical("RocksDB database is not open");
  }
  return *database;
}

std::optional<tether::schema::bytes_t> storage<rocksdb_storage_tag>::get(
    const tether::schema::bytes_view_t& key) const {
  auto value = std::string{};
  auto status = require_database().Get(ROCKSDB_NAMESPACE::ReadOptions{},
                                        to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    tether::common::critical("RocksDB get failed: {}", status.ToString());
  }
  return tether::schema::make_bytes(value);
}

void storage<rocksdb_storage_tag>::put(
    const tether::schema::bytes_view_t& key,
    const tether::schema::bytes_view_t& value) const {
  auto status = require_database().Put(ROCKSDB_NAMESPACE::WriteOptions{},
                                        to_slice(key), to_slice(value));
  if (!status.ok()) {
    tether::common::critical("RocksDB put failed: {}", status.ToString());
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const tether::schema::bytes_view_t& prefix) const {
  auto out = std::vector<key_value_entry_t>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      require_database().NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  const auto start = to_slice(prefix);
  for (iterator->Seek(start);
       iterator->Valid() && iterator->key().starts_with(start);
       iterator->Next()) {
    out.emplace_back(to_bytes(iterator->key()), to_bytes(iterator->value()));
  }
  if (!iterator->status().ok()) {
    tether::common::critical("RocksDB scan failed: {}",
                             iterator->status().ToString());
  }
  return out;
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  create_parent_directories(path);

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    tether::common::critical("Cannot open RocksDB at {}: {}", path,
                             status.ToString());
  }
  spdlog::debug("Opened RocksDB at {}", path);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  return store;
}

}  // namespace tether::storage
