#pragma once

#include <tether/schema/declaration.hpp>
#include <tether/schema/primitives.hpp>
#include <tether/schema/registry.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace tether::testing {

inline constexpr auto kForeignModel = std::string_view{
    "ForeignModel(organization:text:partition, start_date:timestamp:clustering,"
    " key:uuid:clustering, info:text)"};

/// 2024-01-01T00:00:00.123456Z
inline tether::schema::timestamp_t make_new_year_timestamp() {
  return tether::schema::timestamp_t{
      std::chrono::microseconds{1704067200123456}};
}

inline tether::schema::uuid_t make_uuid(const uint8_t seed) {
  auto bytes = tether::schema::uuid_bytes_t{};
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  // Version 4, RFC 4122 variant.
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0Fu) | 0x40u);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3Fu) | 0x80u);
  return tether::schema::make_uuid(bytes);
}

inline std::shared_ptr<tether::schema::schema_registry> make_registry() {
  auto registry = std::make_shared<tether::schema::schema_registry>();
  registry->add(tether::schema::parse_schema_declaration(kForeignModel));
  return registry;
}

inline tether::schema::entity_instance make_foreign_entity(
    const uint8_t seed,
    const std::string& organization = "Dummy organization") {
  auto entity = tether::schema::entity_instance{};
  entity.schema_name = "ForeignModel";
  entity.values.emplace("organization", organization);
  entity.values.emplace("start_date", make_new_year_timestamp());
  entity.values.emplace("key", make_uuid(seed));
  entity.values.emplace("info", std::string{"some info"});
  return entity;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace tether::testing
