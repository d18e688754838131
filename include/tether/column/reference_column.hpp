#pragma once
#include <tether/codec/composite_key_codec.hpp>
#include <tether/column/map_column.hpp>
#include <tether/schema/enum_string.hpp>
#include <tether/schema/registry.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <string_view>
#include <variant>

namespace tether::column {

enum class reference_kind_t : uint8_t {
  simple = 0,
  string_coerced = 1,
  composite = 2
};

inline constexpr auto kReferenceKindMappings = std::array{
    std::pair<std::string_view, reference_kind_t>{"relation",
                                                  reference_kind_t::simple},
    std::pair<std::string_view, reference_kind_t>{
        "string_relation", reference_kind_t::string_coerced},
    std::pair<std::string_view, reference_kind_t>{
        "composite_relation", reference_kind_t::composite},
};

inline constexpr std::string_view to_string(const reference_kind_t value) {
  return tether::schema::to_string(value, kReferenceKindMappings)
      .value_or("unknown");
}

/// What a reference column reads back.
using reference_t = std::variant<std::monostate,
                                 tether::schema::uuid_t,
                                 std::string,
                                 tether::schema::composite_key_t>;

/// Points at an entity whose primary key is a single uuid.
struct simple_reference final {};

/// Same storage as simple_reference; reads back the uuid's canonical text
/// for consumers that compare identifiers as strings.
struct string_coerced_reference final {};

/// Points at an entity with a composite primary key, stored as map<ascii,
/// text>.
struct composite_reference final {
  std::shared_ptr<const tether::codec::composite_key_codec> codec;
  map_column storage;
};

using reference_strategy_t = std::variant<simple_reference,
                                          string_coerced_reference,
                                          composite_reference>;

/// Column holding a reference to a row of another model.
class reference_column final {
 public:
  /// Throws configuration_error when `config.model` is empty.
  static reference_column simple(tether::codec::reference_config config);
  static reference_column string_coerced(
      tether::codec::reference_config config);
  /// Also throws configuration_error when `config.index` is set.
  static reference_column composite(tether::codec::reference_config config,
                                    tether::schema::schema_resolver_t resolver);

  const tether::codec::reference_config& config() const { return config_; }
  reference_kind_t kind() const;
  const reference_strategy_t& strategy() const { return strategy_; }

  /// Normalize, validate and marshal a value for storage.
  tether::schema::bytes_t to_database(
      const tether::codec::reference_value_t& value) const;

  /// Unmarshal stored bytes into the column's read shape. Empty bytes read
  /// as "no relation set".
  reference_t from_database(const tether::schema::bytes_view_t& bytes) const;

 private:
  reference_column(tether::codec::reference_config config,
                   reference_strategy_t strategy);

  tether::codec::reference_config config_;
  reference_strategy_t strategy_;
};

}  // namespace tether::column
