#pragma once
#include <tether/schema/entity.hpp>
#include <tether/schema/logical_type.hpp>
#include <tether/schema/registry.hpp>
#include <tether/schema/value.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace tether::codec {

/// Options shared by every reference column variant.
struct reference_config final {
  std::string model;
  bool index{false};
};

/// Anything a composite reference column can be assigned.
using reference_value_t = std::variant<std::monostate,
                                       tether::schema::uuid_t,
                                       std::string,
                                       tether::schema::entity_instance,
                                       tether::schema::composite_key_t,
                                       tether::schema::flat_mapping_t>;

/// Flattens the composite primary key of `config.model` into a text map and
/// back.
///
/// Both directions walk the referenced schema's primary key rather than the
/// input, so partial or malformed input is caught deterministically. The
/// schema is resolved on first use and memoized; a failed resolution is not
/// cached.
class composite_key_codec final {
 public:
  /// Map keys are field ids, and double as query-language identifiers.
  static constexpr auto kKeyType = tether::schema::logical_type_t::ascii;
  static constexpr auto kValueType = tether::schema::logical_type_t::text;

  /// Throws configuration_error when `config.model` is empty, when
  /// `config.index` is set, or when `resolver` is empty.
  composite_key_codec(reference_config config,
                      tether::schema::schema_resolver_t resolver);

  composite_key_codec(const composite_key_codec&) = delete;
  composite_key_codec& operator=(const composite_key_codec&) = delete;

  const reference_config& config() const { return config_; }

  /// Resolved schema of the referenced model.
  std::shared_ptr<const tether::schema::entity_schema> schema() const;

  tether::schema::flat_mapping_t encode(const reference_value_t& value) const;
  tether::schema::flat_mapping_t encode(
      const tether::schema::entity_instance& value) const;
  tether::schema::flat_mapping_t encode(
      const tether::schema::composite_key_t& value) const;
  /// Already flat: returned unchanged once its keys are checked.
  tether::schema::flat_mapping_t encode(
      const tether::schema::flat_mapping_t& value) const;

  tether::schema::composite_key_t decode(
      const tether::schema::flat_mapping_t& mapping) const;

 private:
  reference_config config_;
  tether::schema::schema_resolver_t resolver_;
  mutable std::mutex mutex_;
  mutable std::shared_ptr<const tether::schema::entity_schema> schema_;
};

}  // namespace tether::codec
