#include <tether/codec/composite_key_codec.hpp>
#include <tether/codec/value_normalizer.hpp>
#include <tether/common/error.hpp>
#include <tether/schema/identifier.hpp>

#include <utility>

using namespace tether::schema;

namespace tether::codec {

namespace {

void require_identifier(const std::string& key) {
  if (key.empty() || !is_identifier(key)) {
    throw tether::common::type_coercion_error{
        key, "map key is not a valid identifier"};
  }
}

flat_mapping_t flatten(const entity_schema& schema,
                       const composite_key_t& value) {
  auto mapping = flat_mapping_t{};
  for (const auto& field : schema.primary_key()) {
    auto it = value.find(field.id);
    if (it == std::end(value)) {
      throw tether::common::missing_field_error{field.id};
    }
    mapping.emplace(field.id, normalize(field, it->second));
  }
  return mapping;
}

}  // namespace

composite_key_codec::composite_key_codec(reference_config config,
                                         schema_resolver_t resolver)
    : config_{std::move(config)}, resolver_{std::move(resolver)} {
  if (config_.model.empty()) {
    throw tether::common::configuration_error{"no model provided"};
  }
  if (config_.index) {
    // Index matching over map entries is not strict, which makes it unfit
    // for primary key semantics.
    throw tether::common::configuration_error{
        "secondary indexes on composite references are not allowed"};
  }
  if (!resolver_) {
    throw tether::common::configuration_error{
        "no schema resolver provided for model '" + config_.model + "'"};
  }
}

std::shared_ptr<const entity_schema> composite_key_codec::schema() const {
  auto lock = std::scoped_lock{mutex_};
  if (schema_) {
    return schema_;
  }

  auto resolved = resolver_(config_.model);
  auto primary_key = resolved.primary_key();
  if (primary_key.empty()) {
    throw tether::common::configuration_error{
        "model '" + config_.model + "' has no primary key"};
  }
  for (const auto& field : primary_key) {
    if (field.id.empty() || !is_identifier(field.id)) {
      throw tether::common::configuration_error{
          "primary key field '" + field.id + "' of model '" + config_.model +
          "' cannot be used as a map key"};
    }
  }
  schema_ = std::make_shared<const entity_schema>(std::move(resolved));
  return schema_;
}

flat_mapping_t composite_key_codec::encode(
    const reference_value_t& value) const {
  return std::visit(
      overloaded{
          [](const std::monostate&) { return flat_mapping_t{}; },
          [this](const entity_instance& arg) { return encode(arg); },
          [this](const composite_key_t& arg) { return encode(arg); },
          [this](const flat_mapping_t& arg) { return encode(arg); },
          [this](const uuid_t&) -> flat_mapping_t {
            throw tether::common::type_coercion_error{
                config_.model, "a single uuid cannot address a composite key"};
          },
          [this](const std::string&) -> flat_mapping_t {
            throw tether::common::type_coercion_error{
                config_.model, "text cannot address a composite key"};
          }},
      value);
}

flat_mapping_t composite_key_codec::encode(const entity_instance& value) const {
  if (value.values.empty()) {
    return {};
  }
  if (value.schema_name != config_.model) {
    throw tether::common::type_coercion_error{
        config_.model, "instance of '" + value.schema_name +
                           "' cannot reference '" + config_.model + "'"};
  }
  auto resolved = schema();
  auto key = composite_key_t{};
  for (const auto& field : resolved->primary_key()) {
    if (const auto* component = value.find(field.id)) {
      key.emplace(field.id, *component);
    }
  }
  return flatten(*resolved, key);
}

flat_mapping_t composite_key_codec::encode(const composite_key_t& value) const {
  if (value.empty()) {
    return {};
  }
  return flatten(*schema(), value);
}

flat_mapping_t composite_key_codec::encode(const flat_mapping_t& value) const {
  for (const auto& [key, text] : value) {
    require_identifier(key);
  }
  return value;
}

composite_key_t composite_key_codec::decode(
    const flat_mapping_t& mapping) const {
  if (mapping.empty()) {
    return {};
  }
  auto key = composite_key_t{};
  for (const auto& field : schema()->primary_key()) {
    auto it = mapping.find(field.id);
    if (it == std::end(mapping)) {
      throw tether::common::missing_field_error{field.id};
    }
    key.emplace(field.id, denormalize(field, it->second));
  }
  return key;
}

}  // namespace tether::codec
