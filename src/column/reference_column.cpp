#include <tether/codec/validator.hpp>
#include <tether/column/reference_column.hpp>
#include <tether/common/error.hpp>
#include <tether/schema/encoding/scale/encoder.hpp>

#include <optional>
#include <utility>

using namespace tether::schema;

namespace tether::column {

namespace {

using stored_uuid_t = std::optional<uuid_bytes_t>;

void require_model(const tether::codec::reference_config& config) {
  if (config.model.empty()) {
    throw tether::common::configuration_error{"no model provided"};
  }
}

stored_uuid_t to_stored_uuid(const tether::codec::reference_config& config,
                             const tether::codec::reference_value_t& value) {
  return std::visit(
      overloaded{
          [](const std::monostate&) -> stored_uuid_t { return std::nullopt; },
          [](const uuid_t& arg) -> stored_uuid_t {
            return make_uuid_bytes(arg);
          },
          [&config](const std::string& arg) -> stored_uuid_t {
            if (arg.empty()) {
              return std::nullopt;
            }
            auto parsed = try_make_uuid(arg);
            if (!parsed) {
              throw tether::common::type_coercion_error{
                  config.model, "'" + arg + "' is not a uuid"};
            }
            return make_uuid_bytes(*parsed);
          },
          [&config](const auto&) -> stored_uuid_t {
            throw tether::common::type_coercion_error{
                config.model, "a single uuid reference cannot hold a "
                              "composite value"};
          }},
      value);
}

std::optional<uuid_t> from_stored_uuid(
    const tether::codec::reference_config& config,
    const bytes_view_t& bytes) {
  if (bytes.empty()) {
    return std::nullopt;
  }
  auto encoder = tether::schema::encoding::scale_encoder_t{};
  auto stored = encoder.decode<stored_uuid_t>(bytes, config.model);
  if (!stored) {
    return std::nullopt;
  }
  return make_uuid(*stored);
}

}  // namespace

reference_column::reference_column(tether::codec::reference_config config,
                                   reference_strategy_t strategy)
    : config_{std::move(config)}, strategy_{std::move(strategy)} {}

reference_column reference_column::simple(
    tether::codec::reference_config config) {
  require_model(config);
  return reference_column{std::move(config), simple_reference{}};
}

reference_column reference_column::string_coerced(
    tether::codec::reference_config config) {
  require_model(config);
  return reference_column{std::move(config), string_coerced_reference{}};
}

reference_column reference_column::composite(
    tether::codec::reference_config config,
    schema_resolver_t resolver) {
  auto codec = std::make_shared<const tether::codec::composite_key_codec>(
      config, std::move(resolver));
  auto storage = map_column{tether::codec::composite_key_codec::kKeyType,
                            tether::codec::composite_key_codec::kValueType};
  return reference_column{
      std::move(config),
      composite_reference{.codec = std::move(codec),
                          .storage = std::move(storage)}};
}

reference_kind_t reference_column::kind() const {
  return static_cast<reference_kind_t>(strategy_.index());
}

bytes_t reference_column::to_database(
    const tether::codec::reference_value_t& value) const {
  auto encoder = tether::schema::encoding::scale_encoder_t{};
  return std::visit(
      overloaded{[&](const composite_reference& arg) {
                   return arg.storage.to_database(
                       tether::codec::validate(*arg.codec, arg.storage, value));
                 },
                 [&](const auto&) {
                   return encoder.encode(to_stored_uuid(config_, value));
                 }},
      strategy_);
}

reference_t reference_column::from_database(const bytes_view_t& bytes) const {
  return std::visit(
      overloaded{
          [&](const simple_reference&) -> reference_t {
            auto uuid = from_stored_uuid(config_, bytes);
            if (!uuid) {
              return std::monostate{};
            }
            return *uuid;
          },
          [&](const string_coerced_reference&) -> reference_t {
            auto uuid = from_stored_uuid(config_, bytes);
            if (!uuid) {
              return std::monostate{};
            }
            return tether::schema::to_string(*uuid);
          },
          [&](const composite_reference& arg) -> reference_t {
            return arg.codec->decode(arg.storage.from_database(bytes));
          }},
      strategy_);
}

}  // namespace tether::column
