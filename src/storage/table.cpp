#include <tether/common/error.hpp>
#include <tether/key/row_key.hpp>
#include <tether/schema/encoding/scale/encoder.hpp>
#include <tether/storage/table.hpp>

#include <spdlog/spdlog.h>

#include <bit>
#include <tuple>

using namespace tether::schema;

namespace tether::storage {

namespace {

using encoder_t = tether::schema::encoding::scale_encoder_t;
using columns_t = std::vector<std::tuple<std::string, bytes_t>>;
using row_t = std::tuple<columns_t, columns_t>;

std::optional<bytes_t> encode_payload(const wire_value_t& wire) {
  auto encoder = encoder_t{};
  return std::visit(
      overloaded{
          [](const std::monostate&) -> std::optional<bytes_t> {
            return std::nullopt;
          },
          [&](const std::string& arg) -> std::optional<bytes_t> {
            return encoder.encode(arg);
          },
          [&](const int64_t arg) -> std::optional<bytes_t> {
            return encoder.encode(arg);
          },
          [&](const double arg) -> std::optional<bytes_t> {
            return encoder.encode(std::bit_cast<uint64_t>(arg));
          },
          [&](const bool arg) -> std::optional<bytes_t> {
            return encoder.encode(arg);
          },
          [&](const uuid_t& arg) -> std::optional<bytes_t> {
            return encoder.encode(make_uuid_bytes(arg));
          },
          [&](const bytes_t& arg) -> std::optional<bytes_t> {
            return encoder.encode(arg);
          }},
      wire);
}

template <typename T>
T decode_payload(const field_definition& field, const bytes_t& payload) {
  auto encoder = encoder_t{};
  return encoder.decode<T>(make_bytes_view(payload), field.id);
}

/// Payload to what the driver would hand back for this column type.
wire_value_t read_wire(const field_definition& field, const bytes_t& payload) {
  switch (field.logical_type) {
    case logical_type_t::text:
    case logical_type_t::ascii:
      return decode_payload<std::string>(field, payload);
    case logical_type_t::uuid:
    case logical_type_t::timeuuid:
      return make_uuid(decode_payload<uuid_bytes_t>(field, payload));
    case logical_type_t::integer:
    case logical_type_t::big_integer:
      return decode_payload<int64_t>(field, payload);
    case logical_type_t::boolean:
      return decode_payload<bool>(field, payload);
    case logical_type_t::timestamp:
      // Written as milliseconds, read back as seconds.
      return static_cast<double>(decode_payload<int64_t>(field, payload)) /
             1000.0;
    case logical_type_t::floating:
      return std::bit_cast<double>(decode_payload<uint64_t>(field, payload));
    case logical_type_t::blob:
      return decode_payload<bytes_t>(field, payload);
  }
  throw tether::common::type_coercion_error{field.id, "unknown column type"};
}

codec::reference_value_t widen(const tether::column::reference_t& value) {
  return std::visit(
      [](const auto& arg) -> codec::reference_value_t { return arg; }, value);
}

}  // namespace

table::table(storage<rocksdb_storage_tag>& storage,
             const schema_resolver_t& resolver,
             table_definition definition)
    : storage_{storage},
      schema_{resolver(definition.schema_name)},
      definition_{std::move(definition)} {
  if (schema_.primary_key().empty()) {
    throw tether::common::configuration_error{
        "table '" + schema_.name + "' has no primary key"};
  }
  for (const auto& [id, column] : definition_.relations) {
    if (schema_.find(id) != nullptr) {
      throw tether::common::configuration_error{
          "reference column '" + id + "' shadows a field of '" +
          schema_.name + "'"};
    }
  }
}

void table::insert(const record& row) {
  if (row.entity.schema_name != schema_.name) {
    throw tether::common::type_coercion_error{
        schema_.name, "cannot store an instance of '" +
                          row.entity.schema_name + "'"};
  }
  auto key = tether::key::make_row_key(schema_, row.entity);
  auto value = encode_row(row);
  storage_.put(make_bytes_view(key), make_bytes_view(value));
  spdlog::debug("Stored '{}' row ({} byte key, {} byte value)", schema_.name,
                key.size(), value.size());
}

std::optional<record> table::get(const composite_key_t& key) const {
  auto row_key = tether::key::make_row_key(schema_, key);
  auto stored = storage_.get(make_bytes_view(row_key));
  if (!stored) {
    spdlog::debug("No '{}' row for key {}", schema_.name,
                  to_hex(make_bytes_view(row_key)));
    return std::nullopt;
  }
  return decode_row(make_bytes_view(*stored));
}

std::vector<record> table::list() const {
  auto prefix = tether::key::make_table_prefix(schema_.name);
  auto out = std::vector<record>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    out.push_back(decode_row(make_bytes_view(value)));
  }
  return out;
}

const tether::column::reference_column* table::find_relation(
    const std::string& id) const {
  for (const auto& [name, column] : definition_.relations) {
    if (name == id) {
      return &column;
    }
  }
  return nullptr;
}

bytes_t table::encode_row(const record& row) const {
  auto fields = columns_t{};
  for (const auto& [id, value] : row.entity.values) {
    const auto* field = schema_.find(id);
    if (field == nullptr) {
      throw tether::common::type_coercion_error{
          id, "not declared by '" + schema_.name + "'"};
    }
    if (auto payload = encode_payload(encode_native(*field, value))) {
      fields.emplace_back(id, std::move(*payload));
    }
  }

  auto relations = columns_t{};
  for (const auto& [id, value] : row.relations) {
    const auto* column = find_relation(id);
    if (column == nullptr) {
      throw tether::common::type_coercion_error{
          id, "not a reference column of '" + schema_.name + "'"};
    }
    relations.emplace_back(id, column->to_database(value));
  }

  auto encoder = encoder_t{};
  return encoder.encode(row_t{std::move(fields), std::move(relations)});
}

record table::decode_row(const bytes_view_t& bytes) const {
  auto encoder = encoder_t{};
  auto [fields, relations] = encoder.decode<row_t>(bytes, schema_.name);

  auto row = record{};
  row.entity.schema_name = schema_.name;
  for (const auto& [id, payload] : fields) {
    const auto* field = schema_.find(id);
    if (field == nullptr) {
      spdlog::warn("Ignoring stored field '{}' unknown to '{}'", id,
                   schema_.name);
      continue;
    }
    row.entity.values.emplace(id,
                              decode_native(*field, read_wire(*field, payload)));
  }

  // Unset reference columns read like empty stored bytes.
  for (const auto& [id, column] : definition_.relations) {
    auto value = column.from_database(bytes_view_t{});
    for (const auto& [stored_id, payload] : relations) {
      if (stored_id == id) {
        value = column.from_database(make_bytes_view(payload));
      }
    }
    row.relations.emplace(id, widen(value));
  }
  return row;
}

}  // namespace tether::storage
