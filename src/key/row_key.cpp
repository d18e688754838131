#include <tether/common/error.hpp>
#include <tether/key/builder.hpp>
#include <tether/key/row_key.hpp>

using namespace tether::schema;

namespace tether::key {

bytes_t make_table_prefix(const std::string_view schema_name) {
  auto b = builder{};
  b.write(kTableKeyPrefix);
  b.write(schema_name);
  b.write(std::string_view{"|"});
  return b.data;
}

bytes_t make_row_key(const entity_schema& schema, const composite_key_t& key) {
  auto b = builder{};
  b.data = make_table_prefix(schema.name);
  for (const auto& field : schema.primary_key()) {
    auto it = key.find(field.id);
    if (it == std::end(key) ||
        std::holds_alternative<std::monostate>(it->second)) {
      throw tether::common::missing_field_error{field.id};
    }
    b.write(encode_native(field, it->second));
  }
  return b.data;
}

bytes_t make_row_key(const entity_schema& schema,
                     const entity_instance& entity) {
  return make_row_key(schema, entity.values);
}

}  // namespace tether::key
