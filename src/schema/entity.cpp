#include <tether/schema/entity.hpp>

#include <algorithm>
#include <iterator>

namespace tether::schema {

std::vector<field_definition> entity_schema::primary_key() const {
  auto key = std::vector<field_definition>{};
  std::ranges::copy_if(fields, std::back_inserter(key),
                       [](const field_definition& field) {
                         return field.role == key_role_t::partition;
                       });
  std::ranges::copy_if(fields, std::back_inserter(key),
                       [](const field_definition& field) {
                         return field.role == key_role_t::clustering;
                       });
  return key;
}

const field_definition* entity_schema::find(const std::string_view id) const {
  auto it = std::ranges::find(fields, id, &field_definition::id);
  return it == std::end(fields) ? nullptr : &*it;
}

const value_t* entity_instance::find(const std::string_view id) const {
  auto it = values.find(std::string{id});
  return it == std::end(values) ? nullptr : &it->second;
}

}  // namespace tether::schema
