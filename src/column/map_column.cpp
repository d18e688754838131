#include <tether/column/map_column.hpp>
#include <tether/common/error.hpp>
#include <tether/schema/identifier.hpp>

#include <optional>
#include <string>
#include <tuple>
#include <vector>

using namespace tether::schema;

namespace tether::column {

namespace {

using entries_t = std::vector<std::tuple<std::string, std::optional<std::string>>>;

bool is_text_type(const logical_type_t type) {
  return type == logical_type_t::ascii || type == logical_type_t::text;
}

bool fits(const logical_type_t type, const std::string& value) {
  return type != logical_type_t::ascii || is_ascii(value);
}

}  // namespace

map_column::map_column(const logical_type_t key_type,
                       const logical_type_t value_type,
                       const bool index)
    : key_type_{key_type}, value_type_{value_type}, index_{index} {
  if (!is_text_type(key_type_) || !is_text_type(value_type_)) {
    throw tether::common::configuration_error{
        "map column supports ascii and text only, got map<" +
        std::string{to_string(key_type_)} + ", " +
        std::string{to_string(value_type_)} + ">"};
  }
}

flat_mapping_t map_column::validate(const flat_mapping_t& value) const {
  for (const auto& [key, text] : value) {
    if (key.empty() || !fits(key_type_, key)) {
      throw tether::common::type_coercion_error{
          key, "map key is not valid " + std::string{to_string(key_type_)}};
    }
    if (text && (text->empty() || !fits(value_type_, *text))) {
      throw tether::common::type_coercion_error{
          key, "map value is not valid " + std::string{to_string(value_type_)}};
    }
  }
  return value;
}

bytes_t map_column::to_database(const flat_mapping_t& value) const {
  auto entries = entries_t{};
  entries.reserve(value.size());
  for (const auto& [key, text] : validate(value)) {
    entries.emplace_back(key, text);
  }
  auto encoder = tether::schema::encoding::scale_encoder_t{};
  return encoder.encode(entries);
}

flat_mapping_t map_column::from_database(const bytes_view_t& bytes) const {
  if (bytes.empty()) {
    return {};
  }
  auto encoder = tether::schema::encoding::scale_encoder_t{};
  auto entries = encoder.decode<entries_t>(bytes, "");
  auto value = flat_mapping_t{};
  for (auto& [key, text] : entries) {
    value.insert_or_assign(std::move(key), std::move(text));
  }
  return value;
}

}  // namespace tether::column
