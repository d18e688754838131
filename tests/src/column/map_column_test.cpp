#include <gtest/gtest.h>
#include <tether/column/map_column.hpp>
#include <tether/common/error.hpp>

#include <optional>
#include <string>

using tether::column::map_column;
using tether::schema::flat_mapping_t;
using tether::schema::logical_type_t;

TEST(map_column, accepts_only_textual_types) {
  EXPECT_NO_THROW((map_column{logical_type_t::ascii, logical_type_t::text}));
  EXPECT_NO_THROW((map_column{logical_type_t::text, logical_type_t::ascii}));
  EXPECT_THROW((map_column{logical_type_t::uuid, logical_type_t::text}),
               tether::common::configuration_error);
  EXPECT_THROW((map_column{logical_type_t::ascii, logical_type_t::blob}),
               tether::common::configuration_error);
}

TEST(map_column, validate_checks_keys_and_values) {
  auto column = map_column{logical_type_t::ascii, logical_type_t::text};
  auto valid = flat_mapping_t{{"name", "Zoë"}, {"missing", std::nullopt}};
  EXPECT_EQ(column.validate(valid), valid);

  EXPECT_THROW(column.validate(flat_mapping_t{{"", "x"}}),
               tether::common::type_coercion_error);
  EXPECT_THROW(column.validate(flat_mapping_t{{"naïve", "x"}}),
               tether::common::type_coercion_error);
  EXPECT_THROW(column.validate(flat_mapping_t{{"name", ""}}),
               tether::common::type_coercion_error);

  auto ascii_values = map_column{logical_type_t::ascii, logical_type_t::ascii};
  EXPECT_THROW(ascii_values.validate(flat_mapping_t{{"name", "Zoë"}}),
               tether::common::type_coercion_error);
}

TEST(map_column, stores_and_loads_entries) {
  auto column = map_column{logical_type_t::ascii, logical_type_t::text};
  auto value = flat_mapping_t{
      {"organization", "Acme"}, {"key", std::nullopt}, {"start_date", "0"}};
  auto bytes = column.to_database(value);
  EXPECT_FALSE(bytes.empty());
  EXPECT_EQ(column.from_database(tether::schema::make_bytes_view(bytes)),
            value);
}

TEST(map_column, empty_bytes_load_as_empty_mapping) {
  auto column = map_column{logical_type_t::ascii, logical_type_t::text};
  EXPECT_TRUE(column.from_database(tether::schema::bytes_view_t{}).empty());
}

TEST(map_column, malformed_bytes_are_rejected) {
  auto column = map_column{logical_type_t::ascii, logical_type_t::text};
  // One entry announced, none present.
  auto bytes = tether::schema::bytes_t{0x04};
  EXPECT_THROW(column.from_database(tether::schema::make_bytes_view(bytes)),
               tether::common::type_coercion_error);
}

TEST(map_column, refuses_to_store_invalid_entries) {
  auto column = map_column{logical_type_t::ascii, logical_type_t::text};
  EXPECT_THROW(column.to_database(flat_mapping_t{{"", "x"}}),
               tether::common::type_coercion_error);
}
