#include <gtest/gtest.h>
#include <tether/common/error.hpp>
#include <tether/key/row_key.hpp>
#include <tether/testing/common.hpp>

#include <algorithm>
#include <string>

using tether::schema::bytes_t;
using tether::schema::composite_key_t;

namespace {

bool starts_with(const bytes_t& bytes, const bytes_t& prefix) {
  return bytes.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(bytes));
}

}  // namespace

TEST(row_key, table_prefix_is_delimited_by_pipes) {
  EXPECT_EQ(tether::key::make_table_prefix("ForeignModel"),
            tether::schema::make_bytes(std::string_view{"TABLE|ForeignModel|"}));
}

TEST(row_key, encodes_each_component_after_the_prefix) {
  auto schema =
      tether::schema::parse_schema_declaration("Counter(id:bigint:partition)");
  auto key = tether::key::make_row_key(
      schema, composite_key_t{{"id", int64_t{0x0102}}});

  auto expected =
      tether::schema::make_bytes(std::string_view{"TABLE|Counter|"});
  // Integer tag, then eight little-endian bytes.
  expected.insert(std::end(expected), {0x02, 0x02, 0x01, 0x00, 0x00, 0x00,
                                       0x00, 0x00, 0x00});
  EXPECT_EQ(key, expected);
}

TEST(row_key, entity_and_key_produce_the_same_row_key) {
  auto schema =
      tether::schema::parse_schema_declaration(tether::testing::kForeignModel);
  auto entity = tether::testing::make_foreign_entity(1);
  auto key = composite_key_t{
      {"organization", entity.values.at("organization")},
      {"start_date", entity.values.at("start_date")},
      {"key", entity.values.at("key")},
  };

  auto from_entity = tether::key::make_row_key(schema, entity);
  EXPECT_EQ(from_entity, tether::key::make_row_key(schema, key));
  EXPECT_TRUE(starts_with(from_entity,
                          tether::key::make_table_prefix("ForeignModel")));
}

TEST(row_key, different_keys_do_not_collide) {
  auto schema =
      tether::schema::parse_schema_declaration(tether::testing::kForeignModel);
  EXPECT_NE(
      tether::key::make_row_key(schema, tether::testing::make_foreign_entity(1)),
      tether::key::make_row_key(schema, tether::testing::make_foreign_entity(2)));
  EXPECT_NE(tether::key::make_row_key(
                schema, tether::testing::make_foreign_entity(1, "Acme")),
            tether::key::make_row_key(
                schema, tether::testing::make_foreign_entity(1, "Acme2")));
}

TEST(row_key, absent_or_null_components_are_missing) {
  auto schema =
      tether::schema::parse_schema_declaration(tether::testing::kForeignModel);
  auto entity = tether::testing::make_foreign_entity(1);
  entity.values.erase("key");
  try {
    tether::key::make_row_key(schema, entity);
    FAIL() << "expected missing_field_error";
  } catch (const tether::common::missing_field_error& ex) {
    EXPECT_EQ(ex.field_id(), "key");
  }

  entity = tether::testing::make_foreign_entity(1);
  entity.values["organization"] = std::monostate{};
  EXPECT_THROW(tether::key::make_row_key(schema, entity),
               tether::common::missing_field_error);
}
