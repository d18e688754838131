#include <gtest/gtest.h>
#include <tether/common/error.hpp>
#include <tether/schema/declaration.hpp>
#include <tether/schema/registry.hpp>
#include <tether/testing/common.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

namespace {

std::vector<std::string> ids(
    const std::vector<tether::schema::field_definition>& fields) {
  auto out = std::vector<std::string>{};
  std::ranges::transform(fields, std::back_inserter(out),
                         &tether::schema::field_definition::id);
  return out;
}

}  // namespace

TEST(schema_declaration, parses_fields_types_and_roles) {
  auto schema =
      tether::schema::parse_schema_declaration(tether::testing::kForeignModel);
  EXPECT_EQ(schema.name, "ForeignModel");
  ASSERT_EQ(schema.fields.size(), 4u);
  EXPECT_EQ(schema.fields[1].id, "start_date");
  EXPECT_EQ(schema.fields[1].logical_type,
            tether::schema::logical_type_t::timestamp);
  EXPECT_EQ(schema.fields[1].role, tether::schema::key_role_t::clustering);
  EXPECT_EQ(schema.fields[3].role, tether::schema::key_role_t::regular);
}

TEST(schema_declaration, rejects_malformed_input) {
  EXPECT_THROW(tether::schema::parse_schema_declaration("Model"),
               tether::common::configuration_error);
  EXPECT_THROW(tether::schema::parse_schema_declaration("Model()"),
               tether::common::configuration_error);
  EXPECT_THROW(tether::schema::parse_schema_declaration("Model(id)"),
               tether::common::configuration_error);
  EXPECT_THROW(tether::schema::parse_schema_declaration("Model(id:float)"),
               tether::common::configuration_error);
  EXPECT_THROW(
      tether::schema::parse_schema_declaration("Model(id:uuid:primary)"),
      tether::common::configuration_error);
  EXPECT_THROW(tether::schema::parse_schema_declaration("Bad Name(id:uuid)"),
               tether::common::configuration_error);
}

TEST(entity_schema, primary_key_orders_partition_before_clustering) {
  auto schema = tether::schema::parse_schema_declaration(
      "Event(at:timestamp:clustering, info:text, tenant:text:partition, "
      "seq:int:clustering)");
  EXPECT_EQ(ids(schema.primary_key()),
            (std::vector<std::string>{"tenant", "at", "seq"}));
  EXPECT_NE(schema.find("info"), nullptr);
  EXPECT_EQ(schema.find("missing"), nullptr);
}

TEST(schema_registry, resolves_registered_schemas) {
  auto registry = tether::testing::make_registry();
  EXPECT_TRUE(registry->find("ForeignModel").has_value());
  EXPECT_FALSE(registry->find("Other").has_value());
  EXPECT_EQ(registry->resolve("ForeignModel").fields.size(), 4u);
  EXPECT_EQ(registry->names(), (std::vector<std::string>{"ForeignModel"}));
}

TEST(schema_registry, unknown_schema_fails_resolution) {
  auto registry = tether::testing::make_registry();
  try {
    registry->resolve("Missing");
    FAIL() << "expected schema_resolution_error";
  } catch (const tether::common::schema_resolution_error& ex) {
    EXPECT_EQ(ex.model(), "Missing");
    EXPECT_EQ(ex.code(), tether::common::error_code::schema_resolution);
  }
}

TEST(schema_registry, rejects_invalid_and_duplicate_field_ids) {
  auto registry = tether::schema::schema_registry{};
  auto invalid = tether::schema::entity_schema{
      .name = "Invalid",
      .fields = {{.id = "bad-id",
                  .logical_type = tether::schema::logical_type_t::text,
                  .role = tether::schema::key_role_t::partition}}};
  EXPECT_THROW(registry.add(invalid), tether::common::configuration_error);

  EXPECT_THROW(registry.add(tether::schema::parse_schema_declaration(
                   "Twice(id:uuid:partition, id:text)")),
               tether::common::configuration_error);
  EXPECT_TRUE(registry.names().empty());
}

TEST(schema_registry, resolver_reaches_the_shared_registry) {
  auto registry = tether::testing::make_registry();
  auto resolver = tether::schema::make_resolver(registry);
  EXPECT_EQ(resolver("ForeignModel").name, "ForeignModel");
  EXPECT_THROW(resolver("Other"), tether::common::schema_resolution_error);
  EXPECT_THROW(tether::schema::make_resolver(nullptr),
               tether::common::configuration_error);
}
