#include <gtest/gtest.h>
#include <tether/common/error.hpp>
#include <tether/schema/field_definition.hpp>
#include <tether/testing/common.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

using namespace std::chrono_literals;
using tether::schema::field_definition;
using tether::schema::logical_type_t;
using tether::schema::value_t;
using tether::schema::wire_value_t;

namespace {

field_definition make_field(const logical_type_t type) {
  return field_definition{.id = "component", .logical_type = type};
}

constexpr auto kVersion1Uuid =
    std::string_view{"c232ab00-9414-11ec-b3c8-9f6bdeced846"};
constexpr auto kVersion4Uuid =
    std::string_view{"123e4567-e89b-42d3-a456-426614174000"};

}  // namespace

TEST(field_definition, timestamp_encodes_to_truncated_milliseconds) {
  auto wire = tether::schema::encode_native(
      make_field(logical_type_t::timestamp),
      value_t{tether::testing::make_new_year_timestamp()});
  ASSERT_TRUE(std::holds_alternative<int64_t>(wire));
  EXPECT_EQ(std::get<int64_t>(wire), 1704067200123);
}

TEST(field_definition, timestamp_decodes_from_seconds_only) {
  auto field = make_field(logical_type_t::timestamp);
  auto from_double =
      tether::schema::decode_native(field, wire_value_t{1704067200.123});
  ASSERT_TRUE(std::holds_alternative<tether::schema::timestamp_t>(from_double));
  EXPECT_EQ(std::get<tether::schema::timestamp_t>(from_double)
                .time_since_epoch(),
            1704067200123000us);

  auto from_integer =
      tether::schema::decode_native(field, wire_value_t{int64_t{60}});
  EXPECT_EQ(std::get<tether::schema::timestamp_t>(from_integer)
                .time_since_epoch(),
            60s);

  EXPECT_THROW(tether::schema::decode_native(
                   field, wire_value_t{std::string{"1704067200123"}}),
               tether::common::type_coercion_error);
}

TEST(field_definition, timestamp_rejects_out_of_range_seconds) {
  auto field = make_field(logical_type_t::timestamp);
  EXPECT_THROW(tether::schema::decode_native(
                   field, wire_value_t{std::numeric_limits<int64_t>::max()}),
               tether::common::type_coercion_error);
  EXPECT_THROW(tether::schema::decode_native(
                   field, wire_value_t{std::numeric_limits<int64_t>::min()}),
               tether::common::type_coercion_error);
  EXPECT_THROW(tether::schema::decode_native(field, wire_value_t{9.3e15}),
               tether::common::type_coercion_error);
  EXPECT_THROW(tether::schema::decode_native(
                   field, wire_value_t{std::numeric_limits<double>::quiet_NaN()}),
               tether::common::type_coercion_error);
}

TEST(field_definition, uuid_accepts_its_textual_form) {
  auto field = make_field(logical_type_t::uuid);
  auto expected = *tether::schema::try_make_uuid(kVersion4Uuid);

  auto encoded = tether::schema::encode_native(
      field, value_t{std::string{kVersion4Uuid}});
  EXPECT_EQ(std::get<tether::schema::uuid_t>(encoded), expected);

  auto decoded = tether::schema::decode_native(
      field, wire_value_t{std::string{kVersion4Uuid}});
  EXPECT_EQ(std::get<tether::schema::uuid_t>(decoded), expected);

  EXPECT_THROW(tether::schema::decode_native(
                   field, wire_value_t{std::string{"nope"}}),
               tether::common::type_coercion_error);
}

TEST(field_definition, timeuuid_requires_version_one) {
  auto field = make_field(logical_type_t::timeuuid);
  auto v1 = *tether::schema::try_make_uuid(kVersion1Uuid);
  auto v4 = *tether::schema::try_make_uuid(kVersion4Uuid);

  EXPECT_EQ(std::get<tether::schema::uuid_t>(
                tether::schema::encode_native(field, value_t{v1})),
            v1);
  EXPECT_THROW(tether::schema::encode_native(field, value_t{v4}),
               tether::common::type_coercion_error);
}

TEST(field_definition, integer_enforces_its_range) {
  auto field = make_field(logical_type_t::integer);
  EXPECT_EQ(std::get<int64_t>(
                tether::schema::encode_native(field, value_t{int32_t{-7}})),
            -7);
  EXPECT_THROW(tether::schema::encode_native(
                   field, value_t{int64_t{1} << 40}),
               tether::common::type_coercion_error);
  EXPECT_EQ(std::get<int32_t>(tether::schema::decode_native(
                field, wire_value_t{std::string{"42"}})),
            42);
  EXPECT_THROW(tether::schema::decode_native(
                   field, wire_value_t{std::string{"42abc"}}),
               tether::common::type_coercion_error);
  EXPECT_THROW(tether::schema::decode_native(
                   field, wire_value_t{std::string{"99999999999"}}),
               tether::common::type_coercion_error);
}

TEST(field_definition, big_integer_widens_integers) {
  auto field = make_field(logical_type_t::big_integer);
  EXPECT_EQ(std::get<int64_t>(
                tether::schema::encode_native(field, value_t{int32_t{3}})),
            3);
  EXPECT_EQ(std::get<int64_t>(tether::schema::decode_native(
                field, wire_value_t{std::string{"-9000000000"}})),
            -9000000000);
}

TEST(field_definition, boolean_reads_true_and_false_text) {
  auto field = make_field(logical_type_t::boolean);
  EXPECT_EQ(std::get<bool>(tether::schema::decode_native(
                field, wire_value_t{std::string{"true"}})),
            true);
  EXPECT_EQ(std::get<bool>(tether::schema::decode_native(
                field, wire_value_t{std::string{"false"}})),
            false);
  EXPECT_THROW(tether::schema::decode_native(
                   field, wire_value_t{std::string{"False"}}),
               tether::common::type_coercion_error);
}

TEST(field_definition, ascii_rejects_non_ascii_text) {
  auto field = make_field(logical_type_t::ascii);
  EXPECT_THROW(tether::schema::encode_native(
                   field, value_t{std::string{"caf\xc3\xa9"}}),
               tether::common::type_coercion_error);
}

TEST(field_definition, mismatched_value_type_is_rejected) {
  EXPECT_THROW(tether::schema::encode_native(make_field(logical_type_t::integer),
                                             value_t{std::string{"12"}}),
               tether::common::type_coercion_error);
  EXPECT_THROW(tether::schema::encode_native(make_field(logical_type_t::text),
                                             value_t{int32_t{12}}),
               tether::common::type_coercion_error);
}

TEST(field_definition, null_passes_through_both_directions) {
  auto field = make_field(logical_type_t::uuid);
  EXPECT_TRUE(std::holds_alternative<std::monostate>(
      tether::schema::encode_native(field, value_t{})));
  EXPECT_TRUE(std::holds_alternative<std::monostate>(
      tether::schema::decode_native(field, wire_value_t{})));
}

TEST(field_definition, type_coercion_error_names_the_field) {
  try {
    tether::schema::encode_native(make_field(logical_type_t::boolean),
                                  value_t{int32_t{1}});
    FAIL() << "expected type_coercion_error";
  } catch (const tether::common::type_coercion_error& ex) {
    EXPECT_EQ(ex.field_id(), "component");
    EXPECT_EQ(ex.code(), tether::common::error_code::type_coercion);
  }
}
