#pragma once
#include <tether/schema/field_definition.hpp>
#include <tether/schema/value.hpp>

#include <optional>
#include <string>

namespace tether::codec {

/// Canonical text for one primary-key component.
///
/// Timestamps become the decimal count of milliseconds since the epoch, as
/// the driver writes them. Text input is decoded under the field's type and
/// re-rendered, so "007" stores as "7" and uppercase uuids store lowercase.
/// Null and empty results become std::nullopt.
std::optional<std::string> normalize(const tether::schema::field_definition& field,
                                     const tether::schema::value_t& value);

/// Typed value back from canonical text.
///
/// Stored timestamps are milliseconds but a native read yields seconds, so
/// the text is converted to double seconds before the field decodes it.
tether::schema::value_t denormalize(
    const tether::schema::field_definition& field,
    const std::optional<std::string>& stored);

}  // namespace tether::codec
