#pragma once
#include <tether/schema/entity.hpp>

#include <string_view>

namespace tether::schema {

/// Parse `Name(field:type[:role], ...)`, e.g.
/// `ForeignModel(organization:text:partition, key:uuid:clustering, info:text)`.
///
/// Types use the CQL names (text, ascii, uuid, timeuuid, int, bigint,
/// boolean, timestamp, double, blob); the role defaults to regular. Throws
/// configuration_error on malformed input.
entity_schema parse_schema_declaration(std::string_view declaration);

}  // namespace tether::schema
