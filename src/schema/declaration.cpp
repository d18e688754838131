#include <tether/common/error.hpp>
#include <tether/schema/declaration.hpp>
#include <tether/schema/identifier.hpp>

#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace tether::schema {

namespace {

std::string_view trim(std::string_view input) {
  while (!input.empty() &&
         std::isspace(static_cast<unsigned char>(input.front())) != 0) {
    input.remove_prefix(1);
  }
  while (!input.empty() &&
         std::isspace(static_cast<unsigned char>(input.back())) != 0) {
    input.remove_suffix(1);
  }
  return input;
}

std::vector<std::string_view> split(std::string_view input, const char sep) {
  auto parts = std::vector<std::string_view>{};
  while (true) {
    auto pos = input.find(sep);
    parts.push_back(trim(input.substr(0, pos)));
    if (pos == std::string_view::npos) {
      break;
    }
    input.remove_prefix(pos + 1);
  }
  return parts;
}

[[noreturn]] void malformed(const std::string_view declaration,
                            const std::string& reason) {
  throw tether::common::configuration_error{
      "malformed schema declaration '" + std::string{declaration} +
      "': " + reason};
}

}  // namespace

entity_schema parse_schema_declaration(const std::string_view declaration) {
  auto input = trim(declaration);
  auto open = input.find('(');
  if (open == std::string_view::npos || input.back() != ')') {
    malformed(declaration, "expected Name(field:type, ...)");
  }

  auto schema = entity_schema{};
  schema.name = std::string{trim(input.substr(0, open))};
  if (schema.name.empty() || !is_identifier(schema.name)) {
    malformed(declaration, "invalid schema name");
  }

  auto body = trim(input.substr(open + 1, input.size() - open - 2));
  if (body.empty()) {
    malformed(declaration, "no fields declared");
  }
  for (const auto& item : split(body, ',')) {
    auto parts = split(item, ':');
    if (parts.size() < 2 || parts.size() > 3) {
      malformed(declaration, "expected field:type[:role] in '" +
                                 std::string{item} + "'");
    }
    auto field = field_definition{};
    field.id = std::string{parts[0]};
    auto type = try_from_string<logical_type_t>(parts[1]);
    if (!type) {
      malformed(declaration, "unknown type '" + std::string{parts[1]} +
                                 "', expected one of " +
                                 join_names(kLogicalTypeMappings));
    }
    field.logical_type = *type;
    if (parts.size() == 3) {
      auto role = try_from_string<key_role_t>(parts[2]);
      if (!role) {
        malformed(declaration, "unknown role '" + std::string{parts[2]} +
                                   "', expected one of " +
                                   join_names(kKeyRoleMappings));
      }
      field.role = *role;
    }
    schema.fields.push_back(std::move(field));
  }
  return schema;
}

}  // namespace tether::schema
