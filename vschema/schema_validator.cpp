#include "schema_validator.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <array>
#include <format>
#include <regex>

namespace vschema {

static const std::array<std::string_view, 19> supported_formats = {
  "date-time", "time",          "date", "duration",      "email",        "idn-email",    "hostname",     "idn-hostname",          "ipv4", "ipv6",
  "uuid",      "uri",           "uri-reference", "iri",  "iri-reference", "uri-template", "json-pointer", "relative-json-pointer", "regex",
};

// Only 'regex' is checked; other formats in the meta-schema describe URIs which are left to consumers
static void meta_format_check(const std::string &format, const std::string &value)
{
  if (format == "regex")
    std::regex{ value };
}

schema_syntax_checker::schema_syntax_checker() : meta_validator(nullptr, meta_format_check)
{
  meta_validator.set_root_schema(nlohmann::json_schema::draft7_schema_builtin);
}

std::optional<std::string> schema_syntax_checker::check(const nlohmann::json &document) const
{
  first_error_handler err;
  try {
    auto patch = meta_validator.validate(document, err);
  } catch (const std::exception &e) {
    return std::string{ e.what() };
  }
  if (err)
    return err.message;
  return std::nullopt;
}

bool is_supported_format(std::string_view format)
{
  return std::find(supported_formats.begin(), supported_formats.end(), format) != supported_formats.end();
}

static result<void> validate_schema_syntax(const schema &node)
{
  if (auto error = schema_syntax_checker::get().check(node.to_json()))
    return make_error(schema_error::kind::invalid_schema, "invalid schema syntax: " + error.value());

  if (auto error = node.type.validate())
    return make_error(schema_error::kind::invalid_schema, error.value());

  return {};
}

static result<void> validate_type_constraints(const schema &node)
{
  if (node.const_value.has_value() && !node.type.is_empty())
    return make_error(schema_error::kind::invalid_schema, "cannot use both 'const' and 'type' in the same schema");

  if (node.enum_values.has_value() && !node.type.is_empty())
    return make_error(schema_error::kind::invalid_schema, "cannot use both 'enum' and 'type' in the same schema");

  return {};
}

static result<void> validate_numeric_constraints(const schema &node)
{
  if (!node.has_numeric_constraints())
    return {};

  if (!node.type.is_empty() && !node.type.matches("number") && !node.type.matches("integer"))
    return make_error(schema_error::kind::invalid_schema, "numeric constraints can only be used with number or integer types, got " + node.type.to_string());

  if (node.multiple_of.has_value() && node.multiple_of.value() <= 0)
    return make_error(schema_error::kind::invalid_schema, "multipleOf must be greater than 0");

  if (node.minimum.has_value() && node.exclusive_minimum.has_value())
    return make_error(schema_error::kind::invalid_schema, "cannot use both minimum and exclusiveMinimum");

  if (node.maximum.has_value() && node.exclusive_maximum.has_value())
    return make_error(schema_error::kind::invalid_schema, "cannot use both maximum and exclusiveMaximum");

  return {};
}

static result<void> validate_string_constraints(const schema &node)
{
  if (!node.format.empty()) {
    if (!node.type.is_empty() && !node.type.matches("string"))
      return make_error(schema_error::kind::invalid_schema, "format can only be used with string type, got " + node.type.to_string());

    if (!is_supported_format(node.format))
      return make_error(schema_error::kind::invalid_schema, "unsupported format: " + node.format);
  }

  if (!node.pattern.empty() && !node.type.is_empty() && !node.type.matches("string"))
    return make_error(schema_error::kind::invalid_schema, "pattern can only be used with string type, got " + node.type.to_string());

  if (!node.format.empty() && !node.pattern.empty())
    return make_error(schema_error::kind::invalid_schema, "cannot use both format and pattern in the same schema");

  if (node.min_length.has_value() && node.max_length.has_value() && node.min_length.value() > node.max_length.value())
    return make_error(schema_error::kind::invalid_schema, std::format("minLength ({}) cannot be greater than maxLength ({})", node.min_length.value(), node.max_length.value()));

  return {};
}

static result<void> validate_array_constraints(const schema &node)
{
  if (node.items) {
    if (!node.type.is_empty() && !node.type.matches("array"))
      return make_error(schema_error::kind::invalid_schema, "items can only be used with array type, got " + node.type.to_string());

    if (auto valid = validate(*node.items); !valid)
      return make_error(schema_error::kind::invalid_schema, "invalid items schema: " + valid.error().message);
  }

  if (node.min_items.has_value() || node.max_items.has_value()) {
    if (!node.type.is_empty() && !node.type.matches("array"))
      return make_error(schema_error::kind::invalid_schema, "minItems/maxItems can only be used with array type, got " + node.type.to_string());

    if (node.min_items.has_value() && node.max_items.has_value() && node.max_items.value() < node.min_items.value())
      return make_error(schema_error::kind::invalid_schema, std::format("maxItems ({}) cannot be less than minItems ({})", node.max_items.value(), node.min_items.value()));
  }

  return {};
}

static result<void> validate_nested_schemas(const schema &node)
{
  for (const auto *list: { &node.all_of, &node.any_of, &node.one_of })
    for (const auto &child: *list)
      if (child)
        if (auto valid = validate(*child); !valid)
          return valid;

  for (const auto *child: { &node.if_schema, &node.then_schema, &node.else_schema, &node.not_schema })
    if (*child)
      if (auto valid = validate(**child); !valid)
        return valid;

  for (const auto &[name, child]: node.definitions)
    if (child)
      if (auto valid = validate(*child); !valid)
        return valid;

  return {};
}

result<void> validate(const schema &node)
{
  for (const auto check: { validate_schema_syntax, validate_type_constraints, validate_numeric_constraints, validate_string_constraints, validate_array_constraints, validate_nested_schemas }) {
    if (auto valid = check(node); !valid) {
      spdlog::debug("Schema validation failed: {}", valid.error().message);
      return valid;
    }
  }
  return {};
}

} // namespace vschema
