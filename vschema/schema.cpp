#include "schema.hpp"
#include "vschema.hpp"
#include <algorithm>
#include <cstdint>
#include <format>
#include <limits>

namespace vschema {

namespace {

std::unexpected<schema_error> field_error(const std::string &key, const nlohmann::json &value, std::string_view expected)
{
  return make_error(schema_error::kind::invalid_annotation, std::format("'{}' must be {}, got {}", key, expected, value.dump()));
}

result<int> decode_int(const std::string &key, const nlohmann::json &value)
{
  if (value.is_number_integer()) {
    const auto v = value.get<std::int64_t>();
    if (v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max())
      return static_cast<int>(v);
  } else if (value.is_number_float()) {
    const auto v = value.get<double>();
    if (v == static_cast<double>(static_cast<std::int64_t>(v)) && v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max())
      return static_cast<int>(v);
  }
  return field_error(key, value, "an integer");
}

result<schema_ptr> decode_child(const std::string &key, const nlohmann::json &value)
{
  if (!value.is_object())
    return field_error(key, value, "a schema object");
  return schema::from_json(value);
}

result<schema_map> decode_map(const std::string &key, const nlohmann::json &value)
{
  if (!value.is_object())
    return field_error(key, value, "a map of schemas");
  schema_map output;
  for (const auto &[name, child]: value.items()) {
    auto child_schema = decode_child(key + "/" + name, child);
    if (!child_schema)
      return std::unexpected(child_schema.error());
    output.insert({ name, std::move(child_schema.value()) });
  }
  return output;
}

result<std::vector<schema_ptr>> decode_list(const std::string &key, const nlohmann::json &value)
{
  if (!value.is_array())
    return field_error(key, value, "a list of schemas");
  std::vector<schema_ptr> output;
  for (const auto &child: value) {
    auto child_schema = decode_child(key, child);
    if (!child_schema)
      return std::unexpected(child_schema.error());
    output.push_back(std::move(child_schema.value()));
  }
  return output;
}

result<std::vector<nlohmann::json>> decode_values(const std::string &key, const nlohmann::json &value)
{
  if (!value.is_array())
    return field_error(key, value, "a list");
  return std::vector<nlohmann::json>(value.begin(), value.end());
}

nlohmann::json encode_map(const schema_map &map)
{
  nlohmann::json output = nlohmann::json::object();
  for (const auto &[name, child]: map)
    output[name] = child ? child->to_json() : nlohmann::json::object();
  return output;
}

nlohmann::json encode_list(const std::vector<schema_ptr> &list)
{
  nlohmann::json output = nlohmann::json::array();
  for (const auto &child: list)
    output.push_back(child ? child->to_json() : nlohmann::json::object());
  return output;
}

schema_ptr clone_child(const schema_ptr &child)
{
  return child ? child->clone() : nullptr;
}

schema_map clone_map(const schema_map &map)
{
  schema_map output;
  for (const auto &[name, child]: map)
    output.insert({ name, clone_child(child) });
  return output;
}

std::vector<schema_ptr> clone_list(const std::vector<schema_ptr> &list)
{
  std::vector<schema_ptr> output;
  output.reserve(list.size());
  for (const auto &child: list)
    output.push_back(clone_child(child));
  return output;
}

bool equal_maps(const schema_map &a, const schema_map &b)
{
  if (a.size() != b.size())
    return false;
  for (const auto &[name, child]: a) {
    auto it = b.find(name);
    if (it == b.end() || !equals(child, it->second))
      return false;
  }
  return true;
}

bool equal_lists(const std::vector<schema_ptr> &a, const std::vector<schema_ptr> &b)
{
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (!equals(a[i], b[i]))
      return false;
  return true;
}

} // namespace

schema::schema(std::string type_name)
{
  if (!type_name.empty())
    type.types.push_back(std::move(type_name));
}

schema_ptr schema::make(std::string type_name)
{
  return std::make_shared<schema>(std::move(type_name));
}

result<schema_ptr> schema::from_json(const nlohmann::json &node)
{
  auto s = std::make_shared<schema>();
  if (node.is_null())
    return s;
  if (!node.is_object())
    return make_error(schema_error::kind::invalid_annotation, "schema must be a map, got " + node.dump());

  std::optional<schema_error> error;
  const auto assign = [&error](auto &target, auto decoded) {
    if (decoded)
      target = std::move(decoded.value());
    else
      error = decoded.error();
  };

  for (const auto &[key, value]: node.items()) {
    if (value.is_null())
      continue;

    if (key == "$schema" || key == "$id" || key == "title" || key == "description" || key == "pattern" || key == "format" || key == "$ref") {
      if (!value.is_string())
        return field_error(key, value, "a string");
      auto text = value.get<std::string>();
      if (key == "$schema")
        s->schema_uri = std::move(text);
      else if (key == "$id")
        s->id = std::move(text);
      else if (key == "title")
        s->title = std::move(text);
      else if (key == "description")
        s->description = std::move(text);
      else if (key == "pattern")
        s->pattern = std::move(text);
      else if (key == "format")
        s->format = std::move(text);
      else
        s->ref = std::move(text);
    } else if (key == "deprecated" || key == "readOnly" || key == "writeOnly" || key == "uniqueItems") {
      if (!value.is_boolean())
        return field_error(key, value, "a boolean");
      const bool flag = value.get<bool>();
      if (key == "deprecated")
        s->deprecated = flag;
      else if (key == "readOnly")
        s->read_only = flag;
      else if (key == "writeOnly")
        s->write_only = flag;
      else
        s->unique_items = flag;
    } else if (key == "default") {
      s->default_value = value;
    } else if (key == "const") {
      s->const_value = value;
    } else if (key == "examples") {
      assign(s->examples, decode_values(key, value));
    } else if (key == "enum") {
      assign(s->enum_values, decode_values(key, value));
    } else if (key == "type") {
      assign(s->type, type_list::from_json(value));
    } else if (key == "required") {
      assign(s->required, required_list::from_json(value));
    } else if (key == "minimum") {
      assign(s->minimum, decode_int(key, value));
    } else if (key == "maximum") {
      assign(s->maximum, decode_int(key, value));
    } else if (key == "exclusiveMinimum") {
      assign(s->exclusive_minimum, decode_int(key, value));
    } else if (key == "exclusiveMaximum") {
      assign(s->exclusive_maximum, decode_int(key, value));
    } else if (key == "multipleOf") {
      assign(s->multiple_of, decode_int(key, value));
    } else if (key == "minLength") {
      assign(s->min_length, decode_int(key, value));
    } else if (key == "maxLength") {
      assign(s->max_length, decode_int(key, value));
    } else if (key == "minItems") {
      assign(s->min_items, decode_int(key, value));
    } else if (key == "maxItems") {
      assign(s->max_items, decode_int(key, value));
    } else if (key == "items") {
      assign(s->items, decode_child(key, value));
    } else if (key == "not") {
      assign(s->not_schema, decode_child(key, value));
    } else if (key == "if") {
      assign(s->if_schema, decode_child(key, value));
    } else if (key == "then") {
      assign(s->then_schema, decode_child(key, value));
    } else if (key == "else") {
      assign(s->else_schema, decode_child(key, value));
    } else if (key == "properties") {
      assign(s->properties, decode_map(key, value));
      s->properties_given = true;
    } else if (key == "patternProperties") {
      assign(s->pattern_properties, decode_map(key, value));
    } else if (key == "definitions") {
      assign(s->definitions, decode_map(key, value));
    } else if (key == "anyOf") {
      assign(s->any_of, decode_list(key, value));
    } else if (key == "allOf") {
      assign(s->all_of, decode_list(key, value));
    } else if (key == "oneOf") {
      assign(s->one_of, decode_list(key, value));
    } else if (key == "additionalProperties") {
      if (value.is_boolean()) {
        s->additional_properties = value.get<bool>();
      } else {
        schema_ptr child;
        assign(child, decode_child(key, value));
        s->additional_properties = std::move(child);
      }
    } else if (key.starts_with(custom_annotation_prefix)) {
      s->custom_annotations[key] = value;
    }

    if (error)
      return std::unexpected(*error);
  }

  return s;
}

nlohmann::json schema::to_json() const
{
  nlohmann::json output = nlohmann::json::object();

  if (!schema_uri.empty())
    output["$schema"] = schema_uri;
  if (!id.empty())
    output["$id"] = id;
  if (!ref.empty())
    output["$ref"] = ref;
  if (!title.empty())
    output["title"] = title;
  if (!description.empty())
    output["description"] = description;
  if (deprecated)
    output["deprecated"] = true;
  if (read_only)
    output["readOnly"] = true;
  if (write_only)
    output["writeOnly"] = true;
  if (default_value.has_value())
    output["default"] = default_value.value();
  if (const_value.has_value())
    output["const"] = const_value.value();
  if (!examples.empty())
    output["examples"] = examples;
  if (enum_values.has_value() && !enum_values->empty())
    output["enum"] = enum_values.value();
  if (!type.types.empty())
    output["type"] = type.to_json();

  const std::pair<const char *, const std::optional<int> &> integer_fields[] = {
    { "minimum", minimum },       { "maximum", maximum },       { "exclusiveMinimum", exclusive_minimum }, { "exclusiveMaximum", exclusive_maximum },
    { "multipleOf", multiple_of }, { "minLength", min_length }, { "maxLength", max_length },               { "minItems", min_items },
    { "maxItems", max_items },
  };
  for (const auto &[name, field]: integer_fields)
    if (field.has_value())
      output[name] = field.value();

  if (!pattern.empty())
    output["pattern"] = pattern;
  if (!format.empty())
    output["format"] = format;
  if (items)
    output["items"] = items->to_json();
  if (unique_items)
    output["uniqueItems"] = true;

  if (!properties.empty())
    output["properties"] = encode_map(properties);
  if (!pattern_properties.empty())
    output["patternProperties"] = encode_map(pattern_properties);
  if (const auto *flag = std::get_if<bool>(&additional_properties))
    output["additionalProperties"] = *flag;
  else if (const auto *child = std::get_if<schema_ptr>(&additional_properties); child && *child)
    output["additionalProperties"] = (*child)->to_json();
  output["required"] = required.to_json();

  if (!any_of.empty())
    output["anyOf"] = encode_list(any_of);
  if (!all_of.empty())
    output["allOf"] = encode_list(all_of);
  if (!one_of.empty())
    output["oneOf"] = encode_list(one_of);
  if (not_schema)
    output["not"] = not_schema->to_json();
  if (if_schema)
    output["if"] = if_schema->to_json();
  if (then_schema)
    output["then"] = then_schema->to_json();
  if (else_schema)
    output["else"] = else_schema->to_json();

  if (!definitions.empty())
    output["definitions"] = encode_map(definitions);

  for (const auto &[key, value]: custom_annotations)
    output[key] = value;

  return output;
}

schema_ptr schema::clone() const
{
  auto copy = std::make_shared<schema>(*this);

  copy->items              = clone_child(items);
  copy->not_schema         = clone_child(not_schema);
  copy->if_schema          = clone_child(if_schema);
  copy->then_schema        = clone_child(then_schema);
  copy->else_schema        = clone_child(else_schema);
  copy->properties         = clone_map(properties);
  copy->pattern_properties = clone_map(pattern_properties);
  copy->definitions        = clone_map(definitions);
  copy->any_of             = clone_list(any_of);
  copy->all_of             = clone_list(all_of);
  copy->one_of             = clone_list(one_of);
  if (const auto *child = std::get_if<schema_ptr>(&additional_properties))
    copy->additional_properties = clone_child(*child);

  return copy;
}

bool schema::has_numeric_constraints() const
{
  return minimum || maximum || exclusive_minimum || exclusive_maximum || multiple_of;
}

bool equals(const schema_ptr &a, const schema_ptr &b)
{
  if (!a && !b)
    return true;
  if (!a || !b)
    return false;
  return equals(*a, *b);
}

bool equals(const schema &a, const schema &b)
{
  if (&a == &b)
    return true;

  // Descriptive fields (title, description) are not compared
  if (a.pattern != b.pattern || a.format != b.format || a.deprecated != b.deprecated || a.read_only != b.read_only || a.write_only != b.write_only
      || a.unique_items != b.unique_items || a.ref != b.ref)
    return false;

  if (a.type.types != b.type.types)
    return false;

  if (a.minimum != b.minimum || a.maximum != b.maximum || a.exclusive_minimum != b.exclusive_minimum || a.exclusive_maximum != b.exclusive_maximum
      || a.multiple_of != b.multiple_of || a.min_length != b.min_length || a.max_length != b.max_length || a.min_items != b.min_items
      || a.max_items != b.max_items)
    return false;

  if (a.default_value != b.default_value || a.const_value != b.const_value)
    return false;

  const std::vector<nlohmann::json> no_values;
  if (a.enum_values.value_or(no_values) != b.enum_values.value_or(no_values) || a.examples != b.examples)
    return false;

  if (!equal_maps(a.properties, b.properties) || !equal_maps(a.definitions, b.definitions) || !equal_maps(a.pattern_properties, b.pattern_properties))
    return false;

  if (!equals(a.items, b.items) || !equals(a.if_schema, b.if_schema) || !equals(a.then_schema, b.then_schema) || !equals(a.else_schema, b.else_schema)
      || !equals(a.not_schema, b.not_schema))
    return false;

  return equal_lists(a.any_of, b.any_of) && equal_lists(a.all_of, b.all_of) && equal_lists(a.one_of, b.one_of);
}

void fix_required_properties(schema &node)
{
  if (!node.properties.empty()) {
    for (auto &[name, child]: node.properties) {
      if (!child)
        continue;
      fix_required_properties(*child);
      if (child->required.flag && !node.required.contains(name))
        node.required.names.push_back(name);
    }
    // A schema with properties must be an object
    if (!node.type.matches("object"))
      node.type = { "object" };
  }

  for (auto *child: { &node.then_schema, &node.if_schema, &node.else_schema, &node.items, &node.not_schema })
    if (*child)
      fix_required_properties(**child);

  if (auto *child = std::get_if<schema_ptr>(&node.additional_properties); child && *child)
    fix_required_properties(**child);

  for (auto *list: { &node.any_of, &node.all_of, &node.one_of })
    for (auto &child: *list)
      if (child)
        fix_required_properties(*child);

  for (auto &[name, child]: node.definitions)
    if (child)
      fix_required_properties(*child);
}

void disable_required_properties(schema &node)
{
  node.required = {};

  for (auto &[name, child]: node.properties)
    if (child)
      disable_required_properties(*child);

  for (auto *child: { &node.items, &node.if_schema, &node.then_schema, &node.else_schema, &node.not_schema })
    if (*child)
      disable_required_properties(**child);

  for (auto *list: { &node.any_of, &node.all_of, &node.one_of })
    for (auto &child: *list)
      if (child)
        disable_required_properties(*child);

  if (auto *child = std::get_if<schema_ptr>(&node.additional_properties); child && *child)
    disable_required_properties(**child);

  for (auto &[name, child]: node.definitions)
    if (child)
      disable_required_properties(*child);
}

} // namespace vschema
