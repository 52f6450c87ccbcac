#include "schema_generator.hpp"
#include "annotation.hpp"
#include "helm_docs.hpp"
#include "schema_validator.hpp"
#include "vschema.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cmath>
#include <format>
#include <regex>
#include <sstream>

namespace vschema {

result<skip_auto_generation> parse_skip_auto_generation(const std::vector<std::string> &field_names)
{
  skip_auto_generation skip;
  std::vector<std::string> invalid_names;

  for (const auto &name: field_names) {
    if (name == "type")
      skip.type = true;
    else if (name == "title")
      skip.title = true;
    else if (name == "description")
      skip.description = true;
    else if (name == "required")
      skip.required = true;
    else if (name == "default")
      skip.default_value = true;
    else if (name == "additionalProperties")
      skip.additional_properties = true;
    else
      invalid_names.push_back(name);
  }

  if (!invalid_names.empty()) {
    std::string joined;
    for (const auto &name: invalid_names)
      joined += (joined.empty() ? "" : "', '") + name;
    return make_error(schema_error::kind::invalid_config, "unsupported field names '" + joined + "' for skipping auto-generation");
  }

  return skip;
}

nlohmann::json cast_node_value(const std::string &raw_value, const type_list &type)
{
  for (const auto &t: type.types) {
    if (t == "boolean") {
      if (raw_value == "true")
        return true;
      if (raw_value == "false")
        return false;
    } else if (t == "integer") {
      std::string_view digits = raw_value;
      if (digits.starts_with('+'))
        digits.remove_prefix(1);
      std::int64_t value   = 0;
      const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
      if (!digits.empty() && ec == std::errc{} && end == digits.data() + digits.size())
        return value;
    } else if (t == "number") {
      std::string_view digits = raw_value;
      if (digits.starts_with('+'))
        digits.remove_prefix(1);
      double value         = 0;
      const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
      if (!digits.empty() && ec == std::errc{} && end == digits.data() + digits.size() && std::isfinite(value))
        return value;
    }
  }
  return raw_value;
}

schema_generator::schema_generator(const values_document &document, inference_options options, reference_cache &cache)
  : document(document), options(std::move(options)), cache(cache)
{
}

result<schema_ptr> schema_generator::generate()
{
  const auto &docs = document.documents();
  if (docs.size() != 1)
    return make_error(schema_error::kind::invalid_document, std::format("Strange yaml document found in '{}': expected exactly one document, found {}", document.locator(), docs.size()));

  auto root        = schema::make("object");
  root->schema_uri = draft07_schema_id;

  auto content = mapping_schema(docs.front(), root->required.names, *root);
  if (!content)
    return content;
  root->properties = std::move(content.value()->properties);

  // Consumers expect a 'global' key to be allowed
  if (!root->properties.contains(std::string{ global_property_name }) && !options.dont_add_global) {
    auto global = schema::make("object");
    if (!options.skip.title)
      global->title = global_property_name;
    if (!options.skip.description)
      global->description = global_property_description;
    root->properties.insert({ std::string{ global_property_name }, global });
  }

  if (!options.skip.additional_properties)
    root->additional_properties = false;

  return root;
}

result<schema_ptr> schema_generator::mapping_schema(const YAML::Node &node, std::vector<std::string> &parent_required, schema &root)
{
  auto output = schema::make("object");
  if (!node.IsMap())
    return output;

  for (const auto &i: node) {
    auto property = property_schema(i.first, i.second, parent_required, root);
    if (!property)
      return property;
    output->properties.insert_or_assign(key_name(i.first), property.value());
  }

  return output;
}

void schema_generator::apply_helm_docs(schema &node, const std::string &comment)
{
  std::vector<std::string> comment_lines;
  std::stringstream ss(comment);
  std::string line;
  while (std::getline(ss, line))
    comment_lines.push_back(line);

  const auto value = parse_helm_docs_comment(comment_lines);
  if (!value.default_value.empty() && !node.default_value.has_value()) {
    node.default_value = value.default_value;
    node.set();
  }
  if (!value.description.empty() && node.description.empty()) {
    node.description = value.description;
    node.set();
  }
  if (!value.value_type.empty() && node.type.is_empty()) {
    auto type = helm_docs_type_to_schema_type(value.value_type);
    if (!type) {
      spdlog::warn("{}", type.error());
    } else {
      node.type = type_list{ type.value() };
      node.set();
    }
  }
}

result<void> schema_generator::resolve_references(schema &node, schema &root)
{
  auto delta = resolve_schema_refs(node, document.locator(), options.resolve_urls, root, cache);
  if (!delta)
    return std::unexpected(delta.error());

  if (auto merged = merge_definitions(root.definitions, delta.value()); !merged)
    return merged;
  if (auto merged = merge_definitions(root.definitions, node.definitions); !merged)
    return merged;
  node.definitions.clear();
  return {};
}

result<schema_ptr> schema_generator::property_schema(const YAML::Node &key, const YAML::Node &value, std::vector<std::string> &parent_required, schema &root)
{
  const auto name        = key_name(key);
  const auto raw_comment = document.head_comment(key);
  const auto comment     = options.keep_full_comment ? raw_comment : remove_leading_comments(raw_comment);

  auto parsed = get_schema_from_comment(comment);
  if (!parsed)
    return make_error(parsed.error().type, "Error while parsing comment of key " + name + ": " + parsed.error().message);

  auto node        = parsed.value().node;
  auto description = parsed.value().description;

  if (options.helm_docs_compatibility)
    apply_helm_docs(*node, raw_comment);

  if (!options.dont_strip_helm_docs_prefix)
    description = strip_helm_docs_prefix(description);

  if (!node->ref.empty() || !node->pattern_properties.empty())
    if (auto resolved = resolve_references(*node, root); !resolved)
      return std::unexpected(resolved.error());

  if (node->has_data) {
    if (auto valid = validate(*node); !valid)
      return make_error(valid.error().type, "Error while validating jsonschema of key " + name + ": " + valid.error().message);
  } else if (!options.skip.type) {
    auto type = type_from_tag(resolve_tag(value));
    if (!type)
      return std::unexpected(type.error());
    node->type = type.value();
  }

  // A reference is complete as it is
  if (!node->ref.empty())
    return node;

  if (node->required.flag || (node->required.names.empty() && !options.skip.required && !node->has_data))
    if (std::find(parent_required.begin(), parent_required.end(), name) == parent_required.end())
      parent_required.push_back(name);

  if (!options.skip.additional_properties && value.IsMap() && (!node->has_data || std::holds_alternative<std::monostate>(node->additional_properties)))
    node->additional_properties = false;

  if (node->title.empty() && !options.skip.title)
    node->title = name;

  if (node->description.empty() && !options.skip.description)
    node->description = description;

  if (!options.skip.default_value && !node->default_value.has_value() && (value.IsScalar() || value.IsNull()))
    node->default_value = cast_node_value(document.value_text(key, value), node->type);

  if (value.IsMap() && !node->properties_given && node->properties.empty()) {
    auto generated = mapping_schema(value, node->required.names, root);
    if (!generated)
      return generated;

    for (const auto &i: value) {
      const auto property_name = key_name(i.first);
      bool governed_by_pattern = false;
      for (const auto &[pattern, pattern_schema]: node->pattern_properties) {
        try {
          if (std::regex_search(property_name, std::regex{ pattern })) {
            governed_by_pattern = true;
            break;
          }
        } catch (const std::regex_error &e) {
          spdlog::warn("Invalid pattern '{}' in patternProperties of key {}: {}", pattern, name, e.what());
        }
      }
      if (!governed_by_pattern)
        node->properties[property_name] = generated.value()->properties[property_name];
    }
  } else if (value.IsSequence() && !node->items) {
    auto items = items_schema(value, root);
    if (!items)
      return items;
    node->items = items.value();

    // Sequence elements only carry the boolean shorthand so far
    fix_required_properties(*node);
  }

  if (!node->properties.empty() && !node->type.matches("object"))
    node->type = type_list{ "object" };

  return node;
}

result<schema_ptr> schema_generator::items_schema(const YAML::Node &sequence, schema &root)
{
  auto items = schema::make();

  for (const auto &element: sequence) {
    if (element.IsScalar() || element.IsNull()) {
      auto type = type_from_tag(resolve_tag(element));
      if (!type)
        return std::unexpected(type.error());
      items->any_of.push_back(schema::make(type.value().types.front()));
    } else if (element.IsSequence()) {
      auto nested = items_schema(element, root);
      if (!nested)
        return nested;
      auto element_schema   = schema::make("array");
      element_schema->items = nested.value();
      items->any_of.push_back(element_schema);
    } else {
      std::vector<std::string> element_required;
      auto element_schema = mapping_schema(element, element_required, root);
      if (!element_schema)
        return element_schema;

      auto &required = element_schema.value()->required.names;
      required.insert(required.end(), element_required.begin(), element_required.end());

      if (!options.skip.additional_properties && element.IsMap() && (!element_schema.value()->has_data || std::holds_alternative<std::monostate>(element_schema.value()->additional_properties)))
        element_schema.value()->additional_properties = false;

      items->any_of.push_back(element_schema.value());
    }
  }

  return items;
}

} // namespace vschema
