#include "schema_types.hpp"
#include <algorithm>
#include <array>

namespace vschema {

static const std::array<std::string_view, 7> primitive_types = { "object", "string", "integer", "number", "array", "null", "boolean" };

result<type_list> type_list::from_json(const nlohmann::json &node)
{
  type_list list;
  switch (node.type()) {
    case nlohmann::json::value_t::null:
      break;

    case nlohmann::json::value_t::string:
      list.types.push_back(node.get<std::string>());
      break;

    case nlohmann::json::value_t::array:
      for (const auto &i: node) {
        if (i.is_null())
          list.types.push_back("null");
        else if (i.is_string())
          list.types.push_back(i.get<std::string>());
        else
          return make_error(schema_error::kind::invalid_annotation, "'type' entries must be strings, got " + i.dump());
      }
      break;

    default:
      return make_error(schema_error::kind::invalid_annotation, "'type' must be a string or a list of strings, got " + node.dump());
  }
  return list;
}

nlohmann::json type_list::to_json() const
{
  if (types.size() == 1)
    return types.front();
  return types;
}

std::optional<std::string> type_list::validate() const
{
  for (const auto &t: types) {
    if (t.empty())
      continue;
    if (std::find(primitive_types.begin(), primitive_types.end(), t) == primitive_types.end())
      return "unsupported type " + to_string();
  }
  return std::nullopt;
}

bool type_list::is_empty() const
{
  return types.empty() || std::ranges::any_of(types, [](const std::string &t) {
           return t.empty();
         });
}

bool type_list::matches(std::string_view type_name) const
{
  return std::ranges::find(types, type_name) != types.end();
}

std::string type_list::to_string() const
{
  std::string output = "[";
  for (const auto &t: types) {
    if (output.size() > 1)
      output += " ";
    output += t;
  }
  return output + "]";
}

result<required_list> required_list::from_json(const nlohmann::json &node)
{
  required_list required;
  if (node.is_boolean()) {
    required.flag = node.get<bool>();
  } else if (node.is_array()) {
    for (const auto &i: node) {
      if (!i.is_string())
        return make_error(schema_error::kind::invalid_annotation, "'required' entries must be strings, got " + i.dump());
      if (!required.contains(i.get<std::string>()))
        required.names.push_back(i.get<std::string>());
    }
  } else if (!node.is_null()) {
    return make_error(schema_error::kind::invalid_annotation, "'required' must be a boolean or a list of strings, got " + node.dump());
  }
  return required;
}

nlohmann::json required_list::to_json() const
{
  return names;
}

bool required_list::contains(std::string_view name) const
{
  return std::ranges::find(names, name) != names.end();
}

} // namespace vschema
