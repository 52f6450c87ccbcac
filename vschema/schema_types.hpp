#pragma once

#include "schema_error.hpp"
#include "nlohmann/json.hpp"
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vschema {

/**
 * @brief The 'type' keyword: a single type name or an ordered list of names
 *
 * The literal name "null" is allowed inside the list to express nullable unions.
 * An empty list means the schema is unconstrained.
 */
class type_list {
public:
  type_list() = default;
  type_list(std::initializer_list<std::string> names) : types(names)
  {
  }

  static result<type_list> from_json(const nlohmann::json &node);
  nlohmann::json to_json() const;

  // Returns an error message when a name is not a JSON Schema primitive type
  std::optional<std::string> validate() const;

  bool is_empty() const;
  bool matches(std::string_view type_name) const;
  std::string to_string() const;

  bool operator==(const type_list &) const = default;

  std::vector<std::string> types;
};

/**
 * @brief The 'required' keyword in its two source forms
 *
 * 'flag' is the per-property shorthand ("mark me required in my parent"),
 * 'names' is the JSON Schema list of required child properties.
 */
struct required_list {
  static result<required_list> from_json(const nlohmann::json &node);
  nlohmann::json to_json() const;

  bool contains(std::string_view name) const;

  std::vector<std::string> names;
  bool flag = false;
};

} // namespace vschema
