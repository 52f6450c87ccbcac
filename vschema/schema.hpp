#pragma once

#include "schema_types.hpp"
#include "schema_error.hpp"
#include "nlohmann/json.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vschema {

class schema;
using schema_ptr     = std::shared_ptr<schema>;
using schema_map     = std::map<std::string, schema_ptr>;
using definition_map = schema_map;

/**
 * @brief 'additionalProperties' is either a boolean or a nested schema
 */
using bool_or_schema = std::variant<std::monostate, bool, schema_ptr>;

/**
 * @brief A (partial) JSON Schema node
 *
 * Children are shared pointers so the reference resolver can rewrite nodes in
 * place. Use clone() when a node must be detached from the tree it came from.
 */
class schema {
public:
  schema() = default;
  explicit schema(std::string type_name);

  static schema_ptr make(std::string type_name = "");

  /**
   * @brief Decodes a schema from a generic JSON value
   *
   * Known keywords are decoded into the typed fields, keys starting with "x-"
   * are kept as custom annotations and anything else is ignored.
   */
  static result<schema_ptr> from_json(const nlohmann::json &node);

  /**
   * @brief Serializes the node. Custom annotations are inlined at the top level
   * and 'has_data' is never written.
   */
  nlohmann::json to_json() const;

  std::string dump() const
  {
    return to_json().dump(2);
  }

  // Deep copy of this node and every child
  schema_ptr clone() const;

  bool has_numeric_constraints() const;

  void set()
  {
    has_data = true;
  }

  // Identity and meta
  std::string schema_uri;
  std::string id;
  std::string title;
  std::string description;
  bool deprecated = false;
  bool read_only  = false;
  bool write_only = false;
  std::optional<nlohmann::json> default_value;
  std::optional<nlohmann::json> const_value;
  std::vector<nlohmann::json> examples;
  // An explicit empty list still counts as set
  std::optional<std::vector<nlohmann::json>> enum_values;

  type_list type;

  // Numeric
  std::optional<int> minimum;
  std::optional<int> maximum;
  std::optional<int> exclusive_minimum;
  std::optional<int> exclusive_maximum;
  std::optional<int> multiple_of;

  // String
  std::string pattern;
  std::string format;
  std::optional<int> min_length;
  std::optional<int> max_length;

  // Array
  schema_ptr items;
  std::optional<int> min_items;
  std::optional<int> max_items;
  bool unique_items = false;

  // Object
  schema_map properties;
  bool properties_given = false; // 'properties' was present, possibly empty
  schema_map pattern_properties;
  bool_or_schema additional_properties;
  required_list required;

  // Composition and conditionals
  std::vector<schema_ptr> any_of;
  std::vector<schema_ptr> all_of;
  std::vector<schema_ptr> one_of;
  schema_ptr not_schema;
  schema_ptr if_schema;
  schema_ptr then_schema;
  schema_ptr else_schema;

  // References
  std::string ref;
  definition_map definitions;

  std::map<std::string, nlohmann::json> custom_annotations;

  // True when the node was populated from an explicit annotation
  bool has_data = false;
};

/**
 * @brief Structural equality ignoring 'title' and 'description'
 *
 * Two null pointers are equal, a null pointer never equals a node.
 */
bool equals(const schema_ptr &a, const schema_ptr &b);
bool equals(const schema &a, const schema &b);

/**
 * @brief Collapses the per-property 'required' shorthand into the parent's list
 *
 * Runs bottom-up over the whole tree and forces 'type' to "object" wherever
 * properties exist. Re-running it appends nothing new.
 */
void fix_required_properties(schema &node);

// Clears every 'required' list in the tree
void disable_required_properties(schema &node);

} // namespace vschema
