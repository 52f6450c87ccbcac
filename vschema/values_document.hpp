#pragma once

#include "schema_error.hpp"
#include "schema_types.hpp"
#include "yaml-cpp/yaml.h"
#include "nlohmann/json.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace vschema {

/**
 * @brief A parsed values file that keeps its source text
 *
 * yaml-cpp drops comments while parsing, so the leading comment of a mapping
 * key is recovered from the source lines using the key's mark.
 */
class values_document {
public:
  static result<values_document> load_file(const std::filesystem::path &path);
  static result<values_document> load(const std::string &content, std::string locator = "");

  /**
   * @brief Returns the comment block directly above a mapping key
   *
   * Lines keep their '#' marker and lose their indentation. Blank lines inside
   * the block are preserved as empty lines. A blank line between the block and
   * the key detaches the block from the key.
   */
  std::string head_comment(const YAML::Node &key) const;

  /**
   * @brief Literal text of a scalar value
   *
   * yaml-cpp keeps no text for null values, so their spelling ("~", "null")
   * is read back from the source. An empty value reads as "".
   */
  std::string value_text(const YAML::Node &key, const YAML::Node &value) const;

  const std::vector<YAML::Node> &documents() const
  {
    return docs;
  }

  const std::string &locator() const
  {
    return path;
  }

private:
  std::string path;
  std::vector<std::string> lines;
  std::vector<YAML::Node> docs;
};

// Short YAML tag of a node ("!!str", "!!int", ...) using the YAML 1.2 core schema
std::string resolve_tag(const YAML::Node &node);

result<type_list> type_from_tag(std::string_view tag);

// Text of a mapping key; a null key reads as "null"
std::string key_name(const YAML::Node &key);

// Converts a YAML node to JSON, typing plain scalars by their resolved tag
nlohmann::json yaml_to_json(const YAML::Node &node);

} // namespace vschema
