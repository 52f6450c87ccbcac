#include "helm_docs.hpp"
#include <optional>
#include <regex>

namespace vschema {

static const std::regex description_regex(R"(^\s*#\s*(.*)\s+--\s*(.*)$)");
static const std::regex value_type_regex(R"(^\((.*?)\)\s*(.*)$)");
static const std::regex default_value_regex(R"(^\s*#\s*@default\s+--\s*(.*)$)");
static const std::regex raw_flag_regex(R"(^\s*#\s+@raw)");
static const std::regex ignored_tag_regex(R"(^\s*#\s*@(notationType|section|ignored|ignore)\b)");
static const std::regex continuation_regex(R"(^\s*#(\s?)(.*)$)");

/**
 * @brief Parses a helm-docs comment block
 *
 * Only the last group starting with a "# --" line is considered. Following
 * comment lines continue the description unless they carry an @tag.
 */
helm_docs_value parse_helm_docs_comment(const std::vector<std::string> &comment_lines)
{
  helm_docs_value value;

  std::optional<size_t> start_index;
  std::smatch match;
  for (size_t i = 0; i < comment_lines.size(); ++i) {
    // "@tag -- value" lines belong to the current group
    if (std::regex_match(comment_lines[i], match, description_regex) && !match[1].str().starts_with('@')) {
      start_index       = i;
      value.description = match[2].str();
    }
  }
  if (!start_index.has_value())
    return value;

  if (std::regex_match(value.description, match, value_type_regex) && match[1].length() > 0) {
    value.value_type  = match[1].str();
    value.description = match[2].str();
  }

  bool is_raw = false;
  for (size_t i = start_index.value() + 1; i < comment_lines.size(); ++i) {
    const auto &line = comment_lines[i];
    if (!is_raw && std::regex_search(line, raw_flag_regex)) {
      is_raw = true;
      continue;
    }
    if (std::regex_match(line, match, default_value_regex)) {
      value.default_value = match[1].str();
      continue;
    }
    if (std::regex_search(line, ignored_tag_regex))
      continue;
    if (std::regex_match(line, match, continuation_regex))
      value.description += (is_raw ? "\n" : " ") + match[2].str();
  }

  return value;
}

std::expected<std::string, std::string> helm_docs_type_to_schema_type(std::string_view helm_docs_type)
{
  if (helm_docs_type == "int")
    return "integer";
  if (helm_docs_type == "bool")
    return "boolean";
  if (helm_docs_type == "float")
    return "number";
  if (helm_docs_type == "list")
    return "array";
  if (helm_docs_type == "map")
    return "object";
  if (helm_docs_type == "string" || helm_docs_type == "object")
    return std::string{ helm_docs_type };
  return std::unexpected("cant translate helm-docs type (" + std::string{ helm_docs_type } + ") to schema type");
}

} // namespace vschema
