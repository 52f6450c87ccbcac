#include "annotation.hpp"
#include "values_document.hpp"
#include "vschema.hpp"
#include "yaml-cpp/yaml.h"
#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

namespace vschema {

static std::string_view trim_prefix(std::string_view text, std::string_view prefix)
{
  if (text.starts_with(prefix))
    text.remove_prefix(prefix.size());
  return text;
}

static std::string join_lines(const std::vector<std::string> &lines)
{
  std::string output;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i != 0)
      output += "\n";
    output += lines[i];
  }
  return output;
}

result<annotation> get_schema_from_comment(const std::string &comment)
{
  std::vector<std::string> description;
  std::vector<std::string> raw_schema;
  bool inside_schema_block = false;
  bool has_data            = false;

  std::stringstream ss(comment);
  std::string line;
  while (std::getline(ss, line)) {
    if (line.starts_with(schema_prefix)) {
      inside_schema_block = !inside_schema_block;
      continue;
    }
    if (inside_schema_block) {
      const auto content = trim_prefix(line, comment_prefix);
      raw_schema.emplace_back(trim_prefix(trim_prefix(content, comment_prefix), " "));
      has_data = true;
    } else {
      description.emplace_back(trim_prefix(trim_prefix(line, comment_prefix), " "));
    }
  }

  if (inside_schema_block)
    return make_error(schema_error::kind::unclosed_annotation, "unclosed schema block found in comment: " + comment);

  nlohmann::json raw_json;
  try {
    raw_json = yaml_to_json(YAML::Load(join_lines(raw_schema)));
  } catch (const YAML::Exception &e) {
    return make_error(schema_error::kind::invalid_annotation, std::string{ "failed to parse schema annotation: " } + e.what());
  }

  auto node = schema::from_json(raw_json);
  if (!node)
    return std::unexpected(node.error());
  if (has_data)
    node.value()->set();

  return annotation{ node.value(), join_lines(description) };
}

std::string remove_leading_comments(const std::string &comment)
{
  const auto separator = comment.rfind("\n\n");
  if (separator == std::string::npos)
    return comment;
  const auto start = comment.find_first_not_of('\n', separator);
  return start == std::string::npos ? "" : comment.substr(start);
}

std::string strip_helm_docs_prefix(const std::string &description)
{
  // See https://github.com/norwoodj/helm-docs for the supported @tags
  static const std::regex helm_docs_tags(R"((\r\n|\r|\n)?\s*@\w+(\s+--\s)?[^\n\r]*)");
  const auto without_tags = std::regex_replace(description, helm_docs_tags, "");

  std::vector<std::string> lines;
  std::stringstream ss(without_tags);
  std::string line;
  while (std::getline(ss, line)) {
    if (line.starts_with("--")) {
      line.erase(0, 2);
      if (!line.empty() && std::isspace(static_cast<unsigned char>(line.front())))
        line.erase(0, 1);
    }
    lines.push_back(line);
  }
  return join_lines(lines);
}

} // namespace vschema
