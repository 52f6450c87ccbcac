#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace vschema {

// Values found in a helm-docs style comment ("# -- (type) description")
struct helm_docs_value {
  std::string default_value;
  std::string description;
  std::string value_type;
};

helm_docs_value parse_helm_docs_comment(const std::vector<std::string> &comment_lines);
std::expected<std::string, std::string> helm_docs_type_to_schema_type(std::string_view helm_docs_type);

} // namespace vschema
