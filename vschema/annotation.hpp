#pragma once

#include "schema.hpp"
#include "schema_error.hpp"
#include <string>

namespace vschema {

struct annotation {
  schema_ptr node;
  std::string description;
};

/**
 * @brief Splits a key's comment into its '# @schema' block and its description
 *
 * The block is decoded as a schema and marked as explicit data. Lines outside
 * the block form the description.
 */
result<annotation> get_schema_from_comment(const std::string &comment);

// Drops everything up to the last blank-line separated paragraph
std::string remove_leading_comments(const std::string &comment);

// Removes helm-docs @tag lines and the "-- " description prefix
std::string strip_helm_docs_prefix(const std::string &description);

} // namespace vschema
