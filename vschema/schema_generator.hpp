#pragma once

#include "ref_resolver.hpp"
#include "schema.hpp"
#include "schema_error.hpp"
#include "values_document.hpp"
#include "yaml-cpp/yaml.h"
#include <string>
#include <vector>

namespace vschema {

// Fields that must not be filled in automatically
struct skip_auto_generation {
  bool type                  = false;
  bool title                 = false;
  bool description           = false;
  bool required              = false;
  bool default_value         = false;
  bool additional_properties = false;
};

result<skip_auto_generation> parse_skip_auto_generation(const std::vector<std::string> &field_names);

struct inference_options {
  bool keep_full_comment           = false;
  bool helm_docs_compatibility     = false;
  bool dont_strip_helm_docs_prefix = false;
  bool dont_add_global             = false;
  bool resolve_urls                = false;
  skip_auto_generation skip;
};

/**
 * @brief Infers a JSON Schema from an annotated values document
 *
 * Every mapping key becomes a property. Its schema comes from the '# @schema'
 * block above it, when present, and is completed from the value itself.
 */
class schema_generator {
public:
  schema_generator(const values_document &document, inference_options options, reference_cache &cache);

  // Builds the root schema of the document
  result<schema_ptr> generate();

private:
  result<schema_ptr> mapping_schema(const YAML::Node &node, std::vector<std::string> &parent_required, schema &root);
  result<schema_ptr> property_schema(const YAML::Node &key, const YAML::Node &value, std::vector<std::string> &parent_required, schema &root);
  result<schema_ptr> items_schema(const YAML::Node &sequence, schema &root);
  void apply_helm_docs(schema &node, const std::string &comment);
  result<void> resolve_references(schema &node, schema &root);

  const values_document &document;
  inference_options options;
  reference_cache &cache;
};

// Converts the literal text of a value to the first matching type, or keeps the text
nlohmann::json cast_node_value(const std::string &raw_value, const type_list &type);

} // namespace vschema
