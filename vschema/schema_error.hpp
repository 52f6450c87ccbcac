#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace vschema {

struct schema_error {
  enum class kind {
    invalid_document,    // Malformed document shape or unparseable input
    unclosed_annotation, // An annotation block without a closing marker
    invalid_annotation,  // Annotation text that does not decode to a schema
    unsupported_tag,     // A YAML tag that has no JSON Schema type
    invalid_schema,      // A schema that breaks one of the validation rules
    definition_conflict, // Two different definitions under one name
    io_error,            // A file that cannot be opened, read or written
    invalid_reference,   // A $ref whose target cannot be loaded
    invalid_config,      // Bad command line or configuration file values
  };

  kind type;
  std::string message;

  std::string_view kind_name() const
  {
    switch (type) {
      case kind::invalid_document:
        return "invalid document";
      case kind::unclosed_annotation:
        return "unclosed annotation";
      case kind::invalid_annotation:
        return "invalid annotation";
      case kind::unsupported_tag:
        return "unsupported tag";
      case kind::invalid_schema:
        return "invalid schema";
      case kind::definition_conflict:
        return "definition conflict";
      case kind::io_error:
        return "io error";
      case kind::invalid_reference:
        return "invalid reference";
      case kind::invalid_config:
        return "invalid config";
    }
    return "unknown";
  }
};

template <typename T>
using result = std::expected<T, schema_error>;

inline std::unexpected<schema_error> make_error(schema_error::kind type, std::string message)
{
  return std::unexpected(schema_error{ type, std::move(message) });
}

} // namespace vschema
