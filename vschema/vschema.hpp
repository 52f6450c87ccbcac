#pragma once

#include <string_view>

namespace vschema {
// Annotation markers inside the comments of a values file
const std::string_view schema_prefix            = "# @schema";
const std::string_view comment_prefix           = "#";
const std::string_view custom_annotation_prefix = "x-";

const std::string_view draft07_schema_id   = "http://json-schema.org/draft-07/schema#";
const std::string_view definitions_prefix  = "/definitions/";
const std::string_view internal_ref_prefix = "#/definitions/";

// Files following this naming convention carry the definitions of a whole API
const std::string_view all_definitions_filename = "_definitions.json";

const std::string_view global_property_name        = "global";
const std::string_view global_property_description = "Global values are values that can be accessed from any chart or subchart by exactly the same name.";

const std::string_view default_schema_filename = "values.schema.json";
const std::string_view default_config_filename = ".vschema.yaml";
const std::string_view log_filename            = "vschema.log";
} // namespace vschema
