#pragma once

#include "ref_resolver.hpp"
#include "schema.hpp"
#include "schema_error.hpp"
#include "schema_generator.hpp"
#include <filesystem>
#include <string>

namespace vschema {

/**
 * @brief Produces the JSON Schema document of one values file
 *
 * Loads the file, infers the schema, normalizes the 'required' lists and
 * validates the result before serializing it.
 *
 * @param values_path      The annotated values file
 * @param options          Inference options
 * @param disable_required Remove every 'required' list from the output
 * @param cache            Remote documents shared across files
 * @return The serialized schema, indented by two spaces
 */
result<std::string> generate_values_schema(const std::filesystem::path &values_path, const inference_options &options, bool disable_required, reference_cache &cache);

// Same as generate_values_schema() but returns the finished tree
result<schema_ptr> build_values_schema(const std::filesystem::path &values_path, const inference_options &options, bool disable_required, reference_cache &cache);

// 'output' when given, otherwise values.schema.json beside the values file
std::filesystem::path output_path_for(const std::filesystem::path &values_path, const std::string &output);

result<void> write_schema_file(const std::filesystem::path &path, const std::string &content);

} // namespace vschema
