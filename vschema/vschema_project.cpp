#include "vschema_project.hpp"
#include "schema_validator.hpp"
#include "values_document.hpp"
#include "vschema.hpp"
#include "spdlog/spdlog.h"
#include <fstream>

namespace vschema {

result<schema_ptr> build_values_schema(const std::filesystem::path &values_path, const inference_options &options, bool disable_required, reference_cache &cache)
{
  auto document = values_document::load_file(values_path);
  if (!document)
    return std::unexpected(document.error());

  spdlog::info("Generating schema for {}", values_path.generic_string());
  schema_generator generator(document.value(), options, cache);
  auto root = generator.generate();
  if (!root)
    return root;

  fix_required_properties(*root.value());
  if (disable_required)
    disable_required_properties(*root.value());

  if (auto valid = validate(*root.value()); !valid)
    return make_error(valid.error().type, "Generated schema for " + values_path.generic_string() + " is invalid: " + valid.error().message);

  return root;
}

result<std::string> generate_values_schema(const std::filesystem::path &values_path, const inference_options &options, bool disable_required, reference_cache &cache)
{
  auto root = build_values_schema(values_path, options, disable_required, cache);
  if (!root)
    return std::unexpected(root.error());
  return root.value()->dump();
}

std::filesystem::path output_path_for(const std::filesystem::path &values_path, const std::string &output)
{
  if (!output.empty())
    return output;
  return values_path.parent_path() / default_schema_filename;
}

result<void> write_schema_file(const std::filesystem::path &path, const std::string &content)
{
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file)
    return make_error(schema_error::kind::io_error, "Cannot open " + path.generic_string() + " for writing");
  file << content << "\n";
  if (!file)
    return make_error(schema_error::kind::io_error, "Failed to write " + path.generic_string());
  return {};
}

} // namespace vschema
