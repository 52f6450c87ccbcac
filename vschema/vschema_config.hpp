#pragma once

#include "schema_error.hpp"
#include "schema_generator.hpp"
#include "cxxopts.hpp"
#include "yaml-cpp/yaml.h"
#include <string>
#include <vector>

namespace vschema {

struct vschema_config {
  std::vector<std::string> values_files;
  std::string output;
  inference_options inference;
  std::vector<std::string> skip_auto_generation_fields;
  bool no_required         = false;
  int http_timeout_seconds = 30;
  std::string log_level    = "warn";
  bool show_help           = false;
  std::string help_text;
};

cxxopts::Options make_cli_options();

/**
 * @brief Builds the run configuration
 *
 * Values come from the configuration file first (the '--config' option or
 * '.vschema.yaml' when present) and are then overridden by the command line.
 */
result<vschema_config> load_config(int argc, const char *const *argv);

// Applies the keys of a configuration file. Keys use the long option names.
result<void> apply_config_file(vschema_config &config, const YAML::Node &file);

} // namespace vschema
