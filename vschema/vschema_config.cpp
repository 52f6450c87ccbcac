#include "vschema_config.hpp"
#include "utilities.hpp"
#include "vschema.hpp"
#include "spdlog/spdlog.h"
#include <sstream>

namespace vschema {

cxxopts::Options make_cli_options()
{
  cxxopts::Options options("vschema", "Generates values.schema.json files from annotated values files");
  options.positional_help("<values.yaml>...");
  // clang-format off
  options.add_options()("h,help", "Print usage")
                       ("o,output", "Output file (single input only)", cxxopts::value<std::string>()->default_value(""))
                       ("k,keep-full-comment", "Keep the whole leading comment of a key", cxxopts::value<bool>()->default_value("false"))
                       ("c,helm-docs-compatibility-mode", "Parse helm-docs comments", cxxopts::value<bool>()->default_value("false"))
                       ("x,dont-strip-helm-docs-prefix", "Keep helm-docs tags and the '-- ' prefix in descriptions", cxxopts::value<bool>()->default_value("false"))
                       ("g,dont-add-global", "Do not add a 'global' property", cxxopts::value<bool>()->default_value("false"))
                       ("r,resolve-urls", "Resolve $ref values pointing to http(s) URLs", cxxopts::value<bool>()->default_value("false"))
                       ("s,skip-auto-generation", "Fields not to fill in automatically: type,title,description,required,default,additionalProperties", cxxopts::value<std::vector<std::string>>())
                       ("n,no-required", "Remove every 'required' list from the output", cxxopts::value<bool>()->default_value("false"))
                       ("t,http-timeout", "Timeout in seconds for fetching URLs", cxxopts::value<int>()->default_value("30"))
                       ("l,log-level", "Console log level (trace, debug, info, warn, error)", cxxopts::value<std::string>()->default_value("warn"))
                       ("config", "Configuration file", cxxopts::value<std::string>()->default_value(std::string{ default_config_filename }))
                       ("values", "Values files", cxxopts::value<std::vector<std::string>>());
  // clang-format on
  options.parse_positional({ "values" });
  return options;
}

result<void> apply_config_file(vschema_config &config, const YAML::Node &file)
{
  if (!file.IsMap())
    return make_error(schema_error::kind::invalid_config, "Configuration must be a mapping");

  try {
    for (const auto &i: file) {
      const auto key     = i.first.as<std::string>();
      const auto &value  = i.second;
      if (key == "output")
        config.output = value.as<std::string>();
      else if (key == "keep-full-comment")
        config.inference.keep_full_comment = value.as<bool>();
      else if (key == "helm-docs-compatibility-mode")
        config.inference.helm_docs_compatibility = value.as<bool>();
      else if (key == "dont-strip-helm-docs-prefix")
        config.inference.dont_strip_helm_docs_prefix = value.as<bool>();
      else if (key == "dont-add-global")
        config.inference.dont_add_global = value.as<bool>();
      else if (key == "resolve-urls")
        config.inference.resolve_urls = value.as<bool>();
      else if (key == "no-required")
        config.no_required = value.as<bool>();
      else if (key == "http-timeout")
        config.http_timeout_seconds = value.as<int>();
      else if (key == "log-level")
        config.log_level = value.as<std::string>();
      else if (key == "values")
        config.values_files = value.as<std::vector<std::string>>();
      else if (key == "skip-auto-generation") {
        config.skip_auto_generation_fields.clear();
        if (value.IsSequence()) {
          config.skip_auto_generation_fields = value.as<std::vector<std::string>>();
        } else {
          std::stringstream ss(value.as<std::string>());
          std::string field;
          while (std::getline(ss, field, ','))
            if (!trim(field).empty())
              config.skip_auto_generation_fields.push_back(trim(field));
        }
      } else
        spdlog::warn("Ignoring unknown configuration key '{}'", key);
    }
  } catch (const YAML::Exception &e) {
    return make_error(schema_error::kind::invalid_config, std::string{ "Invalid configuration value: " } + e.what());
  }

  return {};
}

static result<vschema_config> build_config(const cxxopts::Options &options, const cxxopts::ParseResult &cli)
{
  vschema_config config;

  if (cli.count("help")) {
    config.show_help = true;
    config.help_text = options.help();
    return config;
  }

  const auto config_path = fs::path{ cli["config"].as<std::string>() };
  if (fs::exists(config_path)) {
    spdlog::debug("Loading configuration from {}", config_path.generic_string());
    try {
      if (auto applied = apply_config_file(config, YAML::LoadFile(config_path.string())); !applied)
        return std::unexpected(applied.error());
    } catch (const YAML::Exception &e) {
      return make_error(schema_error::kind::invalid_config, "Failed to parse " + config_path.generic_string() + ": " + e.what());
    }
  } else if (cli.count("config")) {
    return make_error(schema_error::kind::io_error, "Configuration file " + config_path.generic_string() + " does not exist");
  }

  // The command line overrides the configuration file
  if (cli.count("values"))
    config.values_files = cli["values"].as<std::vector<std::string>>();
  if (cli.count("output"))
    config.output = cli["output"].as<std::string>();
  if (cli.count("keep-full-comment"))
    config.inference.keep_full_comment = cli["keep-full-comment"].as<bool>();
  if (cli.count("helm-docs-compatibility-mode"))
    config.inference.helm_docs_compatibility = cli["helm-docs-compatibility-mode"].as<bool>();
  if (cli.count("dont-strip-helm-docs-prefix"))
    config.inference.dont_strip_helm_docs_prefix = cli["dont-strip-helm-docs-prefix"].as<bool>();
  if (cli.count("dont-add-global"))
    config.inference.dont_add_global = cli["dont-add-global"].as<bool>();
  if (cli.count("resolve-urls"))
    config.inference.resolve_urls = cli["resolve-urls"].as<bool>();
  if (cli.count("no-required"))
    config.no_required = cli["no-required"].as<bool>();
  if (cli.count("http-timeout"))
    config.http_timeout_seconds = cli["http-timeout"].as<int>();
  if (cli.count("log-level"))
    config.log_level = cli["log-level"].as<std::string>();
  if (cli.count("skip-auto-generation"))
    config.skip_auto_generation_fields = cli["skip-auto-generation"].as<std::vector<std::string>>();

  auto skip = parse_skip_auto_generation(config.skip_auto_generation_fields);
  if (!skip)
    return std::unexpected(skip.error());
  config.inference.skip = skip.value();

  if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off")
    return make_error(schema_error::kind::invalid_config, "unsupported log level '" + config.log_level + "'");

  if (config.http_timeout_seconds <= 0)
    return make_error(schema_error::kind::invalid_config, "http-timeout must be a positive number of seconds");

  if (!config.output.empty() && config.values_files.size() > 1)
    return make_error(schema_error::kind::invalid_config, "--output can only be used with a single values file");

  return config;
}

result<vschema_config> load_config(int argc, const char *const *argv)
{
  auto options = make_cli_options();
  try {
    return build_config(options, options.parse(argc, argv));
  } catch (const cxxopts::exceptions::exception &e) {
    return make_error(schema_error::kind::invalid_config, e.what());
  }
}

} // namespace vschema
