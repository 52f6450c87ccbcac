#include "vschema.hpp"
#include "vschema_config.hpp"
#include "vschema_project.hpp"
#include "ref_resolver.hpp"
#include "schema_fetcher.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include <chrono>
#include <iostream>

int main(int argc, char **argv)
{
  // Setup logging
  std::error_code error_code;
  fs::remove(vschema::log_filename, error_code);

  auto console_error = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_error->set_level(spdlog::level::warn);
  console_error->set_pattern("[%^%l%$]: %v");
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_log;
  try {
    file_log = std::make_shared<spdlog::sinks::basic_file_sink_mt>(std::string{ vschema::log_filename }, true);
  } catch (const spdlog::spdlog_ex &) {
    try {
      auto time = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
      file_log  = std::make_shared<spdlog::sinks::basic_file_sink_mt>("vschema-" + std::to_string(time) + ".log", true);
    } catch (const spdlog::spdlog_ex &e) {
      std::cerr << "Cannot open " << vschema::log_filename << ": " << e.what() << "\n";
      return -1;
    }
  }
  file_log->set_level(spdlog::level::trace);

  auto vschemalog = std::make_shared<spdlog::logger>("vschemalog", spdlog::sinks_init_list{ console_error, file_log });
  vschemalog->set_level(spdlog::level::trace);
  spdlog::set_default_logger(vschemalog);

  auto config = vschema::load_config(argc, argv);
  if (!config) {
    spdlog::error("{}", config.error().message);
    return -1;
  }

  if (config->show_help || config->values_files.empty()) {
    std::cout << (config->help_text.empty() ? vschema::make_cli_options().help() : config->help_text) << std::endl;
    return 0;
  }

  console_error->set_level(spdlog::level::from_str(config->log_level));

  vschema::reference_cache cache(std::make_shared<vschema::http_schema_fetcher>(std::chrono::seconds(config->http_timeout_seconds)));

  for (const auto &values_file: config->values_files) {
    auto document = vschema::generate_values_schema(values_file, config->inference, config->no_required, cache);
    if (!document) {
      spdlog::error("{}: {}", document.error().kind_name(), document.error().message);
      return -1;
    }

    const auto output_path = vschema::output_path_for(values_file, config->output);
    if (auto written = vschema::write_schema_file(output_path, document.value()); !written) {
      spdlog::error("{}", written.error().message);
      return -1;
    }
    spdlog::info("Wrote {}", output_path.generic_string());
  }

  return 0;
}
