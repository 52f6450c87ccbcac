#pragma once

#include "schema_error.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <string_view>
#include <expected>
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace vschema {

bool is_url(std::string_view locator);
std::expected<fs::path, std::string> is_relative_file(std::string_view locator, std::string_view reference);
std::pair<std::string, std::string> split_reference(std::string_view reference);
std::string generate_definition_name(std::string_view url);
std::string fragment_definition_name(std::string_view fragment);
result<nlohmann::json> json_pointer_lookup(const nlohmann::json &document, const std::string &pointer);
result<nlohmann::json> parse_json(const std::string &text, std::string_view source);
std::string trim(std::string_view input);

template <class CharContainer>
static std::expected<size_t, std::error_code> get_file_contents(std::filesystem::path filename, CharContainer *container)
{
  std::ifstream file(filename, std::ios::binary | std::ios::ate);
  if (!file) {
    return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
  }

  const auto file_size = file.tellg();
  if (file_size < 0) {
    return std::unexpected(std::make_error_code(std::errc::io_error));
  }

  container->resize(static_cast<typename CharContainer::size_type>(file_size));

  file.seekg(0);
  if (!file.read(reinterpret_cast<char *>(container->data()), file_size)) {
    return std::unexpected(std::make_error_code(std::errc::io_error));
  }

  return container->size();
}

template <class CharContainer>
static std::expected<CharContainer, std::error_code> get_file_contents(std::filesystem::path filename)
{
  CharContainer cc;
  auto result = get_file_contents(filename, &cc);
  if (result) {
    return cc;
  }
  return std::unexpected(result.error());
}

} // namespace vschema
