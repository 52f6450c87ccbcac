#include "utilities.hpp"
#include "vschema.hpp"
#include <algorithm>
#include <cctype>

namespace vschema {

bool is_url(std::string_view locator)
{
  return locator.starts_with("http://") || locator.starts_with("https://");
}

/**
 * @brief Resolves a reference relative to the document it appears in
 *
 * @param locator    Path of the document containing the reference
 * @param reference  Reference without its fragment
 * @return The path of an existing file, or the reason the reference is not a relative file
 */
std::expected<fs::path, std::string> is_relative_file(std::string_view locator, std::string_view reference)
{
  if (reference.empty())
    return std::unexpected("empty reference");

  const fs::path reference_path{ reference };
  if (reference_path.is_absolute())
    return std::unexpected(std::string{ reference } + " is an absolute path");

  const auto candidate = fs::path{ locator }.parent_path() / reference_path;
  std::error_code ec;
  if (!fs::is_regular_file(candidate, ec))
    return std::unexpected(candidate.generic_string() + " is not a file");

  return candidate.lexically_normal();
}

std::pair<std::string, std::string> split_reference(std::string_view reference)
{
  const auto hash = reference.find('#');
  if (hash == std::string_view::npos)
    return { std::string{ reference }, "" };
  return { std::string{ reference.substr(0, hash) }, std::string{ reference.substr(hash + 1) } };
}

// Turns a URL into a definition name, e.g. "https://a.io/b.json" -> "a_io_b_json"
std::string generate_definition_name(std::string_view url)
{
  std::string name{ url };
  for (const auto scheme: { "https://", "http://" })
    if (name.starts_with(scheme))
      name.erase(0, std::string_view{ scheme }.size());

  std::replace_if(
    name.begin(),
    name.end(),
    [](char c) {
      return c == '/' || c == '.' || c == '-' || c == '#' || c == ':';
    },
    '_');

  if (!name.empty() && !std::isalpha(static_cast<unsigned char>(name.front())))
    name = "def_" + name;

  return name;
}

std::string fragment_definition_name(std::string_view fragment)
{
  if (fragment.starts_with(definitions_prefix))
    return std::string{ fragment.substr(definitions_prefix.size()) };

  // Fallback: a name derived from the pointer path
  while (fragment.starts_with('/'))
    fragment.remove_prefix(1);
  while (fragment.ends_with('/'))
    fragment.remove_suffix(1);
  std::string name{ fragment };
  std::replace(name.begin(), name.end(), '/', '_');
  return name;
}

result<nlohmann::json> json_pointer_lookup(const nlohmann::json &document, const std::string &pointer)
{
  try {
    const nlohmann::json::json_pointer json_pointer{ pointer };
    if (!document.contains(json_pointer))
      return make_error(schema_error::kind::invalid_reference, "JSON pointer '" + pointer + "' not found");
    return document.at(json_pointer);
  } catch (const nlohmann::json::exception &e) {
    return make_error(schema_error::kind::invalid_reference, "Invalid JSON pointer '" + pointer + "': " + e.what());
  }
}

result<nlohmann::json> parse_json(const std::string &text, std::string_view source)
{
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    return make_error(schema_error::kind::invalid_reference, std::string{ "Failed to parse " } + std::string{ source } + ": " + e.what());
  }
}

std::string trim(std::string_view input)
{
  while (!input.empty() && std::isspace(static_cast<unsigned char>(input.front())))
    input.remove_prefix(1);
  while (!input.empty() && std::isspace(static_cast<unsigned char>(input.back())))
    input.remove_suffix(1);
  return std::string{ input };
}

} // namespace vschema
