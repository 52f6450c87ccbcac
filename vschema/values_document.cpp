#include "values_document.hpp"
#include "utilities.hpp"
#include <charconv>
#include <regex>
#include <sstream>

namespace vschema {

namespace {

const std::string yaml_tag_prefix = "tag:yaml.org,2002:";

bool is_bool_string(const std::string &value)
{
  return value == "true" || value == "True" || value == "TRUE" || value == "false" || value == "False" || value == "FALSE";
}

bool is_int_string(const std::string &value)
{
  static const std::regex int_regex(R"(^[-+]?([0-9]+|0x[0-9a-fA-F_]+|0o[0-7_]+|0b[01_]+)$)");
  return std::regex_match(value, int_regex);
}

bool is_float_string(const std::string &value)
{
  static const std::regex float_regex(R"(^([-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?|[-+]?\.(inf|Inf|INF)|\.(nan|NaN|NAN))$)");
  return std::regex_match(value, float_regex);
}

bool is_timestamp_string(const std::string &value)
{
  static const std::regex timestamp_regex(R"(^[0-9]{4}-[0-9]{1,2}-[0-9]{1,2}([Tt ]+[0-9]{1,2}:[0-9]{1,2}:[0-9]{1,2}(\.[0-9]*)?[ ]*(Z|[-+][0-9]{1,2}(:?[0-9]{2})?)?)?$)");
  return std::regex_match(value, timestamp_regex);
}

std::optional<std::int64_t> parse_yaml_int(std::string value)
{
  std::erase(value, '_');
  bool negative = false;
  if (!value.empty() && (value.front() == '-' || value.front() == '+')) {
    negative = value.front() == '-';
    value.erase(0, 1);
  }

  int base = 10;
  if (value.starts_with("0x"))
    base = 16;
  else if (value.starts_with("0o"))
    base = 8;
  else if (value.starts_with("0b"))
    base = 2;
  if (base != 10)
    value.erase(0, 2);

  std::int64_t output = 0;
  const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), output, base);
  if (ec != std::errc{} || end != value.data() + value.size())
    return std::nullopt;
  return negative ? -output : output;
}

nlohmann::json parse_yaml_float(const std::string &value)
{
  if (value.ends_with("inf") || value.ends_with("Inf") || value.ends_with("INF") || value.ends_with("nan") || value.ends_with("NaN") || value.ends_with("NAN"))
    return value; // JSON has no representation for these
  try {
    return std::stod(value);
  } catch (const std::exception &) {
    return value;
  }
}

std::string resolve_plain_scalar(const std::string &value)
{
  if (value.empty() || value == "~" || value == "null" || value == "Null" || value == "NULL")
    return "!!null";
  if (is_bool_string(value))
    return "!!bool";
  if (is_int_string(value))
    return "!!int";
  if (is_float_string(value))
    return "!!float";
  if (is_timestamp_string(value))
    return "!!timestamp";
  return "!!str";
}

// Column of the first token of a line, block sequence indicators excluded
size_t first_token_column(const std::string &line)
{
  auto index = line.find_first_not_of(" \t");
  while (index != std::string::npos && line[index] == '-' && index + 1 < line.size() && (line[index + 1] == ' ' || line[index + 1] == '\t'))
    index = line.find_first_not_of(" \t", index + 1);
  return index;
}

} // namespace

result<values_document> values_document::load_file(const std::filesystem::path &path)
{
  auto content = get_file_contents<std::string>(path);
  if (!content)
    return make_error(schema_error::kind::io_error, "Failed to read " + path.generic_string() + ": " + content.error().message());
  return load(content.value(), path.generic_string());
}

result<values_document> values_document::load(const std::string &content, std::string locator)
{
  values_document document;
  document.path = std::move(locator);

  std::stringstream ss(content);
  std::string line;
  while (std::getline(ss, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    document.lines.push_back(line);
  }

  try {
    document.docs = YAML::LoadAll(content);
  } catch (const YAML::Exception &e) {
    return make_error(schema_error::kind::invalid_document, "Failed to parse " + document.path + ": " + e.what());
  }

  return document;
}

std::string values_document::head_comment(const YAML::Node &key) const
{
  const auto mark = key.Mark();
  if (mark.is_null() || mark.line <= 0 || static_cast<size_t>(mark.line) >= lines.size())
    return "";

  // Keys inside flow collections share their line with the parent key
  if (first_token_column(lines[static_cast<size_t>(mark.line)]) != static_cast<size_t>(mark.column))
    return "";

  std::vector<std::string> block;
  for (int i = mark.line - 1; i >= 0; --i) {
    const auto &line       = lines[static_cast<size_t>(i)];
    const auto first_index = line.find_first_not_of(" \t");
    if (first_index == std::string::npos) {
      // The block must touch the key
      if (block.empty())
        break;
      block.push_back("");
      continue;
    }
    // Comments indented deeper than the key belong to the previous value
    if (line[first_index] != '#' || static_cast<int>(first_index) > mark.column)
      break;
    block.push_back(line.substr(first_index));
  }

  while (!block.empty() && block.back().empty())
    block.pop_back();

  std::string comment;
  for (auto it = block.rbegin(); it != block.rend(); ++it) {
    if (it != block.rbegin())
      comment += "\n";
    comment += *it;
  }
  return comment;
}

std::string values_document::value_text(const YAML::Node &key, const YAML::Node &value) const
{
  if (!value.IsNull())
    return value.Scalar();

  const auto key_mark   = key.Mark();
  const auto value_mark = value.Mark();
  if (value_mark.is_null() || value_mark.line < 0 || static_cast<size_t>(value_mark.line) >= lines.size())
    return "";

  // An empty value is marked at the next token, which may be a sibling key
  if (value_mark.line != key_mark.line && value_mark.column <= key_mark.column)
    return "";

  const auto &line = lines[static_cast<size_t>(value_mark.line)];
  if (value_mark.column < 0 || static_cast<size_t>(value_mark.column) >= line.size())
    return "";

  static const std::regex null_literal(R"(^(~|null|Null|NULL)(\s|#|,|\]|\}|$))");
  const auto rest = line.substr(static_cast<size_t>(value_mark.column));
  std::smatch match;
  if (std::regex_search(rest, match, null_literal))
    return match[1].str();
  return "";
}

std::string resolve_tag(const YAML::Node &node)
{
  const auto &tag = node.Tag();
  if (tag.starts_with(yaml_tag_prefix))
    return "!!" + tag.substr(yaml_tag_prefix.size());
  if (!tag.empty() && tag != "?" && tag != "!")
    return tag;

  switch (node.Type()) {
    case YAML::NodeType::Map:
      return "!!map";
    case YAML::NodeType::Sequence:
      return "!!seq";
    case YAML::NodeType::Null:
      return "!!null";
    case YAML::NodeType::Scalar:
      // Quoted scalars carry the non-specific "!" tag
      return tag == "!" ? "!!str" : resolve_plain_scalar(node.Scalar());
    default:
      return "!!null";
  }
}

result<type_list> type_from_tag(std::string_view tag)
{
  if (tag == "!!null")
    return type_list{ "null" };
  if (tag == "!!bool")
    return type_list{ "boolean" };
  if (tag == "!!str" || tag == "!!timestamp")
    return type_list{ "string" };
  if (tag == "!!int")
    return type_list{ "integer" };
  if (tag == "!!float")
    return type_list{ "number" };
  if (tag == "!!seq")
    return type_list{ "array" };
  if (tag == "!!map")
    return type_list{ "object" };
  return make_error(schema_error::kind::unsupported_tag, "unsupported yaml tag found: " + std::string{ tag });
}

std::string key_name(const YAML::Node &key)
{
  if (key.IsNull() && key.Scalar().empty())
    return "null";
  return key.Scalar();
}

nlohmann::json yaml_to_json(const YAML::Node &node)
{
  switch (node.Type()) {
    case YAML::NodeType::Map: {
      nlohmann::json output = nlohmann::json::object();
      for (const auto &i: node)
        output[key_name(i.first)] = yaml_to_json(i.second);
      return output;
    }

    case YAML::NodeType::Sequence: {
      nlohmann::json output = nlohmann::json::array();
      for (const auto &i: node)
        output.push_back(yaml_to_json(i));
      return output;
    }

    case YAML::NodeType::Scalar: {
      const auto tag    = resolve_tag(node);
      const auto &value = node.Scalar();
      if (tag == "!!bool")
        return value == "true" || value == "True" || value == "TRUE";
      if (tag == "!!int") {
        if (auto v = parse_yaml_int(value))
          return v.value();
        return parse_yaml_float(value);
      }
      if (tag == "!!float")
        return parse_yaml_float(value);
      if (tag == "!!null")
        return nullptr;
      return value;
    }

    default:
      return nullptr;
  }
}

} // namespace vschema
