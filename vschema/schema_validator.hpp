#pragma once

#include "schema.hpp"
#include "schema_error.hpp"
#include <nlohmann/json-schema.hpp>
#include <optional>
#include <string>

namespace vschema {

/**
 * @brief Checks serialized schemas against the draft-07 meta-schema
 *
 * Building the meta-schema validator is expensive, so a single instance is shared.
 */
class schema_syntax_checker {
  nlohmann::json_schema::json_validator meta_validator;

  class first_error_handler : public nlohmann::json_schema::basic_error_handler {
  public:
    std::string message;
    void error(const nlohmann::json::json_pointer &ptr, const nlohmann::json &instance, const std::string &error_message) override
    {
      nlohmann::json_schema::basic_error_handler::error(ptr, instance, error_message);
      if (message.empty())
        message = (ptr.empty() ? std::string{ "<root>" } : ptr.to_string()) + ": " + error_message;
    }
  };

public:
  static schema_syntax_checker &get()
  {
    static schema_syntax_checker the_checker;
    return the_checker;
  }

private:
  schema_syntax_checker();

public:
  schema_syntax_checker(schema_syntax_checker const &) = delete;
  void operator=(schema_syntax_checker const &)       = delete;

  // Returns the first violation, or nothing when the document is a valid schema
  std::optional<std::string> check(const nlohmann::json &document) const;
};

/**
 * @brief Validates a finished schema node
 *
 * Runs the syntax check, then the cross-field rules (const/enum vs type,
 * numeric, string and array constraints) and recurses into composition,
 * conditional and definition schemas. Returns the first error found.
 */
result<void> validate(const schema &node);

bool is_supported_format(std::string_view format);

} // namespace vschema
