#pragma once

#include <chrono>
#include <expected>
#include <string>

namespace vschema {

/**
 * @brief Retrieves the body of a remote schema document
 *
 * Failures are returned as a message and are never fatal to the caller.
 */
class schema_fetcher {
public:
  virtual ~schema_fetcher() = default;
  virtual std::expected<std::string, std::string> fetch(const std::string &url) = 0;
};

class http_schema_fetcher : public schema_fetcher {
public:
  explicit http_schema_fetcher(std::chrono::seconds timeout = std::chrono::seconds(30)) : timeout(timeout)
  {
  }

  std::expected<std::string, std::string> fetch(const std::string &url) override;

private:
  std::chrono::seconds timeout;
};

} // namespace vschema
