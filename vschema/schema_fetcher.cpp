#include "schema_fetcher.hpp"
#include "spdlog/spdlog.h"
#include <httplib.h>
#include <format>

namespace vschema {

std::expected<std::string, std::string> http_schema_fetcher::fetch(const std::string &url)
{
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos)
    return std::unexpected("not a URL: " + url);

  const auto path_start  = url.find('/', scheme_end + 3);
  const auto host_part   = url.substr(0, path_start);
  const std::string path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

  httplib::Client client(host_part);
  if (!client.is_valid())
    return std::unexpected("unsupported URL: " + url);

  client.set_follow_location(true);
  client.set_connection_timeout(timeout);
  client.set_read_timeout(timeout);

  spdlog::debug("GET {}", url);
  auto response = client.Get(path);
  if (!response)
    return std::unexpected(httplib::to_string(response.error()));

  if (response->status < 200 || response->status >= 300)
    return std::unexpected(std::format("HTTP {}", response->status));

  return response->body;
}

} // namespace vschema
