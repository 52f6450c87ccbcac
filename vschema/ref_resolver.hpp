#pragma once

#include "schema.hpp"
#include "schema_error.hpp"
#include "schema_fetcher.hpp"
#include <map>
#include <memory>
#include <string>

namespace vschema {

/**
 * @brief Remote documents shared by every resolution of one run
 *
 * A document is fetched once, resolved once and kept together with the
 * definitions its nested references produced.
 */
class reference_cache {
public:
  struct entry {
    schema_ptr document;
    definition_map definitions;
  };

  explicit reference_cache(std::shared_ptr<schema_fetcher> fetcher = std::make_shared<http_schema_fetcher>()) : fetcher(std::move(fetcher))
  {
  }

  const entry *find(const std::string &url) const
  {
    auto it = documents.find(url);
    return (it != documents.end()) ? &it->second : nullptr;
  }

  entry &insert(const std::string &url, entry e)
  {
    return documents.insert_or_assign(url, std::move(e)).first->second;
  }

  void erase(const std::string &url)
  {
    documents.erase(url);
  }

  schema_fetcher &get_fetcher()
  {
    return *fetcher;
  }

private:
  std::shared_ptr<schema_fetcher> fetcher;
  std::map<std::string, entry> documents;
};

/**
 * @brief Resolves every reachable $ref of a node in place
 *
 * Internal references are looked up in 'root'. References to local files and,
 * when 'resolve_urls' is set, to remote documents are inlined or rewritten to
 * '#/definitions/<name>'.
 *
 * @param node      Node to rewrite
 * @param locator   Path or URL the node was loaded from
 * @param root      Owner of the definitions registry, only read here
 * @return The definitions the caller must merge into the registry
 */
result<definition_map> resolve_schema_refs(schema &node, const std::string &locator, bool resolve_urls, const schema &root, reference_cache &cache);

/**
 * @brief Adds definitions to a registry
 *
 * An identical redefinition is accepted, a different one fails naming the definition.
 */
result<void> merge_definitions(definition_map &target, const definition_map &source);

} // namespace vschema
