#include "ref_resolver.hpp"
#include "utilities.hpp"
#include "vschema.hpp"
#include "spdlog/spdlog.h"
#include <format>
#include <set>

namespace vschema {

result<void> merge_definitions(definition_map &target, const definition_map &source)
{
  for (const auto &[name, definition]: source) {
    auto existing = target.find(name);
    if (existing == target.end()) {
      target.insert({ name, definition });
      continue;
    }
    if (!equals(existing->second, definition))
      return make_error(schema_error::kind::definition_conflict, "definition conflict: '" + name + "' has different definitions in multiple schema files");
  }
  return {};
}

namespace {

class ref_resolver {
public:
  ref_resolver(const schema &root, bool resolve_urls, reference_cache &cache) : root(root), resolve_urls(resolve_urls), cache(cache)
  {
  }

  result<void> resolve(schema &node, const std::string &locator);

  definition_map delta;

private:
  schema_ptr find_definition(const std::string &name) const;
  void add_url_definition(const std::string &name, const schema_ptr &definition, const std::string &ref);
  result<void> resolve_file_ref(schema &node, const fs::path &file_path, const std::string &fragment);
  void resolve_url_ref(schema &node, const std::string &base_url, const std::string &fragment);
  const reference_cache::entry *load_url(const std::string &base_url);
  result<void> resolve_children(schema &node, const std::string &locator);

  const schema &root;
  bool resolve_urls;
  reference_cache &cache;
  std::set<std::string> visited_refs;
  std::set<std::string> visited_files;
  std::set<std::string> visited_contexts;
};

schema_ptr ref_resolver::find_definition(const std::string &name) const
{
  if (auto it = root.definitions.find(name); it != root.definitions.end())
    return it->second;
  if (auto it = delta.find(name); it != delta.end())
    return it->second;
  return nullptr;
}

// The first definition registered under a name wins, a different one is only reported
void ref_resolver::add_url_definition(const std::string &name, const schema_ptr &definition, const std::string &ref)
{
  if (auto existing = find_definition(name)) {
    if (!equals(existing, definition))
      spdlog::warn("Definition conflict for '{}' from URL {} - using existing definition", name, ref);
    return;
  }
  spdlog::debug("Adding definition '{}'", name);
  delta.insert({ name, definition->clone() });
}

result<void> ref_resolver::resolve(schema &node, const std::string &locator)
{
  // The same remote fragment may legitimately be revisited from different files
  if (!is_url(locator)) {
    const auto context_key = std::format("{}:{}", locator, static_cast<const void *>(&node));
    if (!visited_contexts.insert(context_key).second) {
      spdlog::debug("Schema context already processed, skipping: {}", context_key);
      return {};
    }
  }

  if (!node.ref.empty()) {
    if (visited_refs.contains(node.ref)) {
      spdlog::debug("Circular reference detected, skipping: {}", node.ref);
      return {};
    }

    const auto [base, fragment] = split_reference(node.ref);

    if (base.empty() && fragment.starts_with(definitions_prefix)) {
      const auto name = fragment.substr(definitions_prefix.size());
      if (auto definition = find_definition(name)) {
        spdlog::debug("Found internal definition reference: {}", name);
        node = *definition->clone();
        node.set();
        return {};
      }
      spdlog::debug("Internal definition not found: {}", name);
    }

    if (resolve_urls && is_url(base)) {
      visited_refs.insert(node.ref);
      resolve_url_ref(node, base, fragment);
      return {};
    }

    auto file_path = is_relative_file(locator, base);
    if (file_path.has_value()) {
      visited_refs.insert(node.ref);
      if (!visited_files.insert(file_path.value().generic_string()).second) {
        spdlog::debug("File already processed, skipping: {}", file_path.value().generic_string());
        return {};
      }
      return resolve_file_ref(node, file_path.value(), fragment);
    }
    spdlog::debug("{}", file_path.error());
  }

  return resolve_children(node, locator);
}

result<void> ref_resolver::resolve_file_ref(schema &node, const fs::path &file_path, const std::string &fragment)
{
  const auto file_name = file_path.generic_string();
  auto content         = get_file_contents<std::string>(file_path);
  if (!content)
    return make_error(schema_error::kind::io_error, "Failed to read " + file_name + ": " + content.error().message());

  auto document = parse_json(content.value(), file_name);
  if (!document)
    return std::unexpected(document.error());

  auto full_schema = schema::from_json(document.value());
  if (!full_schema)
    return make_error(schema_error::kind::invalid_reference, file_name + ": " + full_schema.error().message);

  // A named definition stays a reference, its file only contributes definitions
  if (fragment.starts_with(definitions_prefix)) {
    if (auto merged = merge_definitions(delta, full_schema.value()->definitions); !merged)
      return merged;
    node.ref = std::string{ internal_ref_prefix } + fragment.substr(definitions_prefix.size());
    node.set();
    return {};
  }

  schema_ptr resolved = full_schema.value();
  if (!fragment.empty()) {
    auto pointed = json_pointer_lookup(document.value(), fragment);
    if (!pointed)
      return make_error(pointed.error().type, file_name + ": " + pointed.error().message);

    auto pointed_schema = schema::from_json(pointed.value());
    if (!pointed_schema)
      return make_error(schema_error::kind::invalid_reference, file_name + "#" + fragment + ": " + pointed_schema.error().message);

    resolved              = pointed_schema.value();
    resolved->definitions = full_schema.value()->definitions;
  }

  if (auto nested = resolve(*resolved, file_name); !nested)
    return nested;

  // Definitions of the loaded file move to the registry instead of staying inline
  if (auto merged = merge_definitions(delta, resolved->definitions); !merged)
    return merged;
  resolved->definitions.clear();

  node = *resolved;
  node.set();
  return {};
}

const reference_cache::entry *ref_resolver::load_url(const std::string &base_url)
{
  if (auto cached = cache.find(base_url)) {
    spdlog::debug("Using cached schema for URL: {}", base_url);
    return cached;
  }

  spdlog::debug("Downloading schema from URL: {}", base_url);
  auto body = cache.get_fetcher().fetch(base_url);
  if (!body) {
    spdlog::error("Failed to download schema from {}: {}", base_url, body.error());
    return nullptr;
  }

  auto document = parse_json(body.value(), base_url);
  if (!document) {
    spdlog::error("{}", document.error().message);
    return nullptr;
  }

  auto downloaded = schema::from_json(document.value());
  if (!downloaded) {
    spdlog::error("Failed to parse schema from {}: {}", base_url, downloaded.error().message);
    return nullptr;
  }

  // Cached before its nested references are resolved so self references hit the cache
  auto &entry = cache.insert(base_url, { downloaded.value(), {} });

  ref_resolver nested(root, true, cache);
  nested.visited_refs = visited_refs;
  if (auto resolved = nested.resolve(*entry.document, base_url); !resolved) {
    spdlog::error("Failed to resolve references in {}: {}", base_url, resolved.error().message);
    cache.erase(base_url);
    return nullptr;
  }

  for (auto &[name, definition]: nested.delta)
    entry.definitions.insert({ name, std::move(definition) });
  return &entry;
}

void ref_resolver::resolve_url_ref(schema &node, const std::string &base_url, const std::string &fragment)
{
  spdlog::debug("Processing URL reference: base={}, pointer={}", base_url, fragment);

  const auto *downloaded = load_url(base_url);
  if (downloaded == nullptr)
    return;

  for (const auto &[name, definition]: downloaded->definitions)
    add_url_definition(name, definition, node.ref);

  schema_ptr definition;
  std::string definition_name;
  if (!fragment.empty() && downloaded->definitions.contains(fragment_definition_name(fragment))) {
    // Already resolved while the document itself was resolved
    definition_name = fragment_definition_name(fragment);
    definition      = downloaded->definitions.at(definition_name);
  } else if (!fragment.empty()) {
    auto pointed = json_pointer_lookup(downloaded->document->to_json(), fragment);
    if (!pointed) {
      spdlog::error("Failed to resolve JSON pointer {} in schema from {}: {}", fragment, base_url, pointed.error().message);
      return;
    }
    auto pointed_schema = schema::from_json(pointed.value());
    if (!pointed_schema) {
      spdlog::error("Failed to decode schema at {} in {}: {}", fragment, base_url, pointed_schema.error().message);
      return;
    }
    definition = pointed_schema.value();
    if (auto resolved = resolve(*definition, base_url); !resolved) {
      spdlog::error("Failed to resolve references in {}#{}: {}", base_url, fragment, resolved.error().message);
      return;
    }
    definition_name = fragment_definition_name(fragment);
  } else {
    definition      = downloaded->document;
    definition_name = generate_definition_name(base_url);
  }

  const bool is_new = (find_definition(definition_name) == nullptr);
  add_url_definition(definition_name, definition, node.ref);

  // Schemas split across an API wide definitions file depend on each other
  if (is_new && base_url.find(all_definitions_filename) != std::string::npos) {
    spdlog::debug("Adding all definitions from {}", base_url);
    for (const auto &[name, sibling]: downloaded->document->definitions)
      if (find_definition(name) == nullptr)
        delta.insert({ name, sibling->clone() });
  }

  node.ref = std::string{ internal_ref_prefix } + definition_name;
  node.set();
}

result<void> ref_resolver::resolve_children(schema &node, const std::string &locator)
{
  for (auto *map: { &node.properties, &node.definitions, &node.pattern_properties })
    for (auto &[name, child]: *map)
      if (child)
        if (auto resolved = resolve(*child, locator); !resolved)
          return resolved;

  for (auto *child: { &node.items, &node.if_schema, &node.then_schema, &node.else_schema, &node.not_schema })
    if (*child)
      if (auto resolved = resolve(**child, locator); !resolved)
        return resolved;

  for (auto *list: { &node.any_of, &node.all_of, &node.one_of })
    for (auto &child: *list)
      if (child)
        if (auto resolved = resolve(*child, locator); !resolved)
          return resolved;

  return {};
}

} // namespace

result<definition_map> resolve_schema_refs(schema &node, const std::string &locator, bool resolve_urls, const schema &root, reference_cache &cache)
{
  ref_resolver resolver(root, resolve_urls, cache);
  if (auto resolved = resolver.resolve(node, locator); !resolved)
    return std::unexpected(resolved.error());
  return std::move(resolver.delta);
}

} // namespace vschema
