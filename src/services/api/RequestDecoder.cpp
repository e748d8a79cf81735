#include "RequestDecoder.hpp"

#include "core/errors/SdbError.hpp"

namespace lsdb {

static bool has(const ParamMap& params, const std::string& key) {
  return params.find(key) != params.end();
}

// Clients count either from 0 or from 1.
static int firstIndex(const ParamMap& params, const std::string& prefix, const std::string& suffix) {
  return has(params, prefix + "0" + suffix) ? 0 : 1;
}

const std::string& requireParameter(const ParamMap& params, const std::string& key) {
  auto it = params.find(key);
  if (it == params.end()) throw SdbError::missingParameter(key);
  return it->second;
}

AttributeMap decodeAttributes(const ParamMap& params, const std::string& prefix) {
  AttributeMap attributes;
  const std::string base = prefix + "Attribute.";
  for (int n = firstIndex(params, base, ".Name");; ++n) {
    const std::string key = base + std::to_string(n);
    auto name = params.find(key + ".Name");
    if (name == params.end()) break;
    // .Replace is accepted and ignored: a put always replaces
    attributes[name->second] = requireParameter(params, key + ".Value");
  }
  return attributes;
}

std::vector<std::string> decodeAttributeNames(const ParamMap& params, const std::string& prefix) {
  std::vector<std::string> names;
  const std::string base = prefix + "Attribute.";
  for (int n = firstIndex(params, base, ".Name");; ++n) {
    auto name = params.find(base + std::to_string(n) + ".Name");
    if (name == params.end()) break;
    names.push_back(name->second);
  }
  return names;
}

std::vector<ItemAttributes> decodeBatchItems(const ParamMap& params) {
  std::vector<ItemAttributes> items;
  for (int n = firstIndex(params, "Item.", ".ItemName");; ++n) {
    const std::string prefix = "Item." + std::to_string(n) + ".";
    auto name = params.find(prefix + "ItemName");
    if (name == params.end()) break;
    items.push_back({name->second, decodeAttributes(params, prefix)});
  }
  return items;
}

} // namespace lsdb
