#pragma once
#include <map>
#include <string>
#include <vector>

#include "core/metadata/AttributeTable.hpp"

namespace lsdb {

using ParamMap = std::map<std::string, std::string>;

// Value of key, or MissingParameter.
const std::string& requireParameter(const ParamMap& params, const std::string& key);

// <prefix>Attribute.<n>.Name / .Value for n = 0, 1, ... up to the first gap.
// Sequences that start at 1 are accepted too. A name without a value is MissingParameter.
AttributeMap decodeAttributes(const ParamMap& params, const std::string& prefix = "");

// Names only, for requests where .Value is optional.
std::vector<std::string> decodeAttributeNames(const ParamMap& params, const std::string& prefix = "");

// Item.<n>.ItemName with its Item.<n>.Attribute.<m>.* entries, in index order.
std::vector<ItemAttributes> decodeBatchItems(const ParamMap& params);

} // namespace lsdb
