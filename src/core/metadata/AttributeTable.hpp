#pragma once
#include <map>
#include <string>
#include <vector>

namespace lsdb {

class DomainDirectory;

using AttributeMap = std::map<std::string, std::string>;

struct ItemAttributes {
  std::string itemName;
  AttributeMap attributes;
};

// Items and their attributes inside one domain's item table.
// Each attribute name is a nullable column, added the first time it is put.
class AttributeTable {
public:
  explicit AttributeTable(const DomainDirectory& directory) : directory_(directory) {}

  // Inserts the item or replaces the named attributes of an existing one.
  // No-op for an empty map. Throws InvalidParameterValue for an unknown domain,
  // an empty item/attribute name, a reserved name, or a case-only name clash.
  void putAttributes(const std::string& domain,
                     const std::string& itemName,
                     const AttributeMap& attributes);

  // putAttributes per item, in order; stops at the first failure without undoing earlier items.
  void batchPutAttributes(const std::string& domain, const std::vector<ItemAttributes>& items);

  // Removes the whole item. Missing domain or item is not an error.
  void deleteAttributes(const std::string& domain, const std::string& itemName);

  // Set attributes of the item; empty when the domain or item does not exist.
  AttributeMap getAttributes(const std::string& domain, const std::string& itemName);

  // Known attribute names in column order.
  std::vector<std::string> attributeNames(const std::string& domain);

private:
  const DomainDirectory& directory_;
};

} // namespace lsdb
