#include "AttributeTable.hpp"

#include <spdlog/spdlog.h>

#include "core/errors/SdbError.hpp"
#include "core/storage/DomainDirectory.hpp"
#include "core/storage/DomainStore.hpp"

namespace lsdb {

// SQLite folds identifier case for ASCII letters only.
static std::string foldCase(const std::string& s) {
  std::string out(s);
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

static const std::string& findCaseClash(const std::vector<std::string>& known,
                                        const std::string& name) {
  static const std::string none;
  const std::string folded = foldCase(name);
  for (const auto& k : known) {
    if (k != name && foldCase(k) == folded) return k;
  }
  return none;
}

static void checkAttributeNames(const AttributeMap& attributes,
                                const std::vector<std::string>& columns) {
  std::vector<std::string> seen;
  const std::string reserved = foldCase(kItemNameColumn);
  for (const auto& [name, value] : attributes) {
    if (name.empty() || foldCase(name) == reserved) {
      throw SdbError::invalidParameter("Attribute.Name", name);
    }
    const std::string& clash = findCaseClash(columns, name);
    const std::string& inRequest = findCaseClash(seen, name);
    if (!clash.empty() || !inRequest.empty()) {
      throw SdbError(ErrorKind::InvalidParameterValue,
                     "Attribute name (" + name + ") collides with attribute (" +
                     (clash.empty() ? inRequest : clash) + ").");
    }
    seen.push_back(name);
  }
}

void AttributeTable::putAttributes(const std::string& domain,
                                   const std::string& itemName,
                                   const AttributeMap& attributes) {
  if (attributes.empty()) return;
  if (!DomainDirectory::isValidDomainName(domain)) {
    throw SdbError::invalidParameter("DomainName", domain);
  }
  if (itemName.empty()) throw SdbError::invalidParameter("ItemName", itemName);

  auto store = directory_.open(domain);
  if (!store) {
    throw SdbError(ErrorKind::InvalidParameterValue, "The specified domain does not exist.");
  }

  WriteTransaction tx(store->db());
  checkAttributeNames(attributes, store->columns());

  std::vector<std::string> names;
  std::string cols = quoteIdentifier(kItemNameColumn);
  std::string placeholders = "?";
  std::string updates;
  for (const auto& [name, value] : attributes) {
    const std::string col = quoteIdentifier(name);
    names.push_back(name);
    cols += ", " + col;
    placeholders += ", ?";
    if (!updates.empty()) updates += ", ";
    updates += col + " = excluded." + col;
  }
  store->addColumns(names);

  auto st = store->db().prepare(
    std::string("INSERT INTO ") + quoteIdentifier(kItemTable) + " (" + cols + ") VALUES (" +
    placeholders + ") ON CONFLICT(" + quoteIdentifier(kItemNameColumn) + ") DO UPDATE SET " +
    updates);
  int i = 1;
  st.bindText(i++, itemName);
  for (const auto& [name, value] : attributes) st.bindText(i++, value);
  st.step();

  tx.commit();
  spdlog::debug("put {} attribute(s) on {}/{}", attributes.size(), domain, itemName);
}

void AttributeTable::batchPutAttributes(const std::string& domain,
                                        const std::vector<ItemAttributes>& items) {
  for (const auto& item : items) {
    putAttributes(domain, item.itemName, item.attributes);
  }
}

void AttributeTable::deleteAttributes(const std::string& domain, const std::string& itemName) {
  auto store = directory_.open(domain);
  if (!store) return;

  auto st = store->db().prepare(std::string("DELETE FROM ") + quoteIdentifier(kItemTable) +
                                " WHERE " + quoteIdentifier(kItemNameColumn) + " = ?");
  st.bindText(1, itemName);
  st.step();
}

AttributeMap AttributeTable::getAttributes(const std::string& domain, const std::string& itemName) {
  AttributeMap attrs;
  auto store = directory_.open(domain);
  if (!store) return attrs;

  auto st = store->db().prepare(std::string("SELECT * FROM ") + quoteIdentifier(kItemTable) +
                                " WHERE " + quoteIdentifier(kItemNameColumn) + " = ?");
  st.bindText(1, itemName);
  if (!st.step()) return attrs;

  for (int c = 0; c < st.columnCount(); ++c) {
    const std::string name = st.columnName(c);
    if (name == kItemNameColumn) continue;
    if (auto value = st.columnText(c)) attrs.emplace(name, std::move(*value));
  }
  return attrs;
}

std::vector<std::string> AttributeTable::attributeNames(const std::string& domain) {
  auto store = directory_.open(domain);
  if (!store) return {};
  return store->attributeNames();
}

} // namespace lsdb
