#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lsdb {

class DomainDirectory;

struct SelectedItem {
  std::string name;  // empty when the output has no itemName() column
  // result columns in order; nullopt where the item has no such attribute
  std::vector<std::pair<std::string, std::optional<std::string>>> attributes;
};

// A select expression bound to one domain's item table.
struct TranslatedSelect {
  std::string domain;
  std::string sql;
};

// Rewrites `SELECT <output> FROM <domain> <rest>` into SQLite against the item table:
//   - only the table reference after the top-level FROM is replaced
//   - '...' and "..." become string literals, `...` becomes a column name
//   - itemName() becomes the key column
// Throws InvalidParameterValue for anything outside that single-table shape.
TranslatedSelect translateSelect(const std::string& expression);

class SelectTranslator {
public:
  explicit SelectTranslator(const DomainDirectory& directory) : directory_(directory) {}

  // Empty when the domain has no backing store.
  std::vector<SelectedItem> selectItems(const std::string& expression);

private:
  const DomainDirectory& directory_;
};

} // namespace lsdb
