#pragma once
#include <memory>
#include <string>
#include <vector>

#include "core/storage/SqliteDb.hpp"

namespace lsdb {

// Every domain file holds one table of items; each attribute name is a column.
inline constexpr const char* kItemTable = "items";
inline constexpr const char* kItemNameColumn = "__itemName";

// One domain's backing file, opened for the duration of a single operation.
class DomainStore {
public:
  // Creates the file and its item table when missing.
  static std::unique_ptr<DomainStore> create(const std::string& path);
  // nullptr when there is no backing file at path.
  static std::unique_ptr<DomainStore> openExisting(const std::string& path);

  SqliteDb& db() { return db_; }

  // Table columns in declaration order, key column first.
  std::vector<std::string> columns();
  // columns() without the key column.
  std::vector<std::string> attributeNames();

  // Appends a nullable TEXT column for every name not already present.
  // Must run inside a WriteTransaction so concurrent writers see each other's columns.
  void addColumns(const std::vector<std::string>& names);

  DomainStore(const std::string& path, SqliteDb::OpenMode mode);

private:
  SqliteDb db_;
};

} // namespace lsdb
