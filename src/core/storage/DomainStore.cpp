#include "DomainStore.hpp"

#include <algorithm>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace lsdb {

DomainStore::DomainStore(const std::string& path, SqliteDb::OpenMode mode)
  : db_(path, mode) {}

std::unique_ptr<DomainStore> DomainStore::create(const std::string& path) {
  auto store = std::make_unique<DomainStore>(path, SqliteDb::OpenMode::Create);
  store->db().exec(std::string("CREATE TABLE IF NOT EXISTS ") + quoteIdentifier(kItemTable) +
                   " (" + quoteIdentifier(kItemNameColumn) + " TEXT PRIMARY KEY);");
  return store;
}

std::unique_ptr<DomainStore> DomainStore::openExisting(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) return nullptr;
  return std::make_unique<DomainStore>(path, SqliteDb::OpenMode::Existing);
}

std::vector<std::string> DomainStore::columns() {
  auto st = db_.prepare(std::string("PRAGMA table_info(") + quoteIdentifier(kItemTable) + ")");
  std::vector<std::string> cols;
  while (st.step()) {
    // table_info rows: cid, name, type, notnull, dflt_value, pk
    cols.push_back(st.columnText(1).value_or(""));
  }
  return cols;
}

std::vector<std::string> DomainStore::attributeNames() {
  auto cols = columns();
  cols.erase(std::remove(cols.begin(), cols.end(), std::string(kItemNameColumn)), cols.end());
  return cols;
}

void DomainStore::addColumns(const std::vector<std::string>& names) {
  const auto existing = columns();
  for (const auto& name : names) {
    if (std::find(existing.begin(), existing.end(), name) != existing.end()) continue;
    db_.exec(std::string("ALTER TABLE ") + quoteIdentifier(kItemTable) +
             " ADD COLUMN " + quoteIdentifier(name) + " TEXT;");
    spdlog::debug("added attribute column '{}'", name);
  }
}

} // namespace lsdb
