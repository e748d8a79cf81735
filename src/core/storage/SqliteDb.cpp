#include "SqliteDb.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include "core/errors/SdbError.hpp"

namespace lsdb {

static SdbError sqliteFailure(sqlite3* db, const std::string& what) {
  std::string msg = db ? sqlite3_errmsg(db) : "unknown error";
  return SdbError::internal(what + " failed: " + msg);
}

// ---------- Statement ----------

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db), st_(nullptr) {
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st_);
    throw sqliteFailure(db_, "prepare");
  }
  if (!st_) throw SdbError::internal("prepare failed: empty statement");
}

Statement::~Statement() {
  if (st_) sqlite3_finalize(st_);
}

Statement::Statement(Statement&& other) noexcept : db_(other.db_), st_(other.st_) {
  other.st_ = nullptr;
}

void Statement::bindText(int index, const std::string& value) {
  if (sqlite3_bind_text(st_, index, value.data(), static_cast<int>(value.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK) {
    throw sqliteFailure(db_, "bind");
  }
}

bool Statement::step() {
  int rc = sqlite3_step(st_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw sqliteFailure(db_, "step");
}

int Statement::columnCount() const {
  return sqlite3_column_count(st_);
}

std::string Statement::columnName(int i) const {
  const char* name = sqlite3_column_name(st_, i);
  return name ? std::string(name) : std::string();
}

std::optional<std::string> Statement::columnText(int i) const {
  if (sqlite3_column_type(st_, i) == SQLITE_NULL) return std::nullopt;
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(st_, i));
  int len = sqlite3_column_bytes(st_, i);
  return std::string(text ? text : "", static_cast<size_t>(len));
}

// ---------- SqliteDb ----------

SqliteDb::SqliteDb(const std::string& path, OpenMode mode) : db_(nullptr) {
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
  if (mode == OpenMode::Create) flags |= SQLITE_OPEN_CREATE;

  int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    SdbError err = sqliteFailure(db_, "open " + path);
    sqlite3_close(db_);
    throw err;
  }

  try {
    // concurrent writers to the same domain wait for the lock instead of failing
    exec("PRAGMA busy_timeout=5000;");
  } catch (...) {
    sqlite3_close(db_);
    throw;
  }
}

SqliteDb::~SqliteDb() {
  if (db_) sqlite3_close(db_);
}

void SqliteDb::exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw SdbError::internal("SQLite exec failed: " + msg);
  }
}

Statement SqliteDb::prepare(const std::string& sql) {
  return Statement(db_, sql);
}

// ---------- WriteTransaction ----------

WriteTransaction::WriteTransaction(SqliteDb& db) : db_(db) {
  db_.exec("BEGIN IMMEDIATE;");
}

WriteTransaction::~WriteTransaction() {
  if (done_) return;
  try {
    db_.exec("ROLLBACK;");
  } catch (const std::exception& e) {
    spdlog::error("rollback failed: {}", e.what());
  }
}

void WriteTransaction::commit() {
  db_.exec("COMMIT;");
  done_ = true;
}

// ---------- quoting ----------

static std::string quoteWith(const std::string& s, char q) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back(q);
  for (char c : s) {
    if (c == q) out.push_back(q);
    out.push_back(c);
  }
  out.push_back(q);
  return out;
}

std::string quoteIdentifier(const std::string& name) { return quoteWith(name, '"'); }
std::string quoteLiteral(const std::string& text) { return quoteWith(text, '\''); }

} // namespace lsdb
