#pragma once
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace lsdb {

// Prepared statement; finalized on destruction.
class Statement {
public:
  Statement(sqlite3* db, const std::string& sql);
  ~Statement();
  Statement(Statement&& other) noexcept;
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement& operator=(Statement&&) = delete;

  void bindText(int index, const std::string& value);  // 1-based
  // true when a row is available, false when the statement is done
  bool step();

  int columnCount() const;
  std::string columnName(int i) const;
  // std::nullopt for SQL NULL
  std::optional<std::string> columnText(int i) const;

private:
  sqlite3* db_;
  sqlite3_stmt* st_;
};

// Owns one SQLite connection. All failures surface as SdbError(InternalError).
class SqliteDb {
public:
  enum class OpenMode { Existing, Create };

  SqliteDb(const std::string& path, OpenMode mode);
  ~SqliteDb();
  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;

  void exec(const std::string& sql);
  Statement prepare(const std::string& sql);

private:
  sqlite3* db_;
};

// BEGIN IMMEDIATE on construction; ROLLBACK unless commit() was reached.
class WriteTransaction {
public:
  explicit WriteTransaction(SqliteDb& db);
  ~WriteTransaction();
  WriteTransaction(const WriteTransaction&) = delete;
  WriteTransaction& operator=(const WriteTransaction&) = delete;

  void commit();

private:
  SqliteDb& db_;
  bool done_ = false;
};

// "name" with embedded double quotes doubled.
std::string quoteIdentifier(const std::string& name);
// 'text' with embedded single quotes doubled.
std::string quoteLiteral(const std::string& text);

} // namespace lsdb
