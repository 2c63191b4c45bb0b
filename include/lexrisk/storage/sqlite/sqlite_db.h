#pragma once

#include "lexrisk/core/result.h"

#include <memory>
#include <string>
#include <string_view>

// Forward declare sqlite3 to avoid exposing the SQLite header in the public API.
struct sqlite3;
struct sqlite3_stmt;

namespace lexrisk::storage::sqlite {

// SqliteDb owns one SQLite connection and applies the replay-store schema.
// One connection per instance; share the instance, not the raw handle.
class SqliteDb {
 public:
  // Open or create the database at path. ":memory:" opens a private in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // 0 when no schema has been applied.
  [[nodiscard]] int get_schema_version() const;

  // Apply schema v1 (engine_results) if not already applied. Idempotent.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Raw connection, for PreparedStatement only.
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// RAII wrapper for a prepared statement.
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] std::string error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  // Binds a copy of value to the 1-based parameter index. Returns false on SQLite error.
  [[nodiscard]] bool bind_text(int index, std::string_view value);

  // Text of column `index` in the current row; empty for NULL.
  [[nodiscard]] std::string column_text(int index) const;

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace lexrisk::storage::sqlite
