#pragma once

#include "rqcd/core/result.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// sqlite3.h stays out of public headers
struct sqlite3;
struct sqlite3_stmt;

namespace rqcd::storage::sqlite {

// Highest version migrate() knows how to reach.
inline constexpr int kLatestSchemaVersion = 2;

// SqliteDb owns one connection to the analysis history database.
// Schema changes are an ordered list of migrations; migrate() applies whatever
// is missing, each inside its own transaction.
class SqliteDb {
 public:
  // ":memory:" opens a private in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // 0 on a fresh database.
  [[nodiscard]] int schema_version() const;

  [[nodiscard]] core::Result<bool, std::string> migrate();

  [[nodiscard]] std::string last_error() const;

 private:
  friend class Statement;

  struct ConnectionCloser {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, ConnectionCloser> db_;
};

// Statement is one prepared query. Parameter and column indices follow SQLite:
// bind() is 1-based, column_*() is 0-based.
class Statement {
 public:
  enum class Step { kRow, kDone, kError };

  Statement(const SqliteDb& db, std::string_view sql);
  ~Statement() = default;

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&&) = delete;
  Statement& operator=(Statement&&) = delete;

  [[nodiscard]] bool ok() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }

  Statement& bind(int index, std::string_view text);
  Statement& bind(int index, std::int64_t value);
  Statement& bind(int index, double value);

  [[nodiscard]] Step step();

  [[nodiscard]] std::string column_text(int col) const;
  [[nodiscard]] std::int64_t column_int(int col) const;
  [[nodiscard]] double column_double(int col) const;

 private:
  struct Finalizer {
    void operator()(sqlite3_stmt* stmt) const;
  };

  sqlite3* db_;
  std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;
  std::string error_;
};

}  // namespace rqcd::storage::sqlite
