#include "rqcd/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

#include <array>

namespace rqcd::storage::sqlite {

namespace {

struct Migration {
  int version;
  const char* sql;
};

// seq keeps append order; record_id is the key callers see.
constexpr std::array<Migration, kLatestSchemaVersion> kMigrations{{
    {1, R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS analysis_records (
  seq INTEGER PRIMARY KEY AUTOINCREMENT,
  record_id TEXT NOT NULL UNIQUE,
  created_at TEXT NOT NULL,
  requirement TEXT NOT NULL,
  status TEXT NOT NULL,
  severity INTEGER NOT NULL CHECK(severity BETWEEN 1 AND 3),
  tags_json TEXT NOT NULL,
  reasons_json TEXT NOT NULL,
  probability REAL NOT NULL
);
)"},
    {2, R"(
CREATE INDEX IF NOT EXISTS idx_analysis_records_status ON analysis_records(status);
)"},
}};

core::Result<bool, std::string> run_script(sqlite3* db, const char* sql) {
  char* message = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &message) == SQLITE_OK) {
    return core::Result<bool, std::string>::ok(true);
  }
  std::string error = message != nullptr ? message : "unknown SQLite error";
  sqlite3_free(message);
  return core::Result<bool, std::string>::err(error);
}

}  // namespace

void SqliteDb::ConnectionCloser::operator()(sqlite3* db) const { sqlite3_close(db); }

void Statement::Finalizer::operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using OpenResult = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* raw = nullptr;
  if (sqlite3_open(path.c_str(), &raw) != SQLITE_OK) {
    const std::string reason = raw != nullptr ? sqlite3_errmsg(raw) : "out of memory";
    sqlite3_close(raw);
    return OpenResult::err("cannot open history database '" + path + "': " + reason);
  }
  return OpenResult::ok(std::shared_ptr<SqliteDb>(new SqliteDb(raw)));
}

int SqliteDb::schema_version() const {
  Statement query(*this, "SELECT MAX(version) FROM schema_version");
  if (!query.ok() || query.step() != Statement::Step::kRow) {
    return 0;
  }
  return static_cast<int>(query.column_int(0));
}

core::Result<bool, std::string> SqliteDb::migrate() {
  const int current = schema_version();
  for (const auto& migration : kMigrations) {
    if (migration.version <= current) {
      continue;
    }

    auto begun = run_script(db_.get(), "BEGIN");
    if (!begun.has_value()) {
      return begun;
    }

    auto applied = run_script(db_.get(), migration.sql);
    if (applied.has_value()) {
      Statement mark(*this,
                     "INSERT INTO schema_version (version, applied_at) VALUES (?, datetime('now'))");
      if (!mark.ok()) {
        applied = core::Result<bool, std::string>::err(mark.error());
      } else if (mark.bind(1, static_cast<std::int64_t>(migration.version)).step() !=
                 Statement::Step::kDone) {
        applied = core::Result<bool, std::string>::err(last_error());
      }
    }

    if (!applied.has_value()) {
      (void)run_script(db_.get(), "ROLLBACK");
      return core::Result<bool, std::string>::err("schema migration " +
                                                  std::to_string(migration.version) +
                                                  " failed: " + applied.error());
    }

    auto committed = run_script(db_.get(), "COMMIT");
    if (!committed.has_value()) {
      return committed;
    }
  }
  return core::Result<bool, std::string>::ok(true);
}

std::string SqliteDb::last_error() const { return sqlite3_errmsg(db_.get()); }

Statement::Statement(const SqliteDb& db, const std::string_view sql) : db_(db.db_.get()) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &raw, nullptr) !=
      SQLITE_OK) {
    error_ = sqlite3_errmsg(db_);
    sqlite3_finalize(raw);
    return;
  }
  stmt_.reset(raw);
}

Statement& Statement::bind(const int index, const std::string_view text) {
  sqlite3_bind_text(stmt_.get(), index, text.data(), static_cast<int>(text.size()),
                    SQLITE_TRANSIENT);
  return *this;
}

Statement& Statement::bind(const int index, const std::int64_t value) {
  sqlite3_bind_int64(stmt_.get(), index, value);
  return *this;
}

Statement& Statement::bind(const int index, const double value) {
  sqlite3_bind_double(stmt_.get(), index, value);
  return *this;
}

Statement::Step Statement::step() {
  switch (sqlite3_step(stmt_.get())) {
    case SQLITE_ROW:
      return Step::kRow;
    case SQLITE_DONE:
      return Step::kDone;
    default:
      error_ = sqlite3_errmsg(db_);
      return Step::kError;
  }
}

std::string Statement::column_text(const int col) const {
  const unsigned char* text = sqlite3_column_text(stmt_.get(), col);
  if (text == nullptr) {
    return {};
  }
  return {reinterpret_cast<const char*>(text),  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
          static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), col))};
}

std::int64_t Statement::column_int(const int col) const {
  return sqlite3_column_int64(stmt_.get(), col);
}

double Statement::column_double(const int col) const {
  return sqlite3_column_double(stmt_.get(), col);
}

}  // namespace rqcd::storage::sqlite
