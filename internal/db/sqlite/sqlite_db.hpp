#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace sqlvault::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by the application and the backup engine;
  it is opened in serialized (FULLMUTEX) mode.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute one or more SQL statements (pragmas, scripts)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // First column of the first row; throws if the query yields no row
  int64_t QueryInt64(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace sqlvault::db::sqlite
