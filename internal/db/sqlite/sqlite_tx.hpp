#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace sqlvault::db::sqlite {

/*
  Scoped write transaction on a shared connection.

  Uses BEGIN IMMEDIATE:
    - grabs the write lock before the first statement runs
    - a restore never fails halfway on SQLITE_BUSY

  A transaction that neither committed nor rolled back is rolled back on
  destruction. Rollback() tolerates a transaction SQLite already ended
  after a failed statement.
*/
class SqliteTransaction final {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&) = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();
  void Rollback();
  bool IsCommitted() const { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
  bool finished_  = false;
};

} // namespace sqlvault::db::sqlite
