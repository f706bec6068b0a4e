#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace sqlvault::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_ || sqlite3_get_autocommit(db_->Handle())) return;

  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    SQLVAULT_LOG_WARN("Implicit rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  // a failed statement may already have ended the transaction
  if (sqlite3_get_autocommit(db_->Handle())) return;
  db_->Exec("ROLLBACK;");
}

} // namespace sqlvault::db::sqlite
