#include "sqlite_tx.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace jobsrv::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->WriterMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    // Best effort; a failed rollback leaves nothing committed either way.
    sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  }
}

void SqliteTransaction::Commit() {
  int rc = sqlite3_exec(db_->Handle(), "COMMIT;", nullptr, nullptr, nullptr);
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw CommitConflict(std::string("sqlite commit: ") + sqlite3_errmsg(db_->Handle()));
  }
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite commit: ") + sqlite3_errmsg(db_->Handle()));
  }
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace jobsrv::db::sqlite
