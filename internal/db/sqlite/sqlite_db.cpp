#include "sqlite_db.hpp"

#include <stdexcept>

namespace kag::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // concurrent readers while a writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // segment rows cascade on document delete
  Exec("PRAGMA foreign_keys=ON;");

  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::BootstrapSchema() {
  Exec(
      "CREATE TABLE IF NOT EXISTS documents ("
      " id TEXT PRIMARY KEY,"
      " name TEXT NOT NULL,"
      " format TEXT NOT NULL,"
      " user_id TEXT NOT NULL,"
      " created_at_ms INTEGER NOT NULL);");
  Exec("CREATE INDEX IF NOT EXISTS documents_user_idx ON documents(user_id, created_at_ms);");
  Exec(
      "CREATE TABLE IF NOT EXISTS document_segments ("
      " document_id TEXT NOT NULL,"
      " chunk_index INTEGER NOT NULL,"
      " content TEXT NOT NULL,"
      " PRIMARY KEY (document_id, chunk_index),"
      " FOREIGN KEY(document_id) REFERENCES documents(id) ON DELETE CASCADE);");
}

} // namespace kag::db::sqlite
