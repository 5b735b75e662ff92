#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace kag::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
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

  // One open transaction per connection at a time.
  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (pragmas, schema bootstrap, transaction control)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // WAL, foreign keys, busy timeout
  void Configure();

  // Creates the documents / document_segments tables when missing.
  void BootstrapSchema();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace kag::db::sqlite
