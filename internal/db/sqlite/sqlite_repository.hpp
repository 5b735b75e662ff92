#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace kag::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                               UpsertDocument(Transaction&, const model::DocumentRecord&) override;
  std::optional<model::DocumentRecord> GetDocument(Transaction&, const std::string&) override;
  std::vector<model::DocumentRecord>   ListDocuments(Transaction&, const std::string& user_id) override;
  Result                               DeleteDocument(Transaction&, const std::string&) override;

  Result ReplaceSegments(Transaction&, const std::string& document_id, const std::vector<model::SegmentRecord>& segments) override;
  std::vector<model::SegmentRecord> GetSegments(Transaction&, const std::string& document_id) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace kag::db::sqlite
