#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/document_record.hpp"
#include "internal/db/model/segment_record.hpp"

namespace kag::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Deleting a document deletes its segments
  - Segments come back ordered by index

  The DB is the source of truth for documents and their segments.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Documents
  // ---------------------------------------------------------------------

  virtual Result UpsertDocument(Transaction&, const model::DocumentRecord&) = 0;

  virtual std::optional<model::DocumentRecord> GetDocument(Transaction&, const std::string& id) = 0;

  // Newest first, segment_count populated.
  virtual std::vector<model::DocumentRecord> ListDocuments(Transaction&, const std::string& user_id) = 0;

  virtual Result DeleteDocument(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Segments
  // ---------------------------------------------------------------------

  // Drops any existing segments of the document first.
  virtual Result ReplaceSegments(Transaction&, const std::string& document_id, const std::vector<model::SegmentRecord>& segments) = 0;

  virtual std::vector<model::SegmentRecord> GetSegments(Transaction&, const std::string& document_id) = 0;
};

} // namespace kag::db
