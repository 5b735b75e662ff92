#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/document_record.hpp"
#include "segment_store.hpp"
#include "text_splitter.hpp"

namespace kag::db {
class Repository;
}

namespace kag::documents {

struct IngestRequest {
  std::string name;
  std::string format;
  std::string user_id;
  std::string text;

  // Replace an existing document of the same owner; a new id is generated when empty.
  std::string document_id;
};

struct IngestResult {
  std::string document_id;
  uint64_t    segment_count = 0;
};

/*
  Owns documents and their ordered segments.

  Ownership checks never raise: a document that belongs to someone else looks
  exactly like one that does not exist.
*/
class DocumentStore final : public SegmentStore {
 public:
  DocumentStore(std::shared_ptr<db::Repository> repository, TextSplitter splitter);

  // nullopt when document_id names another user's document.
  std::optional<IngestResult> Ingest(const IngestRequest& request);

  std::vector<std::string> GetSegments(const std::string& document_id) override;
  std::vector<std::string> GetSegmentsForUser(const std::string& document_id, const std::string& user_id) override;

  std::vector<db::model::DocumentRecord> ListDocuments(const std::string& user_id);

  bool DeleteDocument(const std::string& document_id, const std::string& user_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  TextSplitter                    splitter_;
};

} // namespace kag::documents
