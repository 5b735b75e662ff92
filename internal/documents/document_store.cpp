#include "document_store.hpp"

#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace kag::documents {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  throw std::runtime_error(prefix + ": " + result.message);
}

std::vector<std::string> Contents(std::vector<db::model::SegmentRecord> records) {
  std::vector<std::string> out;
  out.reserve(records.size());
  for (auto& record : records) {
    out.push_back(std::move(record.content));
  }
  return out;
}

} // namespace

DocumentStore::DocumentStore(std::shared_ptr<db::Repository> repository, TextSplitter splitter)
    : repository_(std::move(repository)), splitter_(std::move(splitter)) {
  if (!repository_) {
    throw std::invalid_argument("DocumentStore: repository is required");
  }
}

std::optional<IngestResult> DocumentStore::Ingest(const IngestRequest& request) {
  if (request.user_id.empty()) {
    throw util::InvalidArgument("document upload requires a user id");
  }

  auto pieces = splitter_.Split(request.text);
  if (pieces.empty()) {
    throw util::InvalidArgument("document '" + request.name + "' has no text content");
  }

  const std::string id = request.document_id.empty() ? util::NewId() : request.document_id;

  auto tx = repository_->Begin();
  if (auto existing = repository_->GetDocument(*tx, id); existing && existing->user_id != request.user_id) {
    KAG_LOG_WARN("Document upload rejected for non-owner",
                 {observability::StringField("document_id", id), observability::StringField("user_id", request.user_id)});
    return std::nullopt;
  }

  db::model::DocumentRecord record;
  record.id            = id;
  record.name          = request.name;
  record.format        = request.format.empty() ? "txt" : request.format;
  record.user_id       = request.user_id;
  record.created_at_ms = util::ToUnixMillis(util::Now());
  ThrowIfDbError(repository_->UpsertDocument(*tx, record), "UpsertDocument");

  std::vector<db::model::SegmentRecord> segments;
  segments.reserve(pieces.size());
  for (std::size_t i = 0; i < pieces.size(); ++i) {
    segments.push_back({id, static_cast<uint32_t>(i), std::move(pieces[i])});
  }
  ThrowIfDbError(repository_->ReplaceSegments(*tx, id, segments), "ReplaceSegments");
  tx->Commit();

  KAG_LOG_INFO("Document ingested", {observability::StringField("document_id", id), observability::StringField("name", record.name),
                                     observability::StringField("user_id", record.user_id),
                                     observability::IntField("segments", static_cast<int64_t>(segments.size()))});
  return IngestResult{id, segments.size()};
}

std::vector<std::string> DocumentStore::GetSegments(const std::string& document_id) {
  auto tx       = repository_->Begin();
  auto segments = repository_->GetSegments(*tx, document_id);
  tx->Commit();
  return Contents(std::move(segments));
}

std::vector<std::string> DocumentStore::GetSegmentsForUser(const std::string& document_id, const std::string& user_id) {
  auto tx       = repository_->Begin();
  auto document = repository_->GetDocument(*tx, document_id);
  if (!document) {
    return {};
  }
  if (document->user_id != user_id) {
    KAG_LOG_WARN("Document access denied", {observability::StringField("document_id", document_id), observability::StringField("user_id", user_id)});
    return {};
  }

  auto segments = repository_->GetSegments(*tx, document_id);
  tx->Commit();
  return Contents(std::move(segments));
}

std::vector<db::model::DocumentRecord> DocumentStore::ListDocuments(const std::string& user_id) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListDocuments(*tx, user_id);
  tx->Commit();
  return records;
}

bool DocumentStore::DeleteDocument(const std::string& document_id, const std::string& user_id) {
  auto tx       = repository_->Begin();
  auto document = repository_->GetDocument(*tx, document_id);
  if (!document || document->user_id != user_id) {
    return false;
  }

  const auto result = repository_->DeleteDocument(*tx, document_id);
  if (result.code == db::ErrorCode::NotFound) {
    return false;
  }
  ThrowIfDbError(result, "DeleteDocument");
  tx->Commit();

  KAG_LOG_INFO("Document deleted", {observability::StringField("document_id", document_id), observability::StringField("user_id", user_id)});
  return true;
}

} // namespace kag::documents
