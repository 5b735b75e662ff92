#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace kag::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

Result MemoryRepository::UpsertDocument(Transaction& t, const model::DocumentRecord& r) {
  auto& s        = TX(t).Mutable();
  auto  stored   = r;
  stored.segment_count = 0;
  s.documents[r.id]    = stored;
  return Result::Ok();
}

std::optional<model::DocumentRecord> MemoryRepository::GetDocument(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.documents.find(id);
  if (it == s.documents.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DocumentRecord> MemoryRepository::ListDocuments(Transaction& t, const std::string& user_id) {
  const auto&                        s = TX(t).View();
  std::vector<model::DocumentRecord> records;
  for (const auto& [id, record] : s.documents) {
    if (record.user_id != user_id) continue;

    auto listed = record;
    if (auto seg = s.segments.find(id); seg != s.segments.end()) {
      listed.segment_count = seg->second.size();
    }
    records.push_back(std::move(listed));
  }

  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id < b.id;
  });
  return records;
}

Result MemoryRepository::DeleteDocument(Transaction& t, const std::string& id) {
  if (!TX(t).View().documents.contains(id)) return Result::Err(ErrorCode::NotFound, "document not found: " + id);

  auto& s = TX(t).Mutable();
  s.documents.erase(id);
  s.segments.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Segments
// ------------------------------------------------------------------

Result MemoryRepository::ReplaceSegments(Transaction& t, const std::string& document_id, const std::vector<model::SegmentRecord>& segments) {
  if (!TX(t).View().documents.contains(document_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "segments reference unknown document: " + document_id);
  }

  auto& stored = TX(t).Mutable().segments[document_id];
  stored.clear();
  for (const auto& segment : segments) {
    if (!stored.emplace(segment.index, segment).second) {
      return Result::Err(ErrorCode::AlreadyExists, "duplicate segment index for document: " + document_id);
    }
  }
  return Result::Ok();
}

std::vector<model::SegmentRecord> MemoryRepository::GetSegments(Transaction& t, const std::string& document_id) {
  const auto& s  = TX(t).View();
  auto        it = s.segments.find(document_id);
  if (it == s.segments.end()) return {};

  std::vector<model::SegmentRecord> ordered;
  ordered.reserve(it->second.size());
  for (const auto& [_, segment] : it->second) {
    ordered.push_back(segment);
  }
  return ordered;
}

} // namespace kag::db::memory
