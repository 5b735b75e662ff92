#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace kag::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                               UpsertDocument(Transaction&, const model::DocumentRecord&) override;
  std::optional<model::DocumentRecord> GetDocument(Transaction&, const std::string&) override;
  std::vector<model::DocumentRecord>   ListDocuments(Transaction&, const std::string& user_id) override;
  Result                               DeleteDocument(Transaction&, const std::string&) override;

  Result ReplaceSegments(Transaction&, const std::string& document_id, const std::vector<model::SegmentRecord>& segments) override;
  std::vector<model::SegmentRecord> GetSegments(Transaction&, const std::string& document_id) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::DocumentRecord> documents;
    // document id -> segments keyed by index
    std::unordered_map<std::string, std::map<uint32_t, model::SegmentRecord>> segments;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace kag::db::memory
