#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/document_record.hpp"
#include "internal/db/model/segment_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

using kag::db::ErrorCode;
using kag::db::Repository;
using kag::db::memory::MemoryRepository;
using kag::db::model::DocumentRecord;
using kag::db::model::SegmentRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

DocumentRecord Document(const std::string& id, const std::string& user_id, uint64_t created_at_ms) {
  return DocumentRecord{.id = id, .name = id + ".txt", .format = "txt", .user_id = user_id, .created_at_ms = created_at_ms};
}

std::vector<SegmentRecord> Segments(const std::string& document_id, const std::vector<std::string>& contents) {
  std::vector<SegmentRecord> out;
  for (uint32_t i = 0; i < contents.size(); ++i) {
    out.push_back(SegmentRecord{.document_id = document_id, .index = i, .content = contents[i]});
  }
  return out;
}

void VerifyDocumentReadWrite(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertDocument(*tx, Document(id, "u1", NowMs())));
    assert(repo.ReplaceSegments(*tx, id, Segments(id, {"one", "two", "three"})));

    // visible inside the transaction before commit
    assert(repo.GetDocument(*tx, id).has_value());
    tx->Commit();
  }

  auto tx  = repo.Begin();
  auto doc = repo.GetDocument(*tx, id);
  assert(doc.has_value());
  assert(doc->user_id == "u1");
  assert(doc->format == "txt");

  const auto segments = repo.GetSegments(*tx, id);
  assert(segments.size() == 3);
  assert(segments[0].content == "one");
  assert(segments[2].content == "three");
  assert(segments[2].index == 2);
  tx->Commit();
}

void VerifyReplaceSegments(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertDocument(*tx, Document(id, "u1", NowMs())));
    assert(repo.ReplaceSegments(*tx, id, Segments(id, {"a", "b", "c", "d"})));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.ReplaceSegments(*tx, id, Segments(id, {"z"})));
    tx->Commit();
  }

  auto       tx       = repo.Begin();
  const auto segments = repo.GetSegments(*tx, id);
  assert(segments.size() == 1);
  assert(segments[0].content == "z");

  const auto orphan = repo.ReplaceSegments(*tx, id + "-missing", Segments(id + "-missing", {"x"}));
  assert(!orphan);
  assert(orphan.code == ErrorCode::ConstraintViolation);
  tx->Rollback();
}

void VerifyListDocuments(Repository& repo, const std::string& prefix) {
  const std::string user = prefix + "-lister";
  {
    auto tx = repo.Begin();
    assert(repo.UpsertDocument(*tx, Document(prefix + "-old", user, 1000)));
    assert(repo.UpsertDocument(*tx, Document(prefix + "-new", user, 2000)));
    assert(repo.UpsertDocument(*tx, Document(prefix + "-other", prefix + "-someone-else", 3000)));
    assert(repo.ReplaceSegments(*tx, prefix + "-new", Segments(prefix + "-new", {"x", "y"})));
    tx->Commit();
  }

  auto       tx   = repo.Begin();
  const auto docs = repo.ListDocuments(*tx, user);
  assert(docs.size() == 2);
  assert(docs[0].id == prefix + "-new");
  assert(docs[0].segment_count == 2);
  assert(docs[1].id == prefix + "-old");
  assert(docs[1].segment_count == 0);
  tx->Commit();
}

void VerifyDeleteCascades(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertDocument(*tx, Document(id, "u1", NowMs())));
    assert(repo.ReplaceSegments(*tx, id, Segments(id, {"gone"})));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.DeleteDocument(*tx, id));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(!repo.GetDocument(*tx, id).has_value());
  assert(repo.GetSegments(*tx, id).empty());

  const auto again = repo.DeleteDocument(*tx, id);
  assert(again.code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertDocument(*tx, Document(id, "u1", NowMs())));
    tx->Rollback();
  }
  {
    // destructor rolls back too
    auto tx = repo.Begin();
    assert(repo.UpsertDocument(*tx, Document(id + "-dropped", "u1", NowMs())));
  }

  auto tx = repo.Begin();
  assert(!repo.GetDocument(*tx, id).has_value());
  assert(!repo.GetDocument(*tx, id + "-dropped").has_value());
  tx->Commit();
}

void VerifyConcurrentWriters(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertDocument(*tx, Document(id, "u1", NowMs())));
    tx->Commit();
  }

  if (supports_parallel_transactions) {
    // snapshot backends reject the second of two overlapping writers
    auto tx1 = repo.Begin();
    auto tx2 = repo.Begin();
    assert(repo.ReplaceSegments(*tx1, id, Segments(id, {"first"})));
    assert(repo.ReplaceSegments(*tx2, id, Segments(id, {"second"})));
    tx1->Commit();

    bool threw = false;
    try {
      tx2->Commit();
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  } else {
    // a shared connection serializes writers instead
    std::vector<std::thread> writers;
    for (int i = 0; i < 4; ++i) {
      writers.emplace_back([&repo, &id, i] {
        auto tx = repo.Begin();
        assert(repo.ReplaceSegments(*tx, id, Segments(id, {"writer-" + std::to_string(i)})));
        tx->Commit();
      });
    }
    for (auto& writer : writers) writer.join();
  }

  auto       tx       = repo.Begin();
  const auto segments = repo.GetSegments(*tx, id);
  assert(segments.size() == 1);
  assert(segments[0].content.rfind(supports_parallel_transactions ? "first" : "writer-", 0) == 0);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->UpsertDocument(*tx, Document(id, "durable-user", 42)));
    assert(repo->ReplaceSegments(*tx, id, Segments(id, {"kept", "across", "restart"})));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx  = repo->Begin();
  auto doc = repo->GetDocument(*tx, id);
  assert(doc.has_value());
  assert(doc->created_at_ms == 42);
  assert(repo->GetSegments(*tx, id).size() == 3);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("kag_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<kag::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    return std::make_shared<kag::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .supports_parallel_transactions = false,
  };
}

void RunBackend(BackendFactory backend) {
  auto repo = backend.make_repository();

  VerifyDocumentReadWrite(*repo, "doc-rw");
  VerifyReplaceSegments(*repo, "doc-replace");
  VerifyListDocuments(*repo, "doc-list");
  VerifyDeleteCascades(*repo, "doc-delete");
  VerifyRollbackBehavior(*repo, "doc-rollback");
  VerifyConcurrentWriters(*repo, "doc-concurrent", backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, "doc-durable");
  backend.cleanup();

  std::cout << "kag_integration_repository_parity[" << backend.name << "]: pass\n";
}

} // namespace

int main() {
  RunBackend(MakeMemoryFactory());
  RunBackend(MakeSqliteFactory());
  return 0;
}
