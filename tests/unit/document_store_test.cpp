#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/documents/document_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using kag::documents::DocumentStore;
using kag::documents::IngestRequest;
using kag::documents::TextSplitter;

struct Backend {
  std::string                                            name;
  std::function<std::shared_ptr<kag::db::Repository>()> make;
};

std::shared_ptr<kag::db::Repository> MakeSqlite() {
  const auto dir = std::filesystem::temp_directory_path() / "kag_document_store_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / "documents.sqlite";
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");

  auto db = std::make_shared<kag::db::sqlite::SqliteDB>(path.string());
  db->BootstrapSchema();
  return std::make_shared<kag::db::sqlite::SqliteRepository>(db);
}

IngestRequest Upload(const std::string& name, const std::string& user_id, const std::string& text, const std::string& id = {}) {
  IngestRequest request;
  request.name        = name;
  request.format      = "txt";
  request.user_id     = user_id;
  request.text        = text;
  request.document_id = id;
  return request;
}

void TestIngestSplitsAndOrdersSegments(DocumentStore& store) {
  const auto result = store.Ingest(Upload("letters.txt", "u1", "abcdefghij"));
  assert(result.has_value());
  assert(!result->document_id.empty());
  assert(result->segment_count == 3);

  const auto segments = store.GetSegments(result->document_id);
  assert((segments == std::vector<std::string>{"abcd", "defg", "ghij"}));
}

void TestUnknownDocumentHasNoSegments(DocumentStore& store) {
  assert(store.GetSegments("no-such-document").empty());
  assert(store.GetSegmentsForUser("no-such-document", "u1").empty());
}

void TestOwnershipIsEnforcedWithoutErrors(DocumentStore& store) {
  const auto owned = store.Ingest(Upload("private.txt", "owner", "secret text"));
  assert(owned.has_value());

  assert(!store.GetSegmentsForUser(owned->document_id, "owner").empty());
  assert(store.GetSegmentsForUser(owned->document_id, "intruder").empty());
  assert(!store.DeleteDocument(owned->document_id, "intruder"));
  assert(!store.Ingest(Upload("private.txt", "intruder", "overwrite", owned->document_id)).has_value());

  assert(store.GetSegments(owned->document_id).front() == "secr");
}

void TestReuploadReplacesSegments(DocumentStore& store) {
  const auto first = store.Ingest(Upload("notes.txt", "u2", "abcdefghij", "notes-1"));
  assert(first->document_id == "notes-1");

  const auto second = store.Ingest(Upload("notes.txt", "u2", "xyz", "notes-1"));
  assert(second->segment_count == 1);
  assert((store.GetSegments("notes-1") == std::vector<std::string>{"xyz"}));
}

void TestListAndDeleteCascade(DocumentStore& store) {
  const auto a = store.Ingest(Upload("a.txt", "lister", "abcdefgh"));
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  const auto b = store.Ingest(Upload("b.md", "lister", "xy"));
  store.Ingest(Upload("other.txt", "someone-else", "zzzz"));

  auto listed = store.ListDocuments("lister");
  assert(listed.size() == 2);
  assert(listed[0].id == b->document_id); // newest first
  assert(listed[0].segment_count == 1);
  assert(listed[1].name == "a.txt");
  assert(listed[1].segment_count == a->segment_count);

  assert(store.DeleteDocument(a->document_id, "lister"));
  assert(!store.DeleteDocument(a->document_id, "lister"));
  assert(store.GetSegments(a->document_id).empty());
  assert(store.ListDocuments("lister").size() == 1);
}

void TestEmptyUploadIsRejected(DocumentStore& store) {
  bool threw = false;
  try {
    store.Ingest(Upload("blank.txt", "u1", "   \n "));
  } catch (const kag::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    store.Ingest(Upload("anon.txt", "", "text"));
  } catch (const kag::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  const std::vector<Backend> backends = {
      {"memory", [] { return std::make_shared<kag::db::memory::MemoryRepository>(); }},
      {"sqlite", MakeSqlite},
  };

  for (const auto& backend : backends) {
    DocumentStore store(backend.make(), TextSplitter(4, 1));

    TestIngestSplitsAndOrdersSegments(store);
    TestUnknownDocumentHasNoSegments(store);
    TestOwnershipIsEnforcedWithoutErrors(store);
    TestReuploadReplacesSegments(store);
    TestListAndDeleteCascade(store);
    TestEmptyUploadIsRejected(store);

    std::cout << "kag_unit_document_store[" << backend.name << "]: pass\n";
  }
  return 0;
}
