#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace kag::db::sqlite {

using kag::db::ErrorCode;
using kag::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  if (!t) return {};
  return std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Finalizes on scope exit so early returns never leak statements.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

Result SqliteRepository::UpsertDocument(Transaction& t, const model::DocumentRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO documents(id,name,format,user_id,created_at_ms) VALUES(?,?,?,?,?) "
               "ON CONFLICT(id) DO UPDATE SET name=excluded.name, format=excluded.format, "
               "user_id=excluded.user_id, created_at_ms=excluded.created_at_ms;");

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindText(st.get(), 3, r.format);
  BindText(st.get(), 4, r.user_id);
  BindU64(st.get(), 5, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::DocumentRecord> SqliteRepository::GetDocument(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT id,name,format,user_id,created_at_ms FROM documents WHERE id=?;");
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::DocumentRecord r;
  r.id            = ColText(st.get(), 0);
  r.name          = ColText(st.get(), 1);
  r.format        = ColText(st.get(), 2);
  r.user_id       = ColText(st.get(), 3);
  r.created_at_ms = ColU64(st.get(), 4);
  return r;
}

std::vector<model::DocumentRecord> SqliteRepository::ListDocuments(Transaction& t, const std::string& user_id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT d.id,d.name,d.format,d.user_id,d.created_at_ms,"
               " (SELECT COUNT(*) FROM document_segments s WHERE s.document_id=d.id) "
               "FROM documents d WHERE d.user_id=? ORDER BY d.created_at_ms DESC, d.id ASC;");
  BindText(st.get(), 1, user_id);

  std::vector<model::DocumentRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::DocumentRecord r;
    r.id            = ColText(st.get(), 0);
    r.name          = ColText(st.get(), 1);
    r.format        = ColText(st.get(), 2);
    r.user_id       = ColText(st.get(), 3);
    r.created_at_ms = ColU64(st.get(), 4);
    r.segment_count = ColU64(st.get(), 5);
    out.push_back(std::move(r));
  }
  return out;
}

Result SqliteRepository::DeleteDocument(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM documents WHERE id=?;");
  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "document not found: " + id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Segments
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceSegments(Transaction& t, const std::string& document_id, const std::vector<model::SegmentRecord>& segments) {
  auto* db = TX(t).Handle();

  {
    Statement del(db, "DELETE FROM document_segments WHERE document_id=?;");
    BindText(del.get(), 1, document_id);
    int rc = sqlite3_step(del.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }

  Statement ins(db, "INSERT INTO document_segments(document_id,chunk_index,content) VALUES(?,?,?);");
  for (const auto& segment : segments) {
    sqlite3_reset(ins.get());
    sqlite3_clear_bindings(ins.get());

    BindText(ins.get(), 1, document_id);
    BindU64(ins.get(), 2, segment.index);
    BindText(ins.get(), 3, segment.content);

    int rc = sqlite3_step(ins.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }
  return Result::Ok();
}

std::vector<model::SegmentRecord> SqliteRepository::GetSegments(Transaction& t, const std::string& document_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT chunk_index,content FROM document_segments WHERE document_id=? ORDER BY chunk_index ASC;");
  BindText(st.get(), 1, document_id);

  std::vector<model::SegmentRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::SegmentRecord r;
    r.document_id = document_id;
    r.index       = static_cast<uint32_t>(ColU64(st.get(), 0));
    r.content     = ColText(st.get(), 1);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace kag::db::sqlite
