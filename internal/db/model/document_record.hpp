#pragma once

#include <cstdint>
#include <string>

namespace kag::db::model {

/*
  Persistent document row.

  Owner is checked on every user-scoped read and delete.
*/

struct DocumentRecord {
  std::string id;
  std::string name;
  std::string format; // "txt", "md", ...
  std::string user_id;

  uint64_t created_at_ms = 0;

  // Filled by ListDocuments only.
  uint64_t segment_count = 0;
};

} // namespace kag::db::model
