#pragma once

#include <cstdint>
#include <string>

namespace kag::db::model {

// One chunk of a document. Ordering by index is the order used to build context.
struct SegmentRecord {
  std::string document_id;
  uint32_t    index = 0;
  std::string content;
};

} // namespace kag::db::model
