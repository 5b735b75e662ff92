#pragma once

#include <string>
#include <vector>

namespace kag::documents {

/*
  Read side of the document store as seen by the context cache.

  GetSegments returns a document's segments in chunk order, or an empty
  sequence when the document is unknown. It never throws for a missing id.
*/
class SegmentStore {
 public:
  virtual ~SegmentStore() = default;

  virtual std::vector<std::string> GetSegments(const std::string& document_id) = 0;

  // Same as GetSegments but empty when user_id does not own the document.
  virtual std::vector<std::string> GetSegmentsForUser(const std::string& document_id, const std::string& user_id) {
    (void)user_id;
    return GetSegments(document_id);
  }
};

} // namespace kag::documents
