#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kag::documents {

/*
  Fixed-size splitter with overlap.

  Windows are chunk_size bytes long. A window is shortened to the last
  whitespace in its second half when one exists, so words are rarely cut.
  Consecutive windows share up to chunk_overlap bytes. Window edges never
  fall inside a UTF-8 sequence. Whitespace-only pieces are dropped.
*/
class TextSplitter {
 public:
  TextSplitter(std::size_t chunk_size, std::size_t chunk_overlap);

  std::vector<std::string> Split(std::string_view text) const;

  std::size_t ChunkSize() const {
    return chunk_size_;
  }
  std::size_t ChunkOverlap() const {
    return chunk_overlap_;
  }

 private:
  std::size_t chunk_size_;
  std::size_t chunk_overlap_;
};

} // namespace kag::documents
