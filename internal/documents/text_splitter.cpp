#include "text_splitter.hpp"

#include <algorithm>
#include <cstddef>

#include "internal/util/errors.hpp"

namespace kag::documents {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n";

std::string_view Trim(std::string_view piece) {
  const auto first = piece.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) return {};
  const auto last = piece.find_last_not_of(kWhitespace);
  return piece.substr(first, last - first + 1);
}

bool IsContinuation(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Moves pos back to the first byte of the UTF-8 sequence it falls in.
std::size_t BoundaryAtOrBefore(std::string_view text, std::size_t pos) {
  while (pos > 0 && pos < text.size() && IsContinuation(text[pos])) --pos;
  return pos;
}

// First sequence boundary strictly after pos.
std::size_t BoundaryAfter(std::string_view text, std::size_t pos) {
  ++pos;
  while (pos < text.size() && IsContinuation(text[pos])) ++pos;
  return pos;
}

} // namespace

TextSplitter::TextSplitter(std::size_t chunk_size, std::size_t chunk_overlap) : chunk_size_(chunk_size), chunk_overlap_(chunk_overlap) {
  if (chunk_size_ == 0) {
    throw util::InvalidArgument("chunk size must be positive");
  }
  if (chunk_overlap_ >= chunk_size_) {
    throw util::InvalidArgument("chunk overlap must be smaller than chunk size");
  }
}

std::vector<std::string> TextSplitter::Split(std::string_view text) const {
  std::vector<std::string> chunks;
  const std::size_t        n     = text.size();
  std::size_t              start = 0;

  while (start < n) {
    std::size_t end = std::min(start + chunk_size_, n);

    if (end < n) {
      end = BoundaryAtOrBefore(text, end);
      // a single character wider than the window is kept whole
      if (end <= start) end = BoundaryAfter(text, start);

      const auto window = text.substr(start, end - start);
      const auto ws     = window.find_last_of(kWhitespace);
      if (ws != std::string_view::npos && ws > chunk_size_ / 2) {
        end = start + ws + 1;
      }
    }

    if (auto piece = Trim(text.substr(start, end - start)); !piece.empty()) {
      chunks.emplace_back(piece);
    }

    if (end >= n) break;

    // always advance, even when the whitespace break shrank the window below the overlap
    std::size_t next = BoundaryAtOrBefore(text, end > chunk_overlap_ ? end - chunk_overlap_ : 0);
    if (next <= start) next = BoundaryAfter(text, start);
    start = next;
  }

  return chunks;
}

} // namespace kag::documents
