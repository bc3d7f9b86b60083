#include "readable_scanner/source.hpp"
#include <algorithm>
#include <cstring>
#include <utility>

namespace rs {

StringSource::StringSource(std::string text, std::size_t max_chunk)
  : text_(std::move(text)), pos_(0), max_chunk_(max_chunk) {}

std::ptrdiff_t StringSource::fill(char* dst, std::size_t cap) {
  if (pos_ >= text_.size()) return kEndOfInput;
  std::size_t n = std::min(cap, text_.size() - pos_);
  if (max_chunk_ > 0) n = std::min(n, max_chunk_);
  std::memcpy(dst, text_.data() + pos_, n);
  pos_ += n;
  return static_cast<std::ptrdiff_t>(n);
}

ChunkSource::ChunkSource(std::vector<std::string> chunks) : chunks_(std::move(chunks)) {}

std::ptrdiff_t ChunkSource::fill(char* dst, std::size_t cap) {
  ++calls_;
  if (idx_ >= chunks_.size()) return kEndOfInput;
  const std::string& c = chunks_[idx_];
  std::size_t n = std::min(cap, c.size() - off_);
  std::memcpy(dst, c.data() + off_, n);
  off_ += n;
  if (off_ >= c.size()) { ++idx_; off_ = 0; }
  return static_cast<std::ptrdiff_t>(n);
}

}
