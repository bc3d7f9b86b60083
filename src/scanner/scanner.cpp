#include "readable_scanner/scanner.hpp"
#include "readable_scanner/errors.hpp"
#include "readable_scanner/pattern.hpp"
#include "readable_scanner/source.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace rs {

struct Scanner::Impl {
  Source& src;
  std::vector<char> buf;
  std::size_t start{0};
  std::size_t end{0};
  bool exhausted{false};
  ScanStats stats;

  Impl(Source& s, std::size_t cap) : src(s), buf(cap) {}

  std::string_view unconsumed() const { return std::string_view(buf.data() + start, end - start); }

  // Appends whatever the source has into [end, capacity). The only caller of
  // Source::fill. State is untouched if fill throws.
  void pull() {
    if (exhausted) return;
    std::ptrdiff_t n = src.fill(buf.data() + end, buf.size() - end);
    ++stats.pulls;
    if (n == Source::kEndOfInput) { exhausted = true; return; }
    end += static_cast<std::size_t>(n);
    stats.chars_pulled += static_cast<std::uint64_t>(n);
    if (end - start > stats.high_water) stats.high_water = end - start;
  }

  // Doubles capacity; [start, end) keeps its offsets.
  void grow() {
    std::vector<char> bigger(buf.size() * 2);
    std::copy(buf.begin() + start, buf.begin() + end, bigger.begin() + start);
    buf.swap(bigger);
    ++stats.grows;
  }

  // Moves [start, end) down to index 0 without reallocating.
  void compact() {
    if (start == 0) return;
    std::memmove(buf.data(), buf.data() + start, end - start);
    end -= start;
    start = 0;
    ++stats.compactions;
  }

  void clear() {
    start = end = 0;
    ++stats.refills;
  }

  // Pulls until at least one unconsumed character is held or the source is done.
  void fill_if_empty() {
    while (start == end && !exhausted) {
      start = end = 0;
      pull();
    }
  }
};

Scanner::Scanner(Source& src) : Scanner(src, Config{}) {}

Scanner::Scanner(Source& src, Config cfg) : p_(nullptr) {
  if (cfg.initial_capacity == 0) throw PreconditionViolation("scanner capacity must be at least 1");
  p_ = new Impl(src, cfg.initial_capacity);
}

Scanner::~Scanner() { delete p_; }

std::string Scanner::read(const Pattern& pat) {
  for (;;) {
    MatchResult m = pat.match_anchored(p_->unconsumed(), !p_->exhausted);
    if (m.matched && (!m.hit_boundary || p_->exhausted)) {
      std::string out(p_->buf.data() + p_->start, m.end);
      p_->start += m.end;
      return out;
    }
    // Definite mismatch, or nothing left that could complete it.
    if (!m.hit_boundary || p_->exhausted) return {};

    // Reclaim the consumed prefix before doubling.
    if (p_->end == p_->buf.size()) {
      if (p_->start > 0) p_->compact();
      else p_->grow();
    }
    p_->pull();
  }
}

std::string Scanner::read_repeatedly(const Pattern& pat, std::size_t horizon) {
  if (horizon == 0) throw PreconditionViolation("read_repeatedly needs a horizon of at least 1");
  while (p_->buf.size() < horizon) p_->grow();

  std::string out;
  for (;;) {
    if (p_->buf.size() - p_->start < horizon) p_->compact();
    while (p_->end - p_->start < horizon && !p_->exhausted) p_->pull();

    do {
      MatchResult m = pat.match_anchored(p_->unconsumed(), false);
      if (!m.matched || m.end == 0) return out;
      out.append(p_->buf.data() + p_->start, m.end);
      p_->start += m.end;
    } while (p_->end - p_->start >= horizon || p_->exhausted);
  }
}

void Scanner::skip(const Pattern& pat) {
  for (;;) {
    while (p_->start < p_->end) {
      MatchResult m = pat.match_anchored(p_->unconsumed(), false);
      if (!m.matched || m.end == 0) return;
      p_->start += m.end;
    }
    if (p_->exhausted) return;
    p_->clear();
    p_->pull();
  }
}

char Scanner::peek() {
  p_->fill_if_empty();
  if (p_->start == p_->end) throw EndOfInput("cannot peek: end of input reached");
  return p_->buf[p_->start];
}

char Scanner::next() {
  char c = peek();
  ++p_->start;
  return c;
}

bool Scanner::at_end() {
  p_->fill_if_empty();
  return p_->exhausted && p_->start == p_->end;
}

std::size_t Scanner::capacity() const noexcept { return p_->buf.size(); }
std::size_t Scanner::buffered() const noexcept { return p_->end - p_->start; }
bool Scanner::exhausted() const noexcept { return p_->exhausted; }
const ScanStats& Scanner::stats() const noexcept { return p_->stats; }

}
