#include "readable_scanner/pattern.hpp"

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include <new>
#include <string>
#include <utility>

namespace rs {

static std::string pcre2_message(int code) {
  PCRE2_UCHAR buf[256];
  int n = pcre2_get_error_message(code, buf, sizeof(buf));
  if (n < 0) return "PCRE2 error " + std::to_string(code);
  return std::string(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(n));
}

struct Regex::Impl {
  pcre2_code* code{nullptr};
  pcre2_match_data* md{nullptr};

  ~Impl() {
    if (md) pcre2_match_data_free(md);
    if (code) pcre2_code_free(code);
  }
};

Regex::Regex(std::string_view pattern, std::uint32_t options)
  : p_(new Impl), pattern_(pattern) {
  int err = 0;
  PCRE2_SIZE erroff = 0;
  p_->code = pcre2_compile(reinterpret_cast<PCRE2_SPTR>(pattern_.data()), pattern_.size(),
                           options, &err, &erroff, nullptr);
  if (!p_->code) {
    delete p_;
    throw RegexError("regex compile failed at offset " + std::to_string(erroff) +
                     " in \"" + std::string(pattern) + "\": " + pcre2_message(err),
                     err, static_cast<std::size_t>(erroff));
  }
  p_->md = pcre2_match_data_create_from_pattern(p_->code, nullptr);
  if (!p_->md) { delete p_; throw std::bad_alloc(); }
}

Regex::~Regex() { delete p_; }

Regex::Regex(Regex&& other) noexcept
  : p_(other.p_), pattern_(std::move(other.pattern_)) { other.p_ = nullptr; }

Regex& Regex::operator=(Regex&& other) noexcept {
  if (this != &other) {
    delete p_;
    p_ = other.p_; other.p_ = nullptr;
    pattern_ = std::move(other.pattern_);
  }
  return *this;
}

MatchResult Regex::match_anchored(std::string_view region, bool more_input) const {
  MatchResult r;
  // Nothing to look at yet: whatever the pattern is, more data could change it.
  if (region.empty() && more_input) { r.hit_boundary = true; return r; }

  std::uint32_t opts = PCRE2_ANCHORED;
  if (more_input) opts |= PCRE2_PARTIAL_HARD | PCRE2_NOTEOL;

  int rc = pcre2_match(p_->code, reinterpret_cast<PCRE2_SPTR>(region.data()), region.size(),
                       0, opts, p_->md, nullptr);
  if (rc == PCRE2_ERROR_NOMATCH) return r;
  if (rc == PCRE2_ERROR_PARTIAL) { r.hit_boundary = true; return r; }
  if (rc < 0) throw RegexError("regex match failed for \"" + pattern_ + "\": " + pcre2_message(rc), rc, 0);

  const PCRE2_SIZE* ov = pcre2_get_ovector_pointer(p_->md);
  r.matched = true;
  r.end = static_cast<std::size_t>(ov[1]);
  // A complete match touching the edge may still be a prefix of a longer one.
  r.hit_boundary = more_input && r.end == region.size();
  return r;
}

}
