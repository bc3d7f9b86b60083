#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rs {

struct MatchResult {
  bool matched = false;
  std::size_t end = 0;       // offset one past the match, relative to region start
  bool hit_boundary = false; // extent was limited by the region edge
};

// Anchored matcher over a caller-supplied region.
//
// `more_input` tells the engine that the region may be followed by further
// characters. A result with hit_boundary set must not be treated as final
// while more input is possible: a longer (or any) match may exist.
class Pattern {
public:
  virtual ~Pattern() = default;
  virtual MatchResult match_anchored(std::string_view region, bool more_input) const = 0;
};

class RegexError : public std::runtime_error {
public:
  RegexError(const std::string& what, int code, std::size_t offset)
    : std::runtime_error(what), code_(code), offset_(offset) {}

  int code() const noexcept { return code_; }
  std::size_t offset() const noexcept { return offset_; }

private:
  int code_;
  std::size_t offset_;
};

// PCRE2-backed pattern. Compile options are PCRE2_* compile flags.
// A Regex keeps its own match data and is not safe to share across threads.
class Regex : public Pattern {
public:
  explicit Regex(std::string_view pattern, std::uint32_t options = 0);
  ~Regex() override;

  Regex(const Regex&) = delete;
  Regex& operator=(const Regex&) = delete;
  Regex(Regex&& other) noexcept;
  Regex& operator=(Regex&& other) noexcept;

  MatchResult match_anchored(std::string_view region, bool more_input) const override;
  const std::string& source() const noexcept { return pattern_; }

private:
  struct Impl; Impl* p_;
  std::string pattern_;
};

}
