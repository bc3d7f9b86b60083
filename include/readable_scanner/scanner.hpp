#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace rs {

class Pattern;
class Source;

struct ScanStats {
  std::uint64_t pulls = 0;        // calls into the source
  std::uint64_t chars_pulled = 0;
  std::uint64_t grows = 0;        // buffer doublings (read, horizon fit)
  std::uint64_t compactions = 0;  // in-place shifts (read, read_repeatedly)
  std::uint64_t refills = 0;      // buffer clears (skip)
  std::size_t   high_water = 0;   // largest unconsumed span held
};

// Buffered, pattern-driven reader over an incremental Source.
//
// All matches are anchored at the cursor. Consumed characters are never
// observed again. Not thread-safe; calls must not be nested.
class Scanner {
public:
  struct Config {
    std::size_t initial_capacity = 128; // characters; doubled on demand
  };

  explicit Scanner(Source& src);       // uses default Config{}
  Scanner(Source& src, Config cfg);    // throws PreconditionViolation on capacity 0
  ~Scanner();

  Scanner(const Scanner&) = delete;
  Scanner& operator=(const Scanner&) = delete;

  // Longest match at the cursor, pulling and growing the buffer until the
  // match no longer touches the data boundary or input is exhausted.
  // Empty when the pattern matches nothing (or only the empty string).
  std::string read(const Pattern& p);

  // Applies `p` over and over, each time with at least `horizon` characters
  // buffered (fewer only at end of input), and returns everything matched.
  // The buffer is doubled first if it cannot hold `horizon` characters.
  // Throws PreconditionViolation when horizon is 0.
  std::string read_repeatedly(const Pattern& p, std::size_t horizon);

  // Discards input for as long as `p` keeps matching non-empty text.
  void skip(const Pattern& p);

  char peek();   // throws EndOfInput
  char next();   // throws EndOfInput
  bool at_end();

  std::size_t capacity() const noexcept;
  std::size_t buffered() const noexcept;  // unconsumed characters held
  bool exhausted() const noexcept;
  const ScanStats& stats() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
