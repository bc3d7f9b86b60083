#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rs {

class Scanner;

struct BoolPolicy {
  std::vector<std::string> true_tokens  = {"true","1","yes","on"};
  std::vector<std::string> false_tokens = {"false","0","no","off"};
  bool case_sensitive = false;
};

struct TokenPolicy {
  bool       strip_cr = true;   // trim trailing '\r' from lines (CRLF)
  BoolPolicy bools;
};

// Typed tokens on top of a Scanner. Every typed call skips leading space
// first. A call that returns std::nullopt leaves the token in place, except
// where noted.
class TokenReader {
public:
  explicit TokenReader(Scanner& sc);               // uses default TokenPolicy{}
  TokenReader(Scanner& sc, TokenPolicy policy);
  ~TokenReader();

  TokenReader(const TokenReader&) = delete;
  TokenReader& operator=(const TokenReader&) = delete;

  void skip_space();
  std::optional<std::string> next_word();
  // Rest of the current line; does not skip leading space.
  std::optional<std::string> next_line();
  std::optional<double> next_number();
  // An integer that does not fit int64 is consumed and reported as nullopt.
  std::optional<std::int64_t> next_integer();
  std::optional<bool> next_bool();

  bool at_end();

private:
  struct Impl; Impl* p_;
};

}
