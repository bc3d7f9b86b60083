#include "readable_scanner/token_reader.hpp"
#include "readable_scanner/pattern.hpp"
#include "readable_scanner/scanner.hpp"

#include <charconv>
#include <cctype>
#include <string_view>
#include <system_error>
#include <utility>
#include <fast_float/fast_float.h>

namespace rs {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

// [(?i)](?:\Qtok\E|...) followed by a non-word character or end of input.
static std::string bool_pattern(const BoolPolicy& bp) {
  std::string alt;
  auto add = [&](const std::string& t) {
    if (t.empty()) return;
    if (!alt.empty()) alt += '|';
    alt += "\\Q" + t + "\\E";
  };
  for (const auto& t : bp.true_tokens)  add(t);
  for (const auto& t : bp.false_tokens) add(t);
  if (alt.empty()) alt = "(*FAIL)";
  return std::string(bp.case_sensitive ? "" : "(?i)") + "(?:" + alt + ")(?![A-Za-z0-9_])";
}

static std::string_view drop_plus(std::string_view s) {
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  return s;
}

struct TokenReader::Impl {
  Scanner& sc;
  TokenPolicy policy;
  Regex space{"[ \\t\\r\\n\\f\\v]+"};
  Regex word{"[^ \\t\\r\\n\\f\\v]+"};
  Regex line{"[^\\n]*\\n?"};
  Regex number{"[+-]?(?:[0-9]+(?:\\.[0-9]*)?|\\.[0-9]+)(?:[eE][+-]?[0-9]+)?"};
  Regex integer{"[+-]?[0-9]+(?![.0-9eE])"};
  Regex boolean;

  Impl(Scanner& s, TokenPolicy p)
    : sc(s), policy(std::move(p)),
      boolean(bool_pattern(policy.bools)) {}

  bool is_true(std::string_view tok) const {
    for (const auto& t : policy.bools.true_tokens) {
      if (policy.bools.case_sensitive ? (tok == t) : ieq(tok, t)) return true;
    }
    return false;
  }
};

TokenReader::TokenReader(Scanner& sc) : TokenReader(sc, TokenPolicy{}) {}

TokenReader::TokenReader(Scanner& sc, TokenPolicy policy)
  : p_(new Impl(sc, std::move(policy))) {}

TokenReader::~TokenReader() { delete p_; }

void TokenReader::skip_space() { p_->sc.skip(p_->space); }

bool TokenReader::at_end() { return p_->sc.at_end(); }

std::optional<std::string> TokenReader::next_word() {
  skip_space();
  std::string w = p_->sc.read(p_->word);
  if (w.empty()) return std::nullopt;
  return w;
}

std::optional<std::string> TokenReader::next_line() {
  if (p_->sc.at_end()) return std::nullopt;
  std::string s = p_->sc.read(p_->line);
  if (!s.empty() && s.back() == '\n') s.pop_back();
  if (p_->policy.strip_cr && !s.empty() && s.back() == '\r') s.pop_back();
  return s;
}

std::optional<double> TokenReader::next_number() {
  skip_space();
  std::string lex = p_->sc.read(p_->number);
  if (lex.empty()) return std::nullopt;
  std::string_view s = drop_plus(lex);
  double out;
  auto res = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (res.ec != std::errc() || res.ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<std::int64_t> TokenReader::next_integer() {
  skip_space();
  std::string lex = p_->sc.read(p_->integer);
  if (lex.empty()) return std::nullopt;
  std::string_view s = drop_plus(lex);
  std::int64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<bool> TokenReader::next_bool() {
  skip_space();
  std::string tok = p_->sc.read(p_->boolean);
  if (tok.empty()) return std::nullopt;
  return p_->is_true(tok);
}

}
