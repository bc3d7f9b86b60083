#include "readable_scanner/scanner.hpp"
#include "readable_scanner/source.hpp"
#include "readable_scanner/token_reader.hpp"
#include <cmath>
#include <iostream>
#include <string>

static int failures = 0;

static void expect(const std::string& what, bool ok) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static bool near(double a, double b) { return std::fabs(a - b) < 1e-12; }

static void mixed_tokens() {
  // One character per pull with a tiny buffer: every token straddles refills.
  rs::StringSource src("  42 -7 3.25e2 TRUE off  hello\tworld 1e", 1);
  rs::Scanner::Config cfg; cfg.initial_capacity = 2;
  rs::Scanner sc(src, cfg);
  rs::TokenReader tr(sc);

  auto i = tr.next_integer();
  expect("int 42", i && *i == 42);
  i = tr.next_integer();
  expect("int -7", i && *i == -7);
  expect("3.25e2 is not an integer", !tr.next_integer());
  auto d = tr.next_number();
  expect("number 325", d && near(*d, 325.0));
  auto b = tr.next_bool();
  expect("TRUE", b && *b);
  b = tr.next_bool();
  expect("off", b && !*b);
  expect("hello is not a bool", !tr.next_bool());
  expect("hello is not a number", !tr.next_number());
  auto w = tr.next_word();
  expect("hello", w && *w == "hello");
  w = tr.next_word();
  expect("world", w && *w == "world");
  d = tr.next_number();
  expect("1 from trailing 1e", d && near(*d, 1.0));
  w = tr.next_word();
  expect("dangling e", w && *w == "e");
  expect("no more words", !tr.next_word());
  expect("at end", tr.at_end());
}

static void bool_needs_word_boundary() {
  rs::StringSource src("truex 1 0");
  rs::Scanner sc(src);
  rs::TokenReader tr(sc);
  expect("truex is not a bool", !tr.next_bool());
  expect("truex still there", tr.next_word() == std::optional<std::string>("truex"));
  expect("1 is true", tr.next_bool() == std::optional<bool>(true));
  expect("0 is false", tr.next_bool() == std::optional<bool>(false));
}

static void case_sensitive_bools() {
  rs::StringSource src("True true");
  rs::Scanner sc(src);
  rs::TokenPolicy pol;
  pol.bools.case_sensitive = true;
  rs::TokenReader tr(sc, pol);
  expect("True rejected", !tr.next_bool());
  expect("skip True", tr.next_word().has_value());
  expect("true accepted", tr.next_bool() == std::optional<bool>(true));
}

static void lines() {
  rs::StringSource src("first\r\nsecond\n\nlast", 3);
  rs::Scanner::Config cfg; cfg.initial_capacity = 4;
  rs::Scanner sc(src, cfg);
  rs::TokenReader tr(sc);
  expect("first", tr.next_line() == std::optional<std::string>("first"));
  expect("second", tr.next_line() == std::optional<std::string>("second"));
  expect("blank", tr.next_line() == std::optional<std::string>(""));
  expect("last without newline", tr.next_line() == std::optional<std::string>("last"));
  expect("no more lines", !tr.next_line());
}

static void keep_cr() {
  rs::StringSource src("a\r\n");
  rs::Scanner sc(src);
  rs::TokenPolicy pol;
  pol.strip_cr = false;
  rs::TokenReader tr(sc, pol);
  expect("cr kept", tr.next_line() == std::optional<std::string>("a\r"));
}

static void integer_overflow_consumed() {
  rs::StringSource src("99999999999999999999 5");
  rs::Scanner sc(src);
  rs::TokenReader tr(sc);
  expect("overflow", !tr.next_integer());
  expect("next integer after overflow", tr.next_integer() == std::optional<std::int64_t>(5));
}

int main(){
  mixed_tokens();
  bool_needs_word_boundary();
  case_sensitive_bools();
  lines();
  keep_cr();
  integer_overflow_consumed();
  if (failures) { std::cerr << "[FAIL] token reader: " << failures << " failure(s)\n"; return 1; }
  std::cout << "[PASS] token reader\n";
  return 0;
}
