#include "readable_scanner/pattern.hpp"
#include "readable_scanner/scanner.hpp"
#include "readable_scanner/source.hpp"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

static int failures = 0;

static void expect(const std::string& what, bool ok) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

// Drains a source through a scanner one pattern read at a time.
static std::string drain(rs::Source& src, std::size_t cap) {
  rs::Scanner::Config cfg; cfg.initial_capacity = cap;
  rs::Scanner sc(src, cfg);
  rs::Regex any("(?s).{1,7}");
  std::string out;
  while (!sc.at_end()) out += sc.read(any);
  return out;
}

static std::string sample_text() {
  std::string s;
  for (int i = 0; i < 200; ++i) s += "line " + std::to_string(i) + "\n";
  return s;
}

static void string_source_sticky_eof() {
  rs::StringSource src("abc", 2);
  char buf[8];
  expect("first chunk", src.fill(buf, 8) == 2);
  expect("second chunk", src.fill(buf, 8) == 1);
  expect("eof", src.fill(buf, 8) == rs::Source::kEndOfInput);
  expect("eof stays", src.fill(buf, 8) == rs::Source::kEndOfInput);
}

static void chunk_source_splits_large_chunks() {
  rs::ChunkSource src({"abcdef", "", "g"});
  expect("chunked content", drain(src, 2) == "abcdefg");
}

static void file_source() {
  const fs::path p = fs::temp_directory_path() / ("rs_file_source_" + std::to_string(::getpid()) + ".txt");
  const std::string text = sample_text();
  { std::ofstream out(p, std::ios::binary); out << text; }
  {
    rs::FileSource src(p.string());
    expect("file content", drain(src, 16) == text);
    expect("file bytes", src.bytes_read() == text.size());
  }
  fs::remove(p);

  bool threw = false;
  try {
    rs::FileSource missing((fs::temp_directory_path() / "rs_definitely_missing.txt").string());
  } catch (const std::system_error& e) {
    threw = e.code().value() == ENOENT;
  }
  expect("missing file throws ENOENT", threw);
}

static void stream_source() {
  const std::string text = sample_text();
  std::istringstream in(text);
  rs::StreamSource src(in);
  expect("stream content", drain(src, 5) == text);
}

// A failed extraction leaves failbit without eofbit; fill must not report 0 forever.
static void stream_source_failed_state() {
  std::istringstream in("abc");
  int x = 0;
  in >> x;
  rs::StreamSource src(in);
  char buf[4];
  bool threw = false;
  try {
    (void)src.fill(buf, sizeof buf);
  } catch (const std::system_error& e) {
    threw = e.code() == std::make_error_code(std::io_errc::stream);
  }
  expect("failbit stream throws io_errc::stream", threw);

  rs::Scanner sc(src);
  threw = false;
  try {
    (void)sc.at_end();
  } catch (const std::system_error&) {
    threw = true;
  }
  expect("scanner over failed stream throws", threw);
}

static void fd_source_pipe() {
  int fds[2];
  if (::pipe(fds) != 0) { expect("pipe()", false); return; }
  const std::string text = "over a pipe\nsecond line\n";
  ssize_t w = ::write(fds[1], text.data(), text.size());
  ::close(fds[1]);
  expect("pipe write", w == static_cast<ssize_t>(text.size()));
  rs::FdSource src(fds[0], true);
  expect("pipe content", drain(src, 3) == text);
  expect("pipe bytes", src.bytes_read() == text.size());
}

int main(){
  string_source_sticky_eof();
  chunk_source_splits_large_chunks();
  file_source();
  stream_source();
  stream_source_failed_state();
  fd_source_pipe();
  if (failures) { std::cerr << "[FAIL] sources: " << failures << " failure(s)\n"; return 1; }
  std::cout << "[PASS] sources\n";
  return 0;
}
