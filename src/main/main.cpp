#include "readable_scanner/run_json.hpp"
#include "readable_scanner/scanner.hpp"
#include "readable_scanner/source.hpp"
#include "readable_scanner/token_reader.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

struct Cli {
  std::size_t capacity = 128;
  std::string mode = "words"; // words|lines|numbers
  std::string scan;           // empty -> stdin
  std::string run_json;
  bool quiet = false;
};

void usage(std::ostream& o) {
  o << "Usage: readable-scan [--capacity=N] [--mode=words|lines|numbers]\n"
       "                     [--scan <file>|--scan=<file>] [--run-json=<file>] [--quiet]\n";
}

// Returns false on a usage error.
bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string cap;
    if (eat("--capacity=", &cap)) {
      try {
        c.capacity = static_cast<std::size_t>(std::stoul(cap));
      } catch (const std::exception&) {
        std::cerr << "[cli] bad --capacity value: " << cap << "\n";
        return false;
      }
      continue;
    }
    if (eat("--mode=", &c.mode)) continue;
    if (eat("--run-json=", &c.run_json)) continue;
    if (eat("--scan=", &c.scan)) continue;
    if (a == "--scan" && i+1 < argc) { c.scan = argv[++i]; continue; }
    if (a == "--quiet") { c.quiet = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    std::cerr << "[cli] unknown argument: " << a << "\n";
    return false;
  }
  if (c.mode != "words" && c.mode != "lines" && c.mode != "numbers") {
    std::cerr << "[cli] unknown mode: " << c.mode << "\n";
    return false;
  }
  if (c.capacity == 0) {
    std::cerr << "[cli] --capacity must be at least 1\n";
    return false;
  }
  return true;
}

struct Counts {
  std::uint64_t tokens = 0;
  std::uint64_t rejects = 0;
};

Counts tokenize(rs::TokenReader& tr, const std::string& mode) {
  Counts n;
  if (mode == "lines") {
    while (auto line = tr.next_line()) { std::cout << *line << "\n"; ++n.tokens; }
    return n;
  }
  if (mode == "numbers") {
    for (;;) {
      if (auto x = tr.next_number()) { std::cout << *x << "\n"; ++n.tokens; continue; }
      // not numeric: drop the word and keep going
      if (!tr.next_word()) break;
      ++n.rejects;
    }
    return n;
  }
  while (auto w = tr.next_word()) { std::cout << *w << "\n"; ++n.tokens; }
  return n;
}

}

int main(int argc, char** argv) {
  Cli cli;
  if (!parse_cli(argc, argv, cli)) { usage(std::cerr); return 2; }

  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  std::unique_ptr<rs::Source> src;
  try {
    if (cli.scan.empty() || cli.scan == "-") src.reset(new rs::FdSource(0));
    else src.reset(new rs::FileSource(cli.scan));
  } catch (const std::exception& e) {
    std::cerr << "[scan] cannot open input: " << e.what() << "\n";
    return 2;
  }

  rs::Scanner::Config scfg;
  scfg.initial_capacity = cli.capacity;
  rs::Scanner scanner(*src, scfg);
  rs::TokenReader reader(scanner);

  Counts counts;
  try {
    counts = tokenize(reader, cli.mode);
  } catch (const std::exception& e) {
    std::cerr << "[scan] error: " << e.what() << "\n";
    return 2;
  }
  std::cout.flush();

  const auto t1 = ch::steady_clock::now();
  const double wall_ms = ch::duration<double, std::milli>(t1 - t0).count();
  const double sec = wall_ms / 1000.0;
  const rs::ScanStats& st = scanner.stats();
  const std::string input = cli.scan.empty() ? "-" : cli.scan;

  if (!cli.quiet) {
    std::cerr << "[scan] ok: " << input << " mode=" << cli.mode
              << " tokens=" << counts.tokens << " rejects=" << counts.rejects
              << " chars=" << st.chars_pulled << " pulls=" << st.pulls
              << " capacity=" << cli.capacity << "->" << scanner.capacity() << "\n";
  }

  if (!cli.run_json.empty()) {
    rs::RunJsonPayload p{};
    p.mode = cli.mode;
    p.tokens = counts.tokens;
    p.rejects = counts.rejects;
    p.chars = st.chars_pulled;
    p.pulls = st.pulls;
    p.grows = st.grows;
    p.compactions = st.compactions;
    p.refills = st.refills;
    p.high_water = st.high_water;
    p.initial_capacity = cli.capacity;
    p.final_capacity = scanner.capacity();
    p.wall_time_ms = wall_ms;
    p.throughput_mb_s = sec > 0.0 ? (st.chars_pulled / (1024.0 * 1024.0)) / sec : 0.0;
    p.tokens_per_sec = sec > 0.0 ? counts.tokens / sec : 0.0;
    p.input = input;

    std::string err;
    if (!rs::RunJsonWriter::write_file(cli.run_json, rs::RunJsonWriter::to_json(p), &err)) {
      std::cerr << "[scan] run json write failed: " << err << "\n";
      return 3;
    }
    if (!cli.quiet) std::cerr << "[scan] wrote " << cli.run_json << "\n";
  }
  return 0;
}
