#include "readable_scanner/run_json.hpp"
#include <cmath> // std::isfinite
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace rs {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:   o << c;      break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"mode\":"; esc(o, p.mode); o << ",";
  o << "\"tokens\":" << p.tokens << ",";
  o << "\"rejects\":" << p.rejects << ",";

  o << "\"scanner\":{"
    << "\"chars\":"            << p.chars            << ","
    << "\"pulls\":"            << p.pulls            << ","
    << "\"grows\":"            << p.grows            << ","
    << "\"compactions\":"      << p.compactions      << ","
    << "\"refills\":"          << p.refills          << ","
    << "\"high_water\":"       << p.high_water       << ","
    << "\"initial_capacity\":" << p.initial_capacity << ","
    << "\"final_capacity\":"   << p.final_capacity
    << "},";

  o << "\"wall_time_ms\":"    << safe_num(p.wall_time_ms)    << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"tokens_per_sec\":"  << safe_num(p.tokens_per_sec)  << ",";

  o << "\"input\":"; esc(o, p.input);
  o << "}";
  return o.str();
}

bool RunJsonWriter::write_file(const std::string& path, const std::string& json,
                               std::string* err_out) {
  const std::filesystem::path out(path);
  std::error_code ec;
  if (!out.parent_path().empty()) std::filesystem::create_directories(out.parent_path(), ec);
  if (ec) {
    if (err_out) *err_out = "create " + out.parent_path().string() + ": " + ec.message();
    return false;
  }
  std::ofstream f(out, std::ios::binary);
  if (!f) {
    if (err_out) *err_out = "failed to open " + path;
    return false;
  }
  f.write(json.data(), static_cast<std::streamsize>(json.size()));
  f << "\n";
  if (!f) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  return true;
}

}
