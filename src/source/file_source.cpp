#include "readable_scanner/source.hpp"
#include <cerrno>
#include <cstdio>
#include <system_error>

namespace rs {

FileSource::FileSource(const std::string& path) : path_(path) {
  f_ = std::fopen(path_.c_str(), "rb");
  if (!f_) throw std::system_error(errno, std::generic_category(), "open " + path_);
}

FileSource::~FileSource() { if (f_) std::fclose(f_); }

std::ptrdiff_t FileSource::fill(char* dst, std::size_t cap) {
  if (eof_) return kEndOfInput;
  std::size_t n = std::fread(dst, 1, cap, f_);
  if (n == 0 && std::ferror(f_)) {
    int err = errno;
    std::clearerr(f_);
    throw std::system_error(err, std::generic_category(), "read " + path_);
  }
  if (n == 0 && cap > 0 && std::feof(f_)) { eof_ = true; return kEndOfInput; }
  bytes_ += n;
  return static_cast<std::ptrdiff_t>(n);
}

}
