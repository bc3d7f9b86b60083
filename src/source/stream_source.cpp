#include "readable_scanner/source.hpp"
#include <istream>
#include <system_error>

namespace rs {

std::ptrdiff_t StreamSource::fill(char* dst, std::size_t cap) {
  if (eof_) return kEndOfInput;
  if (cap == 0) return 0;
  if (in_.bad()) throw std::system_error(std::make_error_code(std::io_errc::stream), "stream source");

  // Take what is already buffered first so interactive streams don't stall.
  std::streamsize n = in_.rdbuf()->in_avail() > 0
      ? in_.readsome(dst, static_cast<std::streamsize>(cap))
      : 0;
  if (n == 0) {
    in_.read(dst, 1);
    n = in_.gcount();
  }
  if (in_.bad()) throw std::system_error(std::make_error_code(std::io_errc::stream), "stream source");
  if (n == 0 && in_.eof()) { eof_ = true; return kEndOfInput; }
  // failbit alone: the stream will never yield again.
  if (n == 0 && in_.fail()) throw std::system_error(std::make_error_code(std::io_errc::stream), "stream source");
  return static_cast<std::ptrdiff_t>(n);
}

}
