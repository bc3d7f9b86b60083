#include "readable_scanner/source.hpp"
#include <cerrno>
#include <system_error>
#include <unistd.h>

namespace rs {

FdSource::~FdSource() { if (owns_ && fd_ >= 0) ::close(fd_); }

std::ptrdiff_t FdSource::fill(char* dst, std::size_t cap) {
  if (eof_) return kEndOfInput;
  if (cap == 0) return 0;
  for (;;) {
    ssize_t n = ::read(fd_, dst, cap);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw std::system_error(errno, std::generic_category(), "read fd " + std::to_string(fd_));
    }
    if (n == 0) { eof_ = true; return kEndOfInput; }
    bytes_ += static_cast<std::uint64_t>(n);
    return static_cast<std::ptrdiff_t>(n);
  }
}

}
