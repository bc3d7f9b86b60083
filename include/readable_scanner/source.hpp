#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <iosfwd>
#include <string>
#include <vector>

namespace rs {

// Incremental character provider.
//
// fill() writes up to `cap` characters into `dst` and returns how many were
// written (possibly 0), or kEndOfInput once no more characters will ever be
// produced. After kEndOfInput every later call returns kEndOfInput too.
// Failures are reported by throwing; the scanner never catches them.
class Source {
public:
  static constexpr std::ptrdiff_t kEndOfInput = -1;

  virtual ~Source() = default;
  virtual std::ptrdiff_t fill(char* dst, std::size_t cap) = 0;
};

// In-memory text. max_chunk > 0 caps the characters handed out per call.
class StringSource : public Source {
public:
  explicit StringSource(std::string text, std::size_t max_chunk = 0);

  std::ptrdiff_t fill(char* dst, std::size_t cap) override;
  std::size_t remaining() const noexcept { return text_.size() - pos_; }

private:
  std::string text_;
  std::size_t pos_{0};
  std::size_t max_chunk_{0};
};

// Hands out pre-arranged chunks one per call, then end-of-input.
// A chunk larger than the free space is continued on the next call.
class ChunkSource : public Source {
public:
  explicit ChunkSource(std::vector<std::string> chunks);

  std::ptrdiff_t fill(char* dst, std::size_t cap) override;
  std::size_t calls() const noexcept { return calls_; }

private:
  std::vector<std::string> chunks_;
  std::size_t idx_{0};
  std::size_t off_{0};
  std::size_t calls_{0};
};

// File read with stdio. Throws std::system_error when the file cannot be
// opened or a read fails.
class FileSource : public Source {
public:
  explicit FileSource(const std::string& path);
  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  std::ptrdiff_t fill(char* dst, std::size_t cap) override;
  std::uint64_t bytes_read() const noexcept { return bytes_; }
  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  std::FILE* f_{nullptr};
  std::uint64_t bytes_{0};
  bool eof_{false};
};

// Adapter over a std::istream owned by the caller.
class StreamSource : public Source {
public:
  explicit StreamSource(std::istream& in) : in_(in) {}

  std::ptrdiff_t fill(char* dst, std::size_t cap) override;

private:
  std::istream& in_;
  bool eof_{false};
};

// POSIX descriptor (pipe, socket, stdin). Closes the descriptor on
// destruction only when `owns` is set.
class FdSource : public Source {
public:
  explicit FdSource(int fd, bool owns = false) : fd_(fd), owns_(owns) {}
  ~FdSource() override;

  FdSource(const FdSource&) = delete;
  FdSource& operator=(const FdSource&) = delete;

  std::ptrdiff_t fill(char* dst, std::size_t cap) override;
  std::uint64_t bytes_read() const noexcept { return bytes_; }

private:
  int fd_;
  bool owns_;
  bool eof_{false};
  std::uint64_t bytes_{0};
};

}
