#pragma once
#include <stdexcept>
#include <string>

namespace rs {

// Base of runtime errors raised by the scanner itself.
class ScanError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A character was requested but the source is exhausted.
class EndOfInput : public ScanError {
public:
  EndOfInput() : ScanError("end of input reached") {}
  explicit EndOfInput(const std::string& what) : ScanError(what) {}
};

// Caller configuration error (horizon of 0, scanner capacity of 0).
class PreconditionViolation : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

}
