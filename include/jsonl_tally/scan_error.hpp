#pragma once
#include <string>

namespace jt {

struct ScanError {
  // Io: open/seek/read failure. Encoding: invalid UTF-8.
  // Config: rejected before any chunk is scheduled.
  enum class Kind { None, Io, Encoding, Config };

  Kind kind = Kind::None;
  std::string message;
  int sys_errno = 0;

  explicit operator bool() const noexcept { return kind != Kind::None; }
};

const char* kind_name(ScanError::Kind k) noexcept;

ScanError make_io_error(std::string what, int err);
ScanError make_encoding_error(std::string what);
ScanError make_config_error(std::string what);

// "<kind>: <message>" for logs.
std::string describe(const ScanError& e);

}
