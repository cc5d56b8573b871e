#include "jsonl_tally/scan_error.hpp"
#include <cstring>

namespace jt {

const char* kind_name(ScanError::Kind k) noexcept {
  switch (k) {
    case ScanError::Kind::None:     return "none";
    case ScanError::Kind::Io:       return "io";
    case ScanError::Kind::Encoding: return "encoding";
    case ScanError::Kind::Config:   return "config";
  }
  return "unknown";
}

ScanError make_io_error(std::string what, int err) {
  ScanError e;
  e.kind = ScanError::Kind::Io;
  e.sys_errno = err;
  e.message = std::move(what);
  if (err != 0) { e.message += ": "; e.message += std::strerror(err); }
  return e;
}

ScanError make_encoding_error(std::string what) {
  ScanError e;
  e.kind = ScanError::Kind::Encoding;
  e.message = std::move(what);
  return e;
}

ScanError make_config_error(std::string what) {
  ScanError e;
  e.kind = ScanError::Kind::Config;
  e.message = std::move(what);
  return e;
}

std::string describe(const ScanError& e) {
  return std::string(kind_name(e.kind)) + ": " + e.message;
}

}
