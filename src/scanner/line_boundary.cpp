#include "jsonl_tally/line_boundary.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/types.h>
#include <vector>

namespace jt {

struct LineBoundaryOracle::Impl {
  std::string path;
  Config cfg;
  FILE* f{nullptr};
  int last_errno{0};
  std::uint64_t scanned{0};
  std::vector<char> window;

  ~Impl() { if (f) std::fclose(f); }

  bool ensure_open() {
    if (f) return true;
    f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; return false; }
    window.resize(cfg.window_bytes > 0 ? cfg.window_bytes : 1);
    return true;
  }

  bool next_boundary(std::uint64_t offset, std::uint64_t& out) {
    if (!ensure_open()) return false;
    if (::fseeko(f, static_cast<off_t>(offset), SEEK_SET) != 0) {
      last_errno = errno; return false;
    }

    std::uint64_t pos = offset;
    while (true) {
      std::size_t n = std::fread(window.data(), 1, window.size(), f);
      if (n == 0) {
        if (std::ferror(f)) { last_errno = errno ? errno : EIO; std::clearerr(f); return false; }
        std::clearerr(f);
        out = pos;  // no terminator before EOF
        return true;
      }
      scanned += n;
      const void* hit = std::memchr(window.data(), '\n', n);
      if (hit) {
        out = pos + static_cast<std::uint64_t>(static_cast<const char*>(hit) - window.data()) + 1;
        return true;
      }
      pos += n;
    }
  }
};

LineBoundaryOracle::LineBoundaryOracle(std::string path)
  : LineBoundaryOracle(std::move(path), Config{}) {}

LineBoundaryOracle::LineBoundaryOracle(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

LineBoundaryOracle::~LineBoundaryOracle() { delete p_; }

bool LineBoundaryOracle::next_boundary(std::uint64_t offset, std::uint64_t& out) {
  return p_->next_boundary(offset, out);
}
int LineBoundaryOracle::last_error() const noexcept { return p_->last_errno; }
std::uint64_t LineBoundaryOracle::bytes_scanned() const noexcept { return p_->scanned; }

}
