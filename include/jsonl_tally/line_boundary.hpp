#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace jt {

// Finds line boundaries with small bounded reads, so planning stays cheap on
// huge files.
class LineBoundaryOracle {
public:
  struct Config {
    std::size_t window_bytes = 4096;
  };

  explicit LineBoundaryOracle(std::string path);
  LineBoundaryOracle(std::string path, Config cfg);

  LineBoundaryOracle(const LineBoundaryOracle&) = delete;
  LineBoundaryOracle& operator=(const LineBoundaryOracle&) = delete;
  ~LineBoundaryOracle();

  // `out` = offset just past the first '\n' at or after `offset`, or the end
  // of file when there is none. Returns false on I/O failure.
  bool next_boundary(std::uint64_t offset, std::uint64_t& out);

  int last_error() const noexcept;
  std::uint64_t bytes_scanned() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
