#pragma once
#include <cstdint>
#include <limits>

namespace jt {

// Half-open byte range [start, end) of the input file.
struct ChunkRange {
  std::uint64_t start = 0;
  std::uint64_t end   = 0;

  std::uint64_t size() const noexcept { return end - start; }
};

inline constexpr std::uint64_t kToEof = std::numeric_limits<std::uint64_t>::max();

inline bool operator==(const ChunkRange& a, const ChunkRange& b) noexcept {
  return a.start == b.start && a.end == b.end;
}

}
