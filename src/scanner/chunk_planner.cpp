#include "jsonl_tally/chunk_planner.hpp"
#include "jsonl_tally/line_boundary.hpp"

#include <string>

namespace jt {

bool ChunkPlanner::plan(std::uint64_t file_size, std::int64_t chunk_size,
                        std::vector<ChunkRange>& out, ScanError* err) {
  out.clear();
  if (chunk_size <= 0) {
    if (err) *err = make_config_error("chunk size must be positive, got " + std::to_string(chunk_size));
    return false;
  }
  if (file_size == 0) return true;

  const auto step = static_cast<std::uint64_t>(chunk_size);
  std::uint64_t prev = 0;

  for (std::uint64_t nominal = step; nominal < file_size; nominal += step) {
    // already swallowed by a line that ran past this nominal boundary
    if (nominal <= prev) continue;

    // Search from the byte before the nominal boundary, so a boundary that
    // already sits right after a '\n' is kept as is.
    std::uint64_t snapped = 0;
    if (!oracle_.next_boundary(nominal - 1, snapped)) {
      if (err) *err = make_io_error("locating line boundary at offset " + std::to_string(nominal),
                                    oracle_.last_error());
      out.clear();
      return false;
    }
    if (snapped >= file_size) break;
    out.push_back(ChunkRange{prev, snapped});
    prev = snapped;
  }

  out.push_back(ChunkRange{prev, file_size});
  return true;
}

}
