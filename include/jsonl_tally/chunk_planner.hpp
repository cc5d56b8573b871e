#pragma once
#include "jsonl_tally/chunk_range.hpp"
#include "jsonl_tally/scan_error.hpp"

#include <cstdint>
#include <vector>

namespace jt {

class LineBoundaryOracle;

class ChunkPlanner {
public:
  explicit ChunkPlanner(LineBoundaryOracle& oracle) : oracle_(oracle) {}

  // Splits [0, file_size) into contiguous line-aligned ranges of roughly
  // chunk_size bytes. chunk_size <= 0 is a configuration error.
  bool plan(std::uint64_t file_size, std::int64_t chunk_size,
            std::vector<ChunkRange>& out, ScanError* err = nullptr);

private:
  LineBoundaryOracle& oracle_;
};

}
