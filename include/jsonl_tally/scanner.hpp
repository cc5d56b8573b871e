#pragma once
#include "jsonl_tally/scan_error.hpp"
#include "jsonl_tally/type_tally.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace jt {

class ScanStats;

inline constexpr std::int64_t kDefaultChunkSize = 1'000'000;

struct ScanStrategy {
  enum class Mode { Naive, Chunked };

  Mode mode = Mode::Naive;
  std::int64_t chunk_size = kDefaultChunkSize;  // Chunked only; must be > 0
  unsigned max_threads = 0;                     // 0 -> hardware concurrency
  std::size_t read_bytes = 512 * 1024;
  bool verbose_errors = false;

  static ScanStrategy naive() { return ScanStrategy{}; }
  static ScanStrategy chunked(std::int64_t chunk_size = kDefaultChunkSize) {
    ScanStrategy s;
    s.mode = Mode::Chunked;
    s.chunk_size = chunk_size;
    return s;
  }
};

const char* mode_name(ScanStrategy::Mode m) noexcept;

// Tallies the file at `path`. On failure `out` is left empty and `err`, when
// given, says why. Chunked and naive results are identical for any input.
bool scan(const std::string& path, const ScanStrategy& strategy,
          TypeTally& out, ScanError* err = nullptr, ScanStats* stats = nullptr);

// Chunked strategy only.
bool scan_chunked(const std::string& path, const ScanStrategy& strategy,
                  TypeTally& out, ScanError* err = nullptr, ScanStats* stats = nullptr);

}
