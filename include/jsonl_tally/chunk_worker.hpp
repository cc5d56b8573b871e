#pragma once
#include "jsonl_tally/chunk_range.hpp"
#include "jsonl_tally/scan_error.hpp"
#include "jsonl_tally/type_tally.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace jt {

// The single message a worker emits per chunk: a whole tally when ok,
// otherwise a fatal error and an empty tally.
struct ChunkOutcome {
  std::size_t index = 0;
  bool ok = false;
  TypeTally tally;
  ScanError error;
  std::uint64_t lines = 0;
  std::uint64_t bytes = 0;
};

class ChunkWorker {
public:
  struct Config {
    std::size_t read_bytes = 512 * 1024;
    bool verbose_errors = false;
  };

  ChunkWorker(std::string path, Config cfg);

  // Reads exactly [range.start, range.end) through its own file handle.
  // Safe to call from several threads at once.
  ChunkOutcome run(std::size_t index, const ChunkRange& range) const;

private:
  std::string path_;
  Config cfg_;
};

}
