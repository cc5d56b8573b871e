#pragma once
#include "jsonl_tally/chunk_range.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace jt {

// Streams '\n'-terminated lines of a byte range through a callback.
// Lines are handed out without their terminator; a non-empty tail after the
// last '\n' is handed out as a final line.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes = 512 * 1024;      // 512 KiB read block
  };

  explicit ChunkReader(std::string path);                        // whole file
  ChunkReader(std::string path, Config cfg);                     // whole file
  ChunkReader(std::string path, ChunkRange range, Config cfg);   // [start, end)

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;
  ~ChunkReader();

  // Return false from the callback to stop early.
  using LineCallback = std::function<bool(std::string_view)>;

  // False on I/O failure (see last_error) or when the callback stopped.
  bool for_each_line(const LineCallback& cb);

  int  last_error() const noexcept;
  bool stopped() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t lines() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
