#pragma once
#include "jsonl_tally/scan_error.hpp"
#include "jsonl_tally/type_tally.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace jt {

class NaiveScanner {
public:
  struct Config {
    std::size_t read_bytes = 512 * 1024;
    bool verbose_errors = false;
  };

  NaiveScanner() = default;
  explicit NaiveScanner(Config cfg) : cfg_(cfg) {}

  // One pass over the whole file on the calling thread.
  bool run(const std::string& path, TypeTally& out, ScanError* err = nullptr);

  std::uint64_t lines() const noexcept { return lines_; }
  std::uint64_t bytes_read() const noexcept { return bytes_; }

private:
  Config cfg_;
  std::uint64_t lines_{0};
  std::uint64_t bytes_{0};
};

}
