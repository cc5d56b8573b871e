#pragma once
#include "jsonl_tally/chunk_worker.hpp"
#include "jsonl_tally/handoff_channel.hpp"
#include "jsonl_tally/scan_error.hpp"
#include "jsonl_tally/type_tally.hpp"

#include <cstddef>
#include <cstdint>

namespace jt {

// Single consumer of chunk outcomes. Owns the final tally.
class ResultAggregator {
public:
  explicit ResultAggregator(std::size_t expected_chunks);

  // Merges one outcome. On a failed outcome, drops everything merged so far
  // and returns false.
  bool accept(ChunkOutcome&& outcome);

  // Receives until every expected chunk arrived or one failed.
  bool collect(HandoffChannel<ChunkOutcome>& channel, TypeTally& out,
               ScanError* err = nullptr);

  std::size_t received() const noexcept { return received_; }
  bool failed() const noexcept { return static_cast<bool>(err_); }
  const ScanError& error() const noexcept { return err_; }
  const TypeTally& tally() const noexcept { return final_; }
  std::uint64_t lines() const noexcept { return lines_; }
  std::uint64_t bytes() const noexcept { return bytes_; }

private:
  std::size_t expected_;
  std::size_t received_{0};
  TypeTally final_;
  ScanError err_;
  std::uint64_t lines_{0};
  std::uint64_t bytes_{0};
};

}
