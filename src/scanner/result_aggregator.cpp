#include "jsonl_tally/result_aggregator.hpp"

namespace jt {

ResultAggregator::ResultAggregator(std::size_t expected_chunks)
  : expected_(expected_chunks) {}

bool ResultAggregator::accept(ChunkOutcome&& outcome) {
  if (failed()) return false;
  ++received_;

  if (!outcome.ok) {
    err_ = outcome.error.kind == ScanError::Kind::None
        ? make_io_error("chunk " + std::to_string(outcome.index) + " failed", 0)
        : std::move(outcome.error);
    final_.clear();
    lines_ = bytes_ = 0;
    return false;
  }

  lines_ += outcome.lines;
  bytes_ += outcome.bytes;
  merge_into(final_, std::move(outcome.tally));
  return true;
}

bool ResultAggregator::collect(HandoffChannel<ChunkOutcome>& channel, TypeTally& out,
                               ScanError* err) {
  while (received_ < expected_) {
    if (!accept(channel.receive())) {
      if (err) *err = err_;
      out.clear();
      return false;
    }
  }
  out = std::move(final_);
  final_.clear();
  return true;
}

}
