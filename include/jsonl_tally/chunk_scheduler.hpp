#pragma once
#include "jsonl_tally/chunk_worker.hpp"
#include "jsonl_tally/scan_error.hpp"
#include "jsonl_tally/type_tally.hpp"

#include <cstddef>
#include <functional>

namespace jt {

class ScanStats;

// Produces the outcome of one chunk. Called concurrently from worker threads.
using ChunkJob = std::function<ChunkOutcome(std::size_t index)>;

// Runs `job` for chunk indices [0, chunks) on up to `max_threads` threads
// (0 -> hardware concurrency) and merges the outcomes on the calling thread.
// Stops handing out chunks at the first failure; an exception escaping `job`
// counts as a failed chunk. Every thread is joined before returning, and on
// failure `out` is empty.
bool run_chunks(std::size_t chunks, unsigned max_threads, const ChunkJob& job,
                TypeTally& out, ScanError* err = nullptr, ScanStats* stats = nullptr);

}
