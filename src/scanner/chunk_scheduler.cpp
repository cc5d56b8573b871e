#include "jsonl_tally/chunk_scheduler.hpp"
#include "jsonl_tally/handoff_channel.hpp"
#include "jsonl_tally/result_aggregator.hpp"
#include "jsonl_tally/scan_stats.hpp"

#include <atomic>
#include <exception>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace jt {

static unsigned thread_budget(unsigned requested, std::size_t chunks) {
  unsigned n = requested ? requested : std::thread::hardware_concurrency();
  if (n == 0) n = 1;
  if (chunks < n) n = static_cast<unsigned>(chunks);
  return n;
}

namespace {

// Cancels and joins whatever was started, on every exit path.
struct WorkerGroup {
  std::atomic<bool>& cancel;
  std::vector<std::thread> threads;

  ~WorkerGroup() {
    cancel.store(true, std::memory_order_relaxed);
    for (auto& th : threads)
      if (th.joinable()) th.join();
  }
};

}

bool run_chunks(std::size_t chunks, unsigned max_threads, const ChunkJob& job,
                TypeTally& out, ScanError* err, ScanStats* stats) {
  out.clear();
  if (chunks == 0) return true;

  HandoffChannel<ChunkOutcome> channel;
  std::atomic<std::size_t> next{0};
  std::atomic<bool> cancel{false};

  auto body = [&] {
    while (!cancel.load(std::memory_order_relaxed)) {
      const std::size_t idx = next.fetch_add(1, std::memory_order_relaxed);
      if (idx >= chunks) break;
      ChunkOutcome outcome;
      try {
        outcome = job(idx);
      } catch (const std::exception& e) {
        outcome = ChunkOutcome{};
        outcome.index = idx;
        outcome.error = make_io_error("chunk " + std::to_string(idx) + " aborted: " + e.what(), 0);
      }
      channel.send(std::move(outcome));
    }
  };

  const unsigned wanted = thread_budget(max_threads, chunks);
  ResultAggregator aggregator(chunks);
  bool ok;
  {
    WorkerGroup group{cancel, {}};
    group.threads.reserve(wanted);
    try {
      for (unsigned i = 0; i < wanted; ++i) group.threads.emplace_back(body);
    } catch (const std::system_error& e) {
      if (group.threads.empty()) {
        if (err) *err = make_io_error(std::string("starting worker thread: ") + e.what(),
                                      e.code().value());
        return false;
      }
      std::cerr << "[scan] started " << group.threads.size() << " of " << wanted
                << " worker threads: " << e.what() << "\n";
    }
    if (stats) stats->set_threads(group.threads.size());

    ok = aggregator.collect(channel, out, err);
  }

  if (stats && ok) {
    stats->add_lines(aggregator.lines());
    stats->add_bytes(aggregator.bytes());
  }
  return ok;
}

}
