#include "jsonl_tally/scanner.hpp"
#include "jsonl_tally/chunk_planner.hpp"
#include "jsonl_tally/chunk_scheduler.hpp"
#include "jsonl_tally/chunk_worker.hpp"
#include "jsonl_tally/line_boundary.hpp"
#include "jsonl_tally/naive_scanner.hpp"
#include "jsonl_tally/scan_stats.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

namespace jt {

const char* mode_name(ScanStrategy::Mode m) noexcept {
  return m == ScanStrategy::Mode::Chunked ? "chunked" : "naive";
}

bool scan_chunked(const std::string& path, const ScanStrategy& strategy,
                  TypeTally& out, ScanError* err, ScanStats* stats) {
  out.clear();
  if (strategy.chunk_size <= 0) {
    if (err) *err = make_config_error("chunk size must be positive, got " +
                                      std::to_string(strategy.chunk_size));
    return false;
  }

  std::error_code ec;
  const std::uint64_t file_size = std::filesystem::file_size(path, ec);
  if (ec) {
    if (err) *err = make_io_error("stat " + path, ec.value());
    return false;
  }

  std::vector<ChunkRange> ranges;
  {
    StageTimer t(stats, "plan");
    LineBoundaryOracle oracle(path);
    ChunkPlanner planner(oracle);
    if (!planner.plan(file_size, strategy.chunk_size, ranges, err)) return false;
  }
  if (stats) stats->set_chunks(ranges.size());
  if (ranges.empty()) return true;

  ChunkWorker::Config wcfg;
  wcfg.read_bytes = strategy.read_bytes;
  wcfg.verbose_errors = strategy.verbose_errors;
  const ChunkWorker worker(path, wcfg);

  StageTimer t(stats, "scan");
  return run_chunks(ranges.size(), strategy.max_threads,
                    [&](std::size_t idx) { return worker.run(idx, ranges[idx]); },
                    out, err, stats);
}

bool scan(const std::string& path, const ScanStrategy& strategy,
          TypeTally& out, ScanError* err, ScanStats* stats) {
  if (strategy.mode == ScanStrategy::Mode::Chunked)
    return scan_chunked(path, strategy, out, err, stats);

  NaiveScanner::Config ncfg;
  ncfg.read_bytes = strategy.read_bytes;
  ncfg.verbose_errors = strategy.verbose_errors;
  NaiveScanner naive(ncfg);

  StageTimer t(stats, "scan");
  const bool ok = naive.run(path, out, err);
  if (stats) {
    stats->set_chunks(1);
    stats->set_threads(1);
    if (ok) {
      stats->add_lines(naive.lines());
      stats->add_bytes(naive.bytes_read());
    }
  }
  return ok;
}

}
