#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jt {

struct StageTiming {
  std::string name;
  std::uint64_t duration_us = 0;
};

struct ScanSummary {
  std::uint64_t lines = 0;
  std::uint64_t bytes = 0;
  std::uint64_t chunks = 0;
  std::uint64_t threads = 0;
  double wall_time_us = 0.0;
  double throughput_mb_s = 0.0;
  std::vector<StageTiming> stages;  // in first-start order
};

// Counters and stage timings for one scan. Touched only by the thread that
// drives the scan.
class ScanStats {
public:
  void add_lines(std::uint64_t n) noexcept { lines_ += n; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void set_chunks(std::uint64_t n) noexcept { chunks_ = n; }
  void set_threads(std::uint64_t n) noexcept { threads_ = n; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  ScanSummary snapshot(double wall_us) const;

private:
  std::uint64_t lines_{0};
  std::uint64_t bytes_{0};
  std::uint64_t chunks_{0};
  std::uint64_t threads_{0};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_us_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

// Starts a stage on construction and ends it on destruction. Null stats is a no-op.
class StageTimer {
public:
  StageTimer(ScanStats* stats, std::string_view name);
  ~StageTimer();
  StageTimer(const StageTimer&) = delete;
  StageTimer& operator=(const StageTimer&) = delete;

private:
  ScanStats* stats_;
  std::string name_;
};

}
