#include "jsonl_tally/scan_stats.hpp"
#include <algorithm>
#include <chrono>

namespace jt {

void ScanStats::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (std::find(stage_order_.begin(), stage_order_.end(), key) == stage_order_.end())
    stage_order_.push_back(key);
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void ScanStats::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_us_[key] += static_cast<std::uint64_t>(us);
  stage_starts_.erase(it);
}

ScanSummary ScanStats::snapshot(double wall_us) const {
  ScanSummary s;
  s.lines = lines_;
  s.bytes = bytes_;
  s.chunks = chunks_;
  s.threads = threads_;
  s.wall_time_us = wall_us;
  s.throughput_mb_s = (wall_us > 0.0) ? (bytes_ / (1024.0*1024.0)) / (wall_us / 1e6) : 0.0;

  s.stages.reserve(stage_order_.size());
  for (auto& name : stage_order_) {
    auto it = stage_accum_us_.find(name);
    s.stages.push_back(StageTiming{name, it == stage_accum_us_.end() ? 0 : it->second});
  }
  return s;
}

StageTimer::StageTimer(ScanStats* stats, std::string_view name)
  : stats_(stats), name_(name) {
  if (stats_) stats_->start_stage(name_);
}

StageTimer::~StageTimer() {
  if (stats_) stats_->end_stage(name_);
}

}
