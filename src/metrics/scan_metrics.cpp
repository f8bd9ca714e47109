#include "fastx_scanner/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace fx {

void ScanMetrics::reset() {
  records_ = bases_ = qual_bytes_ = bytes_ = 0;
  min_len_ = max_len_ = 0;
  grows_ = relocations_ = 0;
  capacity_ = 0;
  errs_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void ScanMetrics::add_record(std::uint64_t seq_len, std::uint64_t qual_len) noexcept {
  if (records_ == 0 || seq_len < min_len_) min_len_ = seq_len;
  if (seq_len > max_len_) max_len_ = seq_len;
  ++records_;
  bases_ += seq_len;
  qual_bytes_ += qual_len;
}

void ScanMetrics::set_buffer_stats(std::uint32_t grows, std::uint32_t relocations,
                                   std::uint64_t capacity) noexcept {
  grows_ = grows;
  relocations_ = relocations;
  capacity_ = capacity;
}

void ScanMetrics::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void ScanMetrics::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

void ScanMetrics::add_error(std::string_view kind) {
  ++errs_[std::string(kind)];
}

ScanStats ScanMetrics::snapshot(double wall_ms) const {
  ScanStats r;
  r.records = records_;
  r.bases = bases_;
  r.qual_bytes = qual_bytes_;
  r.bytes = bytes_;
  r.min_len = min_len_;
  r.max_len = max_len_;
  r.mean_len = records_ ? static_cast<double>(bases_) / static_cast<double>(records_) : 0.0;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;
  r.records_per_sec = (wall_ms > 0.0) ? records_ / (wall_ms / 1000.0) : 0.0;
  r.buffer_grows = grows_;
  r.relocations = relocations_;
  r.final_capacity = capacity_;

  r.errors_by_kind = errs_;
  r.stages.reserve(stage_accum_ms_.size());
  for (auto& kv : stage_accum_ms_) r.stages.push_back(StageTiming{kv.first, kv.second});
  std::sort(r.stages.begin(), r.stages.end(),
            [](const StageTiming& a, const StageTiming& b) { return a.name < b.name; });
  return r;
}

}
