#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fx {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct ScanStats {
  std::uint64_t records = 0;
  std::uint64_t bases = 0;        // sequence bytes, line breaks excluded
  std::uint64_t qual_bytes = 0;
  std::uint64_t bytes = 0;        // input bytes read
  std::uint64_t min_len = 0;
  std::uint64_t max_len = 0;
  double mean_len = 0.0;
  double throughput_mb_s = 0.0;
  double records_per_sec = 0.0;

  std::uint32_t buffer_grows = 0;
  std::uint32_t relocations = 0;
  std::uint64_t final_capacity = 0;

  std::vector<StageTiming> stages;
  std::unordered_map<std::string, std::uint64_t> errors_by_kind;
};

class ScanMetrics {
public:
  void reset();
  void add_record(std::uint64_t seq_len, std::uint64_t qual_len) noexcept;
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void set_buffer_stats(std::uint32_t grows, std::uint32_t relocations,
                        std::uint64_t capacity) noexcept;

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  void add_error(std::string_view kind);
  ScanStats snapshot(double wall_ms) const;

  std::uint64_t records() const noexcept { return records_; }

private:
  std::uint64_t records_{0};
  std::uint64_t bases_{0};
  std::uint64_t qual_bytes_{0};
  std::uint64_t bytes_{0};
  std::uint64_t min_len_{0};
  std::uint64_t max_len_{0};
  std::uint32_t grows_{0};
  std::uint32_t relocations_{0};
  std::uint64_t capacity_{0};
  std::unordered_map<std::string, std::uint64_t> errs_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
