#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fx {

struct RunJsonError {
  std::string kind;       // "unequal_lengths", ...
  std::string message;
  std::optional<std::uint64_t> line;     // 0-based, record start + offset
  std::optional<std::uint64_t> byte;
  std::optional<std::uint64_t> record;
  std::string id;
};

struct RunJsonPayload {
  // Input metadata
  std::string filename;
  std::string format;     // "FASTA" | "FASTQ" | "unknown"
  std::string reader;     // reader variant used
  std::uint64_t file_size = 0;
  bool batch = false;

  // Counts
  std::uint64_t records = 0;
  std::uint64_t bases = 0;
  std::uint64_t qual_bytes = 0;
  std::uint64_t bytes = 0;
  std::uint64_t min_len = 0;
  std::uint64_t max_len = 0;
  double mean_len = 0.0;

  // Timing
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double records_per_sec = 0.0;

  // Buffer behavior
  std::uint64_t buffer_capacity = 0;
  std::uint64_t buffer_grows = 0;
  std::uint64_t relocations = 0;

  // Stages and errors
  std::vector<std::pair<std::string, std::uint64_t>> stage_times;
  std::unordered_map<std::string, std::uint64_t> errors_by_kind;
  std::optional<RunJsonError> error;
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON string.
  static std::string to_json(const RunJsonPayload& p);
};

}
