#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "fastx_scanner/growth_policy.hpp"
#include "fastx_scanner/readers.hpp"

namespace fx {

enum class InputFormat { Auto, Fasta, Fastq, Fastx };

std::optional<InputFormat> parse_input_format(std::string_view s);
std::string_view to_string(InputFormat f) noexcept;

// Settings of one fastx-scan run.
struct ScanConfig {
  InputFormat  format         = InputFormat::Auto;  // Auto: by extension, else content
  bool         multiline_qual = false;              // FASTQ records may span lines
  bool         single_line    = false;              // FASTA sequence on one line
  bool         check_lengths  = true;
  bool         batch          = false;              // read_record_set() instead of next()
  std::size_t  batch_records  = 0;                  // records per set, 0 = no cap
  std::size_t  threads        = 0;                  // > 0: record sets processed on a worker pool
  ReaderConfig reader;

  std::string  report_root    = "artifacts/fastx-scan";
  std::string  slug_mode      = "basename";         // hashprefix|basename|keypath
  int          slug_len       = 32;
  std::string  template_dir   = "templates";
  bool         write_report   = true;

  std::string  to_fasta;                            // convert to this FASTA file
  std::size_t  wrap           = 0;                  // FASTA output line width, 0 = none
  bool         verbose        = false;
};

// Merges a JSON object into `cfg`. Keys mirror the command-line flags with
// '_' for '-'; sizes may be numbers or strings like "64K". Unknown keys and
// wrong value types are errors.
bool load_scan_config(const std::string& path, ScanConfig& cfg, std::string* err_out);

// Same, from JSON text.
bool parse_scan_config(std::string_view json, ScanConfig& cfg, std::string* err_out);

}
