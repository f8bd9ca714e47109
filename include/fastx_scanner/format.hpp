#pragma once
#include <optional>
#include <string_view>

namespace fx {

enum class SeqFormat { Fasta, Fastq };

std::string_view to_string(SeqFormat f) noexcept;

// Grammar variant the search engine runs with.
struct FormatFlags {
  bool is_fasta = true;
  bool allow_multiline_seq = false;    // FASTA sequence may span lines
  bool allow_multiline_qual = false;   // FASTQ sequence and quality may span lines
  bool skip_length_check = false;      // FASTQ: do not compare seq/qual lengths

  // Multi-line parsing peeks one byte past each line.
  bool lookahead() const noexcept { return allow_multiline_seq || allow_multiline_qual; }
  char start_byte() const noexcept { return is_fasta ? '>' : '@'; }
};

}
