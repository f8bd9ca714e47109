#pragma once
#include <cstddef>
#include <ostream>
#include <string_view>

#include "fastx_scanner/lines.hpp"
#include "fastx_scanner/record_view.hpp"

namespace fx {

// Record output. All writers return the stream state afterwards; wrap widths
// of 0 throw std::invalid_argument.

// ">head\nseq\n"
bool write_fasta(std::ostream& out, std::string_view head, std::string_view seq);

// Sequence split into lines of `width` bytes.
bool write_fasta_wrap(std::ostream& out, std::string_view head, std::string_view seq,
                      std::size_t width);

// Sequence lines concatenated into one line.
bool write_fasta_lines(std::ostream& out, std::string_view head, LineIter seq);

// Sequence lines re-wrapped to `width`, across the input line breaks.
bool write_fasta_lines_wrap(std::ostream& out, std::string_view head, LineIter seq,
                            std::size_t width);

// "@head\nseq\n+\nqual\n"
bool write_fastq(std::ostream& out, std::string_view head, std::string_view seq,
                 std::string_view qual);

bool write_fastq_lines(std::ostream& out, std::string_view head, LineIter seq, LineIter qual);

// Writes a record in its own format. FASTQ records always go on four lines;
// FASTA sequences are joined, or wrapped when `wrap` > 0.
template <class Store>
bool write_record(std::ostream& out, const RecordView<Store>& r, std::size_t wrap = 0) {
  if (r.has_quality()) return write_fastq_lines(out, r.head(), r.seq_lines(), r.qual_lines());
  if (wrap) return write_fasta_lines_wrap(out, r.head(), r.seq_lines(), wrap);
  return write_fasta_lines(out, r.head(), r.seq_lines());
}

// FASTA form of any record; quality is dropped.
template <class Store>
bool write_as_fasta(std::ostream& out, const RecordView<Store>& r, std::size_t wrap = 0) {
  if (wrap) return write_fasta_lines_wrap(out, r.head(), r.seq_lines(), wrap);
  return write_fasta_lines(out, r.head(), r.seq_lines());
}

}
