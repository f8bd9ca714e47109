#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "fastx_scanner/byte_source.hpp"
#include "fastx_scanner/core_reader.hpp"
#include "fastx_scanner/format.hpp"
#include "fastx_scanner/growth_policy.hpp"
#include "fastx_scanner/parse_error.hpp"
#include "fastx_scanner/position.hpp"
#include "fastx_scanner/position_store.hpp"
#include "fastx_scanner/record_set.hpp"
#include "fastx_scanner/record_view.hpp"

namespace fx {

struct ReaderConfig {
  std::size_t  capacity = kDefaultCapacity;   // initial buffer size, >= 3
  PolicyConfig policy;
};

// Reader over one input with a fixed grammar. With `detect`, FASTA or FASTQ
// is decided from the first non-empty line before the first record is read.
//
// Every call clears error(); false with no error means end of input. After
// an error the reader stays finished until seek().
template <class Store>
class SeqReader {
public:
  using View = RecordView<Store>;
  using Set  = RecordSet<Store>;

  // Throws std::invalid_argument if the store cannot represent `flags`, or
  // on a bad capacity.
  SeqReader(std::unique_ptr<ByteSource> src, FormatFlags flags, bool detect,
            const ReaderConfig& cfg);
  SeqReader(std::unique_ptr<ByteSource> src, FormatFlags flags, bool detect,
            std::size_t capacity, std::unique_ptr<BufPolicy> policy);

  // `out` stays valid until the next call on this reader.
  bool next(View& out);

  // Like next() without the FASTQ length comparison; use
  // View::check_lengths() later.
  bool next_unchecked_len(View& out);

  bool read_record_set(Set& set);

  bool seek(const Position& pos);

  // Start of the current record, or of the next one before any call.
  Position position() const { return core_.position(); }

  const std::optional<ParseError>& error() const noexcept { return core_.error(); }

  // Unknown until detection ran (or for empty input).
  std::optional<SeqFormat> format() const noexcept;

  const FormatFlags& flags() const noexcept { return flags_; }
  const BufferManager& buffer() const noexcept { return core_.buffer(); }

private:
  enum class Detect { Off, Pending, Done, Empty };

  bool ensure_format();

  CoreReader<Store> core_;
  FormatFlags flags_;
  Detect detect_;
};

extern template class SeqReader<FastaLineStore>;
extern template class SeqReader<FastaRangeStore>;
extern template class SeqReader<FastqRangeStore>;
extern template class SeqReader<MultiRangeStore>;
extern template class SeqReader<FastxLineStore>;

// FASTA, sequence over any number of lines.
class FastaReader : public SeqReader<FastaLineStore> {
public:
  explicit FastaReader(std::unique_ptr<ByteSource> src, const ReaderConfig& cfg = {});
  FastaReader(std::unique_ptr<ByteSource> src, std::size_t capacity, std::unique_ptr<BufPolicy> policy);
};

// FASTA with exactly one sequence line per record.
class FastaSingleLineReader : public SeqReader<FastaRangeStore> {
public:
  explicit FastaSingleLineReader(std::unique_ptr<ByteSource> src, const ReaderConfig& cfg = {});
};

// FASTQ, four lines per record.
class FastqReader : public SeqReader<FastqRangeStore> {
public:
  explicit FastqReader(std::unique_ptr<ByteSource> src, const ReaderConfig& cfg = {});
  FastqReader(std::unique_ptr<ByteSource> src, std::size_t capacity, std::unique_ptr<BufPolicy> policy);
};

// FASTQ, sequence and quality over any number of lines.
class FastqMultilineReader : public SeqReader<MultiRangeStore> {
public:
  explicit FastqMultilineReader(std::unique_ptr<ByteSource> src, const ReaderConfig& cfg = {});
};

// FASTA (multi-line) or FASTQ (single-line), decided from the input.
class FastxReader : public SeqReader<FastxLineStore> {
public:
  explicit FastxReader(std::unique_ptr<ByteSource> src, const ReaderConfig& cfg = {});
};

// FASTA or FASTQ, both multi-line, decided from the input.
class FastxMultilineReader : public SeqReader<FastxLineStore> {
public:
  explicit FastxMultilineReader(std::unique_ptr<ByteSource> src, const ReaderConfig& cfg = {});
};

}
