#include "fastx_scanner/readers.hpp"
#include "fastx_scanner/format_recognition.hpp"
#include <stdexcept>
#include <utility>

namespace fx {

namespace {

// Passes `src` through once the store is known to fit the grammar.
template <class Store>
std::unique_ptr<ByteSource> checked_source(std::unique_ptr<ByteSource> src,
                                           const FormatFlags& f, bool detect) {
  if (!Store::kHasQuality && (detect || !f.is_fasta || f.allow_multiline_qual)) {
    throw std::invalid_argument("position store cannot hold FASTQ records");
  }
  if (!Store::kMultiLine && f.lookahead()) {
    throw std::invalid_argument("position store cannot hold multi-line records");
  }
  return src;
}

FormatFlags fasta_flags(bool multiline) {
  FormatFlags f;
  f.is_fasta = true;
  f.allow_multiline_seq = multiline;
  return f;
}

FormatFlags fastq_flags(bool multiline) {
  FormatFlags f;
  f.is_fasta = false;
  f.allow_multiline_qual = multiline;
  return f;
}

FormatFlags fastx_flags(bool multiline_qual) {
  FormatFlags f;
  f.allow_multiline_seq = true;
  f.allow_multiline_qual = multiline_qual;
  return f;
}

}

template <class Store>
SeqReader<Store>::SeqReader(std::unique_ptr<ByteSource> src, FormatFlags flags, bool detect,
                            const ReaderConfig& cfg)
  : SeqReader(std::move(src), flags, detect, cfg.capacity, make_policy(cfg.policy)) {}

template <class Store>
SeqReader<Store>::SeqReader(std::unique_ptr<ByteSource> src, FormatFlags flags, bool detect,
                            std::size_t capacity, std::unique_ptr<BufPolicy> policy)
  : core_(checked_source<Store>(std::move(src), flags, detect), capacity, std::move(policy)),
    flags_(flags),
    detect_(detect ? Detect::Pending : Detect::Off) {}

template <class Store>
bool SeqReader<Store>::ensure_format() {
  switch (detect_) {
    case Detect::Off:
    case Detect::Done:
      return true;
    case Detect::Empty:
      return false;
    case Detect::Pending:
      break;
  }
  FormatGuess guess;
  std::optional<ParseError> err;
  if (!recognize_format(core_.buffer(), guess, err)) {
    detect_ = Detect::Empty;
    if (err) core_.fail(std::move(*err));
    else     core_.finish();
    return false;
  }
  flags_.is_fasta = guess.format == SeqFormat::Fasta;
  core_.init_pos(guess.byte, guess.line);
  detect_ = Detect::Done;
  return true;
}

template <class Store>
bool SeqReader<Store>::next(View& out) {
  core_.clear_error();
  if (!ensure_format()) return false;
  if (!core_.next(flags_)) return false;
  out = core_.record();
  return true;
}

template <class Store>
bool SeqReader<Store>::next_unchecked_len(View& out) {
  core_.clear_error();
  if (!ensure_format()) return false;
  FormatFlags f = flags_;
  f.skip_length_check = true;
  if (!core_.next(f)) return false;
  out = core_.record();
  return true;
}

template <class Store>
bool SeqReader<Store>::read_record_set(Set& set) {
  core_.clear_error();
  if (!ensure_format()) {
    set.clear();
    return false;
  }
  return core_.read_record_set(set, flags_);
}

template <class Store>
bool SeqReader<Store>::seek(const Position& pos) {
  core_.clear_error();
  if (!ensure_format()) return false;
  return core_.seek(pos, flags_.lookahead());
}

template <class Store>
std::optional<SeqFormat> SeqReader<Store>::format() const noexcept {
  if (detect_ == Detect::Pending || detect_ == Detect::Empty) return std::nullopt;
  return flags_.is_fasta ? SeqFormat::Fasta : SeqFormat::Fastq;
}

template class SeqReader<FastaLineStore>;
template class SeqReader<FastaRangeStore>;
template class SeqReader<FastqRangeStore>;
template class SeqReader<MultiRangeStore>;
template class SeqReader<FastxLineStore>;

FastaReader::FastaReader(std::unique_ptr<ByteSource> src, const ReaderConfig& cfg)
  : SeqReader(std::move(src), fasta_flags(true), false, cfg) {}

FastaReader::FastaReader(std::unique_ptr<ByteSource> src, std::size_t capacity,
                         std::unique_ptr<BufPolicy> policy)
  : SeqReader(std::move(src), fasta_flags(true), false, capacity, std::move(policy)) {}

FastaSingleLineReader::FastaSingleLineReader(std::unique_ptr<ByteSource> src, const ReaderConfig& cfg)
  : SeqReader(std::move(src), fasta_flags(false), false, cfg) {}

FastqReader::FastqReader(std::unique_ptr<ByteSource> src, const ReaderConfig& cfg)
  : SeqReader(std::move(src), fastq_flags(false), false, cfg) {}

FastqReader::FastqReader(std::unique_ptr<ByteSource> src, std::size_t capacity,
                         std::unique_ptr<BufPolicy> policy)
  : SeqReader(std::move(src), fastq_flags(false), false, capacity, std::move(policy)) {}

FastqMultilineReader::FastqMultilineReader(std::unique_ptr<ByteSource> src, const ReaderConfig& cfg)
  : SeqReader(std::move(src), fastq_flags(true), false, cfg) {}

FastxReader::FastxReader(std::unique_ptr<ByteSource> src, const ReaderConfig& cfg)
  : SeqReader(std::move(src), fastx_flags(false), true, cfg) {}

FastxMultilineReader::FastxMultilineReader(std::unique_ptr<ByteSource> src, const ReaderConfig& cfg)
  : SeqReader(std::move(src), fastx_flags(true), true, cfg) {}

}
