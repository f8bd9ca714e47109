#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "fastx_scanner/buffer_manager.hpp"
#include "fastx_scanner/format.hpp"
#include "fastx_scanner/lines.hpp"
#include "fastx_scanner/parse_error.hpp"
#include "fastx_scanner/position.hpp"
#include "fastx_scanner/position_store.hpp"
#include "fastx_scanner/record_set.hpp"
#include "fastx_scanner/record_view.hpp"

namespace fx {

// Record search engine shared by all readers. Finds one record at a time in
// a growable buffer, resuming interrupted searches after the buffer was
// grown or its tail moved to the front.
//
// Calls return false at end of input and on errors; error() tells the two
// apart. After an error the engine is finished until seek() is called.
template <class Store>
class CoreReader {
public:
  CoreReader(std::unique_ptr<ByteSource> src, std::size_t capacity,
             std::unique_ptr<BufPolicy> policy);

  // Advances to the next record, available through record().
  bool next(const FormatFlags& flags);

  // Refills `set` with all complete records of the current buffer (growing
  // it only while not even one record fits). False once no record is left.
  bool read_record_set(RecordSet<Store>& set, const FormatFlags& flags);

  // Moves to a position previously returned by position(). Positions inside
  // the current buffer need no I/O.
  bool seek(const Position& pos, bool multiline);

  // Starts parsing at a buffer offset with the given file line index.
  void init_pos(std::size_t byte, std::uint64_t line);

  // Marks the end of input without an error, or terminates with one.
  void finish();
  void fail(ParseError e);

  // Start of the current record.
  Position position() const;

  // Valid until the next next(), read_record_set() or seek().
  RecordView<Store> record() const { return RecordView<Store>(buf_.buffer(), &store_, &generation_); }

  const std::optional<ParseError>& error() const noexcept { return error_; }
  void clear_error() noexcept { error_.reset(); }

  bool finished() const noexcept { return state_ == State::Finished; }

  BufferManager& buffer() noexcept { return buf_; }
  const BufferManager& buffer() const noexcept { return buf_; }

private:
  enum class State { New, Positioned, Parsing, Finished };

  // Result of one search pass: nullopt once a complete record is located.
  using Found = std::optional<SearchPosition>;

  enum class Step { Next, Complete, Incomplete, Failed };

  bool find_record(const FormatFlags& f, std::optional<SearchPosition> resume,
                   bool check_last_byte, Found& out);
  Step search_head(const FormatFlags& f, std::string_view buffer, LineScanner& lines);
  Step search_seq(const FormatFlags& f, std::string_view buffer, LineScanner& lines);
  Step search_sep(const FormatFlags& f, LineScanner& lines);
  Step search_qual(const FormatFlags& f, std::string_view buffer, LineScanner& lines);

  bool check_end(const FormatFlags& f, SearchPosition pos, bool& has_record);
  bool check_lengths(const FormatFlags& f);

  bool at_end(const FormatFlags& f) const noexcept;
  void advance_record();
  bool adjust_buffer(const FormatFlags& f, SearchPosition& pos);
  bool grow(const FormatFlags& f);
  void make_room(SearchPosition& pos);
  bool fill();

  ParseError make_error(const FormatFlags& f, ErrorKind kind) const;
  std::string record_id() const;

  BufferManager buf_;
  Store store_;
  long long length_diff_{0};   // multi-line FASTQ: seq minus qual length so far
  std::optional<SearchPosition> search_pos_;
  State state_{State::New};
  std::uint64_t line_idx_{0};
  std::uint64_t record_idx_{0};
  std::optional<ParseError> error_;
  std::uint64_t generation_{0};   // bumped by every call that moves the reader
};

extern template class CoreReader<FastaLineStore>;
extern template class CoreReader<FastaRangeStore>;
extern template class CoreReader<FastqRangeStore>;
extern template class CoreReader<MultiRangeStore>;
extern template class CoreReader<FastxLineStore>;

}
