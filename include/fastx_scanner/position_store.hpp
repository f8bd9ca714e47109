#pragma once
#include <array>
#include <cstddef>
#include <string_view>
#include <vector>

#include "fastx_scanner/lines.hpp"
#include "fastx_scanner/position.hpp"

namespace fx {

// Position stores record where the parts of one record sit in the buffer.
//
// Every store provides the sequence interface:
//   init_record, move_to_start, set/record_start, set_seq_start,
//   add_seq_line_start, seq_start, set_sep_pos, sep_pos, set/record_end,
//   num_lines, num_seq_lines, line_offset, seq_lines
// Stores with kHasQuality additionally provide:
//   set_qual_start, add_qual_line_start, qual_start, has_qual,
//   num_qual_lines, qual_lines
//
// kMultiLine stores can hold several sequence / quality lines.
//
// Offsets are monotonic in the order start, seq starts, sep, qual starts,
// end. A record end one past the buffer marks a final line without '\n'.

namespace detail {
inline std::size_t sat_sub(std::size_t a, std::size_t b) noexcept { return a > b ? a - b : 0; }
inline std::size_t stage_index(SearchPos p) noexcept { return static_cast<std::size_t>(p); }
}

// Multi-line FASTA: a list of line starts, closed by the record end.
class FastaLineStore {
public:
  static constexpr bool kHasQuality = false;
  static constexpr bool kMultiLine = true;

  void init_record(std::size_t start) {
    seq_pos_.clear();
    start_ = start;
  }

  void move_to_start(SearchPos, std::size_t offset) {
    start_ -= offset;
    for (auto& p : seq_pos_) p -= offset;
  }

  void set_record_start(std::size_t p) noexcept { start_ = p; }
  std::size_t record_start() const noexcept { return start_; }

  void set_seq_start(std::size_t p) { seq_pos_.push_back(p); }
  void add_seq_line_start(std::size_t p) { seq_pos_.push_back(p); }
  std::size_t seq_start() const noexcept { return seq_pos_.empty() ? start_ : seq_pos_.front(); }

  void set_sep_pos(std::size_t, bool) noexcept {}
  std::size_t sep_pos() const noexcept { return record_end(); }

  // The record end doubles as the end of the last sequence line.
  void set_record_end(std::size_t p, bool has_line) {
    if (has_line) seq_pos_.push_back(p);
  }
  std::size_t record_end() const noexcept { return seq_pos_.empty() ? start_ : seq_pos_.back(); }

  std::size_t num_lines() const noexcept { return seq_pos_.size(); }
  std::size_t num_seq_lines() const noexcept { return detail::sat_sub(seq_pos_.size(), 1); }
  std::size_t line_offset(SearchPos, bool) const noexcept { return seq_pos_.size(); }

  LineIter seq_lines(std::string_view buf) const noexcept {
    return LineIter::from_positions(buf, seq_pos_.data(), seq_pos_.size());
  }

private:
  std::size_t start_{0};
  std::vector<std::size_t> seq_pos_;
};

// Single-line FASTA: {start, seq, end}.
class FastaRangeStore {
public:
  static constexpr bool kHasQuality = false;
  static constexpr bool kMultiLine = false;

  void init_record(std::size_t start) noexcept { pos_ = {start, 0, 0}; }

  void move_to_start(SearchPos stage, std::size_t offset) noexcept {
    const std::size_t last = detail::stage_index(stage) < 2 ? detail::stage_index(stage) : 1;
    for (std::size_t i = 0; i <= last; ++i) pos_[i] -= offset;
  }

  void set_record_start(std::size_t p) noexcept { pos_[0] = p; }
  std::size_t record_start() const noexcept { return pos_[0]; }

  void set_seq_start(std::size_t p) noexcept { pos_[1] = p; }
  void add_seq_line_start(std::size_t) noexcept {}
  std::size_t seq_start() const noexcept { return pos_[1]; }

  void set_sep_pos(std::size_t, bool) noexcept {}
  std::size_t sep_pos() const noexcept { return pos_[2]; }

  void set_record_end(std::size_t p, bool) noexcept { pos_[2] = p; }
  std::size_t record_end() const noexcept { return pos_[2]; }

  std::size_t num_lines() const noexcept { return 2; }
  std::size_t num_seq_lines() const noexcept { return 1; }
  std::size_t line_offset(SearchPos stage, bool has_line) const noexcept {
    return detail::sat_sub(detail::stage_index(stage), has_line ? 0 : 1);
  }

  LineIter seq_lines(std::string_view buf) const noexcept {
    return LineIter::from_positions(buf, &pos_[1], 2);
  }

private:
  std::array<std::size_t, 3> pos_{};
};

// Single-line FASTQ: {start, seq, sep, qual, end}.
class FastqRangeStore {
public:
  static constexpr bool kHasQuality = true;
  static constexpr bool kMultiLine = false;

  void init_record(std::size_t start) noexcept { pos_ = {start, 0, 0, 0, 0}; }

  // Only entries up to the interrupted stage are set yet.
  void move_to_start(SearchPos stage, std::size_t offset) noexcept {
    for (std::size_t i = 0; i <= detail::stage_index(stage); ++i) pos_[i] -= offset;
  }

  void set_record_start(std::size_t p) noexcept { pos_[0] = p; }
  std::size_t record_start() const noexcept { return pos_[0]; }

  void set_seq_start(std::size_t p) noexcept { pos_[1] = p; }
  void add_seq_line_start(std::size_t) noexcept {}
  std::size_t seq_start() const noexcept { return pos_[1]; }

  void set_sep_pos(std::size_t p, bool) noexcept { pos_[2] = p; }
  std::size_t sep_pos() const noexcept { return pos_[2]; }

  void set_qual_start(std::size_t p) noexcept { pos_[3] = p; }
  void add_qual_line_start(std::size_t) noexcept {}
  std::size_t qual_start() const noexcept { return pos_[3]; }
  bool has_qual() const noexcept { return pos_[3] != 0; }

  void set_record_end(std::size_t p, bool) noexcept { pos_[4] = p; }
  std::size_t record_end() const noexcept { return pos_[4]; }

  std::size_t num_lines() const noexcept { return 4; }
  std::size_t num_seq_lines() const noexcept { return 1; }
  std::size_t num_qual_lines() const noexcept { return 1; }
  std::size_t line_offset(SearchPos stage, bool has_line) const noexcept {
    return detail::sat_sub(detail::stage_index(stage), has_line ? 0 : 1);
  }

  LineIter seq_lines(std::string_view buf) const noexcept {
    return LineIter::from_positions(buf, &pos_[1], 2);
  }
  LineIter qual_lines(std::string_view buf) const noexcept {
    return LineIter::from_positions(buf, &pos_[3], 2);
  }

private:
  std::array<std::size_t, 5> pos_{};
};

// Multi-line FASTQ: the five range offsets plus line counts. Line breaks
// inside sequence and quality are searched again when the lines are read.
class MultiRangeStore {
public:
  static constexpr bool kHasQuality = true;
  static constexpr bool kMultiLine = true;

  void init_record(std::size_t start) noexcept {
    pos_ = {start, 0, 0, 0, 0};
    n_seq_ = 0;
    n_qual_ = 0;
  }

  void move_to_start(SearchPos stage, std::size_t offset) noexcept {
    for (std::size_t i = 0; i <= detail::stage_index(stage); ++i) pos_[i] -= offset;
  }

  void set_record_start(std::size_t p) noexcept { pos_[0] = p; }
  std::size_t record_start() const noexcept { return pos_[0]; }

  void set_seq_start(std::size_t p) noexcept { pos_[1] = p; ++n_seq_; }
  void add_seq_line_start(std::size_t) noexcept { ++n_seq_; }
  std::size_t seq_start() const noexcept { return pos_[1]; }

  void set_sep_pos(std::size_t p, bool has_line) noexcept {
    pos_[2] = p;
    if (!has_line) n_seq_ = detail::sat_sub(n_seq_, 1);
  }
  std::size_t sep_pos() const noexcept { return pos_[2]; }

  void set_qual_start(std::size_t p) noexcept { pos_[3] = p; ++n_qual_; }
  void add_qual_line_start(std::size_t) noexcept { ++n_qual_; }
  std::size_t qual_start() const noexcept { return pos_[3]; }
  bool has_qual() const noexcept { return pos_[3] != 0; }

  // Without a final line the last counted quality line does not exist.
  void set_record_end(std::size_t p, bool has_line) noexcept {
    pos_[4] = p;
    if (!has_line && has_qual()) n_qual_ = detail::sat_sub(n_qual_, 1);
  }
  std::size_t record_end() const noexcept { return pos_[4]; }

  std::size_t num_lines() const noexcept { return 2 + n_seq_ + n_qual_; }
  std::size_t num_seq_lines() const noexcept { return n_seq_; }
  std::size_t num_qual_lines() const noexcept { return n_qual_; }
  std::size_t line_offset(SearchPos stage, bool has_line) const noexcept {
    const std::size_t n = n_seq_ + n_qual_ + (stage >= SearchPos::Sep ? 1 : 0);
    return detail::sat_sub(n, has_line ? 0 : 1);
  }

  LineIter seq_lines(std::string_view buf) const noexcept {
    return LineIter::search(slice_or_empty(buf, pos_[1], pos_[2]), n_seq_ == 1);
  }
  LineIter qual_lines(std::string_view buf) const noexcept {
    const std::size_t end = pos_[4] > buf.size() ? buf.size() : pos_[4];
    return LineIter::search(slice_or_empty(buf, pos_[3], end), n_qual_ == 1);
  }

private:
  std::array<std::size_t, 5> pos_{};
  std::size_t n_seq_{0};
  std::size_t n_qual_{0};
};

// FASTA or FASTQ, any number of lines: every line start is stored.
class FastxLineStore {
public:
  static constexpr bool kHasQuality = true;
  static constexpr bool kMultiLine = true;

  void init_record(std::size_t start) {
    seq_pos_.clear();
    qual_pos_.clear();
    start_ = start;
    end_ = start;
  }

  void move_to_start(SearchPos, std::size_t offset) {
    start_ -= offset;
    for (auto& p : seq_pos_) p -= offset;
    for (auto& p : qual_pos_) p -= offset;
  }

  void set_record_start(std::size_t p) noexcept { start_ = p; }
  std::size_t record_start() const noexcept { return start_; }

  void set_seq_start(std::size_t p) { seq_pos_.push_back(p); }
  void add_seq_line_start(std::size_t p) { seq_pos_.push_back(p); }
  std::size_t seq_start() const noexcept { return seq_pos_.empty() ? start_ : seq_pos_.front(); }

  // The separator offset also ends the last sequence line.
  void set_sep_pos(std::size_t p, bool has_line) {
    if (has_line) seq_pos_.push_back(p);
  }
  std::size_t sep_pos() const noexcept { return seq_pos_.empty() ? start_ : seq_pos_.back(); }

  void set_qual_start(std::size_t p) { qual_pos_.push_back(p); }
  void add_qual_line_start(std::size_t p) { qual_pos_.push_back(p); }
  std::size_t qual_start() const noexcept { return qual_pos_.empty() ? end_ : qual_pos_.front(); }
  bool has_qual() const noexcept { return !qual_pos_.empty(); }

  void set_record_end(std::size_t p, bool has_line) {
    end_ = p;
    if (has_qual() && has_line) qual_pos_.push_back(p);
  }
  std::size_t record_end() const noexcept { return end_; }

  std::size_t num_lines() const noexcept { return seq_pos_.size() + qual_pos_.size(); }
  std::size_t num_seq_lines() const noexcept { return detail::sat_sub(seq_pos_.size(), 1); }
  std::size_t num_qual_lines() const noexcept { return detail::sat_sub(qual_pos_.size(), 1); }
  std::size_t line_offset(SearchPos, bool has_line) const noexcept {
    return detail::sat_sub(seq_pos_.size() + qual_pos_.size(), has_line ? 0 : 1);
  }

  LineIter seq_lines(std::string_view buf) const noexcept {
    return LineIter::from_positions(buf, seq_pos_.data(), seq_pos_.size());
  }
  LineIter qual_lines(std::string_view buf) const noexcept {
    return LineIter::from_positions(buf, qual_pos_.data(), qual_pos_.size());
  }

private:
  std::size_t start_{0};
  std::size_t end_{0};
  std::vector<std::size_t> seq_pos_;
  std::vector<std::size_t> qual_pos_;
};

// Slices shared by all stores.

template <class Store>
std::string_view record_head(const Store& s, std::string_view buf) noexcept {
  return trim_cr(slice_or_empty(buf, s.record_start() + 1, s.seq_start() - 1));
}

template <class Store>
std::string_view record_seq(const Store& s, std::string_view buf) noexcept {
  return trim_cr(slice_or_empty(buf, s.seq_start(), s.sep_pos() - 1));
}

template <class Store>
std::string_view record_qual(const Store& s, std::string_view buf) noexcept {
  if constexpr (Store::kHasQuality) {
    if (!s.has_qual()) return {};
    return trim_cr(slice_or_empty(buf, s.qual_start(), s.record_end() - 1));
  } else {
    (void)s; (void)buf;
    return {};
  }
}

// ID: header up to the first space.
inline std::string_view head_id(std::string_view head) noexcept {
  return head.substr(0, head.find(' '));
}

template <class Store>
std::size_t sum_line_lengths(LineIter lines) noexcept {
  std::size_t n = 0;
  std::string_view line;
  while (lines.next(line)) n += line.size();
  return n;
}

// Compares sequence and quality lengths of a complete record. Unless
// `strict`, single-line records are first compared on raw line spans, which
// include terminators, and only stripped if those differ.
template <class Store>
bool lengths_match(const Store& s, std::string_view buf, bool strict,
                   std::size_t* seq_len, std::size_t* qual_len) noexcept {
  if constexpr (!Store::kHasQuality) {
    (void)s; (void)buf; (void)strict; (void)seq_len; (void)qual_len;
    return true;
  } else {
    if (!s.has_qual()) return true;
    std::size_t sl, ql;
    if (s.num_seq_lines() > 1 || s.num_qual_lines() > 1) {
      sl = sum_line_lengths<Store>(s.seq_lines(buf));
      ql = sum_line_lengths<Store>(s.qual_lines(buf));
    } else {
      if (!strict && s.sep_pos() - s.seq_start() == s.record_end() - s.qual_start()) return true;
      sl = record_seq(s, buf).size();
      ql = record_qual(s, buf).size();
    }
    if (seq_len) *seq_len = sl;
    if (qual_len) *qual_len = ql;
    return sl == ql;
  }
}

}
