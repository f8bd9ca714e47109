#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "fastx_scanner/arena.hpp"
#include "fastx_scanner/lines.hpp"
#include "fastx_scanner/position_store.hpp"

// Accessors of a stale RecordView throw std::logic_error. On by default in
// builds without NDEBUG.
#ifndef FX_VIEW_CHECKS
#  ifdef NDEBUG
#    define FX_VIEW_CHECKS 0
#  else
#    define FX_VIEW_CHECKS 1
#  endif
#endif

namespace fx {

// Record copied out of the buffer. Sequence and quality are joined.
struct OwnedRecord {
  std::string head;
  std::string seq;
  std::optional<std::string> qual;

  bool operator==(const OwnedRecord& o) const {
    return head == o.head && seq == o.seq && qual == o.qual;
  }
  bool operator!=(const OwnedRecord& o) const { return !(*this == o); }
};

// Lightweight view over one located record: a buffer plus the offsets a
// position store holds for it. Valid until the owner of the buffer moves on
// (the next reader call, or the RecordSet being refilled).
template <class Store>
class RecordView {
public:
  RecordView() = default;
  // `live` is the owner's generation counter; the view goes stale once it
  // moves past the value seen here.
  RecordView(std::string_view buf, const Store* store, const std::uint64_t* live = nullptr)
    : buf_(buf), store_(store), live_(live), gen_(live ? *live : 0) {}

  bool valid() const noexcept { return store_ != nullptr; }

  // True once the reader or record set this view came from has moved on.
  bool stale() const noexcept { return live_ && *live_ != gen_; }

  // Header line without '>' / '@' and line terminator.
  std::string_view head() const { return record_head(st(), buf_); }

  std::string_view id() const { return head_id(head()); }

  // Part of the header after the first space.
  std::optional<std::string_view> desc() const {
    const std::string_view h = head();
    const std::size_t sp = h.find(' ');
    if (sp == std::string_view::npos) return std::nullopt;
    return h.substr(sp + 1);
  }

  // Raw sequence region; inner line breaks stay in for multi-line records.
  std::string_view seq() const { return record_seq(st(), buf_); }

  bool has_quality() const {
    if constexpr (Store::kHasQuality) return st().has_qual();
    else return false;
  }

  std::optional<std::string_view> opt_qual() const {
    if (!has_quality()) return std::nullopt;
    return record_qual(st(), buf_);
  }

  // Empty for FASTA records.
  std::string_view qual() const { return record_qual(st(), buf_); }

  std::size_t num_seq_lines() const { return st().num_seq_lines(); }
  std::size_t num_qual_lines() const {
    if constexpr (Store::kHasQuality) return has_quality() ? st().num_qual_lines() : 0;
    else return 0;
  }

  LineIter seq_lines() const { return st().seq_lines(buf_); }
  LineIter qual_lines() const {
    if constexpr (Store::kHasQuality) {
      if (has_quality()) return st().qual_lines(buf_);
    }
    return LineIter{};
  }

  // Sequence without line breaks. Borrowed for single-line records,
  // otherwise joined into `scratch`.
  std::string_view full_seq(std::string& scratch) const {
    return join_lines(seq_lines(), num_seq_lines(), scratch);
  }
  std::string_view full_seq(Arena& arena) const { return join_into(seq_lines(), num_seq_lines(), arena); }

  std::string_view full_qual(std::string& scratch) const {
    return join_lines(qual_lines(), num_qual_lines(), scratch);
  }
  std::string_view full_qual(Arena& arena) const { return join_into(qual_lines(), num_qual_lines(), arena); }

  // True for FASTA records. Single-line records compare raw line spans first.
  bool check_lengths(std::size_t* seq_len = nullptr, std::size_t* qual_len = nullptr) const {
    return lengths_match(st(), buf_, false, seq_len, qual_len);
  }

  // Always compares terminator-stripped lengths.
  bool check_lengths_strict(std::size_t* seq_len = nullptr, std::size_t* qual_len = nullptr) const {
    return lengths_match(st(), buf_, true, seq_len, qual_len);
  }

  OwnedRecord to_owned() const {
    OwnedRecord r;
    r.head = std::string(head());
    std::string scratch;
    r.seq = std::string(full_seq(scratch));
    if (has_quality()) r.qual = std::string(full_qual(scratch));
    return r;
  }

  const Store& store() const { return st(); }
  std::string_view buffer() const noexcept { return buf_; }

private:
  const Store& st() const {
#if FX_VIEW_CHECKS
    if (stale()) throw std::logic_error("record view used after its reader or record set moved on");
#endif
    return *store_;
  }

  static std::string_view join_into(LineIter lines, std::size_t n, Arena& arena) {
    if (n <= 1) {
      std::string_view line;
      return (n == 1 && lines.next(line)) ? line : std::string_view{};
    }
    std::size_t total = 0;
    std::string_view line;
    LineIter count = lines;
    while (count.next(line)) total += line.size();
    if (total == 0) return {};
    char* dst = static_cast<char*>(arena.alloc(total));
    std::size_t at = 0;
    while (lines.next(line)) {
      std::memcpy(dst + at, line.data(), line.size());
      at += line.size();
    }
    return std::string_view(dst, total);
  }

  std::string_view buf_;
  const Store* store_{nullptr};
  const std::uint64_t* live_{nullptr};
  std::uint64_t gen_{0};
};

}
