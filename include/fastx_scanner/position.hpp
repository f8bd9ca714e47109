#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace fx {

// Location of a record in the input. Obtained from a reader and handed back
// to seek(); all three fields are zero-based.
struct Position {
  std::uint64_t line   = 0;
  std::uint64_t byte   = 0;
  std::uint64_t record = 0;

  bool operator==(const Position& o) const noexcept {
    return line == o.line && byte == o.byte && record == o.record;
  }
  bool operator!=(const Position& o) const noexcept { return !(*this == o); }
};

// Offset of an error relative to the start of the record it occurred in.
struct ErrorOffset {
  std::uint64_t line = 0;
  std::uint64_t byte = 0;

  bool operator==(const ErrorOffset& o) const noexcept {
    return line == o.line && byte == o.byte;
  }
};

struct ErrorPosition {
  std::optional<Position>    record;   // start of the offending record
  std::optional<ErrorOffset> offset;   // where inside it, if known
  std::optional<std::string> id;       // record ID once the header was read

  // record + offset, or nullopt if no record position is known
  std::optional<Position> position() const;

  // "record 'id' at line N" (1-based line)
  std::string describe() const;

  bool operator==(const ErrorPosition& o) const {
    return record == o.record && offset == o.offset && id == o.id;
  }
};

// Part of a record the search is in. Ordered.
enum class SearchPos : std::uint8_t { Head = 0, Seq = 1, Sep = 2, Qual = 3 };

// Where an incomplete search stopped; the next search resumes here.
struct SearchPosition {
  SearchPos   stage = SearchPos::Head;
  std::size_t byte  = 0;
};

}
