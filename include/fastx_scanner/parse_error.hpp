#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "fastx_scanner/format.hpp"
#include "fastx_scanner/position.hpp"

namespace fx {

enum class ErrorKind {
  Io,
  InvalidStart,     // record does not start with '>' / '@'
  InvalidSep,       // FASTQ separator line does not start with '+'
  UnexpectedEnd,    // truncated record at end of input
  UnequalLengths,   // FASTQ sequence and quality lengths differ
  BufferLimit,      // growth policy refused to enlarge the buffer
};

std::string_view to_string(ErrorKind k) noexcept;

struct ParseError {
  ErrorKind kind = ErrorKind::Io;
  std::optional<SeqFormat> format;   // unset while the format is unknown
  ErrorPosition pos;

  char expected = 0;                 // InvalidStart: '>' or '@', 0 if either
  char found = 0;                    // InvalidStart
  std::optional<char> found_sep;     // InvalidSep: first byte, none if empty line
  std::size_t seq_len = 0;           // UnequalLengths
  std::size_t qual_len = 0;          // UnequalLengths
  int io_errno = 0;                  // Io

  static ParseError io(int err);
  static ParseError buffer_limit();

  std::string message() const;
};

// Printable form of a byte for messages: 'A', \n, \r, \t, \xNN
std::string escape_byte(char c);

}
