#include "fastx_scanner/parse_error.hpp"
#include <cstdio>
#include <cstring>
#include <sstream>

namespace fx {

std::string_view to_string(SeqFormat f) noexcept {
  return f == SeqFormat::Fasta ? "FASTA" : "FASTQ";
}

std::string_view to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::Io:             return "io";
    case ErrorKind::InvalidStart:   return "invalid_start";
    case ErrorKind::InvalidSep:     return "invalid_sep";
    case ErrorKind::UnexpectedEnd:  return "unexpected_end";
    case ErrorKind::UnequalLengths: return "unequal_lengths";
    case ErrorKind::BufferLimit:    return "buffer_limit";
  }
  return "unknown";
}

std::optional<Position> ErrorPosition::position() const {
  if (!record) return std::nullopt;
  Position p = *record;
  if (offset) {
    p.line += offset->line;
    p.byte += offset->byte;
  }
  return p;
}

std::string ErrorPosition::describe() const {
  std::string out;
  if (id) out += "record '" + *id + "'";
  if (record) {
    if (!out.empty()) out += ' ';
    out += "at line " + std::to_string(record->line + 1);
  }
  return out;
}

std::string escape_byte(char c) {
  switch (c) {
    case '\n': return "\\n";
    case '\r': return "\\r";
    case '\t': return "\\t";
    case '\\': return "\\\\";
    case '\'': return "\\'";
    default: break;
  }
  const auto u = static_cast<unsigned char>(c);
  if (u >= 0x20 && u < 0x7f) return std::string(1, c);
  char tmp[8];
  std::snprintf(tmp, sizeof(tmp), "\\x%02x", u);
  return tmp;
}

ParseError ParseError::io(int err) {
  ParseError e;
  e.kind = ErrorKind::Io;
  e.io_errno = err;
  return e;
}

ParseError ParseError::buffer_limit() {
  ParseError e;
  e.kind = ErrorKind::BufferLimit;
  return e;
}

std::string ParseError::message() const {
  std::ostringstream o;
  if (kind == ErrorKind::Io) {
    o << "I/O error: " << std::strerror(io_errno);
    return o.str();
  }
  o << (format ? to_string(*format) : std::string_view("FASTX")) << " parse error: ";
  switch (kind) {
    case ErrorKind::InvalidStart:
      if (expected) o << "expected '" << expected << "' at record start";
      else          o << "expected '>' or '@' at record start";
      o << " but found '" << escape_byte(found) << "'";
      break;
    case ErrorKind::InvalidSep:
      o << "expected '+' separator but found ";
      if (found_sep) o << "'" << escape_byte(*found_sep) << "'";
      else           o << "empty line";
      break;
    case ErrorKind::UnexpectedEnd:
      o << "unexpected end of input";
      break;
    case ErrorKind::UnequalLengths:
      o << "sequence length is " << seq_len << ", but quality length is " << qual_len;
      break;
    case ErrorKind::BufferLimit:
      o << "buffer limit reached";
      return o.str();
    case ErrorKind::Io:
      break;
  }
  const std::string where = pos.describe();
  if (!where.empty()) o << " (" << where << ")";
  return o.str();
}

}
