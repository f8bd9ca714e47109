#include "fastx_scanner/format_recognition.hpp"
#include <string_view>
#include <utility>

namespace fx {

bool recognize_format(BufferManager& buf, FormatGuess& out, std::optional<ParseError>& err) {
  err.reset();
  std::uint64_t line = 0;
  std::size_t i = 0;

  for (;;) {
    if (!buf.fill()) {
      err = ParseError::io(buf.last_error());
      return false;
    }
    const std::string_view b = buf.buffer();
    const bool eof = b.size() < buf.capacity();

    bool decided = false;
    while (i < b.size()) {
      if (b[i] == '\n') { ++i; ++line; continue; }
      if (b[i] == '\r') {
        if (i + 1 < b.size() && b[i + 1] == '\n') { i += 2; ++line; continue; }
        if (i + 1 == b.size() && !eof) break;   // "\r" may continue as "\r\n"
      }
      decided = true;
      break;
    }

    if (decided) {
      const char c = b[i];
      if (c != '>' && c != '@') {
        ParseError e;
        e.kind = ErrorKind::InvalidStart;
        e.found = c;
        Position p;
        p.line = line;
        p.byte = buf.file_offset() + i;
        e.pos.record = p;
        err = std::move(e);
        return false;
      }
      out.format = c == '>' ? SeqFormat::Fasta : SeqFormat::Fastq;
      out.byte = i;
      out.line = line;
      return true;
    }

    if (eof) return false;
    buf.make_room(i);
    i = 0;
  }
}

}
