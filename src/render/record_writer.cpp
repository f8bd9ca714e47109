#include "fastx_scanner/writer.hpp"
#include <stdexcept>

namespace fx {

namespace {

void put(std::ostream& out, std::string_view s) {
  out.write(s.data(), static_cast<std::streamsize>(s.size()));
}

void put_head(std::ostream& out, char start, std::string_view head) {
  out.put(start);
  put(out, head);
  out.put('\n');
}

void check_width(std::size_t width) {
  if (width == 0) throw std::invalid_argument("line width must be > 0");
}

}

bool write_fasta(std::ostream& out, std::string_view head, std::string_view seq) {
  put_head(out, '>', head);
  put(out, seq);
  out.put('\n');
  return static_cast<bool>(out);
}

bool write_fasta_wrap(std::ostream& out, std::string_view head, std::string_view seq,
                      std::size_t width) {
  check_width(width);
  put_head(out, '>', head);
  for (std::size_t i = 0; i < seq.size(); i += width) {
    put(out, seq.substr(i, width));
    out.put('\n');
  }
  return static_cast<bool>(out);
}

bool write_fasta_lines(std::ostream& out, std::string_view head, LineIter seq) {
  put_head(out, '>', head);
  std::string_view line;
  while (seq.next(line)) put(out, line);
  out.put('\n');
  return static_cast<bool>(out);
}

bool write_fasta_lines_wrap(std::ostream& out, std::string_view head, LineIter seq,
                            std::size_t width) {
  check_width(width);
  put_head(out, '>', head);
  std::size_t n_line = 0;   // bytes on the current output line
  std::string_view chunk;
  while (seq.next(chunk)) {
    while (chunk.size() > width - n_line) {
      put(out, chunk.substr(0, width - n_line));
      out.put('\n');
      chunk.remove_prefix(width - n_line);
      n_line = 0;
    }
    put(out, chunk);
    n_line += chunk.size();
  }
  out.put('\n');
  return static_cast<bool>(out);
}

bool write_fastq(std::ostream& out, std::string_view head, std::string_view seq,
                 std::string_view qual) {
  put_head(out, '@', head);
  put(out, seq);
  put(out, "\n+\n");
  put(out, qual);
  out.put('\n');
  return static_cast<bool>(out);
}

bool write_fastq_lines(std::ostream& out, std::string_view head, LineIter seq, LineIter qual) {
  put_head(out, '@', head);
  std::string_view line;
  while (seq.next(line)) put(out, line);
  put(out, "\n+\n");
  while (qual.next(line)) put(out, line);
  out.put('\n');
  return static_cast<bool>(out);
}

}
