#include "fastx_scanner/readers.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static int g_fail = 0;

static void check(bool ok, const std::string& what) {
  if (ok) std::cout << "[PASS] " << what << "\n";
  else  { std::cerr << "[FAIL] " << what << "\n"; ++g_fail; }
}

static std::unique_ptr<fx::ByteSource> mem(const std::string& s) {
  return std::make_unique<fx::MemorySource>(s);
}

int main(){
  // plain records
  {
    fx::FastqReader r(mem("@r1 first\nACGT\n+\nIIII\n@r2\nGG\n+r2\nHH\n"));
    fx::FastqReader::View v;
    check(r.next(v) && v.head() == "r1 first" && v.seq() == "ACGT" && v.qual() == "IIII",
          "first record");
    check(v.has_quality() && v.opt_qual() && *v.opt_qual() == "IIII", "quality present");
    check(r.next(v) && v.id() == "r2" && v.seq() == "GG" && v.qual() == "HH",
          "separator line may repeat the header");
    check(r.position() == fx::Position{4, 22, 1}, "position of second record");
    check(!r.next(v) && !r.error(), "end of input");
  }

  // sequence and quality lengths differ
  {
    fx::FastqReader r(mem("@id\nACGT\n+\nIII\n"));
    fx::FastqReader::View v;
    check(!r.next(v), "unequal lengths is not a record");
    const auto& e = r.error();
    check(e && e->kind == fx::ErrorKind::UnequalLengths && e->seq_len == 4 && e->qual_len == 3,
          "UnequalLengths 4 vs 3");
    check(e && e->pos.id && *e->pos.id == "id", "UnequalLengths carries the id");
    check(e && e->message().find("sequence length is 4, but quality length is 3") != std::string::npos,
          "UnequalLengths message");
  }

  // truncated after the separator
  {
    fx::FastqReader r(mem("@id\nATGC\n+"));
    fx::FastqReader::View v;
    check(!r.next(v), "truncated record is not returned");
    const auto& e = r.error();
    check(e && e->kind == fx::ErrorKind::UnexpectedEnd, "UnexpectedEnd");
    check(e && e->pos.id && *e->pos.id == "id", "partial record id recoverable");
    check(e && e->pos.offset && e->pos.offset->line == 2 && e->pos.offset->byte == 9,
          "offset points at the separator line");
    check(!r.next(v) && !r.error(), "finished after the error");
  }

  // truncated before the sequence
  {
    fx::FastqReader r(mem("@id\n"));
    fx::FastqReader::View v;
    check(!r.next(v) && r.error() && r.error()->kind == fx::ErrorKind::UnexpectedEnd,
          "header only is UnexpectedEnd");
  }

  // bad separator
  {
    fx::FastqReader r(mem("@ok\nA\n+\nI\n@r1\nACGT\nxx\nIIII\n"));
    fx::FastqReader::View v;
    check(r.next(v) && v.id() == "ok", "record before the bad one");
    check(!r.next(v), "bad separator is not a record");
    const auto& e = r.error();
    check(e && e->kind == fx::ErrorKind::InvalidSep && e->found_sep == 'x', "InvalidSep found 'x'");
    check(e && e->pos.id && *e->pos.id == "r1", "InvalidSep id");
    check(e && e->pos.record && e->pos.record->line == 4 && e->pos.record->record == 1,
          "InvalidSep record position");
    check(e && e->pos.offset && e->pos.offset->line == 2 && e->pos.offset->byte == 9,
          "InvalidSep offset");
  }

  // empty separator line
  {
    fx::FastqReader r(mem("@r1\nACGT\n\nIIII\n"));
    fx::FastqReader::View v;
    check(!r.next(v) && r.error() && r.error()->kind == fx::ErrorKind::InvalidSep &&
          !r.error()->found_sep, "empty separator line");
  }

  // wrong start byte for FASTQ
  {
    fx::FastqReader r(mem(">r1\nACGT\n"));
    fx::FastqReader::View v;
    check(!r.next(v) && r.error() && r.error()->kind == fx::ErrorKind::InvalidStart &&
          r.error()->expected == '@' && r.error()->found == '>', "FASTA input rejected by FASTQ reader");
  }

  // CRLF endings, and a mix of LF and CRLF inside one record
  {
    fx::FastqReader r(mem("@r1\r\nAC\r\n+\r\nII\r\n@r2\nGT\n+\nHH\r\n"));
    fx::FastqReader::View v;
    check(r.next(v) && v.head() == "r1" && v.seq() == "AC" && v.qual() == "II", "CRLF record");
    check(r.next(v) && v.seq() == "GT" && v.qual() == "HH", "mixed line endings accepted");
    check(v.check_lengths_strict(), "strict check agrees");
    check(!r.next(v) && !r.error(), "end after CRLF input");
  }

  // no newline at end of input
  {
    fx::FastqReader r(mem("@r1\nACGT\n+\nIIII"));
    fx::FastqReader::View v;
    check(r.next(v) && v.qual() == "IIII", "unterminated quality line");
    check(v.store().record_end() == 16, "record end one past the buffer");
    check(!r.next(v) && !r.error(), "then end of input");
  }

  // unchecked reading leaves the comparison to the caller
  {
    fx::FastqReader r(mem("@a\nACGT\n+\nII\n@b\nAC\n+\nII\n"));
    fx::FastqReader::View v;
    check(r.next_unchecked_len(v) && v.id() == "a", "unchecked read returns a bad record");
    std::size_t sl = 0, ql = 0;
    check(!v.check_lengths(&sl, &ql) && sl == 4 && ql == 2, "check_lengths on demand");
    check(r.next_unchecked_len(v) && v.id() == "b" && v.check_lengths(), "next record is fine");
  }

  // raw line spans equal, stripped lengths not: only the strict check notices
  {
    fx::FastqReader r(mem("@a\nACG\n+\nII\r\n"));
    fx::FastqReader::View v;
    check(r.next(v), "fast path accepts equal raw spans");
    std::size_t sl = 0, ql = 0;
    check(!v.check_lengths_strict(&sl, &ql) && sl == 3 && ql == 2, "strict check rejects 3 vs 2");
  }

  // capacity invariance, including a record larger than the start capacity
  {
    std::string data;
    for (int i = 0; i < 30; ++i) {
      const std::size_t n = static_cast<std::size_t>(1 + (i * 53) % 200);
      data += "@read" + std::to_string(i) + "\n" + std::string(n, 'C') + "\n+\n" +
              std::string(n, '#') + "\n";
    }
    std::vector<fx::OwnedRecord> ref;
    {
      fx::FastqReader r(mem(data));
      fx::FastqReader::View v;
      while (r.next(v)) ref.push_back(v.to_owned());
    }
    check(ref.size() == 30, "reference read of 30 records");
    bool same = true;
    for (std::size_t cap : {3u, 4u, 9u, 32u, 211u, 1000u}) {
      fx::ReaderConfig cfg;
      cfg.capacity = cap;
      fx::FastqReader r(mem(data), cfg);
      fx::FastqReader::View v;
      std::vector<fx::OwnedRecord> got;
      while (r.next(v)) got.push_back(v.to_owned());
      if (got != ref || r.error()) {
        std::cerr << "  capacity " << cap << " differs\n";
        same = false;
      }
      if (cap == 211u && r.buffer().relocation_count() == 0) {
        std::cerr << "  capacity 211 never relocated\n";
        same = false;
      }
    }
    check(same, "records identical for every capacity");
  }

  return g_fail ? 1 : 0;
}
