#include "fastx_scanner/readers.hpp"
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

static int g_fail = 0;

static void check(bool ok, const std::string& what) {
  if (ok) std::cout << "[PASS] " << what << "\n";
  else  { std::cerr << "[FAIL] " << what << "\n"; ++g_fail; }
}

// Reads every record with its position, then seeks back to each one in
// reverse order and compares.
template <class Reader>
static bool round_trip(std::unique_ptr<fx::ByteSource> src, const fx::ReaderConfig& cfg,
                       std::size_t expect_records) {
  Reader r(std::move(src), cfg);
  typename Reader::View v;
  std::vector<std::pair<fx::Position, fx::OwnedRecord>> seen;
  while (r.next(v)) seen.emplace_back(r.position(), v.to_owned());
  if (r.error() || seen.size() != expect_records) {
    std::cerr << "  linear read failed, got " << seen.size() << " records\n";
    return false;
  }
  for (auto it = seen.rbegin(); it != seen.rend(); ++it) {
    if (!r.seek(it->first) || !r.next(v)) {
      std::cerr << "  seek to record " << it->first.record << " failed\n";
      return false;
    }
    if (v.to_owned() != it->second || r.position() != it->first) {
      std::cerr << "  record " << it->first.record << " differs after seek\n";
      return false;
    }
  }
  // and onwards from the first record again
  if (!r.seek(seen.front().first)) return false;
  std::size_t n = 0;
  while (r.next(v)) {
    if (v.to_owned() != seen[n].second) return false;
    ++n;
  }
  return n == seen.size() && !r.error();
}

int main(){
  std::string fastq, fasta;
  for (int i = 0; i < 12; ++i) {
    const std::size_t n = static_cast<std::size_t>(3 + (i * 11) % 40);
    fastq += "@s" + std::to_string(i) + "\n" + std::string(n, 'T') + "\n+\n" + std::string(n, '5') + "\n";
    fasta += ">s" + std::to_string(i) + "\n" + std::string(n, 'C') + "\nAA\n";
    if (i % 4 == 0) fasta += "\n";
  }

  for (std::size_t cap : {16u, 64u, 4096u}) {
    fx::ReaderConfig cfg;
    cfg.capacity = cap;
    check(round_trip<fx::FastqReader>(std::make_unique<fx::MemorySource>(fastq), cfg, 12),
          "FASTQ seek round trip, capacity " + std::to_string(cap));
    check(round_trip<fx::FastaReader>(std::make_unique<fx::MemorySource>(fasta), cfg, 12),
          "FASTA seek round trip, capacity " + std::to_string(cap));
    check(round_trip<fx::FastxReader>(std::make_unique<fx::MemorySource>("\n\n" + fasta), cfg, 12),
          "FASTX seek round trip, capacity " + std::to_string(cap));
  }

  // seeking inside the buffer needs no I/O
  {
    fx::FastqReader r(std::make_unique<fx::MemorySource>(fastq));
    fx::FastqReader::View v;
    check(r.next(v) && r.next(v), "two records read");
    const fx::Position second = r.position();
    const std::uint64_t filled = r.buffer().bytes_read();
    check(r.next(v) && r.seek(second) && r.next(v) && v.id() == "s1", "seek back inside the buffer");
    check(r.buffer().bytes_read() == filled && r.buffer().file_offset() == 0, "no refill for in-buffer seek");
  }

  // seeking to a failing record reproduces the error
  {
    fx::FastqReader r(std::make_unique<fx::MemorySource>("@a\nA\n+\nI\n@b\nAC\n+\nI\n"));
    fx::FastqReader::View v;
    check(r.next(v) && v.id() == "a", "good record first");
    check(!r.next(v) && r.error(), "then the error");
    const fx::ParseError first = *r.error();
    check(first.pos.record && *first.pos.record == fx::Position{4, 9, 1}, "error at record b");

    check(r.seek(*first.pos.record), "seek to the failing record");
    check(!r.next(v) && r.error(), "error again");
    const fx::ParseError again = *r.error();
    check(again.kind == first.kind && again.pos == first.pos &&
          again.seq_len == first.seq_len && again.qual_len == first.qual_len,
          "identical error after seek");

    check(r.seek(fx::Position{}) && r.next(v) && v.id() == "a", "seek to the start after an error");
  }

  // real file: seeks outside the buffer go through the source
  {
    const fs::path p = fs::temp_directory_path() / "fx_seek_test.fq";
    {
      std::ofstream out(p, std::ios::binary);
      out << fastq;
    }
    fx::ReaderConfig cfg;
    cfg.capacity = 32;
    check(round_trip<fx::FastqReader>(std::make_unique<fx::FileSource>(p.string()), cfg, 12),
          "FASTQ seek round trip on a file");
    std::error_code ec;
    fs::remove(p, ec);
  }

  // standard input cannot seek
  {
    fx::FastqReader r(std::make_unique<fx::FileSource>("-"));
    check(!r.seek(fx::Position{0, 5, 0}), "seek on stdin fails");
    check(r.error() && r.error()->kind == fx::ErrorKind::Io && r.error()->io_errno == ESPIPE,
          "Io error with ESPIPE");
  }

  return g_fail ? 1 : 0;
}
