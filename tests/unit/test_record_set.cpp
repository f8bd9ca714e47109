#include "fastx_scanner/readers.hpp"
#include <initializer_list>
#include <iostream>
#include <memory>
#include <stdexcept>
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

template <class Reader>
static std::vector<fx::OwnedRecord> stream_all(const std::string& data, std::size_t cap, bool* err) {
  fx::ReaderConfig cfg;
  cfg.capacity = cap;
  Reader r(mem(data), cfg);
  typename Reader::View v;
  std::vector<fx::OwnedRecord> out;
  while (r.next(v)) out.push_back(v.to_owned());
  *err = r.error().has_value();
  return out;
}

template <class Reader>
static std::vector<fx::OwnedRecord> batch_all(const std::string& data, std::size_t cap, bool* err,
                                              std::size_t* batches = nullptr) {
  fx::ReaderConfig cfg;
  cfg.capacity = cap;
  Reader r(mem(data), cfg);
  typename Reader::Set set;
  std::vector<fx::OwnedRecord> out;
  std::size_t n = 0;
  while (r.read_record_set(set)) {
    ++n;
    for (const auto& rec : set) out.push_back(rec.to_owned());
  }
  *err = r.error().has_value();
  if (batches) *batches = n;
  return out;
}

template <class Reader>
static bool equivalent(const std::string& data, std::initializer_list<std::size_t> caps) {
  bool err = false;
  const auto ref = stream_all<Reader>(data, 1 << 16, &err);
  if (err || ref.empty()) return false;
  for (std::size_t cap : caps) {
    if (batch_all<Reader>(data, cap, &err) != ref || err) {
      std::cerr << "  batch at capacity " << cap << " differs\n";
      return false;
    }
  }
  return true;
}

int main(){
  std::string fastq, fasta;
  for (int i = 0; i < 25; ++i) {
    const std::size_t n = static_cast<std::size_t>(1 + (i * 29) % 90);
    fastq += "@q" + std::to_string(i) + "\n" + std::string(n, 'A') + "\n+\n" + std::string(n, 'F') + "\n";
    fasta += ">f" + std::to_string(i) + "\n" + std::string(n, 'G') + "\n" + std::string(i % 3, 'T') + "\n";
  }

  check(equivalent<fx::FastqReader>(fastq, {3, 8, 50, 300, 1 << 16}), "FASTQ batches equal streaming");
  check(equivalent<fx::FastaReader>(fasta, {3, 8, 50, 300, 1 << 16}), "FASTA batches equal streaming");
  check(equivalent<fx::FastxReader>(fastq, {3, 50, 1 << 16}), "FASTX batches equal streaming");
  check(equivalent<fx::FastqMultilineReader>(fastq, {3, 50, 1 << 16}), "multi-line FASTQ batches equal streaming");

  // one batch holds everything when the buffer does
  {
    bool err = false;
    std::size_t batches = 0;
    const auto all = batch_all<fx::FastqReader>(fastq, 1 << 16, &err, &batches);
    check(all.size() == 25 && batches == 1 && !err, "single batch for a small input");

    batch_all<fx::FastqReader>(fastq, 64, &err, &batches);
    check(batches > 1 && !err, "several batches for a small buffer");
  }

  // records stay valid after the reader moved on
  {
    fx::FastqReader r(mem("@a\nAC\n+\nII\n@b\nGT\n+\nHH\n"));
    fx::FastqReader::Set set;
    check(r.read_record_set(set) && set.size() == 2 && !set.empty(), "batch of two");
    check(!r.read_record_set(set) && set.empty() && !r.error(), "next batch is empty at the end");

    fx::FastqReader r2(mem("@a\nAC\n+\nII\n@b\nGT\n+\nHH\n"), 8, std::make_unique<fx::StdPolicy>());
    fx::FastqReader::Set first;
    check(r2.read_record_set(first) && first.size() == 1, "small buffer: first batch");
    const fx::OwnedRecord before = first[0].to_owned();
    fx::FastqReader::View v;
    check(r2.next(v) && v.id() == "b", "reader continues after the batch");
    check(first[0].to_owned() == before && first[0].id() == "a", "batch unaffected by later reads");
  }

  // next() and read_record_set() can be mixed
  {
    fx::FastaReader r(mem(">a\nA\n>b\nC\n>c\nG\n"));
    fx::FastaReader::View v;
    fx::FastaReader::Set set;
    check(r.next(v) && v.id() == "a", "streamed first record");
    check(r.read_record_set(set) && set.size() == 2 && set[0].id() == "b" && set[1].id() == "c",
          "batch continues with the following records");
    check(r.position().record == 2, "record index counts batched records");
  }

  // record cap per batch
  {
    const std::string five = "@a\nA\n+\nI\n@b\nC\n+\nI\n@c\nG\n+\nI\n@d\nT\n+\nI\n@e\nN\n+\nI\n";
    fx::FastqReader r(mem(five));
    fx::FastqReader::Set set(2);
    std::vector<std::size_t> sizes;
    std::vector<fx::OwnedRecord> capped;
    while (r.read_record_set(set)) {
      sizes.push_back(set.size());
      for (const auto& rec : set) capped.push_back(rec.to_owned());
    }
    bool err = false;
    check(sizes == std::vector<std::size_t>{2, 2, 1} && !r.error(), "cap of 2 gives batches 2, 2, 1");
    check(capped == stream_all<fx::FastqReader>(five, 1 << 16, &err) && !err, "capped batches equal streaming");

    bool bounded = true, same = true;
    for (std::size_t cap : {3u, 8u, 50u, 300u}) {
      fx::ReaderConfig cfg;
      cfg.capacity = cap;
      fx::FastqReader rq(mem(fastq), cfg);
      fx::FastqReader::Set s3(3);
      std::vector<fx::OwnedRecord> out;
      while (rq.read_record_set(s3)) {
        if (s3.size() > 3) bounded = false;
        for (const auto& rec : s3) out.push_back(rec.to_owned());
      }
      if (out != stream_all<fx::FastqReader>(fastq, 1 << 16, &err) || rq.error()) same = false;
    }
    check(bounded && same, "cap holds for small buffers");

    fx::FastqReader rm(mem(five));
    fx::FastqReader::View v;
    check(rm.read_record_set(set) && set.size() == 2, "capped batch");
    check(rm.next(v) && v.id() == "c", "next() continues after a capped batch");
    set.set_max_records(0);
    check(rm.read_record_set(set) && set.size() == 2 && set[0].id() == "d", "cap lifted");
  }

  // views notice when their source moved on
  {
    fx::FastaReader r(mem(">a\nA\n>b\nC\n>c\nG\n"));
    fx::FastaReader::View v, w;
    check(r.next(v) && !v.stale() && v.id() == "a", "fresh view");
    check(r.next(w) && v.stale() && !w.stale(), "older view stale after next()");
#if FX_VIEW_CHECKS
    bool thrown = false;
    try {
      (void)v.id();
    } catch (const std::logic_error&) {
      thrown = true;
    }
    check(thrown, "stale view access throws");
#endif

    fx::FastaReader::Set set(1);
    check(r.read_record_set(set) && set.size() == 1, "one-record batch");
    const fx::FastaReader::View first = set[0];
    check(!first.stale() && first.id() == "c" && w.stale(), "batch view fresh, reader view stale");
    check(!r.read_record_set(set) && first.stale(), "batch view stale after refill");
    check(!fx::FastaReader::View().stale(), "empty view is never stale");
  }

  // an error drops the whole batch
  {
    fx::FastqReader r(mem("@a\nA\n+\nI\n@b\nAC\n+\nI\n"));
    fx::FastqReader::Set set;
    check(!r.read_record_set(set) && set.empty(), "batch with a bad record returns nothing");
    check(r.error() && r.error()->kind == fx::ErrorKind::UnequalLengths &&
          r.error()->pos.id && *r.error()->pos.id == "b", "error names the bad record");
    check(!r.read_record_set(set) && !r.error(), "finished after the error");
  }

  return g_fail ? 1 : 0;
}
