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

static std::vector<fx::OwnedRecord> read_all(const std::string& data, std::size_t cap, bool* err) {
  fx::ReaderConfig cfg;
  cfg.capacity = cap;
  fx::FastqMultilineReader r(std::make_unique<fx::MemorySource>(data), cfg);
  fx::FastqMultilineReader::View v;
  std::vector<fx::OwnedRecord> out;
  while (r.next(v)) out.push_back(v.to_owned());
  *err = r.error().has_value();
  return out;
}

int main(){
  // '@' at the start of a quality line is quality data while lengths differ
  const std::string data = "@r1\nAC\nGT\n+\nII\n@I\n@r2\nA\n+\nI\n";
  {
    fx::FastqMultilineReader r(std::make_unique<fx::MemorySource>(data));
    fx::FastqMultilineReader::View v;
    std::string s1, s2;
    check(r.next(v) && v.head() == "r1", "first record");
    check(v.num_seq_lines() == 2 && v.num_qual_lines() == 2, "two sequence and two quality lines");
    check(v.full_seq(s1) == "ACGT" && v.full_qual(s2) == "II@I", "quality keeps its '@' line");
    check(r.next(v) && v.head() == "r2" && v.seq() == "A" && v.full_qual(s2) == "I",
          "second record starts at the real header");
    check(!r.next(v) && !r.error(), "end of input");
  }

  // same records for every capacity
  {
    bool err = false;
    const auto ref = read_all(data, 1024, &err);
    bool same = ref.size() == 2 && !err;
    for (std::size_t cap : {3u, 4u, 5u, 6u, 8u, 13u, 20u}) {
      if (read_all(data, cap, &err) != ref || err) {
        std::cerr << "  capacity " << cap << " differs\n";
        same = false;
      }
    }
    check(same, "capacity invariance with '@' quality lines");
  }

  // quality line starting with '@' once lengths are equal
  {
    fx::FastqMultilineReader r(std::make_unique<fx::MemorySource>("@r\nAC\n+\n@I\n@s\nG\n+\nI\n"));
    fx::FastqMultilineReader::View v;
    check(r.next(v) && v.qual() == "@I", "quality may begin with '@'");
    check(r.next(v) && v.id() == "s" && v.qual() == "I", "next header after complete quality");
  }

  // quality shorter than the sequence at end of input
  {
    fx::FastqMultilineReader r(std::make_unique<fx::MemorySource>("@r\nACGT\n+\nII"));
    fx::FastqMultilineReader::View v;
    check(!r.next(v), "short quality is not a record");
    const auto& e = r.error();
    check(e && e->kind == fx::ErrorKind::UnequalLengths && e->seq_len == 4 && e->qual_len == 2,
          "UnequalLengths 4 vs 2");
    check(e && e->pos.id && *e->pos.id == "r", "error id");
  }

  // multi-line quality without a final newline
  {
    fx::FastqMultilineReader r(std::make_unique<fx::MemorySource>("@r\nAC\nGT\n+\nII\nII"));
    fx::FastqMultilineReader::View v;
    std::string q;
    check(r.next(v) && v.full_qual(q) == "IIII", "unterminated multi-line quality");
    check(v.check_lengths_strict(), "lengths agree");
    check(!r.next(v) && !r.error(), "end of input");
  }

  // separator never seen
  {
    fx::FastqMultilineReader r(std::make_unique<fx::MemorySource>("@r\nAC\nGT\n"));
    fx::FastqMultilineReader::View v;
    check(!r.next(v) && r.error() && r.error()->kind == fx::ErrorKind::UnexpectedEnd,
          "missing separator is UnexpectedEnd");
  }

  return g_fail ? 1 : 0;
}
