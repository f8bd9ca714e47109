#include "fastx_scanner/byte_source.hpp"
#include "fastx_scanner/readers.hpp"

#include <cctype>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static bool ieq_ext(const std::string& s, const char* ext) {
  if (s.size() != std::strlen(ext)) return false;
  for (size_t i = 0; i < s.size(); ++i)
    if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(ext[i]))) return false;
  return true;
}

static bool name_has(const fs::path& p, const char* token) {
  return p.filename().string().find(token) != std::string::npos;
}

static bool expected_ok_for(const fs::path& p) {
  return !name_has(p, "bad");
}

struct Res {
  bool ok{true};
  uint64_t records{0};
  uint64_t bases{0};
  uint64_t qual{0};
  std::string err;
};

template <class Reader>
static Res run(const fs::path& f, size_t capacity) {
  Res r;
  fx::ReaderConfig cfg;
  cfg.capacity = capacity;
  Reader reader(std::make_unique<fx::FileSource>(f.string()), cfg);
  typename Reader::View v;
  std::string scratch;
  while (reader.next(v)) {
    ++r.records;
    r.bases += v.full_seq(scratch).size();
    if (v.has_quality()) r.qual += v.full_qual(scratch).size();
  }
  if (reader.error()) { r.ok = false; r.err = reader.error()->message(); }
  return r;
}

using Runner = std::function<Res(const fs::path&, size_t)>;

struct NamedRunner {
  const char* name;
  Runner fn;
};

static std::vector<NamedRunner> runners_for(const fs::path& p) {
  std::vector<NamedRunner> out;
  const std::string e = p.extension().string();
  if (ieq_ext(e, ".fa") || ieq_ext(e, ".fasta")) {
    out.push_back({"fasta", run<fx::FastaReader>});
    out.push_back({"fastx", run<fx::FastxReader>});
    out.push_back({"fastx-multiline", run<fx::FastxMultilineReader>});
    if (name_has(p, "single_line")) out.push_back({"fasta-single-line", run<fx::FastaSingleLineReader>});
  } else if (ieq_ext(e, ".fq") || ieq_ext(e, ".fastq")) {
    if (name_has(p, "multi_line")) {
      out.push_back({"fastq-multiline", run<fx::FastqMultilineReader>});
      out.push_back({"fastx-multiline", run<fx::FastxMultilineReader>});
    } else {
      out.push_back({"fastq", run<fx::FastqReader>});
      out.push_back({"fastx", run<fx::FastxReader>});
    }
  }
  return out;
}

int main(int argc, char** argv){
  fs::path dir = (argc > 1) ? fs::path(argv[1]) : fs::path("tests/data");
  if (!fs::exists(dir)) {
    std::cerr << "[ERR] fixtures dir not found: " << dir << "\n";
    return 2;
  }

  const size_t capacities[] = {3, 7, 64, 64 * 1024};

  size_t total=0, passed=0, failed=0;
  for (auto& it : fs::directory_iterator(dir)) {
    if (!it.is_regular_file()) continue;
    const fs::path p = it.path();
    const auto runners = runners_for(p);
    if (runners.empty()) continue;

    const bool expect_ok = expected_ok_for(p);
    bool have_ref = false;
    Res ref;

    for (const auto& nr : runners) {
      for (size_t cap : capacities) {
        Res r = nr.fn(p, cap);
        bool verdict = (r.ok == expect_ok);
        // Results may not depend on the reader variant or the buffer size.
        if (verdict && expect_ok) {
          if (!have_ref) { ref = r; have_ref = true; }
          else verdict = r.records == ref.records && r.bases == ref.bases && r.qual == ref.qual;
        }

        ++total; verdict ? ++passed : ++failed;
        if (verdict) {
          std::cout << "[PASS] " << p.filename().string() << "  " << nr.name << "  cap=" << cap
                    << "  records=" << r.records << "  bases=" << r.bases
                    << "  expected_ok=" << (expect_ok?"true":"false") << "\n";
        } else {
          std::cout << "[FAIL] " << p.filename().string() << "  " << nr.name << "  cap=" << cap
                    << "  records=" << r.records << "  bases=" << r.bases << "  qual=" << r.qual
                    << "  expected_ok=" << (expect_ok?"true":"false")
                    << "  actual_ok=" << (r.ok?"true":"false") << "\n";
          if (have_ref)
            std::cout << "       reference: records=" << ref.records << " bases=" << ref.bases
                      << " qual=" << ref.qual << "\n";
          if (!r.err.empty())
            std::cout << "       error: " << r.err << "\n";
        }
      }
    }
  }

  std::cout << "\nSummary: total=" << total << " passed=" << passed << " failed=" << failed << "\n";
  return failed == 0 ? 0 : 1;
}
