#include "fastx_scanner/artifact_writer.hpp"
#include "fastx_scanner/byte_source.hpp"
#include "fastx_scanner/metrics.hpp"
#include "fastx_scanner/parallel.hpp"
#include "fastx_scanner/path_utils.hpp"
#include "fastx_scanner/readers.hpp"
#include "fastx_scanner/run_json.hpp"
#include "fastx_scanner/scan_config.hpp"
#include "fastx_scanner/writer.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitReport = 2;
constexpr int kExitParse = 3;

const char* kUsage =
  "Usage: fastx-scan [--config=FILE] [--format=auto|fasta|fastq|fastx]\n"
  "                  [--multiline-qual] [--single-line] [--no-length-check] [--batch]\n"
  "                  [--capacity=SIZE] [--policy=std|double_until|limited]\n"
  "                  [--double-until=SIZE] [--limit=SIZE]\n"
  "                  [--report-root=DIR] [--template-dir=DIR] [--no-report]\n"
  "                  [--slug-mode=hashprefix|basename|keypath] [--slug-len=N]\n"
  "                  [--batch-records=N] [--threads=N]\n"
  "                  [--to-fasta=FILE] [--wrap=N] [--verbose] FILE...\n"
  "\n"
  "FILE may be '-' for standard input. --no-length-check only affects\n"
  "streaming mode; --batch always compares FASTQ lengths. --threads\n"
  "implies --batch.\n";

struct Cli {
  fx::ScanConfig cfg;
  std::vector<std::string> files;
};

bool bad_flag(const std::string& a, const std::string& why, std::string* err) {
  *err = a + ": " + why;
  return false;
}

bool size_flag(const std::string& a, const std::string& v, std::size_t& out, std::string* err) {
  auto n = fx::parse_size(v);
  if (!n) return bad_flag(a, "bad size '" + v + "'", err);
  out = *n;
  return true;
}

// --config is applied first so every other flag overrides the file.
bool parse_cli(int argc, char** argv, Cli& c, std::string* err) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    if (a.rfind("--config=", 0) == 0) {
      const std::string path = a.substr(9);
      if (!fx::load_scan_config(path, c.cfg, err)) return false;
      std::cerr << "[config] loaded " << path << "\n";
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    auto& cfg = c.cfg;

    if (eat("--config=", &v)) continue;
    if (eat("--format=", &v)) {
      auto f = fx::parse_input_format(v);
      if (!f) return bad_flag(a, "expected auto|fasta|fastq|fastx", err);
      cfg.format = *f;
      continue;
    }
    if (a == "--multiline-qual")  { cfg.multiline_qual = true; continue; }
    if (a == "--single-line")     { cfg.single_line = true; continue; }
    if (a == "--no-length-check") { cfg.check_lengths = false; continue; }
    if (a == "--batch")           { cfg.batch = true; continue; }
    if (a == "--verbose")         { cfg.verbose = true; continue; }
    if (a == "--no-report")       { cfg.write_report = false; continue; }
    if (eat("--capacity=", &v))     { if (!size_flag(a, v, cfg.reader.capacity, err)) return false; continue; }
    if (eat("--double-until=", &v)) { if (!size_flag(a, v, cfg.reader.policy.double_until, err)) return false; continue; }
    if (eat("--limit=", &v))        { if (!size_flag(a, v, cfg.reader.policy.limit, err)) return false; continue; }
    if (eat("--wrap=", &v))         { if (!size_flag(a, v, cfg.wrap, err)) return false; continue; }
    if (eat("--batch-records=", &v)) { if (!size_flag(a, v, cfg.batch_records, err)) return false; continue; }
    if (eat("--threads=", &v))      { if (!size_flag(a, v, cfg.threads, err)) return false; continue; }
    if (eat("--policy=", &v)) {
      auto k = fx::parse_policy_kind(v);
      if (!k) return bad_flag(a, "expected std|double_until|limited", err);
      cfg.reader.policy.kind = *k;
      continue;
    }
    if (eat("--report-root=", &cfg.report_root)) continue;
    if (eat("--template-dir=", &cfg.template_dir)) continue;
    if (eat("--to-fasta=", &cfg.to_fasta)) continue;
    if (eat("--slug-mode=", &v)) {
      if (v != "hashprefix" && v != "basename" && v != "keypath")
        return bad_flag(a, "expected hashprefix|basename|keypath", err);
      cfg.slug_mode = v;
      continue;
    }
    if (eat("--slug-len=", &v)) {
      try {
        cfg.slug_len = std::stoi(v);
      } catch (const std::exception&) {
        return bad_flag(a, "expected an integer", err);
      }
      if (cfg.slug_len <= 0) return bad_flag(a, "must be positive", err);
      continue;
    }
    if (a == "-h" || a == "--help") {
      std::cout << kUsage;
      std::exit(kExitOk);
    }
    if (a.size() > 1 && a[0] == '-' && a[1] == '-') return bad_flag(a, "unknown flag", err);
    c.files.push_back(a);
  }

  if (c.files.empty()) {
    *err = "no input files";
    return false;
  }
  if (!c.cfg.to_fasta.empty() && c.files.size() > 1) {
    *err = "--to-fasta takes a single input file";
    return false;
  }
  return true;
}

// Outcome of one scan, shared by all reader types.
struct ScanResult {
  std::string format = "unknown";
  std::optional<fx::ParseError> error;
  std::uint64_t bytes = 0;
  std::uint32_t grows = 0;
  std::uint32_t relocations = 0;
  std::uint64_t capacity = 0;
  bool write_failed = false;
};

using Lengths = std::pair<std::size_t, std::size_t>;   // sequence, quality

template <class Store>
Lengths record_lengths(const fx::RecordView<Store>& r) {
  const std::size_t seq_len = fx::sum_line_lengths<Store>(r.seq_lines());
  const std::size_t qual_len = r.has_quality() ? fx::sum_line_lengths<Store>(r.qual_lines()) : 0;
  return {seq_len, qual_len};
}

template <class Reader>
ScanResult run_reader(Reader& reader, const fx::ScanConfig& cfg, fx::ScanMetrics& m,
                      std::ostream* fasta_out) {
  ScanResult res;
  // false stops the scan once the FASTA output fails
  auto on_record = [&](const typename Reader::View& r, const Lengths& len) {
    m.add_record(len.first, len.second);
    if (fasta_out && !fx::write_as_fasta(*fasta_out, r, cfg.wrap)) {
      res.write_failed = true;
      return false;
    }
    return true;
  };

  m.start_stage("parse");
  if (cfg.threads > 0) {
    // lengths on the workers; metrics and output stay in input order
    fx::ParallelConfig pcfg;
    pcfg.n_threads = cfg.threads;
    pcfg.max_records = cfg.batch_records;
    // a false return is explained by reader.error() or write_failed below
    (void)fx::read_parallel_records<Lengths>(reader, pcfg,
      [](const typename Reader::View& r, Lengths& len) { len = record_lengths(r); },
      [&](const typename Reader::View& r, Lengths& len) { return on_record(r, len); });
  } else if (cfg.batch) {
    typename Reader::Set set(cfg.batch_records);
    bool go = true;
    while (go && reader.read_record_set(set)) {
      for (const auto& r : set) {
        if (!(go = on_record(r, record_lengths(r)))) break;
      }
    }
  } else {
    typename Reader::View r;
    while (cfg.check_lengths ? reader.next(r) : reader.next_unchecked_len(r)) {
      if (!on_record(r, record_lengths(r))) break;
    }
  }
  m.end_stage("parse");

  if (auto f = reader.format()) res.format = std::string(fx::to_string(*f));
  res.error = reader.error();
  res.bytes = reader.buffer().bytes_read();
  res.grows = reader.buffer().grow_count();
  res.relocations = reader.buffer().relocation_count();
  res.capacity = reader.buffer().capacity();
  return res;
}

template <class Reader>
ScanResult scan_with(const std::string& path, const fx::ScanConfig& cfg, fx::ScanMetrics& m,
                     std::ostream* fasta_out) {
  Reader reader(std::make_unique<fx::FileSource>(path), cfg.reader);
  return run_reader(reader, cfg, m, fasta_out);
}

// Resolves `auto` by file extension; unknown extensions let the content decide.
fx::InputFormat resolve_format(const std::string& path, const fx::ScanConfig& cfg) {
  if (cfg.format != fx::InputFormat::Auto) return cfg.format;
  auto f = fx::detect_format(path);
  if (!f) return fx::InputFormat::Fastx;
  return *f == fx::SeqFormat::Fasta ? fx::InputFormat::Fasta : fx::InputFormat::Fastq;
}

ScanResult dispatch(const std::string& path, const fx::ScanConfig& cfg, fx::ScanMetrics& m,
                    std::ostream* fasta_out, std::string& reader_name) {
  switch (resolve_format(path, cfg)) {
    case fx::InputFormat::Fasta:
      if (cfg.single_line) {
        reader_name = "FastaSingleLineReader";
        return scan_with<fx::FastaSingleLineReader>(path, cfg, m, fasta_out);
      }
      reader_name = "FastaReader";
      return scan_with<fx::FastaReader>(path, cfg, m, fasta_out);
    case fx::InputFormat::Fastq:
      if (cfg.multiline_qual) {
        reader_name = "FastqMultilineReader";
        return scan_with<fx::FastqMultilineReader>(path, cfg, m, fasta_out);
      }
      reader_name = "FastqReader";
      return scan_with<fx::FastqReader>(path, cfg, m, fasta_out);
    case fx::InputFormat::Auto:
    case fx::InputFormat::Fastx:
      break;
  }
  if (cfg.multiline_qual) {
    reader_name = "FastxMultilineReader";
    return scan_with<fx::FastxMultilineReader>(path, cfg, m, fasta_out);
  }
  reader_name = "FastxReader";
  return scan_with<fx::FastxReader>(path, cfg, m, fasta_out);
}

std::string fmt_double(double v) {
  std::ostringstream ss;
  ss.setf(std::ios::fixed);
  ss.precision(2);
  ss << v;
  return ss.str();
}

fx::RunJsonError to_run_error(const fx::ParseError& e) {
  fx::RunJsonError out;
  out.kind = std::string(fx::to_string(e.kind));
  out.message = e.message();
  if (auto p = e.pos.position()) {
    out.line = p->line;
    out.byte = p->byte;
    out.record = p->record;
  }
  if (e.pos.id) out.id = *e.pos.id;
  return out;
}

fx::TemplateContext summary_context(const fx::RunJsonPayload& p) {
  fx::TemplateContext ctx;
  ctx.set("filename", p.filename);
  ctx.set("format", p.format);
  ctx.set("reader", p.reader);
  ctx.set("records", std::to_string(p.records));
  ctx.set("bases", std::to_string(p.bases));
  ctx.set("min_len", std::to_string(p.min_len));
  ctx.set("mean_len", fmt_double(p.mean_len));
  ctx.set("max_len", std::to_string(p.max_len));
  ctx.set("bytes", std::to_string(p.bytes));
  ctx.set("wall_time_ms", fmt_double(p.wall_time_ms));
  ctx.set("throughput_mb_s", fmt_double(p.throughput_mb_s));
  ctx.set("buffer_capacity", std::to_string(p.buffer_capacity));
  ctx.set("buffer_grows", std::to_string(p.buffer_grows));
  ctx.set("relocations", std::to_string(p.relocations));

  ctx.declare_list("stages");
  for (const auto& st : p.stage_times)
    ctx.add_item("stages", {{"name", st.first}, {"duration_ms", std::to_string(st.second)}});

  ctx.declare_list("error");
  if (p.error) ctx.add_item("error", {{"kind", p.error->kind}, {"message", p.error->message}});
  return ctx;
}

int scan_one_file(const std::string& filepath, const fx::ScanConfig& cfg) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  std::ofstream fasta_file;
  if (!cfg.to_fasta.empty()) {
    if (!fx::ensure_parent_dirs(cfg.to_fasta)) {
      std::cerr << "[scan] cannot create directories for " << cfg.to_fasta << "\n";
      return kExitUsage;
    }
    fasta_file.open(cfg.to_fasta, std::ios::binary);
    if (!fasta_file) {
      std::cerr << "[scan] cannot open " << cfg.to_fasta << " for writing\n";
      return kExitUsage;
    }
  }

  fx::ScanMetrics metrics;
  std::string reader_name;
  ScanResult res;
  try {
    res = dispatch(filepath, cfg, metrics, cfg.to_fasta.empty() ? nullptr : &fasta_file,
                   reader_name);
  } catch (const std::invalid_argument& e) {
    std::cerr << "[scan] " << filepath << ": " << e.what() << "\n";
    return kExitUsage;
  }

  if (fasta_file.is_open()) {
    fasta_file.flush();
    if (res.write_failed || !fasta_file) {
      std::cerr << "[scan] write failed: " << cfg.to_fasta << "\n";
      return kExitReport;
    }
  }

  metrics.add_bytes(res.bytes);
  metrics.set_buffer_stats(res.grows, res.relocations, res.capacity);
  if (res.error) metrics.add_error(fx::to_string(res.error->kind));

  const auto t1 = ch::steady_clock::now();
  const double wall_ms = ch::duration<double, std::milli>(t1 - t0).count();
  const fx::ScanStats st = metrics.snapshot(wall_ms);

  if (res.error) {
    std::cerr << "[scan] " << filepath << ": " << res.error->message() << "\n";
  }

  fx::RunJsonPayload p{};
  p.filename = filepath;
  p.format = res.format;
  p.reader = reader_name;
  std::error_code fec;
  if (filepath != "-") {
    const auto fsz = std::filesystem::file_size(filepath, fec);
    if (!fec) p.file_size = fsz;
  }
  p.batch = cfg.batch || cfg.threads > 0;
  p.records = st.records;
  p.bases = st.bases;
  p.qual_bytes = st.qual_bytes;
  p.bytes = st.bytes;
  p.min_len = st.min_len;
  p.max_len = st.max_len;
  p.mean_len = st.mean_len;
  p.wall_time_ms = wall_ms;
  p.throughput_mb_s = st.throughput_mb_s;
  p.records_per_sec = st.records_per_sec;
  p.buffer_capacity = st.final_capacity;
  p.buffer_grows = st.buffer_grows;
  p.relocations = st.relocations;
  for (const auto& s : st.stages) p.stage_times.emplace_back(s.name, s.duration_ms);
  p.errors_by_kind = st.errors_by_kind;
  if (res.error) p.error = to_run_error(*res.error);

  if (cfg.verbose) {
    for (const auto& s : st.stages)
      std::cerr << "[scan]   stage " << s.name << ": " << s.duration_ms << " ms\n";
    std::cerr << "[scan]   buffer " << st.final_capacity << " bytes, "
              << st.buffer_grows << " grows, " << st.relocations << " relocations\n";
  }

  const int parse_rc = res.error ? kExitParse : kExitOk;
  std::cout << "[scan] " << (res.error ? "error" : "ok") << ": " << filepath
            << " " << p.format << " records=" << p.records << " bases=" << p.bases
            << " " << fmt_double(p.throughput_mb_s) << " MB/s\n";

  if (!cfg.write_report) return parse_rc;

  const std::string slug = fx::report_slug(filepath, cfg.slug_mode, cfg.slug_len);
  std::string err;
  if (!fx::write_report_dir(cfg.report_root, slug, fx::RunJsonWriter::to_json(p),
                            summary_context(p), cfg.template_dir, &err)) {
    std::cerr << "[scan] write_report_dir failed: " << err << "\n";
    return std::max(parse_rc, kExitReport);
  }
  if (cfg.verbose) {
    std::cerr << "[scan]   report " << (std::filesystem::path(cfg.report_root) / slug).string() << "\n";
  }
  return parse_rc;
}

}

int main(int argc, char** argv) {
  Cli cli;
  std::string err;
  if (!parse_cli(argc, argv, cli, &err)) {
    std::cerr << "[config] " << err << "\n" << kUsage;
    return kExitUsage;
  }

  int rc = kExitOk;
  for (const auto& f : cli.files) {
    rc = std::max(rc, scan_one_file(f, cli.cfg));
  }
  return rc;
}
