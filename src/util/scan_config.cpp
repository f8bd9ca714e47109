#include "fastx_scanner/scan_config.hpp"
#include <simdjson.h>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>

namespace fx {

std::optional<InputFormat> parse_input_format(std::string_view s) {
  if (s == "auto")  return InputFormat::Auto;
  if (s == "fasta") return InputFormat::Fasta;
  if (s == "fastq") return InputFormat::Fastq;
  if (s == "fastx") return InputFormat::Fastx;
  return std::nullopt;
}

std::string_view to_string(InputFormat f) noexcept {
  switch (f) {
    case InputFormat::Auto:  return "auto";
    case InputFormat::Fasta: return "fasta";
    case InputFormat::Fastq: return "fastq";
    case InputFormat::Fastx: return "fastx";
  }
  return "auto";
}

namespace {

bool fail(std::string* err_out, std::string msg) {
  if (err_out) *err_out = std::move(msg);
  return false;
}

bool get_string(simdjson::ondemand::value v, std::string_view key, std::string& out, std::string* err) {
  std::string_view s;
  if (v.get_string().get(s)) return fail(err, std::string(key) + ": expected a string");
  out.assign(s.data(), s.size());
  return true;
}

bool get_bool(simdjson::ondemand::value v, std::string_view key, bool& out, std::string* err) {
  if (v.get_bool().get(out)) return fail(err, std::string(key) + ": expected true or false");
  return true;
}

// Numbers or size strings ("64K", "1.5M").
bool get_size(simdjson::ondemand::value v, std::string_view key, std::size_t& out, std::string* err) {
  simdjson::ondemand::json_type t;
  if (v.type().get(t)) return fail(err, std::string(key) + ": bad value");
  if (t == simdjson::ondemand::json_type::string) {
    std::string_view s;
    if (v.get_string().get(s)) return fail(err, std::string(key) + ": bad string");
    auto n = parse_size(s);
    if (!n) return fail(err, std::string(key) + ": bad size '" + std::string(s) + "'");
    out = *n;
    return true;
  }
  std::uint64_t n = 0;
  if (v.get_uint64().get(n)) return fail(err, std::string(key) + ": expected a size");
  out = static_cast<std::size_t>(n);
  return true;
}

bool apply_key(std::string_view key, simdjson::ondemand::value v, ScanConfig& cfg, std::string* err) {
  std::string s;
  if (key == "format") {
    if (!get_string(v, key, s, err)) return false;
    auto f = parse_input_format(s);
    if (!f) return fail(err, "format: expected auto|fasta|fastq|fastx, got '" + s + "'");
    cfg.format = *f;
    return true;
  }
  if (key == "multiline_qual") return get_bool(v, key, cfg.multiline_qual, err);
  if (key == "single_line")    return get_bool(v, key, cfg.single_line, err);
  if (key == "check_lengths")  return get_bool(v, key, cfg.check_lengths, err);
  if (key == "batch")          return get_bool(v, key, cfg.batch, err);
  if (key == "verbose")        return get_bool(v, key, cfg.verbose, err);
  if (key == "write_report")   return get_bool(v, key, cfg.write_report, err);
  if (key == "capacity")       return get_size(v, key, cfg.reader.capacity, err);
  if (key == "double_until")   return get_size(v, key, cfg.reader.policy.double_until, err);
  if (key == "limit")          return get_size(v, key, cfg.reader.policy.limit, err);
  if (key == "wrap")           return get_size(v, key, cfg.wrap, err);
  if (key == "batch_records")  return get_size(v, key, cfg.batch_records, err);
  if (key == "threads")        return get_size(v, key, cfg.threads, err);
  if (key == "policy") {
    if (!get_string(v, key, s, err)) return false;
    auto k = parse_policy_kind(s);
    if (!k) return fail(err, "policy: expected std|double_until|limited, got '" + s + "'");
    cfg.reader.policy.kind = *k;
    return true;
  }
  if (key == "report_root")  return get_string(v, key, cfg.report_root, err);
  if (key == "template_dir") return get_string(v, key, cfg.template_dir, err);
  if (key == "to_fasta")     return get_string(v, key, cfg.to_fasta, err);
  if (key == "slug_mode") {
    if (!get_string(v, key, s, err)) return false;
    if (s != "hashprefix" && s != "basename" && s != "keypath")
      return fail(err, "slug_mode: expected hashprefix|basename|keypath, got '" + s + "'");
    cfg.slug_mode = s;
    return true;
  }
  if (key == "slug_len") {
    std::int64_t n = 0;
    if (v.get_int64().get(n) || n <= 0) return fail(err, "slug_len: expected a positive integer");
    cfg.slug_len = static_cast<int>(n);
    return true;
  }
  return fail(err, "unknown key '" + std::string(key) + "'");
}

}

bool parse_scan_config(std::string_view json, ScanConfig& cfg, std::string* err_out) {
  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(json);

  // work on a copy so a failed load leaves `cfg` untouched
  ScanConfig next = cfg;
  try {
    simdjson::ondemand::document doc = parser.iterate(padded);
    simdjson::ondemand::object obj;
    if (doc.get_object().get(obj)) return fail(err_out, "config: top level must be an object");
    for (auto field : obj) {
      std::string_view key = field.unescaped_key().value();
      if (!apply_key(key, field.value().value(), next, err_out)) return false;
    }
    if (!doc.at_end()) return fail(err_out, "config: trailing content");
  } catch (const simdjson::simdjson_error& e) {
    return fail(err_out, std::string("config: ") + e.what());
  }
  cfg = next;
  return true;
}

bool load_scan_config(const std::string& path, ScanConfig& cfg, std::string* err_out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return fail(err_out, "cannot open config " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_scan_config(ss.str(), cfg, err_out);
}

}
