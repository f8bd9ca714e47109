#include "fastx_scanner/run_json.hpp"
#include <cstdio>
#include <sstream>
#include <cmath> // std::isfinite

namespace fx {

// Length of the well-formed UTF-8 sequence starting at s[i], 0 if there is none.
static std::size_t utf8_len(const std::string& s, std::size_t i){
  const auto b = [&](std::size_t k){ return static_cast<unsigned char>(s[k]); };
  const unsigned char c = b(i);
  std::size_t n = 0;
  unsigned char lo = 0x80, hi = 0xBF;
  if (c >= 0xC2 && c <= 0xDF) n = 2;
  else if (c >= 0xE0 && c <= 0xEF) { n = 3; if (c == 0xE0) lo = 0xA0; if (c == 0xED) hi = 0x9F; }
  else if (c >= 0xF0 && c <= 0xF4) { n = 4; if (c == 0xF0) lo = 0x90; if (c == 0xF4) hi = 0x8F; }
  else return 0;
  if (i + n > s.size()) return 0;
  if (b(i + 1) < lo || b(i + 1) > hi) return 0;
  for (std::size_t k = 2; k < n; ++k) {
    if (b(i + k) < 0x80 || b(i + k) > 0xBF) return 0;
  }
  return n;
}

// Bytes that are not valid UTF-8 are written as the code point of the same
// value (Latin-1).
static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (std::size_t i = 0; i < s.size(); ++i){
    const char c = s[i];
    const unsigned char u = static_cast<unsigned char>(c);
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (u < 0x20) {
          char tmp[8];
          std::snprintf(tmp, sizeof(tmp), "\\u%04x", static_cast<unsigned>(u));
          o << tmp;
        } else if (u < 0x80) {
          o << c;
        } else if (const std::size_t n = utf8_len(s, i)) {
          o.write(s.data() + i, static_cast<std::streamsize>(n));
          i += n - 1;
        } else {
          char tmp[8];
          std::snprintf(tmp, sizeof(tmp), "\\u%04x", static_cast<unsigned>(u));
          o << tmp;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

template <class T>
static void opt_num(std::ostringstream& o, const std::optional<T>& v) {
  if (v) o << *v; else o << "null";
}

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"filename\":"; esc(o, p.filename); o << ",";
  o << "\"format\":";   esc(o, p.format);   o << ",";
  o << "\"reader\":";   esc(o, p.reader);   o << ",";
  o << "\"file_size\":" << p.file_size << ",";
  o << "\"batch\":" << (p.batch ? "true" : "false") << ",";

  o << "\"records\":" << p.records << ",";
  o << "\"bases\":" << p.bases << ",";
  o << "\"qual_bytes\":" << p.qual_bytes << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"min_len\":" << p.min_len << ",";
  o << "\"max_len\":" << p.max_len << ",";
  o << "\"mean_len\":" << safe_num(p.mean_len) << ",";

  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"records_per_sec\":" << safe_num(p.records_per_sec) << ",";

  o << "\"buffer\":{"
    << "\"capacity\":" << p.buffer_capacity << ","
    << "\"grows\":" << p.buffer_grows << ","
    << "\"relocations\":" << p.relocations << "},";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << p.stage_times[i].second << "}";
  }
  o << "],";

  o << "\"errors_by_kind\":{";
  bool first=true;
  for (auto& kv : p.errors_by_kind) {
    if (!first) o << ",";
    first=false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "},";

  o << "\"error\":";
  if (!p.error) {
    o << "null";
  } else {
    const auto& e = *p.error;
    o << "{\"kind\":"; esc(o, e.kind);
    o << ",\"message\":"; esc(o, e.message);
    o << ",\"line\":"; opt_num(o, e.line);
    o << ",\"byte\":"; opt_num(o, e.byte);
    o << ",\"record\":"; opt_num(o, e.record);
    o << ",\"id\":"; esc(o, e.id);
    o << "}";
  }

  o << "}";
  return o.str();
}

}
