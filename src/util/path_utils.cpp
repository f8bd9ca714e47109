#include "fastx_scanner/path_utils.hpp"
#include <array>
#include <cctype>
#include <functional>
#include <iomanip>
#include <sstream>
#if defined(FX_USE_OPENSSL)
  #include <openssl/sha.h>
#endif

namespace fx {

namespace {

std::string lower_ext(std::string_view path) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return ext;
}

void truncate_to(std::string& s, int len) {
  if (len >= 0 && s.size() > static_cast<std::size_t>(len)) s.resize(static_cast<std::size_t>(len));
}

}

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  const auto parent = p.parent_path();
  if (parent.empty() || std::filesystem::is_directory(parent, ec)) return true;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

std::optional<SeqFormat> detect_format(std::string_view path) {
  static const std::array<const char*, 6> kFasta = {".fa", ".fasta", ".fna", ".ffn", ".faa", ".frn"};
  const std::string ext = lower_ext(path);
  for (const char* e : kFasta)
    if (ext == e) return SeqFormat::Fasta;
  if (ext == ".fq" || ext == ".fastq") return SeqFormat::Fastq;
  return std::nullopt;
}

std::string hex_hash_prefix(std::string_view data, int len) {
  std::ostringstream o;
  o << std::hex << std::setfill('0');
#ifdef FX_USE_OPENSSL
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
  for (int i = 0; i < (len + 1) / 2 && i < SHA256_DIGEST_LENGTH; ++i)
    o << std::setw(2) << static_cast<int>(md[i]);
#else
  // not a cryptographic hash; at most 16 digits
  o << std::setw(16) << std::hash<std::string_view>{}(data);
#endif
  std::string s = o.str();
  truncate_to(s, len);
  return s;
}

std::string make_slug(std::string_view key, std::string_view mode, int len) {
  std::string s;
  if (mode == "basename") {
    s = std::filesystem::path(std::string(key)).filename().string();
  } else if (mode == "keypath") {
    s.reserve(key.size());
    for (char c : key) {
      const char out = (c == '/' || c == '\\') ? '-' : c;
      if (out == '-' && s.empty()) continue;
      s.push_back(out);
    }
  } else {
    return hex_hash_prefix(key, len);
  }
  truncate_to(s, len);
  return s;
}

std::string report_slug(const std::string& input_path, std::string_view mode, int len) {
  if (input_path == "-") return "stdin";
  if (mode != "hashprefix") return make_slug(input_path, mode, len);
  // Hash the absolute path so the slug does not depend on the working directory.
  std::error_code ec;
  auto abs = std::filesystem::weakly_canonical(std::filesystem::path(input_path), ec);
  return make_slug(ec ? input_path : abs.string(), mode, len);
}

}
