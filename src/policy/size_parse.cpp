#include "fastx_scanner/growth_policy.hpp"
#include <cctype>
#include <cmath>
#include <limits>
#include <system_error>
#include <string_view>
#include <fast_float/fast_float.h>

namespace fx {

static std::string_view trim_ws(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
  return s;
}

std::optional<std::size_t> parse_size(std::string_view s) {
  s = trim_ws(s);
  if (s.empty()) return std::nullopt;

  double mantissa;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), mantissa);
  if (ec != std::errc() || ptr == s.data()) return std::nullopt;
  if (!std::isfinite(mantissa) || mantissa < 0) return std::nullopt;

  std::string_view unit = trim_ws(std::string_view(ptr, s.data() + s.size() - ptr));
  double scale = 1.0;
  if (!unit.empty()) {
    switch (std::toupper(static_cast<unsigned char>(unit.front()))) {
      case 'B': scale = 1.0; break;
      case 'K': scale = double(kKiB); break;
      case 'M': scale = double(kMiB); break;
      case 'G': scale = double(kGiB); break;
      default: return std::nullopt;
    }
    std::string_view rest = unit.substr(1);
    // accept "K", "KB", "KiB"
    if (!(rest.empty() || rest == "B" || rest == "b" || rest == "iB")) return std::nullopt;
    if (unit.front() == 'B' || unit.front() == 'b') {
      if (!rest.empty()) return std::nullopt;
    }
  }

  const double bytes = std::floor(mantissa * scale);
  if (bytes >= double(std::numeric_limits<std::size_t>::max())) return std::nullopt;
  return static_cast<std::size_t>(bytes);
}

}
