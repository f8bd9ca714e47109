#include "fastx_scanner/growth_policy.hpp"
#include "fastx_scanner/readers.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

static int g_fail = 0;

static void check(bool ok, const std::string& what) {
  if (ok) std::cout << "[PASS] " << what << "\n";
  else  { std::cerr << "[FAIL] " << what << "\n"; ++g_fail; }
}

int main(){
  // default policy: doubling up to 8 MiB, then linear
  fx::StdPolicy std_policy;
  check(std_policy.grow(4) == 8, "std doubles small buffers");
  check(std_policy.grow(8 * fx::kMiB) == 16 * fx::kMiB, "std grows linearly at 8 MiB");
  check(std_policy.grow(16 * fx::kMiB) == 24 * fx::kMiB, "std keeps growing by 8 MiB");
  check(!std_policy.limit(), "std is unbounded");

  fx::DoubleUntilLimited lim(16, 64);
  check(lim.grow_to(16) == std::optional<std::size_t>(32), "limited 16 -> 32");
  check(lim.grow_to(32) == std::optional<std::size_t>(48), "limited 32 -> 48");
  check(lim.grow_to(48) == std::optional<std::size_t>(64), "limited 48 -> 64");
  check(!lim.grow_to(64), "limited refuses past 64");

  fx::PolicyConfig pc;
  pc.kind = fx::PolicyConfig::Kind::DoubleUntilLimited;
  pc.double_until = 4;
  pc.limit = 8;
  auto made = fx::make_policy(pc);
  check(made->limit() == std::optional<std::size_t>(8), "make_policy limited");
  check(fx::parse_policy_kind("double_until") == fx::PolicyConfig::Kind::DoubleUntil, "policy kind parse");
  check(!fx::parse_policy_kind("tiny"), "bad policy kind rejected");

  // size strings
  check(fx::parse_size("4096") == std::optional<std::size_t>(4096), "parse 4096");
  check(fx::parse_size("64K") == std::optional<std::size_t>(64 * 1024), "parse 64K");
  check(fx::parse_size("64KiB") == std::optional<std::size_t>(64 * 1024), "parse 64KiB");
  check(fx::parse_size("1.5M") == std::optional<std::size_t>(1536 * 1024), "parse 1.5M");
  check(fx::parse_size(" 10B ") == std::optional<std::size_t>(10), "parse 10B");
  check(fx::parse_size("2G") == std::optional<std::size_t>(2 * fx::kGiB), "parse 2G");
  check(!fx::parse_size(""), "empty size rejected");
  check(!fx::parse_size("abc"), "non-number rejected");
  check(!fx::parse_size("10X"), "bad unit rejected");
  check(!fx::parse_size("-1"), "negative size rejected");

  // a record that outgrows the limit ends in BufferLimit
  {
    fx::ReaderConfig cfg;
    cfg.capacity = 4;
    cfg.policy.kind = fx::PolicyConfig::Kind::DoubleUntilLimited;
    cfg.policy.double_until = 4;
    cfg.policy.limit = 8;
    fx::FastqReader r(std::make_unique<fx::MemorySource>("@r1\nACGTACGT\n+\nIIIIIIII\n"), cfg);
    fx::FastqReader::View v;
    const bool got = r.next(v);
    check(!got && r.error() && r.error()->kind == fx::ErrorKind::BufferLimit,
          "oversized record hits BufferLimit");
    check(r.buffer().capacity() == 8, "buffer grew up to the limit");
    check(!r.next(v) && !r.error(), "reader finished after BufferLimit");
  }

  // the same record fits once the limit allows it
  {
    fx::ReaderConfig cfg;
    cfg.capacity = 4;
    cfg.policy.kind = fx::PolicyConfig::Kind::DoubleUntilLimited;
    cfg.policy.double_until = 4;
    cfg.policy.limit = 64;
    fx::FastqReader r(std::make_unique<fx::MemorySource>("@r1\nACGTACGT\n+\nIIIIIIII\n"), cfg);
    fx::FastqReader::View v;
    check(r.next(v) && v.seq() == "ACGTACGT", "record read below the limit");
  }

  // capacity above the limit is a programming error
  bool threw = false;
  try {
    fx::ReaderConfig cfg;
    cfg.capacity = 128;
    cfg.policy.kind = fx::PolicyConfig::Kind::DoubleUntilLimited;
    cfg.policy.limit = 64;
    fx::FastaReader r(std::make_unique<fx::MemorySource>(">a\n"), cfg);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  check(threw, "capacity above limit throws");

  return g_fail ? 1 : 0;
}
