#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

namespace fx {

constexpr std::size_t kKiB = 1024;
constexpr std::size_t kMiB = 1024 * kKiB;
constexpr std::size_t kGiB = 1024 * kMiB;

// Decides how the read buffer grows when a record does not fit.
class BufPolicy {
public:
  virtual ~BufPolicy() = default;

  // New capacity for a buffer currently holding `current` bytes.
  virtual std::size_t grow(std::size_t current) const = 0;

  // Hard ceiling, if any.
  virtual std::optional<std::size_t> limit() const { return std::nullopt; }

  // grow() checked against limit(); nullopt means the buffer may not grow.
  std::optional<std::size_t> grow_to(std::size_t current) const;
};

// Doubles up to `double_until`, then adds `double_until` per step.
class DoubleUntil : public BufPolicy {
public:
  explicit DoubleUntil(std::size_t double_until) : double_until_(double_until) {}
  std::size_t grow(std::size_t current) const override;
  std::size_t double_until() const noexcept { return double_until_; }

private:
  std::size_t double_until_;
};

// Default: doubles until 8 MiB, then grows linearly in 8 MiB steps, unbounded.
class StdPolicy : public DoubleUntil {
public:
  StdPolicy() : DoubleUntil(8 * kMiB) {}
};

class DoubleUntilLimited : public DoubleUntil {
public:
  DoubleUntilLimited(std::size_t double_until, std::size_t limit)
    : DoubleUntil(double_until), limit_(limit) {}
  std::optional<std::size_t> limit() const override { return limit_; }

private:
  std::size_t limit_;
};

struct PolicyConfig {
  enum class Kind { Std, DoubleUntil, DoubleUntilLimited };

  Kind        kind         = Kind::Std;
  std::size_t double_until = 8 * kMiB;
  std::size_t limit        = 1 * kGiB;   // only used by DoubleUntilLimited
};

std::unique_ptr<BufPolicy> make_policy(const PolicyConfig& cfg);

// "std" | "double_until" | "limited"
std::optional<PolicyConfig::Kind> parse_policy_kind(std::string_view s);

// Human readable byte sizes: "4096", "64K", "1.5M", "2G" (binary multiples,
// optional trailing "B" / "iB"). Returns nullopt on malformed input.
std::optional<std::size_t> parse_size(std::string_view s);

}
