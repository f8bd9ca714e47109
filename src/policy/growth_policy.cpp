#include "fastx_scanner/growth_policy.hpp"

namespace fx {

std::optional<std::size_t> BufPolicy::grow_to(std::size_t current) const {
  const std::size_t next = grow(current);
  if (next <= current) return std::nullopt;
  if (auto l = limit(); l && next > *l) return std::nullopt;
  return next;
}

std::size_t DoubleUntil::grow(std::size_t current) const {
  if (current < double_until_) return current * 2;
  return current + double_until_;
}

std::unique_ptr<BufPolicy> make_policy(const PolicyConfig& cfg) {
  switch (cfg.kind) {
    case PolicyConfig::Kind::DoubleUntil:
      return std::make_unique<DoubleUntil>(cfg.double_until);
    case PolicyConfig::Kind::DoubleUntilLimited:
      return std::make_unique<DoubleUntilLimited>(cfg.double_until, cfg.limit);
    case PolicyConfig::Kind::Std:
    default:
      return std::make_unique<StdPolicy>();
  }
}

std::optional<PolicyConfig::Kind> parse_policy_kind(std::string_view s) {
  if (s == "std")          return PolicyConfig::Kind::Std;
  if (s == "double_until") return PolicyConfig::Kind::DoubleUntil;
  if (s == "limited")      return PolicyConfig::Kind::DoubleUntilLimited;
  return std::nullopt;
}

}
