#include "fastx_scanner/arena.hpp"
#include <algorithm>
#include <cstring>

namespace fx {

Arena::Arena(std::size_t cap_bytes) {
  if (cap_bytes) blocks_.push_back(Block{std::make_unique<char[]>(cap_bytes), cap_bytes});
}

void* Arena::alloc(std::size_t n) {
  if (n == 0) n = 1;
  while (cur_ < blocks_.size() && head_ + n > blocks_[cur_].size) {
    ++cur_;
    head_ = 0;
  }
  if (cur_ == blocks_.size()) {
    const std::size_t last = blocks_.empty() ? 0 : blocks_.back().size;
    const std::size_t size = std::max(n, last + last / 2 + 64);
    blocks_.push_back(Block{std::make_unique<char[]>(size), size});
    head_ = 0;
  }
  char* p = blocks_[cur_].data.get() + head_;
  head_ += n;
  used_ += n;
  if (used_ > high_water_) high_water_ = used_;
  return p;
}

std::string_view Arena::copy(std::string_view s) {
  if (s.empty()) return {};
  void* p = alloc(s.size());
  std::memcpy(p, s.data(), s.size());
  return std::string_view(static_cast<const char*>(p), s.size());
}

void Arena::reset() {
  if (blocks_.size() > 1) {
    const std::size_t total = capacity();
    blocks_.clear();
    blocks_.push_back(Block{std::make_unique<char[]>(total), total});
  }
  cur_ = 0;
  head_ = 0;
  used_ = 0;
}

void Arena::reset_and_shrink(std::size_t keep_capacity) {
  reset();
  if (!blocks_.empty() && keep_capacity < blocks_[0].size) {
    blocks_.clear();
    if (keep_capacity) blocks_.push_back(Block{std::make_unique<char[]>(keep_capacity), keep_capacity});
  }
  if (high_water_ > capacity()) high_water_ = capacity();
}

std::size_t Arena::capacity() const noexcept {
  std::size_t total = 0;
  for (const auto& b : blocks_) total += b.size;
  return total;
}

}
