#include "fastx_scanner/buffer_manager.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace fx {

BufferManager::BufferManager(std::unique_ptr<ByteSource> src, std::size_t capacity,
                             std::unique_ptr<BufPolicy> policy)
  : src_(std::move(src)), policy_(std::move(policy)) {
  if (!src_) throw std::invalid_argument("BufferManager: null byte source");
  if (!policy_) policy_ = std::make_unique<StdPolicy>();
  if (capacity < kMinCapacity) {
    throw std::invalid_argument("buffer capacity too small, should be >= " +
                                std::to_string(kMinCapacity));
  }
  if (auto l = policy_->limit(); l && capacity > *l) {
    throw std::invalid_argument("buffer capacity " + std::to_string(capacity) +
                                " exceeds the growth policy limit " + std::to_string(*l));
  }
  buf_.resize(capacity);
}

bool BufferManager::fill(std::size_t* n_read) {
  std::size_t total = 0;
  while (len_ < buf_.size()) {
    long n = src_->read(buf_.data() + len_, buf_.size() - len_);
    if (n < 0) {
      const int e = src_->last_error();
      if (e == EINTR) continue;
      last_errno_ = e ? e : EIO;
      if (n_read) *n_read = total;
      return false;
    }
    if (n == 0) break;
    len_  += static_cast<std::size_t>(n);
    total += static_cast<std::size_t>(n);
  }
  bytes_ += total;
  if (n_read) *n_read = total;
  return true;
}

bool BufferManager::grow() {
  auto next = policy_->grow_to(buf_.size());
  if (!next) return false;
  buf_.resize(*next);
  ++grows_;
  return true;
}

void BufferManager::make_room(std::size_t consumed) {
  if (consumed == 0) return;
  if (consumed > len_) consumed = len_;
  const std::size_t rest = len_ - consumed;
  if (rest) std::memmove(buf_.data(), buf_.data() + consumed, rest);
  len_ = rest;
  file_offset_ += consumed;
  ++relocations_;
}

bool BufferManager::seek_to(std::uint64_t offset) {
  len_ = 0;
  file_offset_ = offset;
  if (!src_->seek(offset)) {
    last_errno_ = src_->last_error() ? src_->last_error() : ESPIPE;
    return false;
  }
  return true;
}

}
