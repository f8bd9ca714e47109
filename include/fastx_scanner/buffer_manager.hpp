#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "fastx_scanner/byte_source.hpp"
#include "fastx_scanner/growth_policy.hpp"

namespace fx {

constexpr std::size_t kDefaultCapacity = 64 * kKiB;
constexpr std::size_t kMinCapacity     = 3;

// Growable read buffer over a ByteSource. Tracks the absolute offset of the
// first buffered byte so positions inside the buffer map back to the input.
class BufferManager {
public:
  // Throws std::invalid_argument if capacity < kMinCapacity or exceeds the
  // policy limit.
  BufferManager(std::unique_ptr<ByteSource> src, std::size_t capacity,
                std::unique_ptr<BufPolicy> policy);

  // Reads until the buffer is at capacity or the source is exhausted.
  // Returns false on a read failure (errno in last_error()).
  bool fill(std::size_t* n_read = nullptr);

  // Enlarges capacity as the policy allows; false when it refuses.
  bool grow();

  // Drops the first `consumed` bytes and moves the rest to offset 0.
  void make_room(std::size_t consumed);

  // Repositions the source and empties the buffer.
  bool seek_to(std::uint64_t offset);

  std::string_view buffer() const noexcept { return {buf_.data(), len_}; }
  std::size_t size() const noexcept { return len_; }
  std::size_t capacity() const noexcept { return buf_.size(); }
  std::uint64_t file_offset() const noexcept { return file_offset_; }
  std::uint64_t bytes_read() const noexcept { return bytes_; }
  std::uint32_t grow_count() const noexcept { return grows_; }
  std::uint32_t relocation_count() const noexcept { return relocations_; }
  int last_error() const noexcept { return last_errno_; }
  const BufPolicy& policy() const noexcept { return *policy_; }

private:
  std::unique_ptr<ByteSource> src_;
  std::unique_ptr<BufPolicy> policy_;
  std::vector<char> buf_;
  std::size_t len_{0};
  std::uint64_t file_offset_{0};
  std::uint64_t bytes_{0};
  std::uint32_t grows_{0};
  std::uint32_t relocations_{0};
  int last_errno_{0};
};

}
