#pragma once
#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace fx {

// Bump allocator made of blocks. Returned pointers stay valid until reset(),
// even when later allocations add blocks.
class Arena {
public:
  explicit Arena(std::size_t cap_bytes = 0);

  void* alloc(std::size_t n);
  std::string_view copy(std::string_view s);

  // Reset head to zero; capacity stays (blocks are merged into one).
  void reset();

  // Reset and optionally shrink capacity to `keep_capacity` bytes.
  void reset_and_shrink(std::size_t keep_capacity = 0);

  std::size_t used() const noexcept { return used_; }
  std::size_t capacity() const noexcept;
  std::size_t high_water() const noexcept { return high_water_; }

private:
  struct Block {
    std::unique_ptr<char[]> data;
    std::size_t size = 0;
  };

  std::vector<Block> blocks_;
  std::size_t cur_{0};     // block currently bumped
  std::size_t head_{0};    // offset inside blocks_[cur_]
  std::size_t used_{0};
  std::size_t high_water_{0};
};

}
