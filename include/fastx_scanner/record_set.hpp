#pragma once
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string_view>
#include <vector>

#include "fastx_scanner/arena.hpp"
#include "fastx_scanner/record_view.hpp"

namespace fx {

// Batch of records sharing one copy of the reader buffer. Refilled by
// read_record_set(); stores and buffer capacity are reused between batches.
// A batch ends when the buffer holds no further complete record, or after
// `max_records` records (0: no cap).
template <class Store>
class RecordSet {
public:
  RecordSet() = default;
  explicit RecordSet(std::size_t max_records) : max_records_(max_records) {}

  class const_iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type        = RecordView<Store>;
    using difference_type   = std::ptrdiff_t;
    using pointer           = void;
    using reference         = RecordView<Store>;

    const_iterator() = default;
    const_iterator(const RecordSet* set, std::size_t i) : set_(set), i_(i) {}

    RecordView<Store> operator*() const { return (*set_)[i_]; }
    const_iterator& operator++() { ++i_; return *this; }
    const_iterator operator++(int) { const_iterator t = *this; ++i_; return t; }
    bool operator==(const const_iterator& o) const { return set_ == o.set_ && i_ == o.i_; }
    bool operator!=(const const_iterator& o) const { return !(*this == o); }

  private:
    const RecordSet* set_{nullptr};
    std::size_t i_{0};
  };

  std::size_t size() const noexcept { return used_; }
  bool empty() const noexcept { return used_ == 0; }

  std::size_t max_records() const noexcept { return max_records_; }
  void set_max_records(std::size_t n) noexcept { max_records_ = n; }
  bool full() const noexcept { return max_records_ != 0 && used_ >= max_records_; }

  // Valid until the set is refilled or cleared.
  RecordView<Store> operator[](std::size_t i) const { return RecordView<Store>(buf_, &stores_[i], &gen_); }

  const_iterator begin() const { return const_iterator(this, 0); }
  const_iterator end() const { return const_iterator(this, used_); }

  void clear() {
    ++gen_;
    used_ = 0;
    buf_ = {};
    arena_.reset();
  }

  // Filled by the reader.
  void push(const Store& s) {
    if (used_ < stores_.size()) stores_[used_] = s;
    else stores_.push_back(s);
    ++used_;
  }

  void set_buffer(std::string_view live) {
    arena_.reset();
    buf_ = arena_.copy(live);
  }

  std::string_view buffer() const noexcept { return buf_; }

private:
  Arena arena_;
  std::string_view buf_;
  std::vector<Store> stores_;
  std::size_t used_{0};
  std::size_t max_records_{0};
  std::uint64_t gen_{0};
};

}
