#pragma once
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>

namespace fx {

// Removes one trailing '\r'.
inline std::string_view trim_cr(std::string_view s) noexcept {
  if (!s.empty() && s.back() == '\r') s.remove_suffix(1);
  return s;
}

// Removes a trailing "\n", "\r\n" or lone "\r".
inline std::string_view trim_end(std::string_view s) noexcept {
  if (s.empty()) return s;
  if (s.back() == '\n') { s.remove_suffix(1); return trim_cr(s); }
  if (s.back() == '\r') s.remove_suffix(1);
  return s;
}

// buf[a, b), or empty when the range is reversed or past the end. Record end
// offsets may sit one past the buffer when the last line has no terminator.
inline std::string_view slice_or_empty(std::string_view buf, std::size_t a, std::size_t b) noexcept {
  if (a > b || b > buf.size()) return {};
  return buf.substr(a, b - a);
}

// Walks '\n'-terminated lines of `text` from a start offset. Unterminated
// trailing bytes are never returned as a line.
class LineScanner {
public:
  LineScanner(std::string_view text, std::size_t start) noexcept : text_(text), pos_(start) {}

  // line includes its '\n'; next_pos is the offset right after it.
  bool next(std::string_view& line, std::size_t& next_pos) noexcept {
    if (pos_ >= text_.size()) return false;
    const void* hit = std::memchr(text_.data() + pos_, '\n', text_.size() - pos_);
    if (!hit) return false;
    const std::size_t end = static_cast<std::size_t>(static_cast<const char*>(hit) - text_.data()) + 1;
    line = text_.substr(pos_, end - pos_);
    pos_ = end;
    next_pos = end;
    return true;
  }

  // Consumes `guess` if the text continues with exactly those bytes.
  bool guess_next(std::string_view guess, std::size_t& next_pos) noexcept {
    if (pos_ > text_.size() || text_.size() - pos_ < guess.size()) return false;
    if (std::memcmp(text_.data() + pos_, guess.data(), guess.size()) != 0) return false;
    pos_ += guess.size();
    next_pos = pos_;
    return true;
  }

  std::size_t pos() const noexcept { return pos_; }

private:
  std::string_view text_;
  std::size_t pos_;
};

// Lines of one record part, terminators stripped. Either walks stored line
// start offsets or searches for line breaks on the fly.
class LineIter {
public:
  LineIter() = default;

  // Yields buf[pos[i], pos[i+1] - 1) for i in [0, n - 1).
  static LineIter from_positions(std::string_view buf, const std::size_t* pos, std::size_t n) noexcept {
    LineIter it;
    it.mode_ = Mode::Positions;
    it.text_ = buf;
    it.pos_ = pos;
    it.n_ = n;
    return it;
  }

  // Splits `text` on '\n'; with one_line the whole slice is a single line.
  static LineIter search(std::string_view text, bool one_line) noexcept {
    LineIter it;
    it.mode_ = one_line ? Mode::Single : Mode::Search;
    it.text_ = text;
    return it;
  }

  bool next(std::string_view& line) noexcept {
    switch (mode_) {
      case Mode::Positions:
        if (i_ + 1 >= n_) return false;
        line = trim_cr(slice_or_empty(text_, pos_[i_], pos_[i_ + 1] - 1));
        ++i_;
        return true;
      case Mode::Single:
        if (done_) return false;
        line = trim_end(text_);
        done_ = true;
        return true;
      case Mode::Search: {
        if (text_.empty()) return false;
        const std::size_t nl = text_.find('\n');
        if (nl == std::string_view::npos) {
          line = trim_cr(text_);
          text_ = {};
          return true;
        }
        line = trim_cr(text_.substr(0, nl));
        text_.remove_prefix(nl + 1);
        return true;
      }
      case Mode::Empty:
        break;
    }
    return false;
  }

private:
  enum class Mode { Empty, Positions, Single, Search };
  Mode mode_ = Mode::Empty;
  std::string_view text_;
  const std::size_t* pos_ = nullptr;
  std::size_t n_ = 0;
  std::size_t i_ = 0;
  bool done_ = false;
};

// Concatenates `n` lines. A single line is returned as is; several lines are
// joined into `out`.
inline std::string_view join_lines(LineIter lines, std::size_t n, std::string& out) {
  std::string_view line;
  if (n == 0) return {};
  if (n == 1) return lines.next(line) ? line : std::string_view{};
  out.clear();
  while (lines.next(line)) out.append(line.data(), line.size());
  return out;
}

}
