#include "fastx_scanner/core_reader.hpp"
#include <utility>

namespace fx {

namespace {

int byte_at(std::string_view buf, std::size_t i) noexcept {
  return i < buf.size() ? static_cast<unsigned char>(buf[i]) : -1;
}

// Line content without its '\n' and optional '\r'.
std::string_view line_content(std::string_view line) noexcept {
  return trim_cr(line.substr(0, line.size() - 1));
}

SearchPos next_stage(SearchPos p) noexcept {
  return static_cast<SearchPos>(static_cast<std::uint8_t>(p) + 1);
}

}

template <class Store>
CoreReader<Store>::CoreReader(std::unique_ptr<ByteSource> src, std::size_t capacity,
                              std::unique_ptr<BufPolicy> policy)
  : buf_(std::move(src), capacity, std::move(policy)) {}

template <class Store>
bool CoreReader<Store>::next(const FormatFlags& f) {
  error_.reset();
  ++generation_;
  switch (state_) {
    case State::New:
      if (!fill()) return false;
      state_ = State::Parsing;
      break;
    case State::Positioned:
      state_ = State::Parsing;
      break;
    case State::Finished:
      return false;
    case State::Parsing:
      advance_record();
      break;
  }

  // A cursor left by read_record_set() belongs to the current record.
  std::optional<SearchPosition> resume = search_pos_;
  search_pos_.reset();
  bool check_last_byte = false;

  for (;;) {
    Found found;
    if (!find_record(f, resume, check_last_byte, found)) return false;
    if (found) {
      if (!at_end(f)) {
        if (!adjust_buffer(f, *found)) return false;
        resume = found;
        continue;
      }
      if (!check_last_byte) {
        // Whatever the last pass finds, no record follows it.
        check_last_byte = true;
        state_ = State::Finished;
        resume = found;
        continue;
      }
      bool has_record = false;
      if (!check_end(f, *found, has_record)) return false;
      if (!has_record) return false;
    }
    if (!f.is_fasta && !f.skip_length_check && !check_lengths(f)) return false;
    return true;
  }
}

template <class Store>
bool CoreReader<Store>::read_record_set(RecordSet<Store>& set, const FormatFlags& f) {
  error_.reset();
  ++generation_;
  set.clear();

  bool adjust = false;
  switch (state_) {
    case State::New:
      if (!fill()) return false;
      state_ = State::Positioned;
      break;
    case State::Finished:
      return false;
    case State::Parsing:
      // The record returned by next() is done; move on before relocating.
      advance_record();
      state_ = State::Positioned;
      adjust = true;
      break;
    case State::Positioned:
      adjust = true;
      break;
  }

  SearchPosition pos = search_pos_ ? *search_pos_ : SearchPosition{SearchPos::Head, store_.record_start()};
  search_pos_.reset();
  if (adjust) {
    make_room(pos);
    if (!fill()) return false;
  }

  std::optional<SearchPosition> resume = pos;
  bool check_last_byte = false;

  auto failed = [&]() {
    set.clear();
    return false;
  };

  for (;;) {
    Found found;
    if (!find_record(f, resume, check_last_byte, found)) return failed();

    if (!found) {
      if (!f.is_fasta && !f.skip_length_check && !check_lengths(f)) return failed();
      set.push(store_);
      line_idx_ += store_.num_lines();
      ++record_idx_;
      store_.init_record(store_.record_end());
      length_diff_ = 0;
      resume.reset();
      if (set.full()) {
        // More records may follow, even after the last-byte pass.
        state_ = State::Positioned;
        search_pos_ = SearchPosition{SearchPos::Head, store_.record_start()};
        break;
      }
      continue;
    }

    if (at_end(f)) {
      if (!check_last_byte) {
        check_last_byte = true;
        state_ = State::Finished;
        resume = found;
        continue;
      }
      bool has_record = false;
      if (!check_end(f, *found, has_record)) return failed();
      if (has_record) {
        if (!f.is_fasta && !f.skip_length_check && !check_lengths(f)) return failed();
        set.push(store_);
      } else if (set.empty()) {
        return false;
      }
    } else if (set.empty()) {
      // Not even one record fits: the buffer has to grow.
      if (!grow(f) || !fill()) return failed();
      resume = found;
      continue;
    }

    search_pos_ = *found;
    break;
  }

  set.set_buffer(buf_.buffer());
  return true;
}

template <class Store>
bool CoreReader<Store>::seek(const Position& pos, bool multiline) {
  error_.reset();
  ++generation_;
  search_pos_.reset();
  line_idx_ = pos.line;
  record_idx_ = pos.record;
  length_diff_ = 0;

  const std::uint64_t off = buf_.file_offset();
  const std::uint64_t corr = multiline ? 1 : 0;
  if (state_ != State::New && pos.byte >= off && pos.byte - off + corr <= buf_.size()) {
    store_.init_record(static_cast<std::size_t>(pos.byte - off));
    state_ = State::Positioned;
    return true;
  }

  store_.init_record(0);
  state_ = State::New;
  if (!buf_.seek_to(pos.byte)) {
    fail(ParseError::io(buf_.last_error()));
    return false;
  }
  return true;
}

template <class Store>
void CoreReader<Store>::init_pos(std::size_t byte, std::uint64_t line) {
  store_.init_record(byte);
  line_idx_ = line;
  state_ = State::Positioned;
}

template <class Store>
void CoreReader<Store>::finish() {
  state_ = State::Finished;
}

template <class Store>
void CoreReader<Store>::fail(ParseError e) {
  error_ = std::move(e);
  state_ = State::Finished;
}

template <class Store>
Position CoreReader<Store>::position() const {
  Position p;
  p.line = line_idx_;
  p.byte = buf_.file_offset() + store_.record_start();
  p.record = record_idx_;
  return p;
}

template <class Store>
bool CoreReader<Store>::find_record(const FormatFlags& f, std::optional<SearchPosition> resume,
                                    bool check_last_byte, Found& out) {
  const std::string_view buffer = buf_.buffer();
  std::string_view search_buf = buffer;
  if (f.lookahead() && !check_last_byte) {
    // Keep one byte to peek at past every line.
    if (buffer.empty()) {
      out = SearchPosition{SearchPos::Head, 0};
      return true;
    }
    search_buf.remove_suffix(1);
  }

  SearchPos stage = resume ? resume->stage : SearchPos::Head;
  LineScanner lines(search_buf, resume ? resume->byte : store_.record_start());

  for (;;) {
    Step step = Step::Failed;
    switch (stage) {
      case SearchPos::Head: step = search_head(f, buffer, lines); break;
      case SearchPos::Seq:  step = search_seq(f, buffer, lines); break;
      case SearchPos::Sep:  step = search_sep(f, lines); break;
      case SearchPos::Qual: step = search_qual(f, buffer, lines); break;
    }
    switch (step) {
      case Step::Next:
        stage = next_stage(stage);
        continue;
      case Step::Complete:
        out.reset();
        return true;
      case Step::Incomplete:
        out = SearchPosition{stage, lines.pos()};
        return true;
      case Step::Failed:
        state_ = State::Finished;
        return false;
    }
  }
}

template <class Store>
typename CoreReader<Store>::Step
CoreReader<Store>::search_head(const FormatFlags& f, std::string_view buffer, LineScanner& lines) {
  std::string_view line;
  std::size_t next_pos = 0;
  for (;;) {
    if (!lines.next(line, next_pos)) return Step::Incomplete;
    if (line == "\n" || line == "\r\n") {
      store_.set_record_start(next_pos);
      ++line_idx_;
      continue;
    }
    if (line[0] != f.start_byte()) {
      ParseError e = make_error(f, ErrorKind::InvalidStart);
      e.expected = f.start_byte();
      e.found = line[0];
      error_ = std::move(e);
      return Step::Failed;
    }
    store_.set_seq_start(next_pos);
    if (f.is_fasta && f.allow_multiline_seq && byte_at(buffer, next_pos) == '>') {
      // header directly followed by another header: empty sequence
      store_.set_sep_pos(next_pos, false);
      store_.set_record_end(next_pos, false);
      return Step::Complete;
    }
    return Step::Next;
  }
}

template <class Store>
typename CoreReader<Store>::Step
CoreReader<Store>::search_seq(const FormatFlags& f, std::string_view buffer, LineScanner& lines) {
  std::string_view line;
  std::size_t next_pos = 0;
  for (;;) {
    if (!lines.next(line, next_pos)) return Step::Incomplete;
    if (f.is_fasta) {
      if (!f.allow_multiline_seq || byte_at(buffer, next_pos) == '>') {
        store_.set_sep_pos(next_pos, true);
        store_.set_record_end(next_pos, true);
        return Step::Complete;
      }
    } else {
      if (f.allow_multiline_qual) length_diff_ += static_cast<long long>(line_content(line).size());
      if (!f.allow_multiline_qual || byte_at(buffer, next_pos) == '+') {
        store_.set_sep_pos(next_pos, true);
        return Step::Next;
      }
    }
    store_.add_seq_line_start(next_pos);
  }
}

template <class Store>
typename CoreReader<Store>::Step
CoreReader<Store>::search_sep(const FormatFlags& f, LineScanner& lines) {
  if constexpr (Store::kHasQuality) {
    std::size_t next_pos = 0;
    if (lines.guess_next("+\n", next_pos)) {
      store_.set_qual_start(next_pos);
      return Step::Next;
    }
    std::string_view line;
    if (!lines.next(line, next_pos)) return Step::Incomplete;
    // Multi-line parsing only gets here after peeking a '+'.
    if (f.allow_multiline_qual || line[0] == '+') {
      store_.set_qual_start(next_pos);
      return Step::Next;
    }
    ParseError e = make_error(f, ErrorKind::InvalidSep);
    e.pos.offset = ErrorOffset{1 + store_.num_seq_lines(), store_.sep_pos() - store_.record_start()};
    e.pos.id = record_id();
    const std::string_view content = line_content(line);
    if (!content.empty()) e.found_sep = content[0];
    error_ = std::move(e);
    return Step::Failed;
  } else {
    (void)f; (void)lines;
    return Step::Complete;
  }
}

template <class Store>
typename CoreReader<Store>::Step
CoreReader<Store>::search_qual(const FormatFlags& f, std::string_view buffer, LineScanner& lines) {
  if constexpr (Store::kHasQuality) {
    std::string_view line;
    std::size_t next_pos = 0;
    for (;;) {
      if (!lines.next(line, next_pos)) return Step::Incomplete;
      if (!f.allow_multiline_qual) {
        store_.set_record_end(next_pos, true);
        return Step::Complete;
      }
      // '@' is a valid quality character; only a caught-up length ends the record.
      length_diff_ -= static_cast<long long>(line_content(line).size());
      if (byte_at(buffer, next_pos) == '@' && length_diff_ <= 0) {
        store_.set_record_end(next_pos, true);
        return Step::Complete;
      }
      store_.add_qual_line_start(next_pos);
    }
  } else {
    (void)f; (void)buffer; (void)lines;
    return Step::Complete;
  }
}

template <class Store>
bool CoreReader<Store>::check_end(const FormatFlags& f, SearchPosition pos, bool& has_record) {
  const std::string_view buf = buf_.buffer();
  // A last line may lack its terminator; a lone '\r' counts as a line.
  const bool has_line = pos.byte < buf.size();
  has_record = false;

  if (pos.stage == SearchPos::Head) {
    const std::size_t start = store_.record_start();
    if (start >= buf.size()) return true;
    if (buf[start] != f.start_byte()) {
      ParseError e = make_error(f, ErrorKind::InvalidStart);
      e.expected = f.start_byte();
      e.found = buf[start];
      fail(std::move(e));
      return false;
    }
    // a header needs its terminator, fall through to UnexpectedEnd
  } else {
    bool closes = false;
    if (f.is_fasta) {
      closes = f.allow_multiline_seq || has_line;
    } else if constexpr (Store::kHasQuality) {
      closes = pos.stage == SearchPos::Qual &&
               (has_line || (f.allow_multiline_qual && pos.byte > store_.qual_start()));
    }
    if (closes) {
      // One past the buffer when the last line is unterminated. Without a
      // line left, every line was consumed with its terminator.
      const std::size_t end = (!has_line || buf.back() == '\n') ? buf.size() : buf.size() + 1;
      if (f.is_fasta) {
        store_.set_sep_pos(end, has_line);
      } else if (f.allow_multiline_qual) {
        length_diff_ -= static_cast<long long>(trim_cr(slice_or_empty(buf, pos.byte, end - 1)).size());
      }
      store_.set_record_end(end, has_line);
      has_record = true;
      return true;
    }
  }

  ParseError e = make_error(f, ErrorKind::UnexpectedEnd);
  e.pos.offset = ErrorOffset{store_.line_offset(pos.stage, has_line),
                             buf.size() - 1 - store_.record_start()};
  if (pos.stage > SearchPos::Head) e.pos.id = record_id();
  fail(std::move(e));
  return false;
}

template <class Store>
bool CoreReader<Store>::check_lengths(const FormatFlags& f) {
  if constexpr (Store::kHasQuality) {
    if (!store_.has_qual()) return true;
    const std::string_view buf = buf_.buffer();
    std::size_t seq_len = 0, qual_len = 0;
    if (!f.allow_multiline_qual) {
      if (lengths_match(store_, buf, false, &seq_len, &qual_len)) return true;
    } else {
      seq_len = sum_line_lengths<Store>(store_.seq_lines(buf));
      qual_len = static_cast<std::size_t>(static_cast<long long>(seq_len) - length_diff_);
      if (seq_len == qual_len) return true;
    }
    ParseError e = make_error(f, ErrorKind::UnequalLengths);
    e.pos.id = record_id();
    e.seq_len = seq_len;
    e.qual_len = qual_len;
    fail(std::move(e));
    return false;
  } else {
    (void)f;
    return true;
  }
}

template <class Store>
bool CoreReader<Store>::at_end(const FormatFlags& f) const noexcept {
  // The unsearched lookahead byte does not count as free space.
  return buf_.size() + (f.lookahead() ? 1 : 0) < buf_.capacity();
}

template <class Store>
void CoreReader<Store>::advance_record() {
  line_idx_ += store_.num_lines();
  ++record_idx_;
  store_.init_record(store_.record_end());
  length_diff_ = 0;
}

template <class Store>
bool CoreReader<Store>::adjust_buffer(const FormatFlags& f, SearchPosition& pos) {
  if (store_.record_start() == 0) {
    // the record fills the whole buffer
    if (!grow(f)) return false;
  } else {
    make_room(pos);
  }
  return fill();
}

template <class Store>
bool CoreReader<Store>::grow(const FormatFlags& f) {
  if (buf_.grow()) return true;
  fail(make_error(f, ErrorKind::BufferLimit));
  return false;
}

template <class Store>
void CoreReader<Store>::make_room(SearchPosition& pos) {
  const std::size_t offset = store_.record_start();
  buf_.make_room(offset);
  store_.move_to_start(pos.stage, offset);
  pos.byte -= offset;
}

template <class Store>
bool CoreReader<Store>::fill() {
  if (buf_.fill()) return true;
  fail(ParseError::io(buf_.last_error()));
  return false;
}

template <class Store>
ParseError CoreReader<Store>::make_error(const FormatFlags& f, ErrorKind kind) const {
  ParseError e;
  e.kind = kind;
  e.format = f.is_fasta ? SeqFormat::Fasta : SeqFormat::Fastq;
  e.pos.record = position();
  return e;
}

template <class Store>
std::string CoreReader<Store>::record_id() const {
  return std::string(head_id(record_head(store_, buf_.buffer())));
}

template class CoreReader<FastaLineStore>;
template class CoreReader<FastaRangeStore>;
template class CoreReader<FastqRangeStore>;
template class CoreReader<MultiRangeStore>;
template class CoreReader<FastxLineStore>;

}
