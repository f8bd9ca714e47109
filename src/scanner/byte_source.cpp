#include "fastx_scanner/byte_source.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/types.h>

namespace fx {

bool ByteSource::seek(std::uint64_t) {
  errno = ESPIPE;
  return false;
}

struct FileSource::Impl {
  std::string path;
  FILE* f{nullptr};
  bool owned{false};
  int last_errno{0};

  void open() {
    if (path == "-") { f = stdin; owned = false; return; }
    f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; return; }
    owned = true;
  }

  ~Impl() { if (f && owned) std::fclose(f); }
};

FileSource::FileSource(std::string path) : p_(new Impl{std::move(path)}) { p_->open(); }

FileSource::~FileSource() { delete p_; }

long FileSource::read(char* dst, std::size_t n) {
  if (!p_->f) { errno = p_->last_errno; return -1; }
  std::size_t got = std::fread(dst, 1, n, p_->f);
  if (got == 0 && std::ferror(p_->f)) {
    p_->last_errno = errno ? errno : EIO;
    if (p_->last_errno == EINTR) std::clearerr(p_->f);
    return -1;
  }
  return static_cast<long>(got);
}

bool FileSource::seek(std::uint64_t offset) {
  if (!p_->f) { errno = p_->last_errno; return false; }
  if (p_->f == stdin) { p_->last_errno = ESPIPE; return false; }
  if (fseeko(p_->f, static_cast<off_t>(offset), SEEK_SET) != 0) {
    p_->last_errno = errno;
    return false;
  }
  std::clearerr(p_->f);
  return true;
}

int  FileSource::last_error() const noexcept { return p_->last_errno; }
bool FileSource::is_open() const noexcept { return p_->f != nullptr; }
const std::string& FileSource::path() const noexcept { return p_->path; }

long MemorySource::read(char* dst, std::size_t n) {
  const std::size_t left = data_.size() - pos_;
  const std::size_t take = std::min(n, left);
  if (take) std::memcpy(dst, data_.data() + pos_, take);
  pos_ += take;
  return static_cast<long>(take);
}

bool MemorySource::seek(std::uint64_t offset) {
  pos_ = static_cast<std::size_t>(std::min<std::uint64_t>(offset, data_.size()));
  return true;
}

}
