#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace fx {

// Where the read buffer gets its bytes from.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Reads up to n bytes into dst. Returns the number of bytes read, 0 at end
  // of input, or -1 on failure (errno in last_error()).
  virtual long read(char* dst, std::size_t n) = 0;

  // Repositions to an absolute byte offset. Sources that cannot seek return
  // false with last_error() == ESPIPE.
  virtual bool seek(std::uint64_t offset);

  virtual int last_error() const noexcept = 0;
};

// stdio-backed source; "-" reads standard input.
class FileSource : public ByteSource {
public:
  explicit FileSource(std::string path);
  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  long read(char* dst, std::size_t n) override;
  bool seek(std::uint64_t offset) override;
  int  last_error() const noexcept override;

  bool is_open() const noexcept;
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
};

// Owns its bytes; always seekable.
class MemorySource : public ByteSource {
public:
  explicit MemorySource(std::string data) : data_(std::move(data)) {}

  long read(char* dst, std::size_t n) override;
  bool seek(std::uint64_t offset) override;
  int  last_error() const noexcept override { return 0; }

private:
  std::string data_;
  std::size_t pos_{0};
};

}
