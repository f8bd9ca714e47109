#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>

#include "fastx_scanner/buffer_manager.hpp"
#include "fastx_scanner/format.hpp"
#include "fastx_scanner/parse_error.hpp"

namespace fx {

struct FormatGuess {
  SeqFormat     format = SeqFormat::Fasta;
  std::size_t   byte   = 0;   // offset of the start byte in the buffer
  std::uint64_t line   = 0;   // empty lines skipped before it
};

// Skips leading "\n" / "\r\n" lines and decides on the first other byte:
// '>' FASTA, '@' FASTQ. Skipped lines may be dropped from the buffer when it
// is full. Returns false with `err` unset for empty input, and with `err`
// set on I/O failure or any other start byte.
bool recognize_format(BufferManager& buf, FormatGuess& out, std::optional<ParseError>& err);

}
