#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "fastx_scanner/format.hpp"

namespace fx {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Guess format from extension (.fa .fasta .fna .ffn .faa .frn | .fq .fastq),
// case-insensitive. nullopt when the content has to decide.
std::optional<SeqFormat> detect_format(std::string_view path);

// Slug generation per config: "hashprefix", "basename", or "keypath".
std::string make_slug(std::string_view key, std::string_view mode, int len);

// Hash helper (stable) used by slug.
std::string hex_hash_prefix(std::string_view data, int len);

// Report directory name for one input; standard input ("-") is "stdin".
std::string report_slug(const std::string& input_path, std::string_view mode, int len);

}
