#pragma once

#include <string>
#include <string_view>
#include <filesystem>

enum class Compression {
    Gzip,
    Xz
};

// Program name used in filter strings ("gzip" or "xz").
std::string_view compression_name(Compression compression);

// Command a consumer runs to expand a block ("gzip -d" or "xz -d").
std::string_view decompression_command(Compression compression);

// Compresses `data` as one gzip member or one xz stream at `level` (0-9).
// Output is deterministic: the gzip header carries no timestamp.
// Throws InvalidFilterError for a bad level, IOFailure if libarchive fails.
std::string compress_buffer(std::string_view data, Compression compression, int level);

// Expands a gzip or xz stream, the format is detected from its magic.
std::string decompress_buffer(std::string_view data);

void write_compressed_file(const std::filesystem::path& path, std::string_view data, Compression compression, int level);
std::string read_compressed_file(const std::filesystem::path& path);
