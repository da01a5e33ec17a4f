#pragma once

#include "compression.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <filesystem>

// Directory holding the <lang>.txt message catalogs
extern std::filesystem::path L10N_DIR;

inline constexpr std::size_t DEFAULT_BLOCK_SIZE = 400 * 1024;
inline constexpr std::string_view DEFAULT_HDLIST_FILTER = ".cz:gzip -9";
inline constexpr std::string_view DEFAULT_SYNTHESIS_FILTER = ".cz:xz -7";
inline constexpr std::string_view DEFAULT_XML_INFO_FILTER = ".lzma:xz -7";

// A filter string such as ".cz:gzip -9": output suffix, program, level.
// The level is written as a negative option, the parsed value is positive.
struct FilterSpec {
    std::string suffix;
    Compression compression = Compression::Gzip;
    int level = 9;
};

// Throws InvalidFilterError when the string is malformed, names another
// program than gzip or xz, or carries a level outside 0-9.
FilterSpec parse_filter(const std::string& filter);

// Options of one media_info build, filled from the command line.
struct BuildOptions {
    std::filesystem::path rpms_dir;
    std::filesystem::path media_info_dir; // defaults to <rpms_dir>/media_info
    std::string hdlist_filter = std::string(DEFAULT_HDLIST_FILTER);
    std::string synthesis_filter = std::string(DEFAULT_SYNTHESIS_FILTER);
    std::string xml_info_filter = std::string(DEFAULT_XML_INFO_FILTER);
    std::size_t block_size = DEFAULT_BLOCK_SIZE;
    bool no_hdlist = false;
    bool xml_info = false;
    bool no_md5sum = false;
    bool versioned = false;
    bool allow_empty_media = false;
    bool no_bad_rpm = false;
    bool nolock = false;
};

std::filesystem::path resolve_media_info_dir(const BuildOptions& options);
std::filesystem::path get_staging_dir(const std::filesystem::path& media_info_dir);
std::filesystem::path get_lock_file(const std::filesystem::path& media_info_dir);
