#pragma once

#include "config.hpp"
#include "rpm_header.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

struct BuildResult {
    std::filesystem::path media_info_dir;
    std::vector<std::string> published; // file names inside media_info_dir
    std::size_t package_count = 0;
    std::size_t skipped_count = 0;
};

// *.rpm files of a directory, sorted by file name
std::vector<std::filesystem::path> collect_rpms(const std::filesystem::path& rpms_dir);

// "YYYYMMDD-HHMMSS" in local time, used as prefix of versioned media info
std::string version_stamp(std::chrono::system_clock::time_point when);

// Generates hdlist, synthesis and the xml media info for options.rpms_dir.
// Outputs are staged in media_info/tmp and only moved into place once every
// writer succeeded. Any failure leaves previously published files untouched.
BuildResult build_media_info(const BuildOptions& options, HeaderParser& parser);
