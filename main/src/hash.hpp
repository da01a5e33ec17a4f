#pragma once

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// Calculates the MD5 digest of a file as lowercase hex.
// Throws IOFailure if the file cannot be read.
std::string calculate_md5(const fs::path& file_path);
