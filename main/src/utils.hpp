#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <filesystem>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_verbose(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

void set_verbose_mode(bool enable);
bool get_verbose_mode();

// Exclusive advisory lock on a media_info directory (RAII).
// The lock file is removed again when the lock is released.
class MediaInfoLock {
public:
    explicit MediaInfoLock(const fs::path& lock_file);
    ~MediaInfoLock();
    MediaInfoLock(const MediaInfoLock&) = delete;
    MediaInfoLock& operator=(const MediaInfoLock&) = delete;
private:
    fs::path lock_file_;
    int lock_fd = -1;
};

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
// Removes whatever `path` holds and creates it again, empty
void reset_dir(const fs::path& path);
void write_file(const fs::path& path, std::string_view data);
std::string read_file(const fs::path& path);
void rename_file(const fs::path& from, const fs::path& to);
std::string strip_suffix(std::string_view name, std::string_view suffix);
