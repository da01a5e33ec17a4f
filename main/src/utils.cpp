#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>

namespace fs = std::filesystem;

namespace {
    bool verbose_mode = false;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_verbose(std::string_view msg) {
    if (!verbose_mode) return;
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void set_verbose_mode(bool enable) {
    verbose_mode = enable;
}

bool get_verbose_mode() {
    return verbose_mode;
}

MediaInfoLock::MediaInfoLock(const fs::path& lock_file) : lock_file_(lock_file) {
    ensure_dir_exists(lock_file_.parent_path());
    log_info(string_format("info.locking", lock_file_.string()));
    lock_fd = open(lock_file_.c_str(), O_CREAT | O_RDWR, 0644);
    if (lock_fd < 0) {
        throw GenhdlistException(string_format("error.create_file_failed", lock_file_.string()) + ": " + strerror(errno));
    }

    if (flock(lock_fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        close(lock_fd);
        lock_fd = -1;
        if (err == EWOULDBLOCK) {
            throw GenhdlistException(string_format("error.media_info_locked", lock_file_.string()));
        } else {
            throw GenhdlistException(string_format("error.lock_failed", lock_file_.string()) + ": " + strerror(err));
        }
    }
}

MediaInfoLock::~MediaInfoLock() {
    if (lock_fd != -1) {
        std::error_code ec;
        fs::remove(lock_file_, ec);
        flock(lock_fd, LOCK_UN);
        close(lock_fd);
        lock_fd = -1;
    }
}

void reset_dir(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        throw IOFailure(string_format("error.remove_failed", path.string()) + ": " + ec.message());
    }
    ensure_dir_exists(path);
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw IOFailure(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw IOFailure(string_format("error.path_not_dir", path.string()));
    }
}

void write_file(const fs::path& path, std::string_view data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw IOFailure(string_format("error.create_file_failed", path.string()) + ": " + strerror(errno));
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file) {
        throw IOFailure(string_format("error.write_failed", path.string()));
    }
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOFailure(string_format("error.open_file_failed", path.string()));
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void rename_file(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        throw IOFailure(string_format("error.rename_failed", from.string(), to.string()) + ": " + ec.message());
    }
}

std::string strip_suffix(std::string_view name, std::string_view suffix) {
    if (name.ends_with(suffix)) name.remove_suffix(suffix.size());
    return std::string(name);
}
