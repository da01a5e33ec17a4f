#include "compression.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>

namespace {
    // Custom deleters for libarchive handles
    struct ArchiveReadDeleter {
        void operator()(struct archive* a) const {
            if (a) {
                archive_read_close(a);
                archive_read_free(a);
            }
        }
    };

    struct ArchiveWriteDeleter {
        void operator()(struct archive* a) const {
            if (a) {
                archive_write_close(a);
                archive_write_free(a);
            }
        }
    };

    struct ArchiveEntryDeleter {
        void operator()(struct archive_entry* e) const {
            if (e) archive_entry_free(e);
        }
    };

    using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
    using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
    using ArchiveEntryHandle = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

    la_ssize_t append_to_string(struct archive*, void* client_data, const void* buffer, size_t length) {
        auto* out = static_cast<std::string*>(client_data);
        out->append(static_cast<const char*>(buffer), length);
        return static_cast<la_ssize_t>(length);
    }

    std::string archive_error(struct archive* a) {
        const char* err = archive_error_string(a);
        return err ? err : get_string("error.unknown");
    }

    void check_write(struct archive* a, int r, std::string_view what) {
        if (r != ARCHIVE_OK) {
            throw IOFailure(string_format("error.compress_failed", std::string(what)) + ": " + archive_error(a));
        }
    }
}

std::string_view compression_name(Compression compression) {
    switch (compression) {
        case Compression::Gzip: return "gzip";
        case Compression::Xz: return "xz";
    }
    return "";
}

std::string_view decompression_command(Compression compression) {
    switch (compression) {
        case Compression::Gzip: return "gzip -d";
        case Compression::Xz: return "xz -d";
    }
    return "";
}

std::string compress_buffer(std::string_view data, Compression compression, int level) {
    if (level < 0 || level > 9) {
        throw InvalidFilterError(string_format("error.invalid_level", level));
    }

    ArchiveWriteHandle a(archive_write_new());
    if (!a) {
        throw IOFailure(get_string("error.archive_alloc_failed"));
    }

    check_write(a.get(), archive_write_set_format_raw(a.get()), "format");
    const std::string level_str = std::to_string(level);
    if (compression == Compression::Gzip) {
        check_write(a.get(), archive_write_add_filter_gzip(a.get()), "gzip");
        // NULL value turns the option off: no mtime in the member header
        check_write(a.get(), archive_write_set_filter_option(a.get(), "gzip", "timestamp", nullptr), "gzip");
        check_write(a.get(), archive_write_set_filter_option(a.get(), "gzip", "compression-level", level_str.c_str()), "gzip");
    } else {
        check_write(a.get(), archive_write_add_filter_xz(a.get()), "xz");
        check_write(a.get(), archive_write_set_filter_option(a.get(), "xz", "compression-level", level_str.c_str()), "xz");
    }
    // Unblocked output, no padding after the compressed stream
    check_write(a.get(), archive_write_set_bytes_per_block(a.get(), 0), "block size");

    std::string out;
    check_write(a.get(), archive_write_open(a.get(), &out, nullptr, append_to_string, nullptr), "open");

    ArchiveEntryHandle entry(archive_entry_new());
    archive_entry_set_pathname(entry.get(), "data");
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(data.size()));
    check_write(a.get(), archive_write_header(a.get(), entry.get()), "header");

    if (!data.empty()) {
        la_ssize_t written = archive_write_data(a.get(), data.data(), data.size());
        if (written < 0 || static_cast<size_t>(written) != data.size()) {
            throw IOFailure(string_format("error.compress_failed", std::string("data")) + ": " + archive_error(a.get()));
        }
    }
    // Closing flushes the compressor, the output is only complete afterwards
    check_write(a.get(), archive_write_close(a.get()), "close");
    return out;
}

std::string decompress_buffer(std::string_view data) {
    ArchiveReadHandle a(archive_read_new());
    if (!a) {
        throw IOFailure(get_string("error.archive_alloc_failed"));
    }
    archive_read_support_filter_gzip(a.get());
    archive_read_support_filter_xz(a.get());
    archive_read_support_format_raw(a.get());
    // A block of zero bytes decompresses to nothing, raw format cannot bid on that
    archive_read_support_format_empty(a.get());

    if (archive_read_open_memory(a.get(), data.data(), data.size()) != ARCHIVE_OK) {
        throw IOFailure(get_string("error.decompress_failed") + ": " + archive_error(a.get()));
    }

    struct archive_entry* entry;
    int r = archive_read_next_header(a.get(), &entry);
    if (r == ARCHIVE_EOF) {
        return "";
    }
    if (r != ARCHIVE_OK) {
        throw IOFailure(get_string("error.decompress_failed") + ": " + archive_error(a.get()));
    }

    std::string out;
    char buffer[8192];
    while (true) {
        la_ssize_t n = archive_read_data(a.get(), buffer, sizeof(buffer));
        if (n == 0) break;
        if (n < 0) {
            throw IOFailure(get_string("error.decompress_failed") + ": " + archive_error(a.get()));
        }
        out.append(buffer, static_cast<size_t>(n));
    }
    return out;
}

void write_compressed_file(const std::filesystem::path& path, std::string_view data, Compression compression, int level) {
    write_file(path, compress_buffer(data, compression, level));
}

std::string read_compressed_file(const std::filesystem::path& path) {
    return decompress_buffer(read_file(path));
}
