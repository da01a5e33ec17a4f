#include "hdlist.hpp"
#include "byte_order.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <exception>
#include <limits>
#include <tuple>

namespace fs = std::filesystem;

namespace {
    constexpr std::uint64_t MAX_TOC_VALUE = std::numeric_limits<std::int32_t>::max();

    std::uint32_t checked_u32(std::uint64_t value, const fs::path& path) {
        if (value > MAX_TOC_VALUE) {
            throw IOFailure(string_format("error.hdlist_too_large", path.string()));
        }
        return static_cast<std::uint32_t>(value);
    }
}

HdlistPacker::HdlistPacker(const fs::path& path, Compression compression, int level, std::size_t block_size)
    : path_(path), compression_(compression), level_(level), block_size_(block_size) {
    if (level < 0 || level > 9) {
        throw InvalidFilterError(string_format("error.invalid_level", level));
    }
    if (block_size == 0) {
        throw GenhdlistException(get_string("error.invalid_block_size"));
    }

    handle_.open(path_, std::ios::binary | std::ios::trunc);
    if (!handle_.is_open()) {
        throw IOFailure(string_format("error.create_file_failed", path_.string()));
    }
    uncaught_at_open_ = std::uncaught_exceptions();
    log_verbose(string_format("info.hdlist_open", path_.string(), compression_name(compression_), level_));
}

HdlistPacker::HdlistPacker(const fs::path& path, const FilterSpec& filter, std::size_t block_size)
    : HdlistPacker(path, filter.compression, filter.level, block_size) {}

HdlistPacker::HdlistPacker(const fs::path& path, const std::string& filter, std::size_t block_size)
    : HdlistPacker(path, parse_filter(filter), block_size) {}

HdlistPacker::~HdlistPacker() {
    if (state_ == State::Open && std::uncaught_exceptions() == uncaught_at_open_) {
        try {
            finalize();
            return;
        } catch (const std::exception& e) {
            log_error(string_format("error.hdlist_finalize_failed", path_.string(), e.what()));
        }
    }
    abort();
}

void HdlistPacker::add_entry(const std::string& name, std::string_view raw_header) {
    if (state_ != State::Open) {
        throw GenhdlistException(string_format("error.hdlist_closed", path_.string()));
    }
    if (name.empty() || name.find('\n') != std::string::npos) {
        throw GenhdlistException(string_format("error.invalid_entry_name", name));
    }

    HdlistEntry entry;
    entry.name = name;
    entry.order = entries_.size() + 1;
    entry.size = checked_u32(raw_header.size(), path_);

    if (!names_.insert(name).second) {
        throw DuplicatePackageError(string_format("error.duplicate_package", name));
    }
    entries_.push_back(std::move(entry));

    block_entries_.push_back(entries_.size() - 1);
    block_data_.append(raw_header);

    if (block_data_.size() >= block_size_) {
        try {
            end_block();
        } catch (...) {
            state_ = State::Failed;
            throw;
        }
    }
}

void HdlistPacker::finalize() {
    if (state_ == State::Finalized) return;
    if (state_ != State::Open) {
        throw IOFailure(string_format("error.hdlist_failed", path_.string()));
    }

    try {
        build_toc();
        handle_.close();
        if (handle_.fail()) {
            throw IOFailure(string_format("error.write_failed", path_.string()));
        }
    } catch (...) {
        state_ = State::Failed;
        throw;
    }
    state_ = State::Finalized;
    log_verbose(string_format("info.hdlist_written", path_.string(), entries_.size(), blocks_written_));
}

void HdlistPacker::abort() noexcept {
    if (state_ == State::Finalized || state_ == State::Aborted) return;
    state_ = State::Aborted;
    if (handle_.is_open()) handle_.close();
    std::error_code ec;
    fs::remove(path_, ec);
}

void HdlistPacker::check_stream(std::string_view what) {
    if (!handle_) {
        throw IOFailure(string_format("error.hdlist_io", std::string(what), path_.string()));
    }
}

void HdlistPacker::end_seek() {
    handle_.seekp(static_cast<std::streamoff>(coff_), std::ios::beg);
    check_stream("seek");
}

void HdlistPacker::end_block() {
    if (block_data_.empty()) return;

    log_verbose(string_format("info.hdlist_block", block_data_.size(), block_entries_.size()));
    end_seek();
    const std::string cdata = compress_buffer(block_data_, compression_, level_);
    handle_.write(cdata.data(), static_cast<std::streamsize>(cdata.size()));
    check_stream("write");

    const std::uint32_t coff = checked_u32(coff_, path_);
    const std::uint32_t csize = checked_u32(cdata.size(), path_);
    std::uint32_t off = 0;
    for (std::size_t index : block_entries_) {
        HdlistEntry& entry = entries_[index];
        entry.off = off;
        entry.coff = coff;
        entry.csize = csize;
        off += entry.size;
    }

    coff_ += cdata.size();
    ++blocks_written_;
    block_data_.clear();
    block_entries_.clear();
}

void HdlistPacker::build_toc() {
    end_block();
    end_seek();

    std::vector<const HdlistEntry*> sorted;
    sorted.reserve(entries_.size());
    for (const auto& entry : entries_) sorted.push_back(&entry);
    std::sort(sorted.begin(), sorted.end(), [](const HdlistEntry* a, const HdlistEntry* b) {
        return std::tie(a->name, a->order) < std::tie(b->name, b->order);
    });

    std::string toc;
    for (const auto& dir : dirs_) {
        toc += dir + "\n";
    }
    for (const auto& [name, target] : symlinks_) {
        toc += name + "\n" + target + "\n";
    }
    for (const auto* entry : sorted) {
        toc += entry->name + "\n";
    }
    for (const auto* entry : sorted) {
        put_be32(toc, entry->coff);
        put_be32(toc, entry->csize);
        put_be32(toc, entry->off);
        put_be32(toc, entry->size);
    }
    const std::uint32_t toc_length = checked_u32(toc.size(), path_);

    std::string command(decompression_command(compression_));
    command.resize(HDLIST_COMMAND_SIZE, '\0');

    toc += HDLIST_TOC_HEADER;
    put_be32(toc, static_cast<std::uint32_t>(dirs_.size()));
    put_be32(toc, static_cast<std::uint32_t>(symlinks_.size()));
    put_be32(toc, static_cast<std::uint32_t>(entries_.size()));
    put_be32(toc, toc_length);
    toc += command;
    toc += HDLIST_TOC_FOOTER;

    handle_.write(toc.data(), static_cast<std::streamsize>(toc.size()));
    handle_.flush();
    check_stream("toc");
    coff_ += toc.size();
}

HdlistReader::HdlistReader(const fs::path& path) : path_(path) {
    std::ifstream file(path_, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        throw IOFailure(string_format("error.open_file_failed", path_.string()));
    }
    const auto file_size = static_cast<std::uint64_t>(file.tellg());
    if (file_size < HDLIST_TRAILER_SIZE) {
        throw GenhdlistException(string_format("error.hdlist_invalid", path_.string()));
    }

    std::string trailer(HDLIST_TRAILER_SIZE, '\0');
    file.seekg(static_cast<std::streamoff>(file_size - HDLIST_TRAILER_SIZE));
    file.read(trailer.data(), static_cast<std::streamsize>(trailer.size()));
    if (!file) {
        throw IOFailure(string_format("error.read_failed", path_.string()));
    }
    if (trailer.compare(0, 4, HDLIST_TOC_HEADER) != 0 ||
        trailer.compare(HDLIST_TRAILER_SIZE - 4, 4, HDLIST_TOC_FOOTER) != 0) {
        throw GenhdlistException(string_format("error.hdlist_invalid", path_.string()));
    }

    dir_count_ = get_be32(trailer, 4);
    symlink_count_ = get_be32(trailer, 8);
    const std::uint32_t file_count = get_be32(trailer, 12);
    const std::uint32_t toc_length = get_be32(trailer, 16);
    command_ = trailer.substr(20, HDLIST_COMMAND_SIZE);
    command_.resize(command_.find('\0') == std::string::npos ? command_.size() : command_.find('\0'));

    if (toc_length > file_size - HDLIST_TRAILER_SIZE ||
        static_cast<std::uint64_t>(file_count) * HDLIST_TUPLE_SIZE > toc_length) {
        throw GenhdlistException(string_format("error.hdlist_invalid", path_.string()));
    }

    std::string toc(toc_length, '\0');
    file.seekg(static_cast<std::streamoff>(file_size - HDLIST_TRAILER_SIZE - toc_length));
    file.read(toc.data(), static_cast<std::streamsize>(toc.size()));
    if (!file) {
        throw IOFailure(string_format("error.read_failed", path_.string()));
    }

    const std::size_t names_end = toc_length - static_cast<std::size_t>(file_count) * HDLIST_TUPLE_SIZE;
    std::size_t pos = 0;
    auto next_line = [&]() {
        std::size_t eol = toc.find('\n', pos);
        if (eol == std::string::npos || eol >= names_end) {
            throw GenhdlistException(string_format("error.hdlist_invalid", path_.string()));
        }
        std::string line = toc.substr(pos, eol - pos);
        pos = eol + 1;
        return line;
    };

    for (std::uint32_t i = 0; i < dir_count_; ++i) next_line();
    for (std::uint32_t i = 0; i < symlink_count_ * 2; ++i) next_line();

    entries_.reserve(file_count);
    for (std::uint32_t i = 0; i < file_count; ++i) {
        HdlistEntry entry;
        entry.name = next_line();
        entry.order = i + 1;
        entries_.push_back(std::move(entry));
    }
    if (pos != names_end) {
        throw GenhdlistException(string_format("error.hdlist_invalid", path_.string()));
    }

    for (std::uint32_t i = 0; i < file_count; ++i) {
        const std::size_t base = names_end + static_cast<std::size_t>(i) * HDLIST_TUPLE_SIZE;
        entries_[i].coff = get_be32(toc, base);
        entries_[i].csize = get_be32(toc, base + 4);
        entries_[i].off = get_be32(toc, base + 8);
        entries_[i].size = get_be32(toc, base + 12);
    }
}

std::optional<HdlistEntry> HdlistReader::find(const std::string& name) const {
    auto it = std::lower_bound(entries_.begin(), entries_.end(), name,
                               [](const HdlistEntry& e, const std::string& n) { return e.name < n; });
    if (it == entries_.end() || it->name != name) return std::nullopt;
    return *it;
}

std::string HdlistReader::read_header(const std::string& name) const {
    auto entry = find(name);
    if (!entry) {
        throw GenhdlistException(string_format("error.hdlist_no_entry", name, path_.string()));
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        throw IOFailure(string_format("error.open_file_failed", path_.string()));
    }
    std::string block(entry->csize, '\0');
    file.seekg(entry->coff);
    file.read(block.data(), static_cast<std::streamsize>(block.size()));
    if (!file) {
        throw IOFailure(string_format("error.read_failed", path_.string()));
    }

    const std::string data = decompress_buffer(block);
    if (static_cast<std::uint64_t>(entry->off) + entry->size > data.size()) {
        throw GenhdlistException(string_format("error.hdlist_invalid", path_.string()));
    }
    return data.substr(entry->off, entry->size);
}
