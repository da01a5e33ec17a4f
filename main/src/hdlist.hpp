#pragma once

#include "compression.hpp"
#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

// hdlist layout:
//   [compressed block]*
//   [dir name\n]* [symlink name\n target\n]* [entry name\n]*   (names sorted)
//   [coff csize off size]*                                     (be32 each)
//   "cz[0" dirs symlinks files toc_length command[40] "0]cz"    (trailer)
inline constexpr std::string_view HDLIST_TOC_HEADER = "cz[0";
inline constexpr std::string_view HDLIST_TOC_FOOTER = "0]cz";
inline constexpr std::size_t HDLIST_COMMAND_SIZE = 40;
inline constexpr std::size_t HDLIST_TRAILER_SIZE = 4 + 4 * 4 + HDLIST_COMMAND_SIZE + 4;
inline constexpr std::size_t HDLIST_TUPLE_SIZE = 16;

struct HdlistEntry {
    std::string name;
    std::uint64_t order = 0; // insertion sequence, TOC position when read back
    std::uint32_t size = 0;  // uncompressed header length
    std::uint32_t off = 0;   // offset inside the uncompressed block
    std::uint32_t csize = 0; // compressed size of the containing block
    std::uint32_t coff = 0;  // file offset of the containing block
};

// Writes package headers into size-bounded compressed blocks followed by a
// sorted table of contents. Entries never span two blocks.
//
// finalize() is idempotent. A packer that goes out of scope unfinalized
// finalizes itself, unless it already failed or the scope is left through an
// exception: then the partial file is removed instead.
class HdlistPacker {
public:
    HdlistPacker(const std::filesystem::path& path, Compression compression, int level,
                 std::size_t block_size = DEFAULT_BLOCK_SIZE);
    HdlistPacker(const std::filesystem::path& path, const FilterSpec& filter,
                 std::size_t block_size = DEFAULT_BLOCK_SIZE);
    HdlistPacker(const std::filesystem::path& path, const std::string& filter,
                 std::size_t block_size = DEFAULT_BLOCK_SIZE);
    ~HdlistPacker();

    HdlistPacker(const HdlistPacker&) = delete;
    HdlistPacker& operator=(const HdlistPacker&) = delete;

    void add_entry(const std::string& name, std::string_view raw_header);
    void finalize();
    void abort() noexcept;

    bool finalized() const { return state_ == State::Finalized; }
    const std::filesystem::path& path() const { return path_; }
    std::size_t entry_count() const { return entries_.size(); }
    std::size_t block_count() const { return blocks_written_; }
    // Insertion order
    const std::vector<HdlistEntry>& entries() const { return entries_; }

private:
    enum class State { Open, Finalized, Failed, Aborted };

    void end_block();
    void end_seek();
    void build_toc();
    void check_stream(std::string_view what);

    std::filesystem::path path_;
    Compression compression_;
    int level_;
    std::size_t block_size_;
    std::ofstream handle_;

    std::vector<HdlistEntry> entries_; // insertion order
    std::unordered_set<std::string> names_;
    // Part of the format, never filled by this producer
    std::vector<std::string> dirs_;
    std::vector<std::pair<std::string, std::string>> symlinks_;

    std::string block_data_;
    std::vector<std::size_t> block_entries_;
    std::uint64_t coff_ = 0;
    std::size_t blocks_written_ = 0;
    State state_ = State::Open;
    int uncaught_at_open_ = 0;
};

// Random access to the headers of an existing hdlist.
class HdlistReader {
public:
    explicit HdlistReader(const std::filesystem::path& path);

    // Sorted by name, as stored in the table of contents
    const std::vector<HdlistEntry>& entries() const { return entries_; }
    std::optional<HdlistEntry> find(const std::string& name) const;
    std::string read_header(const std::string& name) const;

    const std::string& decompression_command() const { return command_; }
    std::uint32_t dir_count() const { return dir_count_; }
    std::uint32_t symlink_count() const { return symlink_count_; }

private:
    std::filesystem::path path_;
    std::vector<HdlistEntry> entries_;
    std::string command_;
    std::uint32_t dir_count_ = 0;
    std::uint32_t symlink_count_ = 0;
};
