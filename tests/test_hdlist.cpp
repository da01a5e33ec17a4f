#include <gtest/gtest.h>
#include "../main/src/byte_order.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/hdlist.hpp"
#include "../main/src/localization.hpp"
#include "../main/src/utils.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class HdlistTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        init_localization();
        test_dir = fs::absolute("tmp_hdlist_test");
        if (fs::exists(test_dir)) fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        if (fs::exists(test_dir)) fs::remove_all(test_dir);
    }

    std::string trailer_of(const fs::path& path) {
        std::string data = read_file(path);
        return data.substr(data.size() - HDLIST_TRAILER_SIZE);
    }
};

TEST_F(HdlistTest, EntriesAreSortedInToc) {
    fs::path path = test_dir / "hdlist.cz";
    {
        HdlistPacker packer(path, Compression::Gzip, 9);
        packer.add_entry("c", "header of c");
        packer.add_entry("a", "header of a");
        packer.add_entry("b", "header of b");
        packer.finalize();
        EXPECT_TRUE(packer.finalized());
        EXPECT_EQ(packer.entry_count(), 3u);
    }

    HdlistReader reader(path);
    ASSERT_EQ(reader.entries().size(), 3u);
    EXPECT_EQ(reader.entries()[0].name, "a");
    EXPECT_EQ(reader.entries()[1].name, "b");
    EXPECT_EQ(reader.entries()[2].name, "c");

    EXPECT_EQ(reader.read_header("a"), "header of a");
    EXPECT_EQ(reader.read_header("b"), "header of b");
    EXPECT_EQ(reader.read_header("c"), "header of c");
    EXPECT_EQ(reader.decompression_command(), "gzip -d");
    EXPECT_EQ(reader.dir_count(), 0u);
    EXPECT_EQ(reader.symlink_count(), 0u);
}

TEST_F(HdlistTest, InsertionSequence) {
    HdlistPacker packer(test_dir / "hdlist.cz", Compression::Gzip, 9);
    packer.add_entry("c", "1");
    packer.add_entry("a", "2");
    packer.add_entry("b", "3");

    const auto& entries = packer.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "c");
    EXPECT_EQ(entries[0].order, 1u);
    EXPECT_EQ(entries[1].name, "a");
    EXPECT_EQ(entries[1].order, 2u);
    EXPECT_EQ(entries[2].name, "b");
    EXPECT_EQ(entries[2].order, 3u);
    packer.finalize();

    // read back, order is the TOC position
    HdlistReader reader(test_dir / "hdlist.cz");
    EXPECT_EQ(reader.entries()[0].name, "a");
    EXPECT_EQ(reader.entries()[0].order, 1u);
}

TEST_F(HdlistTest, OffsetsWithinOneBlock) {
    fs::path path = test_dir / "hdlist.cz";
    {
        HdlistPacker packer(path, Compression::Gzip, 9);
        packer.add_entry("x", std::string(10, 'x'));
        packer.add_entry("y", std::string(20, 'y'));
    }

    HdlistReader reader(path);
    auto x = reader.find("x");
    auto y = reader.find("y");
    ASSERT_TRUE(x && y);
    EXPECT_EQ(x->coff, 0u);
    EXPECT_EQ(y->coff, 0u);
    EXPECT_EQ(x->csize, y->csize);
    EXPECT_EQ(x->off, 0u);
    EXPECT_EQ(x->size, 10u);
    EXPECT_EQ(y->off, 10u);
    EXPECT_EQ(y->size, 20u);
    EXPECT_FALSE(reader.find("z").has_value());
}

TEST_F(HdlistTest, BlockThresholdSplitsBlocks) {
    fs::path path = test_dir / "hdlist.cz";
    {
        HdlistPacker packer(path, Compression::Gzip, 9, 1);
        packer.add_entry("first", std::string(10, '1'));
        packer.add_entry("second", std::string(20, '2'));
        packer.finalize();
        EXPECT_EQ(packer.block_count(), 2u);
    }

    HdlistReader reader(path);
    auto first = reader.find("first");
    auto second = reader.find("second");
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->coff, 0u);
    EXPECT_EQ(second->coff, first->csize);
    EXPECT_EQ(first->off, 0u);
    EXPECT_EQ(second->off, 0u);
    EXPECT_EQ(reader.read_header("second"), std::string(20, '2'));
}

TEST_F(HdlistTest, TrailerLayout) {
    fs::path path = test_dir / "hdlist.cz";
    {
        HdlistPacker packer(path, ".cz:xz -7");
        packer.add_entry("pkg-1.0-1.noarch", "abc");
        packer.add_entry("lib-2.0-1.x86_64", "defg");
    }

    std::string data = read_file(path);
    std::string trailer = data.substr(data.size() - HDLIST_TRAILER_SIZE);
    EXPECT_EQ(HDLIST_TRAILER_SIZE, 64u);
    EXPECT_EQ(trailer.substr(0, 4), "cz[0");
    EXPECT_EQ(trailer.substr(60, 4), "0]cz");
    EXPECT_EQ(get_be32(trailer, 4), 0u);
    EXPECT_EQ(get_be32(trailer, 8), 0u);
    EXPECT_EQ(get_be32(trailer, 12), 2u);

    // names, then one tuple per entry
    const std::uint32_t toc_length = get_be32(trailer, 16);
    const std::string names = "lib-2.0-1.x86_64\npkg-1.0-1.noarch\n";
    EXPECT_EQ(toc_length, names.size() + 2 * HDLIST_TUPLE_SIZE);
    std::string toc = data.substr(data.size() - HDLIST_TRAILER_SIZE - toc_length, toc_length);
    EXPECT_EQ(toc.substr(0, names.size()), names);

    // tuples are (coff, csize, off, size), sorted like the names
    const std::size_t lib = names.size();
    const std::size_t pkg = lib + HDLIST_TUPLE_SIZE;
    EXPECT_EQ(get_be32(toc, lib), 0u);
    EXPECT_EQ(get_be32(toc, lib + 4), data.size() - HDLIST_TRAILER_SIZE - toc_length);
    EXPECT_EQ(get_be32(toc, lib + 8), 3u);
    EXPECT_EQ(get_be32(toc, lib + 12), 4u);
    EXPECT_EQ(get_be32(toc, pkg), 0u);
    EXPECT_EQ(get_be32(toc, pkg + 4), get_be32(toc, lib + 4));
    EXPECT_EQ(get_be32(toc, pkg + 8), 0u);
    EXPECT_EQ(get_be32(toc, pkg + 12), 3u);

    std::string command = trailer.substr(20, HDLIST_COMMAND_SIZE);
    EXPECT_EQ(command, std::string("xz -d") + std::string(HDLIST_COMMAND_SIZE - 5, '\0'));
}

TEST_F(HdlistTest, FinalizeTwiceIsNoop) {
    fs::path path = test_dir / "hdlist.cz";
    HdlistPacker packer(path, Compression::Gzip, 9);
    packer.add_entry("a", "1");
    packer.finalize();
    std::string first = read_file(path);
    EXPECT_NO_THROW(packer.finalize());
    EXPECT_EQ(read_file(path), first);
    EXPECT_THROW(packer.add_entry("b", "2"), GenhdlistException);
}

TEST_F(HdlistTest, DestructorFinalizes) {
    fs::path path = test_dir / "hdlist.cz";
    {
        HdlistPacker packer(path, Compression::Gzip, 9);
        packer.add_entry("a", "1");
    }
    HdlistReader reader(path);
    EXPECT_EQ(reader.read_header("a"), "1");
}

TEST_F(HdlistTest, ExceptionDuringScopeRemovesFile) {
    fs::path path = test_dir / "hdlist.cz";
    try {
        HdlistPacker packer(path, Compression::Gzip, 9);
        packer.add_entry("a", "1");
        throw std::runtime_error("scanning failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(HdlistTest, AbortRemovesFile) {
    fs::path path = test_dir / "hdlist.cz";
    HdlistPacker packer(path, Compression::Gzip, 9);
    packer.add_entry("a", "1");
    packer.abort();
    EXPECT_FALSE(fs::exists(path));
    EXPECT_FALSE(packer.finalized());
    EXPECT_THROW(packer.finalize(), IOFailure);
}

TEST_F(HdlistTest, Deterministic) {
    for (const std::string name : {"one.cz", "two.cz"}) {
        HdlistPacker packer(test_dir / name, Compression::Gzip, 9, 16);
        packer.add_entry("zeta", std::string(12, 'z'));
        packer.add_entry("alpha", std::string(30, 'a'));
        packer.add_entry("mu", "m");
    }
    EXPECT_EQ(read_file(test_dir / "one.cz"), read_file(test_dir / "two.cz"));
}

TEST_F(HdlistTest, DuplicateEntry) {
    HdlistPacker packer(test_dir / "hdlist.cz", Compression::Gzip, 9);
    packer.add_entry("a", "1");
    EXPECT_THROW(packer.add_entry("a", "2"), DuplicatePackageError);
    packer.finalize();

    HdlistReader reader(test_dir / "hdlist.cz");
    ASSERT_EQ(reader.entries().size(), 1u);
    EXPECT_EQ(reader.read_header("a"), "1");
}

TEST_F(HdlistTest, InvalidEntryName) {
    HdlistPacker packer(test_dir / "hdlist.cz", Compression::Gzip, 9);
    EXPECT_THROW(packer.add_entry("", "1"), GenhdlistException);
    EXPECT_THROW(packer.add_entry("a\nb", "1"), GenhdlistException);
}

TEST_F(HdlistTest, InvalidFilterCreatesNothing) {
    fs::path path = test_dir / "hdlist.cz";
    EXPECT_THROW(HdlistPacker(path, ".cz:bzip2 -9"), InvalidFilterError);
    EXPECT_THROW(HdlistPacker(path, Compression::Gzip, 12), InvalidFilterError);
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(HdlistTest, EmptyArchive) {
    fs::path path = test_dir / "hdlist.cz";
    {
        HdlistPacker packer(path, Compression::Gzip, 9);
        packer.finalize();
        EXPECT_EQ(packer.block_count(), 0u);
    }
    std::string data = read_file(path);
    EXPECT_EQ(data.size(), HDLIST_TRAILER_SIZE);

    HdlistReader reader(path);
    EXPECT_TRUE(reader.entries().empty());
}

TEST_F(HdlistTest, ReaderRejectsGarbage) {
    fs::path path = test_dir / "garbage";
    write_file(path, std::string(100, 'g'));
    EXPECT_THROW(HdlistReader reader(path), GenhdlistException);
    write_file(path, "short");
    EXPECT_THROW(HdlistReader reader(path), GenhdlistException);
}

TEST_F(HdlistTest, UnwritablePath) {
    EXPECT_THROW(HdlistPacker(test_dir / "no" / "such" / "hdlist.cz", Compression::Gzip, 9), IOFailure);
}
