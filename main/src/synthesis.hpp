#pragma once

#include "compression.hpp"
#include "package.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

// One package of a synthesis file:
//   @requires@a@b[>= 1.0]     (likewise suggests, obsoletes, conflicts, provides)
//   @summary@text
//   @filesize@12345
//   @info@name@epoch@size@group
struct SynthesisRecord {
    std::string name;
    std::uint32_t epoch = 0;
    std::uint64_t size = 0;
    std::string group;
    std::vector<std::string> requires_deps;
    std::vector<std::string> suggests;
    std::vector<std::string> obsoletes;
    std::vector<std::string> conflicts;
    std::vector<std::string> provides;
    std::optional<std::string> summary;
    std::optional<std::uint64_t> filesize;

    static SynthesisRecord from_fields(const PackageFields& fields);
};

// Collects records in arrival order and writes them as one compressed stream.
class SynthesisWriter {
public:
    // Throws DuplicatePackageError if the name was already recorded
    void record(const PackageFields& fields);
    void record(SynthesisRecord entry);

    std::string serialize() const;
    void finalize(const std::filesystem::path& path, Compression compression, int level) const;

    const std::vector<SynthesisRecord>& records() const { return records_; }

private:
    std::vector<SynthesisRecord> records_;
    std::unordered_set<std::string> names_;
};

std::vector<SynthesisRecord> parse_synthesis(const std::string& text);
std::vector<SynthesisRecord> read_synthesis(const std::filesystem::path& path);
