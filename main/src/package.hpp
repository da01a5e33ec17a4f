#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ChangelogEntry {
    std::int64_t time = 0;
    std::string name;
    std::string text;
};

// Metadata of one package as delivered by a HeaderParser.
// Dependency lists hold already formatted tokens (see format_dependency).
struct PackageFields {
    std::string name; // archive entry name: file name without ".rpm"
    std::uint32_t epoch = 0;
    std::string version;
    std::string release;
    std::string arch;
    std::string summary;
    std::string description;
    std::string group;
    std::string license;
    std::string packager;
    std::int64_t buildtime = 0;
    std::optional<std::string> sourcerpm;
    std::string url;
    std::optional<std::uint64_t> filesize;
    std::uint64_t size = 0;

    std::vector<std::string> files;
    std::vector<ChangelogEntry> changelog;

    std::vector<std::string> requires_deps; // "requires" is a keyword
    std::vector<std::string> suggests;
    std::vector<std::string> obsoletes;
    std::vector<std::string> conflicts;
    std::vector<std::string> provides;
};

struct ParsedPackage {
    PackageFields fields;
    std::string raw_header; // stored verbatim as the hdlist entry
};
