#pragma once

#include "compression.hpp"
#include "package.hpp"

#include <array>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

enum class XmlDocument {
    Files,
    Info,
    Changelog
};

inline constexpr std::array<XmlDocument, 3> ALL_XML_DOCUMENTS = {
    XmlDocument::Info, XmlDocument::Files, XmlDocument::Changelog
};

// "files", "info" or "changelog"
std::string_view xml_document_name(XmlDocument kind);

// Builds files.xml, info.xml and changelog.xml. Packages appear in the
// order they were added, each document is generated and written on its own.
class MediaInfoXmlWriter {
public:
    void add(std::shared_ptr<const PackageFields> fields);

    std::string files_document() const;
    // Throws MissingFieldError if a package has no source rpm
    std::string info_document() const;
    std::string changelog_document() const;

    std::string document(XmlDocument kind) const;
    void write(XmlDocument kind, const std::filesystem::path& path, Compression compression, int level) const;

    std::size_t size() const { return packages_.size(); }

private:
    std::vector<std::shared_ptr<const PackageFields>> packages_;
    std::unordered_set<std::string> names_;
};

std::string xml_escape(std::string_view text);
