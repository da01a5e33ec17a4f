#include "media_info_xml.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

namespace {
    constexpr std::string_view XML_PROLOG = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<media_info>";
    constexpr std::string_view XML_EPILOG = "</media_info>";
}

std::string_view xml_document_name(XmlDocument kind) {
    switch (kind) {
        case XmlDocument::Files: return "files";
        case XmlDocument::Info: return "info";
        case XmlDocument::Changelog: return "changelog";
    }
    return "";
}

std::string xml_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c;
        }
    }
    return out;
}

void MediaInfoXmlWriter::add(std::shared_ptr<const PackageFields> fields) {
    if (!names_.insert(fields->name).second) {
        throw DuplicatePackageError(string_format("error.duplicate_package", fields->name));
    }
    packages_.push_back(std::move(fields));
}

std::string MediaInfoXmlWriter::files_document() const {
    std::string data(XML_PROLOG);
    for (const auto& pkg : packages_) {
        data += "<files fn=\"" + xml_escape(pkg->name) + "\">\n";
        for (const auto& file : pkg->files) {
            data += xml_escape(file) + "\n";
        }
        data += "</files>\n";
    }
    data += XML_EPILOG;
    return data;
}

std::string MediaInfoXmlWriter::info_document() const {
    std::string data(XML_PROLOG);
    for (const auto& pkg : packages_) {
        if (!pkg->sourcerpm) {
            throw MissingFieldError(string_format("error.missing_sourcerpm", pkg->name));
        }
        data += "<info fn=\"" + xml_escape(pkg->name) + "\"";
        data += " sourcerpm=\"" + xml_escape(*pkg->sourcerpm) + "\"";
        data += " url=\"" + xml_escape(pkg->url) + "\"";
        data += " license=\"" + xml_escape(pkg->license) + "\">";
        data += xml_escape(pkg->description);
        data += "</info>\n";
    }
    data += XML_EPILOG;
    return data;
}

std::string MediaInfoXmlWriter::changelog_document() const {
    std::string data(XML_PROLOG);
    for (const auto& pkg : packages_) {
        data += "<changelogs fn=\"" + xml_escape(pkg->name) + "\">\n";
        for (const auto& log : pkg->changelog) {
            data += "<log time=\"" + std::to_string(log.time) + "\">\n";
            data += "<log_name>" + xml_escape(log.name) + "</log_name>\n";
            data += "<log_text>" + xml_escape(log.text) + "</log_text>\n";
            data += "</log>\n";
        }
        data += "</changelogs>\n";
    }
    data += XML_EPILOG;
    return data;
}

std::string MediaInfoXmlWriter::document(XmlDocument kind) const {
    switch (kind) {
        case XmlDocument::Files: return files_document();
        case XmlDocument::Info: return info_document();
        case XmlDocument::Changelog: return changelog_document();
    }
    return "";
}

void MediaInfoXmlWriter::write(XmlDocument kind, const std::filesystem::path& path, Compression compression, int level) const {
    log_info(string_format("info.writing_xml", std::string(xml_document_name(kind))));
    write_compressed_file(path, document(kind), compression, level);
}
