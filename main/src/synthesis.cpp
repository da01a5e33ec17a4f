#include "synthesis.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sstream>

namespace {
    void append_list(std::string& out, std::string_view field, const std::vector<std::string>& values) {
        if (values.empty()) return;
        out += '@';
        out += field;
        for (const auto& value : values) {
            out += '@';
            out += value;
        }
        out += '\n';
    }

    std::vector<std::string> split(const std::string& s, char delim) {
        std::vector<std::string> res;
        size_t start = 0, end = 0;
        while ((end = s.find(delim, start)) != std::string::npos) {
            res.push_back(s.substr(start, end - start));
            start = end + 1;
        }
        res.push_back(s.substr(start));
        return res;
    }

    std::uint64_t parse_number(const std::string& value, const std::string& line) {
        try {
            size_t consumed = 0;
            std::uint64_t n = std::stoull(value, &consumed);
            if (consumed == value.size()) return n;
        } catch (const std::logic_error&) {
        }
        throw GenhdlistException(string_format("error.synthesis_invalid_line", line));
    }
}

SynthesisRecord SynthesisRecord::from_fields(const PackageFields& fields) {
    SynthesisRecord record;
    record.name = fields.name;
    record.epoch = fields.epoch;
    record.size = fields.size;
    record.group = fields.group;
    record.requires_deps = fields.requires_deps;
    record.suggests = fields.suggests;
    record.obsoletes = fields.obsoletes;
    record.conflicts = fields.conflicts;
    record.provides = fields.provides;
    if (!fields.summary.empty()) record.summary = fields.summary;
    record.filesize = fields.filesize;
    return record;
}

void SynthesisWriter::record(const PackageFields& fields) {
    record(SynthesisRecord::from_fields(fields));
}

void SynthesisWriter::record(SynthesisRecord entry) {
    if (!names_.insert(entry.name).second) {
        throw DuplicatePackageError(string_format("error.duplicate_package", entry.name));
    }
    records_.push_back(std::move(entry));
}

std::string SynthesisWriter::serialize() const {
    std::string out;
    for (const auto& r : records_) {
        append_list(out, "requires", r.requires_deps);
        append_list(out, "suggests", r.suggests);
        append_list(out, "obsoletes", r.obsoletes);
        append_list(out, "conflicts", r.conflicts);
        append_list(out, "provides", r.provides);
        if (r.summary) {
            out += "@summary@" + *r.summary + "\n";
        }
        if (r.filesize) {
            out += "@filesize@" + std::to_string(*r.filesize) + "\n";
        }
        out += "@info@" + r.name + "@" + std::to_string(r.epoch) + "@" + std::to_string(r.size) + "@" + r.group + "\n";
    }
    return out;
}

void SynthesisWriter::finalize(const std::filesystem::path& path, Compression compression, int level) const {
    log_verbose(string_format("info.writing_synthesis", path.string(), records_.size()));
    write_compressed_file(path, serialize(), compression, level);
}

std::vector<SynthesisRecord> parse_synthesis(const std::string& text) {
    std::vector<SynthesisRecord> records;
    SynthesisRecord current;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        if (line[0] != '@') {
            throw GenhdlistException(string_format("error.synthesis_invalid_line", line));
        }
        auto words = split(line.substr(1), '@');
        const std::string& field = words[0];
        std::vector<std::string> values(words.begin() + 1, words.end());

        if (field == "info") {
            if (values.size() < 4) {
                throw GenhdlistException(string_format("error.synthesis_invalid_line", line));
            }
            current.name = values[0];
            current.epoch = static_cast<std::uint32_t>(parse_number(values[1], line));
            current.size = parse_number(values[2], line);
            // a group may itself contain '@'
            current.group = values[3];
            for (size_t i = 4; i < values.size(); ++i) current.group += "@" + values[i];
            records.push_back(std::move(current));
            current = SynthesisRecord{};
        } else if (field == "requires") {
            current.requires_deps = std::move(values);
        } else if (field == "suggests") {
            current.suggests = std::move(values);
        } else if (field == "obsoletes") {
            current.obsoletes = std::move(values);
        } else if (field == "conflicts") {
            current.conflicts = std::move(values);
        } else if (field == "provides") {
            current.provides = std::move(values);
        } else if (field == "summary") {
            current.summary = line.substr(std::string("@summary@").size());
        } else if (field == "filesize") {
            if (values.size() != 1) {
                throw GenhdlistException(string_format("error.synthesis_invalid_line", line));
            }
            current.filesize = parse_number(values[0], line);
        } else {
            log_warning(string_format("warning.synthesis_unknown_field", field));
        }
    }
    return records;
}

std::vector<SynthesisRecord> read_synthesis(const std::filesystem::path& path) {
    return parse_synthesis(read_compressed_file(path));
}
