#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <regex>

namespace fs = std::filesystem;

fs::path L10N_DIR = GENHDLIST_L10N_DIR;

FilterSpec parse_filter(const std::string& filter) {
    // .<suffix>:<program> -<level>
    static const std::regex filter_regex(R"(^(\.[^:/\s]+):(\S+)\s+(-?\d+)$)");
    std::smatch match;
    if (!std::regex_match(filter, match, filter_regex)) {
        throw InvalidFilterError(string_format("error.invalid_filter", filter));
    }

    FilterSpec spec;
    spec.suffix = match[1];

    const std::string program = match[2];
    if (program == "gzip") {
        spec.compression = Compression::Gzip;
    } else if (program == "xz") {
        spec.compression = Compression::Xz;
    } else {
        throw InvalidFilterError(string_format("error.unsupported_filter", program));
    }

    const std::string level_token = match[3];
    if (level_token.size() != 2 || level_token[0] != '-') {
        throw InvalidFilterError(string_format("error.invalid_filter_level", filter));
    }
    spec.level = -std::stoi(level_token);
    return spec;
}

fs::path resolve_media_info_dir(const BuildOptions& options) {
    if (!options.media_info_dir.empty()) return options.media_info_dir;
    return options.rpms_dir / "media_info";
}

fs::path get_staging_dir(const fs::path& media_info_dir) {
    return media_info_dir / "tmp";
}

fs::path get_lock_file(const fs::path& media_info_dir) {
    return media_info_dir / "UPDATING";
}
