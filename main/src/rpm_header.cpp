#include "rpm_header.hpp"
#include "dependency.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <rpm/rpmio.h>
#include <rpm/rpmlib.h>
#include <rpm/rpmlog.h>
#include <rpm/rpmtag.h>
#include <rpm/rpmtd.h>

#include <cstdlib>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;

namespace {
    struct RpmTdDeleter {
        void operator()(rpmtd td) const {
            if (td) {
                rpmtdFreeData(td);
                rpmtdFree(td);
            }
        }
    };

    struct RpmFdDeleter {
        void operator()(FD_t fd) const {
            if (fd) Fclose(fd);
        }
    };

    using RpmTdHandle = std::unique_ptr<std::remove_pointer_t<rpmtd>, RpmTdDeleter>;
    using RpmFdHandle = std::unique_ptr<std::remove_pointer_t<FD_t>, RpmFdDeleter>;

    std::once_flag rpm_config_once;
    bool rpm_config_loaded = false;

    std::string header_string(Header h, rpmTagVal tag) {
        const char* value = headerGetString(h, tag);
        return value ? value : "";
    }

    std::vector<std::string> header_strings(Header h, rpmTagVal tag, headerGetFlags flags = HEADERGET_MINMEM) {
        std::vector<std::string> values;
        RpmTdHandle td(rpmtdNew());
        if (!headerGet(h, tag, td.get(), flags)) return values;
        values.reserve(rpmtdCount(td.get()));
        while (const char* value = rpmtdNextString(td.get())) {
            values.emplace_back(value);
        }
        return values;
    }

    std::vector<std::uint32_t> header_uint32s(Header h, rpmTagVal tag) {
        std::vector<std::uint32_t> values;
        RpmTdHandle td(rpmtdNew());
        if (!headerGet(h, tag, td.get(), HEADERGET_MINMEM)) return values;
        values.reserve(rpmtdCount(td.get()));
        while (const std::uint32_t* value = rpmtdNextUint32(td.get())) {
            values.push_back(*value);
        }
        return values;
    }

    std::vector<std::string> dependency_tokens(Header h, rpmTagVal name_tag, rpmTagVal version_tag, rpmTagVal flags_tag) {
        std::vector<std::string> names = header_strings(h, name_tag);
        if (names.empty()) return {};
        std::vector<std::string> versions = header_strings(h, version_tag);
        std::vector<std::uint32_t> flags = header_uint32s(h, flags_tag);
        if (versions.empty()) versions.resize(names.size());
        if (flags.empty()) flags.resize(names.size(), 0);
        return format_dependency_list(names, versions, flags);
    }
}

RpmHeaderParser::RpmHeaderParser() {
    std::call_once(rpm_config_once, [] {
        rpm_config_loaded = rpmReadConfigFiles(nullptr, nullptr) == 0;
    });
    if (!rpm_config_loaded) {
        throw GenhdlistException(get_string("error.rpm_config_failed"));
    }
    if (!get_verbose_mode()) {
        rpmSetVerbosity(RPMLOG_CRIT);
    }

    ts_.reset(rpmtsCreate());
    if (!ts_) {
        throw GenhdlistException(get_string("error.rpm_ts_failed"));
    }
    rpmtsSetVSFlags(ts_.get(), _RPMVSF_NOSIGNATURES);
}

ParsedPackage RpmHeaderParser::parse(const fs::path& path) {
    RpmFdHandle fd(Fopen(path.c_str(), "r.ufdio"));
    if (!fd || Ferror(fd.get())) {
        throw IOFailure(string_format("error.open_file_failed", path.string()));
    }

    Header raw = nullptr;
    const rpmRC rc = rpmReadPackageFile(ts_.get(), fd.get(), path.c_str(), &raw);
    RpmHeaderHandle h(raw);
    switch (rc) {
        case RPMRC_OK:
        case RPMRC_NOKEY:
        case RPMRC_NOTTRUSTED:
            break;
        case RPMRC_NOTFOUND:
            throw HeaderParseError(string_format("error.rpm_not_a_package", path.string()));
        default:
            throw HeaderParseError(string_format("error.rpm_read_failed", path.string()));
    }
    if (!h) {
        throw HeaderParseError(string_format("error.rpm_read_failed", path.string()));
    }

    const std::string name = strip_suffix(path.filename().string(), ".rpm");
    log_verbose(string_format("info.rpm_parsed", path.filename().string()));
    return ParsedPackage{fields_from_header(h.get(), name), export_header(h.get())};
}

PackageFields fields_from_header(Header h, const std::string& name) {
    PackageFields f;
    f.name = name;
    f.epoch = static_cast<std::uint32_t>(headerGetNumber(h, RPMTAG_EPOCH));
    f.version = header_string(h, RPMTAG_VERSION);
    f.release = header_string(h, RPMTAG_RELEASE);
    f.arch = header_string(h, RPMTAG_ARCH);
    f.summary = header_string(h, RPMTAG_SUMMARY);
    f.description = header_string(h, RPMTAG_DESCRIPTION);
    f.group = header_string(h, RPMTAG_GROUP);
    f.license = header_string(h, RPMTAG_LICENSE);
    f.packager = header_string(h, RPMTAG_PACKAGER);
    f.buildtime = static_cast<std::int64_t>(headerGetNumber(h, RPMTAG_BUILDTIME));
    if (const char* sourcerpm = headerGetString(h, RPMTAG_SOURCERPM)) {
        f.sourcerpm = sourcerpm;
    }
    f.url = header_string(h, RPMTAG_URL);
    f.size = headerIsEntry(h, RPMTAG_LONGSIZE) ? headerGetNumber(h, RPMTAG_LONGSIZE)
                                                : headerGetNumber(h, RPMTAG_SIZE);

    // rpmReadPackageFile merges the signature tags into the header
    if (headerIsEntry(h, RPMTAG_LONGSIGSIZE)) {
        f.filesize = headerGetNumber(h, RPMTAG_LONGSIGSIZE) + RPM_FILESIZE_OVERHEAD;
    } else if (headerIsEntry(h, RPMTAG_SIGSIZE)) {
        f.filesize = headerGetNumber(h, RPMTAG_SIGSIZE) + RPM_FILESIZE_OVERHEAD;
    }

    // Extension tag, joins DIRNAMES/BASENAMES or returns OLDFILENAMES
    f.files = header_strings(h, RPMTAG_FILENAMES, HEADERGET_EXT);

    const auto times = header_uint32s(h, RPMTAG_CHANGELOGTIME);
    const auto authors = header_strings(h, RPMTAG_CHANGELOGNAME);
    const auto texts = header_strings(h, RPMTAG_CHANGELOGTEXT);
    if (authors.size() != times.size() || texts.size() != times.size()) {
        throw HeaderParseError(string_format("error.rpm_bad_changelog", name));
    }
    for (std::size_t i = 0; i < times.size(); ++i) {
        f.changelog.push_back({static_cast<std::int64_t>(times[i]), authors[i], texts[i]});
    }

    f.requires_deps = dependency_tokens(h, RPMTAG_REQUIRENAME, RPMTAG_REQUIREVERSION, RPMTAG_REQUIREFLAGS);
    f.suggests = dependency_tokens(h, RPMTAG_RECOMMENDNAME, RPMTAG_RECOMMENDVERSION, RPMTAG_RECOMMENDFLAGS);
    f.obsoletes = dependency_tokens(h, RPMTAG_OBSOLETENAME, RPMTAG_OBSOLETEVERSION, RPMTAG_OBSOLETEFLAGS);
    f.conflicts = dependency_tokens(h, RPMTAG_CONFLICTNAME, RPMTAG_CONFLICTVERSION, RPMTAG_CONFLICTFLAGS);
    f.provides = dependency_tokens(h, RPMTAG_PROVIDENAME, RPMTAG_PROVIDEVERSION, RPMTAG_PROVIDEFLAGS);
    return f;
}

std::string export_header(Header h) {
    unsigned int size = 0;
    void* blob = headerExport(h, &size);
    if (!blob) {
        throw HeaderParseError(get_string("error.rpm_export_failed"));
    }
    std::string data(static_cast<const char*>(blob), size);
    std::free(blob);
    return data;
}
