#pragma once

#include "package.hpp"

#include <rpm/header.h>
#include <rpm/rpmts.h>

#include <filesystem>
#include <memory>
#include <string>
#include <type_traits>

// Size of the lead and header structures, added to the signature size to
// get the size of the whole package file
inline constexpr std::uint64_t RPM_FILESIZE_OVERHEAD = 440;

// Custom deleters for librpm handles
struct RpmHeaderDeleter {
    void operator()(Header h) const {
        if (h) headerFree(h);
    }
};

struct RpmTsDeleter {
    void operator()(rpmts ts) const {
        if (ts) rpmtsFree(ts);
    }
};

using RpmHeaderHandle = std::unique_ptr<std::remove_pointer_t<Header>, RpmHeaderDeleter>;
using RpmTsHandle = std::unique_ptr<std::remove_pointer_t<rpmts>, RpmTsDeleter>;

// Source of package metadata. The build only relies on the returned values.
class HeaderParser {
public:
    virtual ~HeaderParser() = default;
    virtual ParsedPackage parse(const std::filesystem::path& path) = 0;
};

// Reads .rpm files through librpm. Signatures are not checked, digests are.
class RpmHeaderParser : public HeaderParser {
public:
    RpmHeaderParser();
    ParsedPackage parse(const std::filesystem::path& path) override;

private:
    RpmTsHandle ts_;
};

// Field set of a package header. `name` is the archive entry name.
// Throws InvalidDependencyError for an unusable dependency.
PackageFields fields_from_header(Header h, const std::string& name);

// Header blob as stored in the hdlist (headerExport, no magic).
std::string export_header(Header h);
