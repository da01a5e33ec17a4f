#include "media_info.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "hdlist.hpp"
#include "localization.hpp"
#include "media_info_xml.hpp"
#include "synthesis.hpp"
#include "utils.hpp"

#include <algorithm>
#include <ctime>
#include <exception>
#include <memory>
#include <optional>

namespace fs = std::filesystem;

namespace {
    // Runs one finalization step and keeps the first failure
    template<typename Step>
    void run_output_step(std::exception_ptr& first_error, const std::string& output, Step&& step) {
        try {
            step();
        } catch (const GenhdlistException& e) {
            log_error(string_format("error.output_failed", output, e.what()));
            if (!first_error) first_error = std::current_exception();
        }
    }
}

std::vector<fs::path> collect_rpms(const fs::path& rpms_dir) {
    std::vector<fs::path> rpms;
    for (const auto& entry : fs::directory_iterator(rpms_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".rpm") {
            rpms.push_back(entry.path());
        }
    }
    std::sort(rpms.begin(), rpms.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return rpms;
}

std::string version_stamp(std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm);
    return buf;
}

BuildResult build_media_info(const BuildOptions& options, HeaderParser& parser) {
    const FilterSpec hdlist_filter = parse_filter(options.hdlist_filter);
    const FilterSpec synthesis_filter = parse_filter(options.synthesis_filter);
    const FilterSpec xml_filter = parse_filter(options.xml_info_filter);

    if (!fs::is_directory(options.rpms_dir)) {
        throw GenhdlistException(string_format("error.rpms_dir_missing", options.rpms_dir.string()));
    }
    const std::vector<fs::path> rpms = collect_rpms(options.rpms_dir);
    if (rpms.empty() && !options.allow_empty_media) {
        throw GenhdlistException(string_format("error.no_rpms", options.rpms_dir.string()));
    }

    BuildResult result;
    result.media_info_dir = resolve_media_info_dir(options);
    const fs::path& media_info_dir = result.media_info_dir;
    ensure_dir_exists(media_info_dir);

    std::optional<MediaInfoLock> lock;
    if (!options.nolock) {
        lock.emplace(get_lock_file(media_info_dir));
    }

    const std::string hdlist_name = "hdlist" + hdlist_filter.suffix;
    const std::string synthesis_name = "synthesis.hdlist" + synthesis_filter.suffix;
    const bool xml_info = options.xml_info || fs::exists(media_info_dir / ("info.xml" + xml_filter.suffix));

    std::vector<std::string> outputs;
    if (!options.no_hdlist) outputs.push_back(hdlist_name);
    outputs.push_back(synthesis_name);
    if (xml_info) {
        for (XmlDocument kind : ALL_XML_DOCUMENTS) {
            outputs.push_back(std::string(xml_document_name(kind)) + ".xml" + xml_filter.suffix);
        }
    }

    const fs::path staging = get_staging_dir(media_info_dir);
    reset_dir(staging);

    std::optional<HdlistPacker> packer;
    if (!options.no_hdlist) {
        packer.emplace(staging / hdlist_name, hdlist_filter, options.block_size);
    }
    SynthesisWriter synthesis;
    MediaInfoXmlWriter xml;

    for (const auto& rpm : rpms) {
        ParsedPackage parsed;
        try {
            parsed = parser.parse(rpm);
        } catch (const GenhdlistException& e) {
            if (!options.no_bad_rpm) {
                throw GenhdlistException(string_format("error.bad_rpm", rpm.filename().string(), e.what()));
            }
            log_warning(string_format("warning.skipping_bad_rpm", rpm.filename().string(), e.what()));
            ++result.skipped_count;
            continue;
        }

        auto fields = std::make_shared<const PackageFields>(std::move(parsed.fields));
        log_verbose(string_format("info.adding_package", fields->name));
        if (packer) {
            packer->add_entry(fields->name, parsed.raw_header);
        }
        synthesis.record(*fields);
        if (xml_info) {
            xml.add(fields);
        }
        ++result.package_count;
    }

    std::exception_ptr first_error;
    if (packer) {
        run_output_step(first_error, hdlist_name, [&] { packer->finalize(); });
    }
    run_output_step(first_error, synthesis_name, [&] {
        synthesis.finalize(staging / synthesis_name, synthesis_filter.compression, synthesis_filter.level);
    });
    if (xml_info) {
        for (XmlDocument kind : ALL_XML_DOCUMENTS) {
            const std::string name = std::string(xml_document_name(kind)) + ".xml" + xml_filter.suffix;
            run_output_step(first_error, name, [&] {
                xml.write(kind, staging / name, xml_filter.compression, xml_filter.level);
            });
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }

    const std::string prefix = options.versioned ? version_stamp(std::chrono::system_clock::now()) + "-" : "";
    for (const auto& name : outputs) {
        const std::string published = prefix + name;
        log_verbose(string_format("info.publishing", name, published));
        rename_file(staging / name, media_info_dir / published);
        result.published.push_back(published);
    }
    std::error_code ec;
    fs::remove(staging, ec);
    if (ec) {
        log_warning(string_format("warning.staging_cleanup_failed", staging.string(), ec.message()));
    }

    if (!options.no_md5sum) {
        log_verbose(get_string("info.writing_md5sum"));
        std::string md5sum;
        for (const auto& name : result.published) {
            md5sum += calculate_md5(media_info_dir / name) + "  " + name + "\n";
        }
        write_file(media_info_dir / "MD5SUM", md5sum);
    }

    log_info(string_format("info.build_complete", result.package_count, media_info_dir.string()));
    return result;
}
