#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "media_info.hpp"
#include "rpm_header.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
}

int main(int argc, char* argv[]) {
    try {
        init_localization();

        cxxopts::Options options(argv[0], get_string("info.description"));
        options.custom_help(get_string("info.usage"));
        options.positional_help("<rpms_dir>");
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("clean", get_string("help.clean"), cxxopts::value<bool>()->default_value("false"))
            ("no-bad-rpm", get_string("help.no_bad_rpm"), cxxopts::value<bool>()->default_value("false"))
            ("no-md5sum", get_string("help.no_md5sum"), cxxopts::value<bool>()->default_value("false"))
            ("no-clean-old-rpms", get_string("help.no_clean_old_rpms"), cxxopts::value<bool>()->default_value("false"))
            ("only-clean-old-rpms", get_string("help.only_clean_old_rpms"), cxxopts::value<bool>()->default_value("false"))
            ("nolock", get_string("help.nolock"), cxxopts::value<bool>()->default_value("false"))
            ("no-hdlist", get_string("help.no_hdlist"), cxxopts::value<bool>()->default_value("false"))
            ("allow-empty-media", get_string("help.allow_empty_media"), cxxopts::value<bool>()->default_value("false"))
            ("file-deps", get_string("help.file_deps"), cxxopts::value<std::string>())
            ("hdlist-filter", get_string("help.hdlist_filter"), cxxopts::value<std::string>()->default_value(std::string(DEFAULT_HDLIST_FILTER)))
            ("synthesis-filter", get_string("help.synthesis_filter"), cxxopts::value<std::string>()->default_value(std::string(DEFAULT_SYNTHESIS_FILTER)))
            ("xml-info", get_string("help.xml_info"), cxxopts::value<bool>()->default_value("false"))
            ("xml-info-filter", get_string("help.xml_info_filter"), cxxopts::value<std::string>()->default_value(std::string(DEFAULT_XML_INFO_FILTER)))
            ("versioned", get_string("help.versioned"), cxxopts::value<bool>()->default_value("false"))
            ("media-info-dir", get_string("help.media_info_dir"), cxxopts::value<std::string>())
            ("block-size", get_string("help.block_size"), cxxopts::value<std::size_t>()->default_value(std::to_string(DEFAULT_BLOCK_SIZE)))
            ("v,verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"))
            ("version", get_string("help.version"), cxxopts::value<bool>()->default_value("false"))
            ("rpms_dir", "", cxxopts::value<std::string>());

        options.parse_positional({"rpms_dir"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result["version"].as<bool>()) {
            std::cout << string_format("info.version", std::string(argv[0]), std::string(GENHDLIST_VERSION)) << std::endl;
            return 0;
        }

        set_verbose_mode(result["verbose"].as<bool>());

        if (result["no-clean-old-rpms"].as<bool>()) {
            log_warning(get_string("warning.no_clean_old_rpms_ignored"));
        }
        if (result["only-clean-old-rpms"].as<bool>()) {
            throw GenhdlistException(get_string("error.only_clean_old_rpms_unsupported"));
        }
        if (result.count("file-deps")) {
            throw GenhdlistException(get_string("error.file_deps_unsupported"));
        }
        // Incremental updates are not implemented, every build is a clean one
        if (result["clean"].as<bool>()) {
            log_verbose(get_string("info.clean_build"));
        }

        if (!result.count("rpms_dir")) {
            print_usage(options);
            throw GenhdlistException(get_string("error.no_rpms_dir"));
        }

        BuildOptions build;
        build.rpms_dir = result["rpms_dir"].as<std::string>();
        if (result.count("media-info-dir")) {
            build.media_info_dir = result["media-info-dir"].as<std::string>();
        }
        build.hdlist_filter = result["hdlist-filter"].as<std::string>();
        build.synthesis_filter = result["synthesis-filter"].as<std::string>();
        build.xml_info_filter = result["xml-info-filter"].as<std::string>();
        build.block_size = result["block-size"].as<std::size_t>();
        build.no_hdlist = result["no-hdlist"].as<bool>();
        build.xml_info = result["xml-info"].as<bool>();
        build.no_md5sum = result["no-md5sum"].as<bool>();
        build.versioned = result["versioned"].as<bool>();
        build.allow_empty_media = result["allow-empty-media"].as<bool>();
        build.no_bad_rpm = result["no-bad-rpm"].as<bool>();
        build.nolock = result["nolock"].as<bool>();

        // Package metadata must not be translated into the media info
        setenv("LC_ALL", "C", 1);

        RpmHeaderParser parser;
        build_media_info(build, parser);

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const GenhdlistException& e) {
        log_error(string_format("error.genhdlist_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
