#include "config.hpp"
#include "console.hpp"
#include "settings.hpp"
#include "transform.hpp"
#include "verbose.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace x5;

// ========== Output ==========

// Serializes a document; invalid UTF-8 in asset names is replaced.
std::string dump_json(const nlohmann::json& document) {
    return document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Writes text to path, or to stdout when path is empty.
void write_output(const std::string& text, const std::string& path) {
    if (path.empty()) {
        std::cout << text << std::endl;
        return;
    }
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file " + path);
    }
    out << text << '\n';
    if (!out) {
        throw std::runtime_error("Cannot write output file " + path);
    }
}

// ========== Settings ==========

// Settings from .x5.json, then the environment, then the command line.
Settings resolve_settings(const CLI::Option* limit_option, uint64_t limit_flag,
                          const Console& console) {
    Settings settings = load_settings();
    if (!apply_environment(settings)) {
        console.print_warning(std::string("Ignoring ") + ASSET_SIZE_LIMIT_ENV +
                              ": not a non-negative integer");
    }
    if (limit_option->count() > 0) {
        settings.asset_size_limit = limit_flag;
    }
    verbose_log("settings", "Asset size limit " + std::to_string(settings.asset_size_limit));
    return settings;
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Convert zipped HTML5 creatives into ad-server custom creatives"};
    app.footer("\nExamples:\n"
               "  x5conv banner.zip                                 List snippets and assets\n"
               "  x5conv banner.zip --snippet index.html --table    Show referenced assets\n"
               "  x5conv banner.zip --snippet index.html            Print html and assets\n"
               "  x5conv banner.zip --snippet index.html --advertiser 42 \\\n"
               "         --url https://example.com --size 300x250   Print the full creative\n");

    std::string archive;
    app.add_option("archive", archive, "Zip archive of the HTML5 creative")
        ->required()
        ->check(CLI::ExistingFile);

    std::string snippet;
    app.add_option("-s,--snippet", snippet, "Name of the html file to build the creative from");

    std::string advertiser;
    auto* advertiser_option = app.add_option("--advertiser", advertiser, "Advertiser id");

    std::string url;
    auto* url_option = app.add_option("--url", url, "Click-through destination URL");

    std::string size;
    auto* size_option = app.add_option("--size", size, "Creative size as WIDTHxHEIGHT");

    advertiser_option->needs(url_option)->needs(size_option);
    url_option->needs(advertiser_option)->needs(size_option);
    size_option->needs(advertiser_option)->needs(url_option);

    std::string creative_name;
    app.add_option("--name", creative_name, "Creative name (default: X5 <archive> <transform id>)");

    std::string transform_id;
    app.add_option("--transform-id", transform_id, "Id embedded in asset file names (default: archive stem)");

    uint64_t asset_size_limit = DEFAULT_ASSET_SIZE_LIMIT;
    auto* limit_option = app.add_option("--asset-size-limit", asset_size_limit,
                                        "Largest accepted asset in bytes");

    bool metadata = false;
    app.add_flag("--metadata", metadata, "Print snippet and asset metadata");

    bool table = false;
    app.add_flag("--table", table, "Print the assets referenced by --snippet as a table");

    std::string output_path;
    app.add_option("-o,--output", output_path, "Write to file instead of stdout");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log ingestion and conversion steps to stderr");

    CLI11_PARSE(app, argc, argv);

    set_verbose(verbose);
    Console console;

    try {
        Settings settings = resolve_settings(limit_option, asset_size_limit, console);

        std::filesystem::path archive_path(archive);
        if (transform_id.empty()) {
            transform_id = archive_path.stem().string();
        }
        Transform transform(transform_id, archive, archive_path.filename().string(),
                            settings.bundle_options());

        std::string text;
        if (table) {
            if (snippet.empty()) {
                console.print_error("Error: --table requires --snippet");
                return 1;
            }
            text = transform.bundle().assets_table(snippet);
        } else if (metadata || snippet.empty()) {
            text = dump_json(transform.bundle().metadata());
        } else if (advertiser_option->count() > 0) {
            text = dump_json(transform.get_creative(snippet, advertiser, url, size, creative_name));
        } else {
            text = dump_json(transform.get_creative_part(snippet).to_json());
        }

        write_output(text, output_path);

        if (!output_path.empty()) {
            const Bundle& bundle = transform.bundle();
            console.print_field("Transform id:", transform.transform_id());
            console.print_field("Snippets:", std::to_string(bundle.snippets().size()));
            console.print_field("Assets:", std::to_string(bundle.assets().size()));
            console.print_success("Wrote " + output_path);
        }
    } catch (const std::exception& e) {
        console.print_error("Error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
