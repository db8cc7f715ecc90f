#include "bundle.hpp"
#include "converters/factory.hpp"
#include "errors.hpp"
#include "mimetypes.hpp"
#include "verbose.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <sstream>

namespace x5 {

namespace {
    // OS metadata files that never belong to a creative.
    const std::unordered_set<std::string> JUNK_FILENAMES = {
        "Thumbs.db", "desktop.ini"
    };

    std::string to_upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    // A table cell: text plus alignment.
    struct Cell {
        std::string text;
        bool right_aligned = false;
    };

    Cell flag_cell(bool value) {
        return value ? Cell{"True", true} : Cell{"", false};
    }

    std::string pad(const Cell& cell, size_t width) {
        std::string fill(width > cell.text.size() ? width - cell.text.size() : 0, ' ');
        return cell.right_aligned ? fill + cell.text : cell.text + fill;
    }
}

nlohmann::json CreativePart::to_json() const {
    nlohmann::json creative_assets = nlohmann::json::array();
    for (const auto& asset : assets) {
        creative_assets.push_back(asset.to_json());
    }
    return {
        {"htmlSnippet", html_snippet},
        {"customCreativeAssets", creative_assets}
    };
}

Bundle::Bundle(std::string transform_id, BundleOptions options)
    : transform_id_(std::move(transform_id)), options_(std::move(options)) {
    auto policy = std::make_shared<AssetPolicy>();
    policy->size_limit = options_.asset_size_limit;
    policy->unsupported_mimetypes = options_.unsupported_mimetypes;
    policy_ = policy;
}

bool Bundle::is_skipped_entry(const ZipEntry& entry) {
    const std::string& name = entry.name;
    if (entry.is_directory || (!name.empty() && name.back() == '/')) {
        return true;
    }
    if (name.find("__MACOSX/") != std::string::npos) {
        return true;
    }
    auto slash_pos = name.rfind('/');
    std::string basename = slash_pos == std::string::npos ? name : name.substr(slash_pos + 1);
    if (basename.empty() || basename[0] == '.') {
        return true;
    }
    return JUNK_FILENAMES.count(basename) > 0;
}

std::unique_ptr<Bundle> Bundle::from_zip(const std::string& transform_id,
                                         std::istream& stream,
                                         BundleOptions options) {
    ZipArchive archive(stream, transform_id, options.entry_size_limit);
    auto bundle = std::make_unique<Bundle>(transform_id, std::move(options));

    for (const auto& entry : archive.entries()) {
        if (is_skipped_entry(entry)) {
            verbose_log("bundle", "Skipping " + entry.name);
            continue;
        }
        bundle->add_member(entry, archive);
    }

    if (bundle->snippets_.empty()) {
        throw BundleError("No snippets found in bundle " + transform_id + ".");
    }
    verbose_log("bundle", "Ingested " + std::to_string(bundle->snippets_.size()) +
                " snippet(s) and " + std::to_string(bundle->assets_.size()) +
                " asset(s) for " + transform_id);
    return bundle;
}

void Bundle::add_member(const ZipEntry& entry, const ZipArchive& archive) {
    std::string ext = file_extension(entry.name);
    if (ext.size() <= 1) {
        verbose_log("bundle", "Skipping " + entry.name + " (no extension)");
        return;
    }
    ext = to_upper(ext.substr(1));

    int count = ++macro_names_[ext];
    std::string id = ext + std::to_string(count);
    std::optional<std::string> mimetype = guess_mimetype(entry.name);

    if (mimetype && SNIPPET_MIMETYPES.count(*mimetype) > 0) {
        snippets_[entry.name] = std::make_unique<Snippet>(id, entry, mimetype, archive);
        verbose_log("bundle", "Snippet " + id + ": " + entry.name);
    } else {
        assets_[entry.name] = std::make_unique<Asset>(id, entry, mimetype, policy_, archive);
        verbose_log("bundle", "Asset " + id + ": " + entry.name + " (" +
                    format_bytes(entry.size) + ", " + mimetype.value_or("unknown") + ")");
    }
}

AssetMap Bundle::assets_relative_to(const std::string& root) const {
    return assets_relative_to(std::vector<std::string>{root});
}

AssetMap Bundle::assets_relative_to(const Resource& resource) const {
    return assets_relative_to(std::vector<std::string>{resource.root()});
}

AssetMap Bundle::assets_relative_to(const std::vector<std::string>& roots) const {
    AssetMap result;
    for (const auto& [name, asset] : assets_) {
        for (const auto& root : roots) {
            auto relative = asset->name_relative_to(root);
            if (relative) {
                result[*relative] = asset.get();
                break;
            }
        }
    }
    return result;
}

Snippet* Bundle::find_snippet(const std::string& name) const {
    auto it = snippets_.find(name);
    return it == snippets_.end() ? nullptr : it->second.get();
}

Asset* Bundle::find_asset(const std::string& name) const {
    auto it = assets_.find(name);
    return it == assets_.end() ? nullptr : it->second.get();
}

bool Bundle::remove_asset(const std::string& name) {
    return assets_.erase(name) > 0;
}

void Bundle::transform() {
    if (assets_.empty()) {
        throw BundleError("No assets in bundle " + transform_id_ + ".");
    }

    auto converters = converters::make_converters(*this);
    for (const auto& [name, snippet] : snippets_) {
        for (const auto& converter : converters) {
            if (!converter->match(*snippet)) {
                continue;
            }
            verbose_log("bundle", "Converting " + name + " with " + converter->type() + " converter");
            try {
                converter->convert(*snippet);
            } catch (const ConverterError& e) {
                verbose_err("converter", "Conversion error in " + name + " (" +
                            converter->type() + "): " + e.what());
                throw BundleError("Error converting " + transform_id_ + ": " + e.what());
            } catch (const std::regex_error& e) {
                verbose_err("converter", "Regex error in " + name + " (" +
                            converter->type() + "): " + e.what());
                throw BundleError("Error converting " + transform_id_ + ": " + e.what());
            }
            snippet->set_x5type(converter->type());
            break;
        }
    }
}

const Snippet& Bundle::snippet_or_throw(const std::string& snippet_name) const {
    const Snippet* snippet = find_snippet(snippet_name);
    if (!snippet) {
        throw BundleError("Invalid snippet name or bundle not populated");
    }
    return *snippet;
}

CreativePart Bundle::get_creative_part(std::istream& stream, const std::string& snippet_name) const {
    const Snippet& snippet = snippet_or_throw(snippet_name);
    ZipArchive archive(stream, transform_id_, options_.entry_size_limit);

    CreativePart part;
    part.html_snippet = snippet.as_snippet();

    // Assets over quota stay in the list: their macros are still referenced.
    std::set<std::string> asset_names(snippet.assets().begin(), snippet.assets().end());
    for (const auto& asset_name : asset_names) {
        const Asset* asset = find_asset(asset_name);
        if (!asset) {
            throw BundleError("Asset " + asset_name + " referenced by " + snippet_name +
                              " is missing from bundle " + transform_id_);
        }
        part.assets.push_back(asset->as_creative_asset(transform_id_, archive));
    }
    verbose_log("bundle", "Assembled " + snippet_name + " with " +
                std::to_string(part.assets.size()) + " asset(s)");
    return part;
}

nlohmann::json Bundle::metadata() const {
    nlohmann::json snippets = nlohmann::json::array();
    for (const auto& [name, snippet] : snippets_) {
        snippets.push_back(snippet->to_json(true));
    }
    nlohmann::json assets = nlohmann::json::array();
    for (const auto& [name, asset] : assets_) {
        assets.push_back(asset->to_json(true));
    }
    return {
        {"transform_id", transform_id_},
        {"snippets", snippets},
        {"assets", assets}
    };
}

std::string Bundle::assets_table(const std::string& snippet_name) const {
    const Snippet& snippet = snippet_or_throw(snippet_name);

    const std::vector<std::string> fields = {
        "name", "id", "size", "mimetype", "inlined", "over_limit", "unsupported"
    };

    std::vector<std::vector<Cell>> rows;
    std::set<std::string> asset_names(snippet.assets().begin(), snippet.assets().end());
    for (const auto& asset_name : asset_names) {
        const Asset* asset = find_asset(asset_name);
        if (!asset) continue;
        rows.push_back({
            Cell{asset->name(), false},
            Cell{asset->id(), false},
            Cell{std::to_string(asset->size()), true},
            Cell{asset->mimetype().value_or(""), false},
            flag_cell(asset->inlined()),
            flag_cell(asset->over_limit()),
            flag_cell(asset->unsupported())
        });
    }

    // Boolean columns are wide enough for "False" like the header row.
    std::vector<size_t> widths;
    for (size_t i = 0; i < fields.size(); ++i) {
        size_t width = std::max(fields[i].size(), i >= 4 ? size_t(5) : size_t(0));
        for (const auto& row : rows) {
            width = std::max(width, row[i].text.size());
        }
        widths.push_back(width);
    }

    std::ostringstream out;
    out << "snippet: " << snippet_name << "\n\n";
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out << ' ';
        out << pad(Cell{fields[i], false}, widths[i]);
    }
    out << '\n';
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out << ' ';
        out << std::string(widths[i], '-');
    }
    for (const auto& row : rows) {
        out << '\n';
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out << ' ';
            out << pad(row[i], widths[i]);
        }
    }
    return out.str();
}

} // namespace x5
