#include "edge_converter.hpp"
#include "../bundle.hpp"
#include "../encoding.hpp"
#include "../errors.hpp"
#include "../token_match.hpp"
#include "../verbose.hpp"
#include <set>

namespace x5::converters {

namespace {
    // Runtime file, runtime start comment, loader call, runtime end comment.
    const std::regex MATCH_REGEX(
        "(?:"
        "(edge\\.[0-9]\\.[0-9]\\.[0-9]\\.min\\.js)|"
        "(<!--Adobe Edge Runtime-->)|"
        "(AdobeEdge\\.loadComposition)|"
        "(<!--Adobe Edge Runtime End-->)"
        ")");

    // Groups: 1 src, 2 runtime file name, 3 version.
    const std::regex RUNTIME_REGEX(
        "<script\\s[^>]*src=\""
        "([^\"]*(edge\\.([0-9.]+)\\.min\\.js))"
        "\"[^>]*>");

    // Groups: 1 call prefix, 2 composition name, 3 call suffix.
    const std::regex JS_REGEX(
        "(AdobeEdge\\.loadComposition\\(')"
        "([^']+)"
        "(', '[A-Za-z0-9_-]+', \\{)");

    // Folder variables of the generated js: images, audio, video, scripts.
    const std::regex PATHS_REGEX("\\b(im|aud|vid|js)='([^']*?)/?'");

    const std::regex WINDOW_OPEN_REGEX(
        "window\\.open\\(['\"][^'\"]*['\"]((?:,[^\\)]+)?)\\)");

    const std::vector<std::string> CLICKTAGS = {
        "var clickTag=\"%%CLICK_URL_UNESC%%\" + \"%%DEST_URL_ESC%%\";",
        "var clickTarget=\"_blank\";"
    };

    constexpr const char* MACRO_VARIABLE_PREFIX = "__x5__.macro_";

    std::string replace_all(std::string text, const std::string& from, const std::string& to) {
        if (from.empty()) return text;
        size_t pos = 0;
        while ((pos = text.find(from, pos)) != std::string::npos) {
            text.replace(pos, from.size(), to);
            pos += to.size();
        }
        return text;
    }

    std::string join_path(const std::string& root, const std::string& path) {
        if (root.empty() || (!path.empty() && path[0] == '/')) {
            return path;
        }
        return root.back() == '/' ? root + path : root + "/" + path;
    }

    bool ends_with(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}

bool EdgeConverter::match(const Snippet& snippet) const {
    return all_groups_match(MATCH_REGEX, snippet.content());
}

std::string EdgeConverter::fix_click_url(const std::string& content) {
    return std::regex_replace(content, WINDOW_OPEN_REGEX, "window.open(clickTag$1)");
}

EdgeRuntime EdgeConverter::detect_runtime(const std::string& content) const {
    std::smatch m;
    if (!std::regex_search(content, m, RUNTIME_REGEX)) {
        throw ConverterError("Edge detected in " + bundle_.transform_id() +
                             " but no runtime found");
    }
    return EdgeRuntime{m[1].str(), m[2].str(), m[3].str()};
}

Asset& EdgeConverter::find_edge_js(const std::string& content, const Snippet& snippet,
                                   std::smatch& js_match) const {
    if (!std::regex_search(content, js_match, JS_REGEX)) {
        throw ConverterError("Edge detected in " + bundle_.transform_id() +
                             " but no js found");
    }
    std::string js_name = url_unquote(js_match[2].str() + "_edge.js");
    AssetMap snippet_assets = bundle_.assets_relative_to(snippet);
    auto it = snippet_assets.find(js_name);
    if (it == snippet_assets.end()) {
        throw ConverterError("Edge detected in " + bundle_.transform_id() +
                             " but no js asset found");
    }
    return *it->second;
}

void EdgeConverter::fix_edge_js(Asset& js_asset, const std::string& snippet_root,
                                const EdgeRuntime& runtime) {
    const std::string& js_content = js_asset.content();

    std::vector<std::string> roots;
    for (auto it = std::sregex_iterator(js_content.begin(), js_content.end(), PATHS_REGEX);
         it != std::sregex_iterator(); ++it) {
        std::string folder = (*it)[2].str();
        if (!folder.empty()) {
            roots.push_back(join_path(snippet_root, folder));
        }
    }
    roots.push_back(snippet_root);

    // Relative folders would resolve against the serving host, not the asset.
    js_asset.set_content(std::regex_replace(js_content, PATHS_REGEX, "$1=''"));

    AssetMap assets = bundle_.assets_relative_to(roots);
    std::vector<std::string> tokens;
    for (const auto& [name, asset] : assets) {
        if (asset == &js_asset || ends_with(name, runtime.name)) {
            continue;
        }
        tokens.push_back(name);
    }

    auto regex = tokens_regex(tokens, ".{2}", ".{2}");
    if (!regex) {
        js_asset.set_parsed_content(js_asset.content());
        return;
    }

    // Group 1 carries two characters of quoting context on each side.
    auto replace = [&js_asset, &assets](const std::smatch& m) -> std::string {
        std::string name = m[1].str();
        if (name.find('%') != std::string::npos) {
            name = url_unquote(name);
        }
        if (name.size() < 4) {
            return m[1].str();
        }
        auto it = assets.find(name.substr(2, name.size() - 4));
        if (it == assets.end()) {
            return m[1].str();
        }
        js_asset.add_asset(it->second->name());
        std::string variable = MACRO_VARIABLE_PREFIX + it->second->id();

        if (name.compare(0, 2, "\\\"") == 0 || name.compare(0, 2, "\\'") == 0) {
            // '<a href=\"a.png\">' becomes '<a href=' + __x5__.macro_ID + '>'
            return "' + " + variable + " + '";
        }
        if (name[1] == '"' || name[1] == '\'') {
            // var g23='a.png', becomes var g23=__x5__.macro_ID,
            return name.substr(0, 1) + variable + name.substr(name.size() - 1);
        }
        return name.substr(0, 2) + variable + name.substr(name.size() - 2);
    };

    js_asset.set_parsed_content(regex_replace_fn(js_asset.content(), *regex, replace));
}

std::vector<std::string> EdgeConverter::fix_edge_js_assets(Asset& js_asset, Snippet& snippet) {
    std::vector<std::string> variables;
    std::set<std::string> asset_names(js_asset.assets().begin(), js_asset.assets().end());
    for (const auto& asset_name : asset_names) {
        Asset* asset = bundle_.find_asset(asset_name);
        if (!asset) continue;
        snippet.add_asset(asset_name);
        variables.push_back(MACRO_VARIABLE_PREFIX + asset->id() + " = \"" +
                            format_macro(FILE_MACRO_TEMPLATE, asset->id()) + "\";");
    }
    js_asset.assets().clear();
    inline_assets(snippet);
    return variables;
}

void EdgeConverter::convert(Snippet& snippet) {
    std::string content = snippet.content();

    EdgeRuntime runtime = detect_runtime(content);
    std::string runtime_url = replace_all(bundle_.options().edge_runtime_url,
                                          "{version}", runtime.version);
    content = replace_all(content, runtime.src, runtime_url);
    verbose_log("converter", "Edge runtime " + runtime.version + " served from " + runtime_url);

    std::smatch js_match;
    Asset& js_asset = find_edge_js(content, snippet, js_match);
    snippet.add_asset(js_asset.name());

    fix_edge_js(js_asset, snippet.root(), runtime);
    js_asset.set_parsed_content(fix_click_url(*js_asset.parsed_content()));

    std::vector<std::string> parts;
    parts.push_back(js_match.prefix().str());
    parts.push_back("\n// start x5 injected variables");
    parts.insert(parts.end(), CLICKTAGS.begin(), CLICKTAGS.end());
    parts.push_back("var __x5__ = {};");
    std::vector<std::string> variables = fix_edge_js_assets(js_asset, snippet);
    parts.insert(parts.end(), variables.begin(), variables.end());
    parts.push_back("// end x5 injected variables\n");
    parts.push_back("// Firefox and IE rendering latency remover\n");
    parts.push_back("AdobeEdge.yepnope.errorTimeout = 5e2;\n\n");
    parts.push_back(js_match[1].str() + format_macro(FILE_MACRO_TEMPLATE, js_asset.id()) +
                    "&_=" + js_match[3].str());
    parts.push_back(js_match.suffix().str());

    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += '\n';
        result += parts[i];
    }
    snippet.set_parsed_content(result);
}

} // namespace x5::converters
