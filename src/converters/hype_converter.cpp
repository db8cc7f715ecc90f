#include "hype_converter.hpp"
#include "../bundle.hpp"
#include "../encoding.hpp"
#include "../errors.hpp"
#include "../verbose.hpp"
#include <regex>

namespace x5::converters {

namespace {
    constexpr const char* GENERATED_SCRIPT_SUFFIX = "_hype_generated_script.js";

    const std::regex MATCH_REGEX(
        "<script\\s[^>]*src=[\"'][^\"']+_hype_generated_script\\.js\\?[0-9]+[\"']");

    // Group 1: script path without the query string.
    const std::regex SCRIPT_REGEX(
        "<script\\s[^>]*src=[\"']"
        "([^\"']+_hype_generated_script\\.js)(?:\\?[0-9]+)?"
        "[\"'][^>]*/?>(?:\\s*</script>)?");

    // Hard-coded resources folder of the generated script.
    const std::regex FOLDER_VAR_REGEX("var f\\s*=\\s*\"[^\"]+\",");

    std::string path_basename(const std::string& path) {
        auto slash_pos = path.rfind('/');
        return slash_pos == std::string::npos ? path : path.substr(slash_pos + 1);
    }
}

bool HypeConverter::match(const Snippet& snippet) const {
    return std::regex_search(snippet.content(), MATCH_REGEX);
}

std::string HypeConverter::domain_fix_script(const std::string& container_prefix) {
    return
        "var hypeElementContainer = '" + container_prefix + "_hype_container';\n"
        "function hypeUpdate(){\n"
        "  var hypeDivElements = document.getElementById(hypeElementContainer)\n"
        "      .getElementsByTagName('DIV');\n"
        "  var ph = window.location.protocol + '//' + window.location.host + '/';\n"
        "  for (hi=0; hi<hypeDivElements.length; hi++) {\n"
        "    if (hypeDivElements[hi].style.backgroundImage.indexOf('url') > -1) {\n"
        "      hypeDivElements[hi].style.backgroundImage = hypeDivElements[hi]"
        ".style.backgroundImage.replace('url(\"/', 'url(\"').replace(ph, '')\n"
        "    }\n"
        "  }\n"
        "}\n"
        "onload=hypeUpdate;\n";
}

HypeScriptTag HypeConverter::parse_script_tag(const std::string& content) const {
    std::smatch m;
    if (!std::regex_search(content, m, SCRIPT_REGEX)) {
        throw ConverterError("Hype script tag not found in " + bundle_.transform_id() + ".");
    }
    HypeScriptTag tag;
    tag.start = static_cast<size_t>(m.position(0));
    tag.end = tag.start + static_cast<size_t>(m.length(0));
    tag.src = m[1].str();
    return tag;
}

void HypeConverter::convert(Snippet& snippet) {
    std::string content = snippet.content();
    HypeScriptTag tag = parse_script_tag(content);

    std::string script_path = url_unquote(tag.src);
    std::string script_basename = path_basename(script_path);

    // Resolve next to the snippet first, then at the archive root.
    Asset* script = nullptr;
    AssetMap snippet_assets = bundle_.assets_relative_to(snippet);
    auto it = snippet_assets.find(script_path);
    if (it != snippet_assets.end()) {
        script = it->second;
    } else {
        script = bundle_.find_asset(script_basename);
    }
    if (!script) {
        throw ConverterError("Hype script " + script_basename + " not found.");
    }

    std::string hype_content = std::regex_replace(script->content(), FOLDER_VAR_REGEX, "var f=\"\",");
    std::string container_prefix = script_basename.substr(
        0, script_basename.size() - std::string(GENERATED_SCRIPT_SUFFIX).size());

    std::string block = "<script>\n" + hype_content + "\n" +
                        domain_fix_script(container_prefix) + "\n</script>\n";

    content = content.substr(0, tag.start) + content.substr(tag.end);
    auto body_pos = content.rfind("</body>");
    if (body_pos == std::string::npos) {
        content += block;
    } else {
        content.insert(body_pos, block);
    }
    snippet.set_content(content);

    std::string script_root = script->root();
    std::string script_name = script->name();
    verbose_log("converter", "Inlined Hype script " + script_name + " into " + snippet.name());
    bundle_.remove_asset(script_name);

    // The inlined script names its resources relative to its own folder.
    AssetMap assets = bundle_.assets_relative_to(snippet);
    AssetMap script_assets = bundle_.assets_relative_to(script_root);
    assets.insert(script_assets.begin(), script_assets.end());

    convert_default(snippet, assets);
}

} // namespace x5::converters
