#include "default_converter.hpp"
#include "../bundle.hpp"
#include "../token_match.hpp"
#include "../verbose.hpp"
#include <set>

namespace x5::converters {

bool DefaultConverter::match(const Snippet&) const {
    return true;
}

void DefaultConverter::convert(Snippet& snippet) {
    convert_default(snippet);
}

void DefaultConverter::convert_default(Resource& resource, const std::string& macro_template) {
    convert_default(resource, std::vector<std::string>{resource.root()}, macro_template);
}

void DefaultConverter::convert_default(Resource& resource, const std::vector<std::string>& roots,
                                       const std::string& macro_template) {
    convert_default(resource, bundle_.assets_relative_to(roots), macro_template);
}

void DefaultConverter::convert_default(Resource& resource, const AssetMap& assets,
                                       const std::string& macro_template) {
    rewrite_references(resource, assets, macro_template);
    inline_assets(resource);
}

void DefaultConverter::rewrite_references(Resource& resource, const AssetMap& assets,
                                          const std::string& macro_template) {
    std::vector<std::string> tokens;
    tokens.reserve(assets.size());
    for (const auto& [name, asset] : assets) {
        tokens.push_back(name);
    }

    auto regex = tokens_regex(tokens);
    if (!regex) {
        resource.set_parsed_content(resource.content());
        return;
    }

    size_t before = resource.assets().size();
    resource.set_parsed_content(regex_replace_fn(
        resource.content(), *regex, match_function(resource, assets, macro_template)));
    verbose_log("converter", resource.name() + ": " +
                std::to_string(resource.assets().size() - before) + " reference(s) rewritten");
}

void DefaultConverter::inline_assets(Resource& top) {
    std::set<std::string> visited;
    // top.assets() grows while we walk it.
    for (size_t i = 0; i < top.assets().size(); ++i) {
        std::string asset_name = top.assets()[i];
        if (!visited.insert(asset_name).second) {
            continue;
        }
        Asset* asset = bundle_.find_asset(asset_name);
        if (!asset || asset == &top || !asset->inlineable()) {
            continue;
        }
        // An asset shared with an earlier snippet is rewritten once, but its
        // references still belong to every snippet that ships it.
        if (!asset->converted()) {
            rewrite_references(*asset, bundle_.assets_relative_to(*asset), FILE_MACRO_TEMPLATE);
        }
        std::vector<std::string> nested = asset->assets();
        for (const auto& nested_name : nested) {
            top.add_asset(nested_name);
        }
    }
}

} // namespace x5::converters
