#pragma once

/**
 * Converter for Adobe Edge Animate bundles.
 */

#include "default_converter.hpp"
#include <regex>
#include <string>
#include <vector>

namespace x5::converters {

/**
 * Detected Edge runtime script reference.
 */
struct EdgeRuntime {
    std::string src;      // Full src attribute value.
    std::string name;     // Runtime file name, e.g. edge.6.0.0.min.js.
    std::string version;  // Runtime version, e.g. 6.0.0.
};

/**
 * Rewrites Edge compositions.
 *
 * The runtime is served from the Adobe CDN, asset paths in the generated
 * *_edge.js are replaced with macro variables injected in the snippet, and
 * the composition loader fetches the rewritten script through its macro.
 */
class EdgeConverter : public DefaultConverter {
public:
    explicit EdgeConverter(Bundle& bundle) : DefaultConverter(bundle) {}

    const char* type() const override { return "edge"; }

    // All four runtime signatures must be present.
    bool match(const Snippet& snippet) const override;

    void convert(Snippet& snippet) override;

    // Replaces window.open("url", ...) with window.open(clickTag, ...).
    static std::string fix_click_url(const std::string& content);

private:
    EdgeRuntime detect_runtime(const std::string& content) const;

    // Finds the loadComposition call and the generated js asset it loads.
    Asset& find_edge_js(const std::string& content, const Snippet& snippet,
                        std::smatch& js_match) const;

    // Blanks folder variables and rewrites asset references in the js.
    void fix_edge_js(Asset& js_asset, const std::string& snippet_root,
                     const EdgeRuntime& runtime);

    // Moves the js references onto the snippet and returns the macro
    // variable assignments to inject.
    std::vector<std::string> fix_edge_js_assets(Asset& js_asset, Snippet& snippet);
};

} // namespace x5::converters
