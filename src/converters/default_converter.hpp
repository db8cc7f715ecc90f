#pragma once

/**
 * Converter for generic HTML5 bundles.
 */

#include "converter.hpp"
#include "../config.hpp"
#include <string>
#include <vector>

namespace x5::converters {

/**
 * Replaces every reachable asset path with its macro placeholder.
 *
 * Always matches, so it is tried last. Tool-specific converters derive from
 * it to reuse the reference rewriting.
 */
class DefaultConverter : public Converter {
public:
    explicit DefaultConverter(Bundle& bundle) : Converter(bundle) {}

    const char* type() const override { return "default"; }
    bool match(const Snippet& snippet) const override;
    void convert(Snippet& snippet) override;

protected:
    /**
     * Rewrites resource, then inlines every inlineable asset it references.
     * References found in inlined assets are added to resource as well.
     */
    void convert_default(Resource& resource,
                         const std::string& macro_template = FILE_MACRO_TEMPLATE);

    // Same, resolving references against roots instead of the resource's
    // own directory.
    void convert_default(Resource& resource, const std::vector<std::string>& roots,
                         const std::string& macro_template = FILE_MACRO_TEMPLATE);

    // Same, with a prepared name-to-asset lookup.
    void convert_default(Resource& resource, const AssetMap& assets,
                         const std::string& macro_template = FILE_MACRO_TEMPLATE);

    // Replaces asset references in resource's content; records them on resource.
    void rewrite_references(Resource& resource, const AssetMap& assets,
                            const std::string& macro_template);

    /**
     * Walks top's reference list as a worklist and rewrites each inlineable,
     * not yet converted asset in it. Their references are appended to top,
     * so nested references are visited too. Each asset is rewritten at most
     * once.
     */
    void inline_assets(Resource& top);
};

} // namespace x5::converters
