#pragma once

/**
 * Converter for Tumult Hype bundles.
 */

#include "default_converter.hpp"
#include <cstddef>
#include <string>

namespace x5::converters {

/**
 * Location of the generated script tag in a Hype snippet.
 */
struct HypeScriptTag {
    size_t start = 0;
    size_t end = 0;
    std::string src;  // Script path without the cache-busting query.
};

/**
 * Inlines the generated Hype script into the snippet.
 *
 * The <script src> tag is replaced by an inline block placed before
 * </body>, followed by a loader fix for background-image URLs. The script
 * asset is dropped from the bundle and remaining references are rewritten
 * by the default conversion.
 */
class HypeConverter : public DefaultConverter {
public:
    explicit HypeConverter(Bundle& bundle) : DefaultConverter(bundle) {}

    const char* type() const override { return "hype"; }
    bool match(const Snippet& snippet) const override;
    void convert(Snippet& snippet) override;

    // Script that strips the page origin from inline background images.
    static std::string domain_fix_script(const std::string& container_prefix);

private:
    HypeScriptTag parse_script_tag(const std::string& content) const;
};

} // namespace x5::converters
