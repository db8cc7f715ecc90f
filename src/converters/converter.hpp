#pragma once

/**
 * Abstract interface for creative converters.
 *
 * A converter recognizes snippets authored by one visual tool and rewrites
 * them, together with the assets they pull in, so every asset reference
 * becomes a macro placeholder.
 */

#include "../resource.hpp"

namespace x5 {
class Bundle;
}

namespace x5::converters {

/**
 * Strategy bound to one bundle. Converters never outlive their bundle.
 */
class Converter {
public:
    explicit Converter(Bundle& bundle) : bundle_(bundle) {}
    virtual ~Converter() = default;

    // Tag stored on snippets this converter processed.
    virtual const char* type() const = 0;

    // True if the snippet was produced by the tool this converter handles.
    virtual bool match(const Snippet& snippet) const = 0;

    /**
     * Rewrites the snippet (and referenced assets) in place.
     * Throws ConverterError if an expected marker is missing.
     */
    virtual void convert(Snippet& snippet) = 0;

protected:
    Bundle& bundle_;
};

} // namespace x5::converters
