#pragma once

/**
 * HTML helpers built on the libxml2 HTML parser.
 */

#include <string>

namespace x5 {

/**
 * Turns a full HTML document into a fragment the creative API accepts.
 *
 * Emits the review comment, then every <head> child except <meta> and
 * <title>, then the inner HTML of <body>. Returns html unchanged when it
 * cannot be parsed or has no <body>.
 */
std::string snippet_fragment(const std::string& html);

// Returns the text content of an HTML string, tags removed.
std::string strip_tags(const std::string& html);

} // namespace x5
