#pragma once

/**
 * Byte-level encoding helpers: percent-encoding, base64 and HTML escaping.
 */

#include <string>

namespace x5 {

// Percent-encodes every byte except letters, digits, '_', '.', '-' and '/'.
std::string url_quote(const std::string& text);

// Decodes %XX sequences. Malformed sequences are kept verbatim.
std::string url_unquote(const std::string& text);

// Standard base64 with padding.
std::string base64_encode(const std::string& data);

// Escapes &, <, >, and double quotes for embedding in HTML.
std::string html_escape(const std::string& text);

} // namespace x5
