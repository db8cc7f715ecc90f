#pragma once

/**
 * Application configuration constants.
 *
 * Defines the settings file, mimetype categories, and the defaults used when
 * converting HTML5 creative bundles.
 */

#include <cstdint>
#include <string>
#include <unordered_set>

namespace x5 {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = ".x5.json";                 // Local settings file.
constexpr const char* ASSET_SIZE_LIMIT_ENV = "X5_ASSET_SIZE_LIMIT"; // Environment override.

// ========== Mimetype Categories ==========

// Archive members with these mimetypes become snippets.
inline const std::unordered_set<std::string> SNIPPET_MIMETYPES = {
    "text/html"
};

// Script mimetypes; their rewritten content gets the modulo escape.
inline const std::unordered_set<std::string> SCRIPT_MIMETYPES = {
    "application/javascript",
    "application/x-javascript"
};

// Assets whose content is rewritten and shipped instead of streamed verbatim.
inline const std::unordered_set<std::string> INLINED_MIMETYPES = {
    "text/css",
    "text/html",
    "text/plain",
    "application/javascript",
    "application/x-javascript"
};

// Default set of mimetypes the serving platform does not accept.
inline const std::unordered_set<std::string> DEFAULT_UNSUPPORTED_MIMETYPES = {
    "image/svg+xml"
};

// ========== Conversion Defaults ==========

constexpr std::uint64_t DEFAULT_ASSET_SIZE_LIMIT = 1000000;  // Bytes.

// Largest archive member extracted into memory, by its declared size.
constexpr std::uint64_t MAX_ENTRY_SIZE = 64ull * 1024 * 1024;

// Macro placeholder template; {id} is the resource id.
constexpr const char* FILE_MACRO_TEMPLATE = "%%FILE:{id}%%";

// Edge runtime CDN location; {version} is the detected runtime version.
constexpr const char* DEFAULT_EDGE_RUNTIME_URL =
    "https://animate.adobe.com/runtime/{version}/edge.{version}.min.js";

// Comment prepended to every generated HTML snippet.
constexpr const char* SNIPPET_REVIEW_COMMENT =
    "<!-- Please make sure you review the creative and "
    "that it contains the clicktracking macro -->";

} // namespace x5
