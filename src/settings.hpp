#pragma once

/**
 * Settings for the x5conv CLI.
 *
 * Handles loading of conversion limits from a local JSON file, with an
 * environment override for the asset size ceiling.
 */

#include "bundle.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>

namespace x5 {

/**
 * Conversion settings stored in .x5.json.
 */
struct Settings {
    uint64_t asset_size_limit = DEFAULT_ASSET_SIZE_LIMIT;               // Bytes.
    std::unordered_set<std::string> unsupported_mimetypes =
        DEFAULT_UNSUPPORTED_MIMETYPES;                                 // Rejected asset types.
    std::string edge_runtime_url = DEFAULT_EDGE_RUNTIME_URL;           // {version} template.

    // Converts to the options a Bundle is constructed with.
    BundleOptions bundle_options() const;
};

// Loads settings from path. Missing or malformed files yield defaults.
Settings load_settings(const std::string& path = SETTINGS_FILE);

// Applies X5_ASSET_SIZE_LIMIT if set. Returns false if it is not a number.
bool apply_environment(Settings& settings);

} // namespace x5
