#include "settings.hpp"
#include "verbose.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace x5 {

using json = nlohmann::json;

BundleOptions Settings::bundle_options() const {
    BundleOptions options;
    options.asset_size_limit = asset_size_limit;
    options.unsupported_mimetypes = unsupported_mimetypes;
    options.edge_runtime_url = edge_runtime_url;
    return options;
}

Settings load_settings(const std::string& path) {
    Settings settings;
    if (!std::filesystem::exists(path)) {
        return settings;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return settings;
    }

    try {
        json j;
        file >> j;

        settings.asset_size_limit = j.value("asset_size_limit", settings.asset_size_limit);
        settings.edge_runtime_url = j.value("edge_runtime_url", settings.edge_runtime_url);

        if (j.contains("unsupported_mimetypes") && j["unsupported_mimetypes"].is_array()) {
            settings.unsupported_mimetypes.clear();
            for (const auto& mimetype : j["unsupported_mimetypes"]) {
                if (mimetype.is_string()) {
                    settings.unsupported_mimetypes.insert(mimetype.get<std::string>());
                }
            }
        }
        verbose_log("settings", "Loaded " + path);
    } catch (const json::exception& e) {
        verbose_err("settings", "Ignoring " + path + ": " + e.what());
        return Settings{};
    }
    return settings;
}

bool apply_environment(Settings& settings) {
    const char* limit = std::getenv(ASSET_SIZE_LIMIT_ENV);
    if (!limit || limit[0] == '\0') {
        return true;
    }
    if (limit[0] == '-') {
        return false;
    }
    char* end = nullptr;
    unsigned long long value = std::strtoull(limit, &end, 10);
    if (*end != '\0') {
        return false;
    }
    settings.asset_size_limit = value;
    return true;
}

} // namespace x5
