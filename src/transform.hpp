#pragma once

/**
 * Transform request facade.
 *
 * Owns access to an uploaded archive and the request metadata, and builds
 * the complete creative for the ad-serving API.
 */

#include "bundle.hpp"
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace x5 {

/**
 * Creative dimensions in pixels.
 */
struct CreativeSize {
    int width = 0;
    int height = 0;
};

/**
 * One archive to be converted into a creative.
 *
 * The bundle is ingested and transformed on first use and reused for later
 * payload requests.
 */
class Transform {
public:
    // filename is the name the archive was uploaded under; it defaults the
    // creative name.
    Transform(std::string transform_id, std::string archive_path, std::string filename,
              BundleOptions options = {});

    const std::string& transform_id() const { return transform_id_; }
    const std::string& filename() const { return filename_; }

    // Returns the transformed bundle. Throws TransformError on failure.
    Bundle& bundle();

    /**
     * Builds the creative for snippet_name.
     *
     * Validates advertiser_id (integer), size ("WIDTHxHEIGHT") and url
     * (scheme and host). creative_name is tag-stripped; when empty the
     * name is generated. Throws TransformError on invalid input.
     */
    nlohmann::json get_creative(const std::string& snippet_name,
                                const std::string& advertiser_id,
                                const std::string& url,
                                const std::string& size,
                                const std::string& creative_name = "");

    // Builds only the html snippet and asset list.
    CreativePart get_creative_part(const std::string& snippet_name);

    // ========== Validation ==========

    static int64_t parse_advertiser_id(const std::string& advertiser_id);
    static CreativeSize parse_size(const std::string& size);
    static void validate_url(const std::string& url);

private:
    std::string transform_id_;
    std::string archive_path_;
    std::string filename_;
    BundleOptions options_;
    std::unique_ptr<Bundle> bundle_;

    // Opens a fresh handle positioned at the start of the archive.
    std::ifstream open_archive() const;
};

} // namespace x5
