#pragma once

/**
 * Creative bundle resources.
 *
 * A Resource is one archive member. Snippets are the HTML entry points,
 * Assets are everything else (images, scripts, stylesheets, ...).
 */

#include "zip_archive.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace x5 {

class Asset;

// Non-owning lookup from a (possibly root-relative) name to an asset.
using AssetMap = std::map<std::string, Asset*>;

/**
 * Common state of snippets and assets.
 */
class Resource {
public:
    Resource(std::string id, const ZipEntry& entry, std::optional<std::string> mimetype);
    virtual ~Resource() = default;

    Resource(const Resource&) = delete;
    Resource& operator=(const Resource&) = delete;

    const std::string& id() const { return id_; }
    const std::string& name() const { return entry_.name; }
    uint64_t size() const { return entry_.size; }
    const std::optional<std::string>& mimetype() const { return mimetype_; }
    const ZipEntry& entry() const { return entry_; }

    // Directory part of the name ("" for archive root members).
    std::string root() const;

    // File name without directories.
    std::string basename() const;

    // ========== Content ==========

    // True once the original bytes are in memory.
    bool is_loaded() const { return content_.has_value(); }

    // Reads the original bytes from the archive if not yet loaded.
    void load(const ZipArchive& archive);

    // Original bytes. Throws BundleError if the resource was never loaded.
    const std::string& content() const;

    // Replaces the original bytes (converters pre-process raw content).
    void set_content(std::string content);

    // Rewritten bytes, set by conversion.
    const std::optional<std::string>& parsed_content() const { return parsed_content_; }

    // Stores rewritten bytes and marks the resource converted. Script and
    // HTML content gets the modulo escape applied.
    void set_parsed_content(std::string value);

    // Monotone: once true it stays true.
    bool converted() const { return converted_; }

    // ========== References ==========

    // Asset names referenced by this resource, in discovery order.
    // May contain duplicates.
    std::vector<std::string>& assets() { return assets_; }
    const std::vector<std::string>& assets() const { return assets_; }

    void add_asset(const std::string& asset_name) { assets_.push_back(asset_name); }

    // Strips root (with or without trailing '/') from the name.
    // An empty root returns the full name; nullopt if name is not under root.
    std::optional<std::string> name_relative_to(const std::string& root) const;

    // ========== Serialization ==========

    // Describes the resource for review tools. With escaped set, names are
    // HTML-escaped.
    virtual nlohmann::json to_json(bool escaped) const;

protected:
    bool has_mimetype_in(const std::unordered_set<std::string>& mimetypes) const;

private:
    std::string id_;
    ZipEntry entry_;
    std::optional<std::string> mimetype_;
    std::optional<std::string> content_;
    std::optional<std::string> parsed_content_;
    bool converted_ = false;
    std::vector<std::string> assets_;
};

/**
 * HTML entry point of a creative.
 */
class Snippet : public Resource {
public:
    Snippet(std::string id, const ZipEntry& entry, std::optional<std::string> mimetype,
            const ZipArchive& archive);

    // Type tag of the converter that processed this snippet ("" if none).
    const std::string& x5type() const { return x5type_; }
    void set_x5type(const std::string& type) { x5type_ = type; }

    // Returns the rewritten snippet as an HTML fragment for the creative API.
    std::string as_snippet() const;

    nlohmann::json to_json(bool escaped) const override;

private:
    std::string x5type_;
};

/**
 * Size and type limits the serving platform applies to assets.
 */
struct AssetPolicy {
    uint64_t size_limit = 0;
    std::unordered_set<std::string> unsupported_mimetypes;
};

/**
 * One asset descriptor of the creative payload.
 */
struct CreativeAsset {
    std::string macro_name;         // Resource id referenced by %%FILE:id%%.
    std::string file_name;          // {id}-{transform id}{extension}
    std::string asset_byte_array;   // Base64 payload.

    nlohmann::json to_json() const {
        return {
            {"xsi_type", "CustomCreativeAsset"},
            {"macroName", macro_name},
            {"asset", {
                {"assetByteArray", asset_byte_array},
                {"fileName", file_name}
            }}
        };
    }
};

/**
 * Non-HTML member of a creative bundle.
 *
 * Inlineable assets are loaded at construction, others stay unloaded until
 * the payload is assembled from a reopened archive.
 */
class Asset : public Resource {
public:
    Asset(std::string id, const ZipEntry& entry, std::optional<std::string> mimetype,
          std::shared_ptr<const AssetPolicy> policy, const ZipArchive& archive);

    // Size strictly exceeds the configured ceiling.
    bool over_limit() const;

    // Mimetype unknown or rejected by the serving platform.
    bool unsupported() const;

    // Content is rewritten and shipped instead of streamed verbatim.
    bool inlineable() const;

    // Inlineable and referencing further assets.
    bool inlined() const;

    // Builds the payload descriptor. Omitted assets carry a single null byte.
    CreativeAsset as_creative_asset(const std::string& transform_id,
                                    const ZipArchive& archive) const;

    nlohmann::json to_json(bool escaped) const override;

private:
    std::shared_ptr<const AssetPolicy> policy_;
};

} // namespace x5
