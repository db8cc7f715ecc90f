#pragma once

/**
 * HTML5 creative bundle.
 *
 * Classifies the members of a zipped creative into snippets and assets,
 * runs the converters over every snippet, and assembles the payload the
 * creative API expects for one chosen snippet.
 */

#include "config.hpp"
#include "resource.hpp"
#include <istream>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace x5 {

/**
 * Conversion limits and URLs, usually taken from Settings.
 */
struct BundleOptions {
    uint64_t asset_size_limit = DEFAULT_ASSET_SIZE_LIMIT;
    std::unordered_set<std::string> unsupported_mimetypes = DEFAULT_UNSUPPORTED_MIMETYPES;
    std::string edge_runtime_url = DEFAULT_EDGE_RUNTIME_URL;
    uint64_t entry_size_limit = MAX_ENTRY_SIZE;  // Ceiling for extracting one member.
};

/**
 * Rewritten HTML plus the assets it references.
 */
struct CreativePart {
    std::string html_snippet;
    std::vector<CreativeAsset> assets;

    nlohmann::json to_json() const;
};

/**
 * In-memory classification of one uploaded archive.
 *
 * The bundle owns every resource. It is populated once from an archive,
 * mutated by transform(), and read-only afterwards. Not thread-safe.
 */
class Bundle {
public:
    using SnippetStore = std::map<std::string, std::unique_ptr<Snippet>>;
    using AssetStore = std::map<std::string, std::unique_ptr<Asset>>;

    explicit Bundle(std::string transform_id, BundleOptions options = {});

    // Non-copyable: converters hold references into the bundle.
    Bundle(const Bundle&) = delete;
    Bundle& operator=(const Bundle&) = delete;

    /**
     * Reads a zipped bundle from stream.
     *
     * Skips directories, __MACOSX/ metadata, dot files, Thumbs.db and members
     * without an extension. Throws BundleError if the archive cannot be
     * opened or contains no snippet.
     */
    static std::unique_ptr<Bundle> from_zip(const std::string& transform_id,
                                            std::istream& stream,
                                            BundleOptions options = {});

    // Returns true if an archive member is ignored during ingestion.
    static bool is_skipped_entry(const ZipEntry& entry);

    // Classifies one archive member and stores it. Members without an
    // extension are ignored. A later member with the same name replaces
    // the earlier one.
    void add_member(const ZipEntry& entry, const ZipArchive& archive);

    // ========== Lookup ==========

    // Assets keyed by their name relative to root. Assets outside root are
    // omitted.
    AssetMap assets_relative_to(const std::string& root) const;

    // Assets keyed relative to the directory of resource.
    AssetMap assets_relative_to(const Resource& resource) const;

    // Assets keyed relative to the first root (in order) that contains them.
    AssetMap assets_relative_to(const std::vector<std::string>& roots) const;

    const SnippetStore& snippets() const { return snippets_; }
    const AssetStore& assets() const { return assets_; }

    // Returns nullptr if there is no such member.
    Snippet* find_snippet(const std::string& name) const;
    Asset* find_asset(const std::string& name) const;

    // Drops an asset that was folded into a snippet. Returns false if absent.
    bool remove_asset(const std::string& name);

    const std::string& transform_id() const { return transform_id_; }
    const BundleOptions& options() const { return options_; }

    // ========== Conversion ==========

    /**
     * Runs the first matching converter over every snippet.
     *
     * Throws BundleError if the bundle has no assets or a converter fails.
     */
    void transform();

    /**
     * Builds the creative payload for one snippet.
     *
     * Reopens the archive from stream to read non-inlined asset bytes.
     * Throws BundleError for unknown snippet names.
     */
    CreativePart get_creative_part(std::istream& stream, const std::string& snippet_name) const;

    // ========== Review ==========

    // Snippets and assets described as JSON, names HTML-escaped.
    nlohmann::json metadata() const;

    // Aligned text table of the assets referenced by a snippet.
    std::string assets_table(const std::string& snippet_name) const;

private:
    std::string transform_id_;
    BundleOptions options_;
    std::shared_ptr<const AssetPolicy> policy_;
    SnippetStore snippets_;
    AssetStore assets_;
    std::unordered_map<std::string, int> macro_names_;  // Per-extension id counters.

    const Snippet& snippet_or_throw(const std::string& snippet_name) const;
};

} // namespace x5
