#include "resource.hpp"
#include "config.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "html_fragment.hpp"
#include "mimetypes.hpp"
#include "token_match.hpp"

namespace x5 {

// ========== Resource ==========

Resource::Resource(std::string id, const ZipEntry& entry, std::optional<std::string> mimetype)
    : id_(std::move(id)), entry_(entry), mimetype_(std::move(mimetype)) {}

std::string Resource::root() const {
    auto slash_pos = name().rfind('/');
    if (slash_pos == std::string::npos) {
        return "";
    }
    return name().substr(0, slash_pos);
}

std::string Resource::basename() const {
    auto slash_pos = name().rfind('/');
    if (slash_pos == std::string::npos) {
        return name();
    }
    return name().substr(slash_pos + 1);
}

void Resource::load(const ZipArchive& archive) {
    if (content_) {
        return;
    }
    content_ = archive.read(entry_);
}

const std::string& Resource::content() const {
    if (!content_) {
        throw BundleError("Content of " + name() + " has not been loaded");
    }
    return *content_;
}

void Resource::set_content(std::string content) {
    content_ = std::move(content);
}

void Resource::set_parsed_content(std::string value) {
    if (has_mimetype_in(SCRIPT_MIMETYPES) || has_mimetype_in(SNIPPET_MIMETYPES)) {
        value = escape_modulo_op(value);
    }
    parsed_content_ = std::move(value);
    converted_ = true;
}

std::optional<std::string> Resource::name_relative_to(const std::string& root) const {
    if (root.empty()) {
        return name();
    }
    std::string prefix = root.back() == '/' ? root : root + "/";
    if (name().compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    return name().substr(prefix.size());
}

bool Resource::has_mimetype_in(const std::unordered_set<std::string>& mimetypes) const {
    return mimetype_ && mimetypes.count(*mimetype_) > 0;
}

nlohmann::json Resource::to_json(bool escaped) const {
    auto maybe_escape = [escaped](const std::string& s) {
        return escaped ? html_escape(s) : s;
    };

    nlohmann::json assets = nlohmann::json::array();
    for (const auto& asset_name : assets_) {
        assets.push_back(maybe_escape(asset_name));
    }

    return {
        {"id", id_},
        {"name", maybe_escape(name())},
        {"size", size()},
        {"mimetype", mimetype_ ? nlohmann::json(*mimetype_) : nlohmann::json(nullptr)},
        {"root", maybe_escape(root())},
        {"basename", maybe_escape(basename())},
        {"assets", assets},
        {"converted", converted_}
    };
}

// ========== Snippet ==========

Snippet::Snippet(std::string id, const ZipEntry& entry, std::optional<std::string> mimetype,
                 const ZipArchive& archive)
    : Resource(std::move(id), entry, std::move(mimetype)) {
    load(archive);
}

std::string Snippet::as_snippet() const {
    if (!parsed_content() || parsed_content()->empty()) {
        return "";
    }
    return snippet_fragment(*parsed_content());
}

nlohmann::json Snippet::to_json(bool escaped) const {
    nlohmann::json j = Resource::to_json(escaped);
    j["x5type"] = x5type_;
    if (parsed_content()) {
        j["parsed_content"] = *parsed_content();
    }
    return j;
}

// ========== Asset ==========

Asset::Asset(std::string id, const ZipEntry& entry, std::optional<std::string> mimetype,
             std::shared_ptr<const AssetPolicy> policy, const ZipArchive& archive)
    : Resource(std::move(id), entry, std::move(mimetype)), policy_(std::move(policy)) {
    if (inlineable()) {
        load(archive);
    }
}

bool Asset::over_limit() const {
    return size() > policy_->size_limit;
}

bool Asset::unsupported() const {
    return !mimetype() || policy_->unsupported_mimetypes.count(*mimetype()) > 0;
}

bool Asset::inlineable() const {
    return has_mimetype_in(INLINED_MIMETYPES);
}

bool Asset::inlined() const {
    return inlineable() && !assets().empty();
}

CreativeAsset Asset::as_creative_asset(const std::string& transform_id,
                                       const ZipArchive& archive) const {
    std::string payload;
    if (over_limit() || unsupported()) {
        payload = std::string(1, '\0');
    } else if (inlineable()) {
        payload = parsed_content() ? *parsed_content() : content();
    } else {
        payload = archive.read(entry());
    }

    CreativeAsset creative_asset;
    creative_asset.macro_name = id();
    creative_asset.file_name = id() + "-" + transform_id + file_extension(name());
    creative_asset.asset_byte_array = base64_encode(payload);
    return creative_asset;
}

nlohmann::json Asset::to_json(bool escaped) const {
    nlohmann::json j = Resource::to_json(escaped);
    j["inlineable"] = inlineable();
    j["inlined"] = inlined();
    j["over_limit"] = over_limit();
    j["unsupported"] = unsupported();
    return j;
}

} // namespace x5
