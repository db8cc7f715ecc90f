#include "transform.hpp"
#include "errors.hpp"
#include "html_fragment.hpp"
#include "verbose.hpp"
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace x5 {

namespace {
    std::string trim(const std::string& s) {
        size_t first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        size_t last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    // Parses a whole string as a base-10 integer.
    bool parse_int64(const std::string& text, int64_t& value) {
        std::string trimmed = trim(text);
        if (trimmed.empty()) return false;
        try {
            size_t pos = 0;
            long long parsed = std::stoll(trimmed, &pos, 10);
            if (pos != trimmed.size()) return false;
            value = parsed;
            return true;
        } catch (const std::invalid_argument&) {
            return false;
        } catch (const std::out_of_range&) {
            return false;
        }
    }
}

Transform::Transform(std::string transform_id, std::string archive_path, std::string filename,
                     BundleOptions options)
    : transform_id_(std::move(transform_id)),
      archive_path_(std::move(archive_path)),
      filename_(std::move(filename)),
      options_(std::move(options)) {}

std::ifstream Transform::open_archive() const {
    std::ifstream stream(archive_path_, std::ios::binary);
    if (!stream.is_open()) {
        throw TransformError("Cannot open archive " + archive_path_);
    }
    return stream;
}

Bundle& Transform::bundle() {
    if (!bundle_) {
        std::ifstream stream = open_archive();
        try {
            auto bundle = Bundle::from_zip(transform_id_, stream, options_);
            bundle->transform();
            bundle_ = std::move(bundle);
        } catch (const BundleError& e) {
            verbose_err("transform", e.what());
            throw TransformError(std::string("Cannot transform the archive: ") + e.what());
        }
    }
    return *bundle_;
}

CreativePart Transform::get_creative_part(const std::string& snippet_name) {
    Bundle& transformed = bundle();
    std::ifstream stream = open_archive();
    try {
        return transformed.get_creative_part(stream, snippet_name);
    } catch (const BundleError& e) {
        throw TransformError(e.what());
    }
}

int64_t Transform::parse_advertiser_id(const std::string& advertiser_id) {
    int64_t value = 0;
    if (!parse_int64(advertiser_id, value)) {
        throw TransformError("Invalid advertiser id '" + advertiser_id + "'");
    }
    return value;
}

CreativeSize Transform::parse_size(const std::string& size) {
    auto x_pos = size.find('x');
    if (x_pos == std::string::npos || size.find('x', x_pos + 1) != std::string::npos) {
        throw TransformError("Invalid size '" + size + "'");
    }
    int64_t width = 0;
    int64_t height = 0;
    if (!parse_int64(size.substr(0, x_pos), width) ||
        !parse_int64(size.substr(x_pos + 1), height) ||
        width <= 0 || height <= 0 || width > INT32_MAX || height > INT32_MAX) {
        throw TransformError("Invalid size '" + size + "'");
    }
    return CreativeSize{static_cast<int>(width), static_cast<int>(height)};
}

void Transform::validate_url(const std::string& url) {
    // scheme ":" "//" authority, where the authority runs to the first of "/?#".
    // The rest of the URL is not checked.
    auto colon = url.find(':');
    std::string scheme = colon == std::string::npos ? "" : url.substr(0, colon);
    bool scheme_ok = !scheme.empty() && std::isalpha(static_cast<unsigned char>(scheme[0]));
    for (char c : scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            scheme_ok = false;
        }
    }

    std::string authority;
    if (scheme_ok && url.compare(colon + 1, 2, "//") == 0) {
        size_t start = colon + 3;
        size_t end = url.find_first_of("/?#", start);
        authority = url.substr(start, end == std::string::npos ? std::string::npos : end - start);
    }

    bool open_bracket = authority.find('[') != std::string::npos;
    bool close_bracket = authority.find(']') != std::string::npos;
    if (open_bracket != close_bracket) {
        throw TransformError("Invalid URL '" + url + "'");
    }
    if (!scheme_ok || authority.empty()) {
        throw TransformError("Incorrect URL '" + url + "'");
    }
}

nlohmann::json Transform::get_creative(const std::string& snippet_name,
                                       const std::string& advertiser_id,
                                       const std::string& url,
                                       const std::string& size,
                                       const std::string& creative_name) {
    int64_t advertiser = parse_advertiser_id(advertiser_id);
    CreativeSize dimensions = parse_size(size);
    validate_url(url);

    nlohmann::json creative = get_creative_part(snippet_name).to_json();

    std::string name = creative_name.empty()
        ? "X5 " + filename_ + " " + transform_id_
        : strip_tags(creative_name);

    creative["xsi_type"] = "CustomCreative";
    creative["name"] = name;
    creative["advertiserId"] = advertiser;
    creative["size"] = {{"width", dimensions.width}, {"height", dimensions.height}};
    creative["destinationUrl"] = url;

    verbose_log("transform", "Built creative '" + name + "' from " + snippet_name);
    return creative;
}

} // namespace x5
