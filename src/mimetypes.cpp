#include "mimetypes.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace x5 {

namespace {
    const std::unordered_map<std::string, std::string> MIMETYPES = {
        // Documents and scripts
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".txt", "text/plain"},
        {".json", "application/json"},
        {".xml", "text/xml"},
        {".csv", "text/csv"},
        // Images
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".webp", "image/webp"},
        {".bmp", "image/bmp"},
        {".ico", "image/vnd.microsoft.icon"},
        // Fonts
        {".woff", "font/woff"},
        {".woff2", "font/woff2"},
        {".ttf", "font/ttf"},
        {".otf", "font/otf"},
        {".eot", "application/vnd.ms-fontobject"},
        // Audio and video
        {".mp3", "audio/mpeg"},
        {".wav", "audio/x-wav"},
        {".ogg", "audio/ogg"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
        {".swf", "application/x-shockwave-flash"}
    };
}

std::string file_extension(const std::string& path) {
    auto slash_pos = path.rfind('/');
    std::string basename = slash_pos == std::string::npos ? path : path.substr(slash_pos + 1);

    // Leading dots belong to the name, not the extension.
    size_t first = basename.find_first_not_of('.');
    if (first == std::string::npos) {
        return "";
    }
    auto dot_pos = basename.rfind('.');
    if (dot_pos == std::string::npos || dot_pos < first) {
        return "";
    }
    return basename.substr(dot_pos);
}

std::optional<std::string> guess_mimetype(const std::string& path) {
    std::string ext = file_extension(path);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = MIMETYPES.find(ext);
    if (it == MIMETYPES.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace x5
