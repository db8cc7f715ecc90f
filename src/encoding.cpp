#include "encoding.hpp"
#include <cctype>
#include <cstdint>

namespace x5 {

namespace {
    constexpr const char* HEX_DIGITS = "0123456789ABCDEF";
    constexpr const char* BASE64_ALPHABET =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    bool is_quote_safe(unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' || c == '-' || c == '/';
    }

    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string url_quote(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (is_quote_safe(c)) {
            result += ch;
        } else {
            result += '%';
            result += HEX_DIGITS[c >> 4];
            result += HEX_DIGITS[c & 0x0F];
        }
    }
    return result;
}

std::string url_unquote(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        result += text[i];
    }
    return result;
}

std::string base64_encode(const std::string& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < data.size()) {
        uint32_t triple = (static_cast<unsigned char>(data[i]) << 16) |
                          (static_cast<unsigned char>(data[i + 1]) << 8) |
                          static_cast<unsigned char>(data[i + 2]);
        out += BASE64_ALPHABET[(triple >> 18) & 0x3F];
        out += BASE64_ALPHABET[(triple >> 12) & 0x3F];
        out += BASE64_ALPHABET[(triple >> 6) & 0x3F];
        out += BASE64_ALPHABET[triple & 0x3F];
        i += 3;
    }

    size_t remaining = data.size() - i;
    if (remaining == 1) {
        uint32_t triple = static_cast<unsigned char>(data[i]) << 16;
        out += BASE64_ALPHABET[(triple >> 18) & 0x3F];
        out += BASE64_ALPHABET[(triple >> 12) & 0x3F];
        out += "==";
    } else if (remaining == 2) {
        uint32_t triple = (static_cast<unsigned char>(data[i]) << 16) |
                          (static_cast<unsigned char>(data[i + 1]) << 8);
        out += BASE64_ALPHABET[(triple >> 18) & 0x3F];
        out += BASE64_ALPHABET[(triple >> 12) & 0x3F];
        out += BASE64_ALPHABET[(triple >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::string html_escape(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            default: result += c;
        }
    }
    return result;
}

} // namespace x5
