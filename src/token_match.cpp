#include "token_match.hpp"
#include "encoding.hpp"
#include <algorithm>
#include <cstring>
#include <set>

namespace x5 {

namespace {
    constexpr const char* MACRO_LETTER_CODES = "acghinstu";
}

std::vector<std::string> quoted_unquoted_tokens(const std::vector<std::string>& tokens) {
    std::set<std::string> unique;
    for (const auto& token : tokens) {
        unique.insert(token);
        unique.insert(url_quote(token));
    }

    std::vector<std::string> result(unique.begin(), unique.end());
    std::stable_sort(result.begin(), result.end(),
        [](const std::string& a, const std::string& b) {
            return a.size() > b.size();
        });
    return result;
}

std::string regex_escape(const std::string& text) {
    static const char* special = "\\^$.|?*+()[]{}";
    std::string result;
    result.reserve(text.size() * 2);
    for (char c : text) {
        if (c != '\0' && std::strchr(special, c)) {
            result += '\\';
        }
        result += c;
    }
    return result;
}

std::optional<std::regex> tokens_regex(const std::vector<std::string>& tokens,
                                       const std::string& prefix,
                                       const std::string& suffix) {
    if (tokens.empty()) {
        return std::nullopt;
    }

    std::string pattern = "(";
    bool first = true;
    for (const auto& token : quoted_unquoted_tokens(tokens)) {
        if (!first) pattern += '|';
        pattern += prefix + regex_escape(token) + suffix;
        first = false;
    }
    pattern += ")";
    return std::regex(pattern);
}

bool all_groups_match(const std::regex& re, const std::string& text) {
    std::vector<bool> seen(re.mark_count(), false);
    if (seen.empty()) {
        return false;
    }

    bool any = false;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re);
         it != std::sregex_iterator(); ++it) {
        any = true;
        for (size_t i = 0; i < seen.size(); ++i) {
            if ((*it)[i + 1].matched) {
                seen[i] = true;
            }
        }
    }
    return any && std::all_of(seen.begin(), seen.end(), [](bool b) { return b; });
}

std::string regex_replace_fn(const std::string& text, const std::regex& re,
                             const MatchFunction& replace) {
    std::string result;
    result.reserve(text.size());

    auto last = text.cbegin();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re);
         it != std::sregex_iterator(); ++it) {
        const std::smatch& m = *it;
        result.append(last, m[0].first);
        result += replace(m);
        last = m[0].second;
    }
    result.append(last, text.cend());
    return result;
}

std::string format_macro(const std::string& macro_template, const std::string& id) {
    std::string result = macro_template;
    const std::string placeholder = "{id}";
    size_t pos = 0;
    while ((pos = result.find(placeholder, pos)) != std::string::npos) {
        result.replace(pos, placeholder.size(), id);
        pos += id.size();
    }
    return result;
}

MatchFunction match_function(Resource& owner, const AssetMap& assets,
                             const std::string& macro_template) {
    return [&owner, &assets, macro_template](const std::smatch& m) -> std::string {
        std::string name = m[1].str();
        if (name.find('%') != std::string::npos) {
            name = url_unquote(name);
        }
        auto it = assets.find(name);
        if (it == assets.end()) {
            return m[1].str();
        }
        owner.add_asset(it->second->name());
        return format_macro(macro_template, it->second->id());
    };
}

std::string escape_modulo_op(const std::string& script_block) {
    std::string result;
    result.reserve(script_block.size());
    for (size_t i = 0; i < script_block.size(); ++i) {
        char c = script_block[i];
        result += c;
        if (c != '%' || i + 1 >= script_block.size()) {
            continue;
        }
        if (i > 0 && script_block[i - 1] == '%') {
            continue;
        }
        char next = script_block[i + 1];
        if (next != '\0' && std::strchr(MACRO_LETTER_CODES, next)) {
            result += ' ';
        }
    }
    return result;
}

} // namespace x5
