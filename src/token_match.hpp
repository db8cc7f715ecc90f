#pragma once

/**
 * Regex helpers for detecting and rewriting asset references.
 *
 * Asset paths are matched both verbatim and percent-encoded, and every hit
 * that resolves to a known asset is replaced by its macro placeholder.
 */

#include "resource.hpp"
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace x5 {

// Replacement callback for regex_replace_fn.
using MatchFunction = std::function<std::string(const std::smatch&)>;

// Returns the tokens plus their percent-encoded forms, without duplicates,
// longest first so that alternation prefers the most specific path.
std::vector<std::string> quoted_unquoted_tokens(const std::vector<std::string>& tokens);

// Escapes all ECMAScript regex metacharacters.
std::string regex_escape(const std::string& text);

/**
 * Builds a regex with a single capture group matching any token, verbatim or
 * percent-encoded. prefix and suffix are raw regex fragments placed around
 * every escaped token (e.g. ".{2}" for quoting context).
 *
 * Returns nullopt when tokens is empty.
 */
std::optional<std::regex> tokens_regex(const std::vector<std::string>& tokens,
                                       const std::string& prefix = "",
                                       const std::string& suffix = "");

// True if every capture group of re participates in at least one match.
bool all_groups_match(const std::regex& re, const std::string& text);

// Like std::regex_replace, but the replacement for each match is computed.
std::string regex_replace_fn(const std::string& text, const std::regex& re,
                             const MatchFunction& replace);

// Expands {id} in a macro template.
std::string format_macro(const std::string& macro_template, const std::string& id);

/**
 * Returns a replacement callback resolving group 1 against assets.
 *
 * Percent-encoded hits are decoded before lookup. Unknown names are returned
 * unchanged. Known names are recorded on owner and replaced by the macro.
 */
MatchFunction match_function(Resource& owner, const AssetMap& assets,
                             const std::string& macro_template);

// Inserts a space between '%' and a following macro letter code
// (acghinstu) unless the '%' is itself preceded by '%'.
std::string escape_modulo_op(const std::string& script_block);

} // namespace x5
