#pragma once

/**
 * Mimetype guessing for archive members.
 */

#include <optional>
#include <string>

namespace x5 {

// Returns the archive-relative file extension including the dot ("" if none).
// Only the final path component is considered.
std::string file_extension(const std::string& path);

// Guesses a mimetype from the file extension, case-insensitively.
// Returns nullopt for unknown extensions.
std::optional<std::string> guess_mimetype(const std::string& path);

} // namespace x5
