#pragma once

/**
 * Zip archive reader over a seekable input stream.
 *
 * Wraps the miniz reader so entries can be listed and extracted without
 * buffering the whole archive in memory.
 */

#include "config.hpp"
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace x5 {

/**
 * Central directory information for one archive member.
 */
struct ZipEntry {
    uint32_t index = 0;         // Position in the central directory.
    std::string name;           // Archive-relative path, byte-exact.
    uint64_t size = 0;          // Declared uncompressed size.
    bool is_directory = false;
};

/**
 * Read-only zip archive bound to a stream.
 *
 * The stream must outlive the archive. Opening reads from the stream's
 * current position, which is treated as the start of the archive.
 */
class ZipArchive {
public:
    // Opens the archive. Throws BundleError naming transform_id on failure.
    // Entries declaring more than max_entry_size bytes are never extracted.
    ZipArchive(std::istream& stream, const std::string& transform_id,
               uint64_t max_entry_size = MAX_ENTRY_SIZE);
    ~ZipArchive();

    // Non-copyable
    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    // Returns all entries in central directory order.
    std::vector<ZipEntry> entries() const;

    // Extracts a whole entry. Throws BundleError if the entry is damaged or
    // declares a size over the limit.
    std::string read(const ZipEntry& entry) const;

private:
    std::string transform_id_;
    uint64_t max_entry_size_;
    void* source_ = nullptr;   // StreamSource*
    void* archive_ = nullptr;  // mz_zip_archive*
};

} // namespace x5
