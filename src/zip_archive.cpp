#include "zip_archive.hpp"
#include "errors.hpp"
#include "verbose.hpp"
#include <miniz.h>
#include <cstring>

namespace x5 {

namespace {
    // Stream plus the offset where the archive starts.
    struct StreamSource {
        std::istream* stream;
        std::streamoff base;
    };

    size_t read_stream(void* opaque, mz_uint64 offset, void* buffer, size_t n) {
        auto* source = static_cast<StreamSource*>(opaque);
        source->stream->clear();
        source->stream->seekg(source->base + static_cast<std::streamoff>(offset), std::ios::beg);
        if (!*source->stream) {
            return 0;
        }
        source->stream->read(static_cast<char*>(buffer), static_cast<std::streamsize>(n));
        return static_cast<size_t>(source->stream->gcount());
    }
}

ZipArchive::ZipArchive(std::istream& stream, const std::string& transform_id,
                       uint64_t max_entry_size)
    : transform_id_(transform_id), max_entry_size_(max_entry_size) {
    stream.clear();
    std::streamoff base = stream.tellg();
    stream.seekg(0, std::ios::end);
    std::streamoff end = stream.tellg();
    if (base < 0 || end < base) {
        throw BundleError("Error opening zip from bundle key " + transform_id_ +
                          ": stream is not seekable");
    }

    auto* source = new StreamSource{&stream, base};
    auto* zip = new mz_zip_archive();
    std::memset(zip, 0, sizeof(mz_zip_archive));
    zip->m_pRead = read_stream;
    zip->m_pIO_opaque = source;

    if (!mz_zip_reader_init(zip, static_cast<mz_uint64>(end - base), 0)) {
        std::string reason = mz_zip_get_error_string(mz_zip_get_last_error(zip));
        delete zip;
        delete source;
        throw BundleError("Error opening zip from bundle key " + transform_id_ + ": " + reason);
    }

    source_ = source;
    archive_ = zip;
    verbose_log("bundle", "Opened archive for " + transform_id_ + " (" +
                format_bytes(static_cast<uint64_t>(end - base)) + ")");
}

ZipArchive::~ZipArchive() {
    if (archive_) {
        mz_zip_reader_end(static_cast<mz_zip_archive*>(archive_));
        delete static_cast<mz_zip_archive*>(archive_);
    }
    delete static_cast<StreamSource*>(source_);
}

std::vector<ZipEntry> ZipArchive::entries() const {
    auto* zip = static_cast<mz_zip_archive*>(archive_);
    std::vector<ZipEntry> result;

    mz_uint count = mz_zip_reader_get_num_files(zip);
    result.reserve(count);
    for (mz_uint i = 0; i < count; ++i) {
        mz_zip_archive_file_stat file_stat;
        if (!mz_zip_reader_file_stat(zip, i, &file_stat)) {
            throw BundleError("Error reading zip entry " + std::to_string(i) +
                              " for bundle key " + transform_id_ + ": " +
                              mz_zip_get_error_string(mz_zip_get_last_error(zip)));
        }
        ZipEntry entry;
        entry.index = i;
        entry.name = file_stat.m_filename;
        entry.size = file_stat.m_uncomp_size;
        entry.is_directory = mz_zip_reader_is_file_a_directory(zip, i) != 0;
        result.push_back(std::move(entry));
    }
    return result;
}

std::string ZipArchive::read(const ZipEntry& entry) const {
    auto* zip = static_cast<mz_zip_archive*>(archive_);

    if (entry.size > max_entry_size_) {
        throw BundleError("Zip entry " + entry.name + " for bundle key " + transform_id_ +
                          " declares " + std::to_string(entry.size) + " bytes, over the " +
                          std::to_string(max_entry_size_) + " byte limit");
    }

    std::string content(static_cast<size_t>(entry.size), '\0');
    if (!mz_zip_reader_extract_to_mem(zip, entry.index, &content[0], content.size(), 0)) {
        throw BundleError("Error reading zip entry " + entry.name + " for bundle key " +
                          transform_id_ + ": " +
                          mz_zip_get_error_string(mz_zip_get_last_error(zip)));
    }
    return content;
}

} // namespace x5
