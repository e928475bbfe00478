//
// Created on 24/10/26.
//

/**
 * @file metadata_inspector.hpp
 * @brief Read-only report of the metadata a file carries.
 */

#ifndef UNMARK_METADATA_INSPECTOR_HPP
#define UNMARK_METADATA_INSPECTOR_HPP

#include "archive_codec.hpp"
#include "image_codec.hpp"
#include "media_remuxer.hpp"
#include "pdf_engine.hpp"
#include "type_classifier.hpp"
#include <cstdint>
#include <ctime>
#include <string>
#include <utility>
#include <vector>

namespace unmark {

/**
 * @brief What inspecting one file found.
 */
struct FileDetails {
    std::string name;                 ///< File name without directories
    std::filesystem::path path;
    std::uintmax_t size = 0;          ///< Bytes, 0 when missing
    std::time_t mtime = 0;            ///< Last modification, seconds since epoch
    bool exists = false;
    FileCategory category = FileCategory::Other;
    std::vector<std::pair<std::string, std::string>> metadata; ///< Ordered key/value facts

    /// @return The value stored under @p key, or "".
    [[nodiscard]] std::string value(std::string_view key) const;
};

/**
 * @brief Lists the metadata of a file without modifying it.
 *
 * @details Uses the same capabilities as the sanitizers:
 * - image: format, width, height, has_exif, blocks;
 * - office: entries, title, creator, last_modified_by, created (docProps/core.xml);
 * - pdf: title, author, creator, pages;
 * - zip: files, comment;
 * - video: format, duration, bit_rate, video_codec, audio_codec, encoder.
 *
 * Failures are reported under the "error" key; inspect() never throws.
 */
class MetadataInspector {
public:
    MetadataInspector(IImageCodec& images, IArchiveCodec& archives, IPdfEngine& pdfs, IMediaRemuxer& media,
                      TypeClassifier classifier = TypeClassifier());

    [[nodiscard]] FileDetails inspect(const std::filesystem::path& path) const;

private:
    void inspect_image(const std::filesystem::path& path, FileDetails& details) const;
    void inspect_office(const std::filesystem::path& path, FileDetails& details) const;
    void inspect_pdf(const std::filesystem::path& path, FileDetails& details) const;
    void inspect_zip(const std::filesystem::path& path, FileDetails& details) const;
    void inspect_media(const std::filesystem::path& path, FileDetails& details) const;

    IImageCodec& images_;
    IArchiveCodec& archives_;
    IPdfEngine& pdfs_;
    IMediaRemuxer& media_;
    TypeClassifier classifier_;
};

} // namespace unmark

#endif // UNMARK_METADATA_INSPECTOR_HPP
