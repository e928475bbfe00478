//
// Created on 23/10/26.
//

/**
 * @file type_classifier.hpp
 * @brief Maps a file to its FileCategory.
 */

#ifndef UNMARK_TYPE_CLASSIFIER_HPP
#define UNMARK_TYPE_CLASSIFIER_HPP

#include "file_category.hpp"
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace unmark {

/**
 * @brief Decides the category of a file from its extension and its content.
 *
 * @details Categories are tried in the order image, pdf, office, zip, video;
 * the first one whose extension set contains the (lower-cased) extension, or
 * whose MIME rule matches the sniffed type, wins. Nothing matching yields
 * FileCategory::Other.
 *
 * A file claimed as office by its extension but that is a zip without a
 * [Content_Types].xml part is reclassified as zip. OLE2 compound files keep
 * the office category so that the office sanitizer can reject them.
 */
class TypeClassifier {
public:
    using MimeSniffer = std::function<std::string(const std::filesystem::path&)>;

    /// @brief Classifier sniffing content with MimeDetector (libmagic).
    TypeClassifier();

    /// @brief Classifier with a custom sniffer; an empty result means "unknown".
    explicit TypeClassifier(MimeSniffer sniffer);

    [[nodiscard]] FileCategory classify(const std::filesystem::path& path) const;

private:
    MimeSniffer sniffer_;
};

/**
 * @brief Check whether a file is a zip archive lacking a named part.
 *
 * Entry names are stored uncompressed in zip headers, so the raw bytes are
 * searched for @p part_name.
 * @return True only if the file starts with a zip signature and never
 *         mentions @p part_name.
 */
bool zip_lacks_part(const std::filesystem::path& path, std::string_view part_name);

} // namespace unmark

#endif // UNMARK_TYPE_CLASSIFIER_HPP
