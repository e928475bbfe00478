//
// Created on 22/10/26.
//

/**
 * @file office_sanitizer.hpp
 * @brief Defines the ISanitizer implementation for Office Open XML packages.
 */

#ifndef UNMARK_OFFICE_SANITIZER_HPP
#define UNMARK_OFFICE_SANITIZER_HPP

#include "archive_codec.hpp"
#include "sanitizer.hpp"

namespace unmark {

/**
 * @brief Office Open XML flavour of a package.
 */
enum class OfficeKind {
    Word,
    Spreadsheet,
    Presentation,
    Unknown
};

/**
 * @brief Implements ISanitizer for .docx, .xlsx and .pptx packages.
 *
 * @details The package is loaded as a list of zip entries through an
 * IArchiveCodec and edited in memory:
 * - document properties, thumbnails and customXml/ parts are removed;
 * - comment parts (and the people/author lists behind them) are replaced
 *   with empty documents of their own namespace;
 * - w:trackRevisions is removed from word/settings.xml;
 * - relationships and content-type overrides pointing at removed parts
 *   are pruned.
 *
 * The package is then written back deflated with [Content_Types].xml first.
 * Legacy binary documents (.doc/.xls/.ppt, OLE2 signature) are rejected.
 */
class OfficeSanitizer final : public ISanitizer {
public:
    explicit OfficeSanitizer(IArchiveCodec& codec) : codec_(codec) {}

    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "OfficeSanitizer";
    }

    [[nodiscard]] FileCategory get_category() const noexcept override {
        return FileCategory::Office;
    }

    /**
     * @throws UnsupportedLegacyFormatError for OLE2 or .doc/.xls/.ppt input.
     * @throws DecodeError if the package cannot be read.
     * @throws IoError if the output cannot be written.
     */
    SanitizeReport sanitize(const std::filesystem::path& input,
                            const std::filesystem::path& output) override;

private:
    IArchiveCodec& codec_;
};

/// @return True if the first bytes of @p path carry the OLE2 compound file signature.
bool has_ole2_signature(const std::filesystem::path& path);

/**
 * @brief Decide the flavour of a package.
 *
 * The extension wins; without a known extension the main part
 * (word/document.xml, xl/workbook.xml, ppt/presentation.xml) decides.
 */
OfficeKind detect_office_kind(const std::filesystem::path& path, const ArchiveContents& contents);

} // namespace unmark

#endif // UNMARK_OFFICE_SANITIZER_HPP
