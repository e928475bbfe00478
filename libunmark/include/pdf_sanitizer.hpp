//
// Created on 22/10/26.
//

/**
 * @file pdf_sanitizer.hpp
 * @brief Defines the ISanitizer implementation for PDF documents.
 */

#ifndef UNMARK_PDF_SANITIZER_HPP
#define UNMARK_PDF_SANITIZER_HPP

#include "pdf_engine.hpp"
#include "sanitizer.hpp"
#include <array>

namespace unmark {

/**
 * @brief Implements ISanitizer for PDF files.
 *
 * @details Blanks the document-information fields and the catalog /Lang,
 * drops the XMP metadata stream and every page's /Annots array, then writes
 * the document with object streams disabled.
 */
class PdfSanitizer final : public ISanitizer {
public:
    ///< Document-information fields that are blanked.
    static constexpr std::array<std::string_view, 6> kInfoFields = {
        "Title", "Author", "Subject", "Keywords", "Producer", "Creator"
    };

    explicit PdfSanitizer(IPdfEngine& engine) : engine_(engine) {}

    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "PdfSanitizer";
    }

    [[nodiscard]] FileCategory get_category() const noexcept override {
        return FileCategory::Pdf;
    }

    /**
     * @throws DecodeError if the document cannot be parsed.
     * @throws IoError if the output cannot be written.
     */
    SanitizeReport sanitize(const std::filesystem::path& input,
                            const std::filesystem::path& output) override;

private:
    IPdfEngine& engine_;
};

} // namespace unmark

#endif // UNMARK_PDF_SANITIZER_HPP
