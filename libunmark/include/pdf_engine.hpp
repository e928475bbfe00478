//
// Created on 20/10/26.
//

/**
 * @file pdf_engine.hpp
 * @brief Structured PDF access used by PdfSanitizer and MetadataInspector.
 */

#ifndef UNMARK_PDF_ENGINE_HPP
#define UNMARK_PDF_ENGINE_HPP

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace unmark {

/**
 * @brief One loaded PDF document.
 *
 * Info keys are given without the leading slash ("Title", "Author", ...).
 */
class IPdfDocument {
public:
    virtual ~IPdfDocument() = default;

    /// @return Value of a document-information entry, if present and a string.
    [[nodiscard]] virtual std::optional<std::string> info_field(std::string_view key) const = 0;

    /// @brief Set a document-information entry, creating the dictionary when absent.
    virtual void set_info_field(std::string_view key, std::string_view value) = 0;

    /// @return Catalog /Lang, if present.
    [[nodiscard]] virtual std::optional<std::string> language() const = 0;
    virtual void set_language(std::string_view value) = 0;

    /// @return True if the catalog references an XMP metadata stream.
    [[nodiscard]] virtual bool has_xmp_metadata() const = 0;
    virtual void remove_xmp_metadata() = 0;

    [[nodiscard]] virtual std::size_t page_count() const = 0;

    /// @return Number of entries in the /Annots array of page @p index (0 if none).
    [[nodiscard]] virtual std::size_t annotation_count(std::size_t index) const = 0;

    /// @brief Delete the /Annots array of page @p index.
    virtual void remove_annotations(std::size_t index) = 0;

    /**
     * @brief Serialize the document with object streams disabled.
     * @throws IoError on write failure.
     */
    virtual void save(const std::filesystem::path& path) = 0;
};

/**
 * @brief Opens PDF documents.
 */
class IPdfEngine {
public:
    virtual ~IPdfEngine() = default;

    /**
     * @brief Load a document permissively (damaged xref tables are recovered;
     * files encrypted with an empty user password are accepted).
     * @throws DecodeError if the file cannot be parsed.
     */
    virtual std::unique_ptr<IPdfDocument> open(const std::filesystem::path& path) = 0;
};

/**
 * @brief IPdfEngine bound to qpdf.
 */
class QpdfEngine final : public IPdfEngine {
public:
    std::unique_ptr<IPdfDocument> open(const std::filesystem::path& path) override;
};

} // namespace unmark

#endif // UNMARK_PDF_ENGINE_HPP
