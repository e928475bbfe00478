//
// Created on 19/10/26.
//

#ifndef UNMARK_SANITIZER_HPP
#define UNMARK_SANITIZER_HPP

#include "file_category.hpp"
#include "process_types.hpp"
#include <filesystem>
#include <string_view>

/**
 * @namespace unmark
 * @brief Metadata-stripping engine.
 *
 * @details Holds the ISanitizer interface and its per-category
 * implementations, the capability interfaces they are written against
 * (archive, PDF, image, media), and the Dispatcher / BatchOrchestrator
 * that drive a batch of files through them.
 */
namespace unmark {

/**
 * @brief A format-specific metadata stripper.
 *
 * Each implementation handles one FileCategory. It reads @p input, writes a
 * cleaned copy to @p output and reports what it removed. Implementations hold
 * no per-file state, so one instance serves a whole batch.
 *
 * Errors are reported with the exceptions from errors.hpp; the Dispatcher
 * turns them into per-item error results.
 */
class ISanitizer {
public:
    virtual ~ISanitizer() = default;

    /// @return Human-readable name used as logging tag (e.g. "PdfSanitizer").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return The category this sanitizer is registered for.
    [[nodiscard]] virtual FileCategory get_category() const noexcept = 0;

    /**
     * @brief Strip metadata from @p input into @p output.
     * @param input Original file; never modified.
     * @param output Destination; created or truncated.
     * @return Removed-items report. Only items actually found are listed.
     */
    virtual SanitizeReport sanitize(const std::filesystem::path& input,
                                    const std::filesystem::path& output) = 0;
};

} // namespace unmark

#endif // UNMARK_SANITIZER_HPP
