//
// Created on 23/10/26.
//

/**
 * @file sanitizer_registry.hpp
 * @brief Defines the registry mapping each FileCategory to its ISanitizer.
 */

#ifndef UNMARK_SANITIZER_REGISTRY_HPP
#define UNMARK_SANITIZER_REGISTRY_HPP

#include "archive_codec.hpp"
#include "image_codec.hpp"
#include "media_remuxer.hpp"
#include "pdf_engine.hpp"
#include "sanitizer.hpp"
#include <memory>
#include <vector>

namespace unmark {

/**
 * @brief Registry of the available sanitizers, one per category.
 *
 * @details The default constructor instantiates the library-backed
 * capabilities (libarchive, qpdf, libjpeg/libpng/libwebp/libtiff, FFmpeg)
 * and the built-in sanitizers on top of them. Both are owned here; the
 * sanitizers only hold references into this object, so it is not copyable.
 */
class SanitizerRegistry {
public:
    SanitizerRegistry();

    SanitizerRegistry(const SanitizerRegistry&) = delete;
    SanitizerRegistry& operator=(const SanitizerRegistry&) = delete;

    /**
     * @brief Register @p sanitizer, replacing any sanitizer of the same category.
     */
    void add(std::unique_ptr<ISanitizer> sanitizer);

    /// @return The sanitizer for @p category, or nullptr.
    [[nodiscard]] ISanitizer* find(FileCategory category) const;

    [[nodiscard]] const std::vector<std::unique_ptr<ISanitizer>>& all() const { return sanitizers_; }

private:
    std::unique_ptr<IArchiveCodec> archive_codec_;
    std::unique_ptr<IPdfEngine> pdf_engine_;
    std::unique_ptr<IImageCodec> image_codec_;
    std::unique_ptr<IMediaRemuxer> media_remuxer_;
    ///< Owned sanitizers, in registration order
    std::vector<std::unique_ptr<ISanitizer>> sanitizers_;
};

} // namespace unmark

#endif // UNMARK_SANITIZER_REGISTRY_HPP
