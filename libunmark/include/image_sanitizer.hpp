//
// Created on 22/10/26.
//

/**
 * @file image_sanitizer.hpp
 * @brief Defines the ISanitizer implementation for raster images.
 */

#ifndef UNMARK_IMAGE_SANITIZER_HPP
#define UNMARK_IMAGE_SANITIZER_HPP

#include "image_codec.hpp"
#include "sanitizer.hpp"

namespace unmark {

/**
 * @brief Implements ISanitizer for JPEG, PNG, WebP and TIFF images.
 *
 * @details The source is probed for its real format and auxiliary blocks,
 * then re-encoded with nothing but its ICC profile. GIF, AVIF and HEIC are
 * recognized but have no lossless writer, so they end in a DecodeError.
 */
class ImageSanitizer final : public ISanitizer {
public:
    explicit ImageSanitizer(IImageCodec& codec) : codec_(codec) {}

    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "ImageSanitizer";
    }

    [[nodiscard]] FileCategory get_category() const noexcept override {
        return FileCategory::Image;
    }

    SanitizeReport sanitize(const std::filesystem::path& input,
                            const std::filesystem::path& output) override;

    /**
     * @brief Pick the output format.
     *
     * The probed format wins when writable, then the extension's format,
     * then PNG.
     */
    [[nodiscard]] static ImageFormat select_target(ImageFormat probed, const std::filesystem::path& input);

private:
    IImageCodec& codec_;
};

} // namespace unmark

#endif // UNMARK_IMAGE_SANITIZER_HPP
