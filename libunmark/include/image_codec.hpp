//
// Created on 20/10/26.
//

/**
 * @file image_codec.hpp
 * @brief Raster image capability used by ImageSanitizer and MetadataInspector.
 */

#ifndef UNMARK_IMAGE_CODEC_HPP
#define UNMARK_IMAGE_CODEC_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unmark {

enum class ImageFormat {
    Jpeg,
    Png,
    Webp,
    Tiff,
    Gif,
    Avif,
    Heic,
    Unknown
};

constexpr std::string_view to_string(const ImageFormat format) noexcept {
    switch (format) {
        case ImageFormat::Jpeg:    return "jpeg";
        case ImageFormat::Png:     return "png";
        case ImageFormat::Webp:    return "webp";
        case ImageFormat::Tiff:    return "tiff";
        case ImageFormat::Gif:     return "gif";
        case ImageFormat::Avif:    return "avif";
        case ImageFormat::Heic:    return "heic";
        case ImageFormat::Unknown: return "unknown";
    }
    return "unknown";
}

/// @return True for formats the codec can re-encode.
constexpr bool is_writable(const ImageFormat format) noexcept {
    return format == ImageFormat::Jpeg || format == ImageFormat::Png ||
           format == ImageFormat::Webp || format == ImageFormat::Tiff;
}

/// @return Format implied by a file extension (".jpg" -> Jpeg), Unknown if none.
ImageFormat image_format_from_extension(std::string_view ext);

/// @return Format identified by the leading bytes of a file, Unknown if none.
ImageFormat sniff_image_format(const std::vector<unsigned char>& head);

/**
 * @brief What probing an image found.
 */
struct ImageProbe {
    ImageFormat format = ImageFormat::Unknown;
    uint32_t width = 0;
    uint32_t height = 0;
    std::optional<std::vector<unsigned char>> icc_profile;
    std::vector<std::string> metadata_blocks; ///< Auxiliary blocks present ("EXIF", "XMP", ...)

    [[nodiscard]] bool has_block(std::string_view name) const;
};

/**
 * @brief Image probe/re-encode capability.
 */
class IImageCodec {
public:
    virtual ~IImageCodec() = default;

    /**
     * @brief Identify an image and list its auxiliary blocks.
     *
     * Formats without a writer (gif, avif, heic) are probed too; their
     * metadata is reported but they can only be re-encoded as another format.
     * @throws DecodeError if a recognized format fails to parse.
     */
    virtual ImageProbe probe(const std::filesystem::path& path) = 0;

    /**
     * @brief Write @p input as @p target, carrying over only @p icc_profile.
     *
     * A source already in @p target keeps its pixel data losslessly. A gif,
     * avif or heic source is decoded to RGBA and encoded as @p target.
     * Every other auxiliary block is dropped.
     * @throws DecodeError if the source cannot be decoded or converted to @p target.
     */
    virtual void reencode(const std::filesystem::path& input,
                          const std::filesystem::path& output,
                          ImageFormat target,
                          const std::optional<std::vector<unsigned char>>& icc_profile) = 0;
};

/**
 * @brief IImageCodec bound to libjpeg, libpng, libwebp and libtiff.
 */
class NativeImageCodec final : public IImageCodec {
public:
    ImageProbe probe(const std::filesystem::path& path) override;
    void reencode(const std::filesystem::path& input,
                  const std::filesystem::path& output,
                  ImageFormat target,
                  const std::optional<std::vector<unsigned char>>& icc_profile) override;
};

} // namespace unmark

#endif // UNMARK_IMAGE_CODEC_HPP
