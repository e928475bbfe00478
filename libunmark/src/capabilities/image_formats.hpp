//
// Created on 20/10/26.
//

// Per-library halves of NativeImageCodec. Each strip_* pair probes and
// re-encodes one format in place (same format in, same format out); formats
// without a writer are decoded to RGBA and handed to a write_*_rgba encoder.

#ifndef UNMARK_IMAGE_FORMATS_HPP
#define UNMARK_IMAGE_FORMATS_HPP

#include "../../include/image_codec.hpp"

namespace unmark::detail {

    /**
     * @brief Decoded 8-bit RGBA raster, rows top-down, straight alpha.
     */
    struct RgbaImage {
        uint32_t width = 0;
        uint32_t height = 0;
        std::vector<unsigned char> pixels;
    };

    ImageProbe probe_jpeg(const std::filesystem::path& path);
    void strip_jpeg(const std::filesystem::path& input, const std::filesystem::path& output,
                    const std::optional<std::vector<unsigned char>>& icc_profile);

    ImageProbe probe_png(const std::filesystem::path& path);
    void strip_png(const std::filesystem::path& input, const std::filesystem::path& output,
                   const std::optional<std::vector<unsigned char>>& icc_profile);

    ImageProbe probe_webp(const std::filesystem::path& path);
    void strip_webp(const std::filesystem::path& input, const std::filesystem::path& output,
                    const std::optional<std::vector<unsigned char>>& icc_profile);

    ImageProbe probe_tiff(const std::filesystem::path& path);
    void strip_tiff(const std::filesystem::path& input, const std::filesystem::path& output,
                    const std::optional<std::vector<unsigned char>>& icc_profile);

    ImageProbe probe_gif(const std::filesystem::path& path);
    RgbaImage decode_gif(const std::filesystem::path& path);

    /// AVIF and HEIC stills, read through libavformat.
    ImageProbe probe_heif(const std::filesystem::path& path, ImageFormat format);
    RgbaImage decode_heif(const std::filesystem::path& path);

    void write_jpeg_rgba(const RgbaImage& image, const std::filesystem::path& output,
                         const std::optional<std::vector<unsigned char>>& icc_profile);
    void write_png_rgba(const RgbaImage& image, const std::filesystem::path& output,
                        const std::optional<std::vector<unsigned char>>& icc_profile);
    void write_webp_rgba(const RgbaImage& image, const std::filesystem::path& output,
                         const std::optional<std::vector<unsigned char>>& icc_profile);
    void write_tiff_rgba(const RgbaImage& image, const std::filesystem::path& output,
                         const std::optional<std::vector<unsigned char>>& icc_profile);

} // namespace unmark::detail

#endif // UNMARK_IMAGE_FORMATS_HPP
