//
// Created on 20/10/26.
//

#include "../../include/image_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_category.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "image_formats.hpp"
#include <algorithm>
#include <cstring>
#include <unordered_map>

namespace {

const char* codec_tag() {
    return "NativeImageCodec";
}

std::vector<unsigned char> read_head(const std::filesystem::path& path, const std::size_t n) {
    const unmark::unique_FILE f(unmark::open_file(path, "rb"));
    if (!f) {
        throw unmark::IoError("cannot open " + path.string());
    }
    std::vector<unsigned char> head(n);
    head.resize(std::fread(head.data(), 1, n, f.get()));
    return head;
}

bool starts_with_bytes(const std::vector<unsigned char>& head, const std::size_t off, const char* magic) {
    const std::size_t len = std::strlen(magic);
    return head.size() >= off + len && std::memcmp(head.data() + off, magic, len) == 0;
}

// formats without a writer go through an RGBA raster
void convert(const std::filesystem::path& input, const unmark::ImageFormat source,
             const std::filesystem::path& output, const unmark::ImageFormat target,
             const std::optional<std::vector<unsigned char>>& icc_profile) {
    using unmark::ImageFormat;
    Logger::log(LogLevel::Info,
                input.filename().string() + ": converting " + std::string(to_string(source)) + " to " +
                std::string(to_string(target)), codec_tag());

    unmark::detail::RgbaImage image;
    switch (source) {
        case ImageFormat::Gif:  image = unmark::detail::decode_gif(input); break;
        case ImageFormat::Avif:
        case ImageFormat::Heic: image = unmark::detail::decode_heif(input); break;
        default:
            Logger::log(LogLevel::Error,
                        "No lossless path from " + std::string(to_string(source)) + " to " +
                        std::string(to_string(target)), codec_tag());
            throw unmark::DecodeError("cannot convert " + std::string(to_string(source)) + " image to " +
                                      std::string(to_string(target)));
    }

    switch (target) {
        case ImageFormat::Jpeg: unmark::detail::write_jpeg_rgba(image, output, icc_profile); break;
        case ImageFormat::Png:  unmark::detail::write_png_rgba(image, output, icc_profile); break;
        case ImageFormat::Webp: unmark::detail::write_webp_rgba(image, output, icc_profile); break;
        case ImageFormat::Tiff: unmark::detail::write_tiff_rgba(image, output, icc_profile); break;
        default:
            throw unmark::DecodeError("no encoder for " + std::string(to_string(target)) + " images");
    }
}

} // namespace

namespace unmark {

ImageFormat image_format_from_extension(const std::string_view ext) {
    static const std::unordered_map<std::string_view, ImageFormat> ext_to_format = {
        {".jpg", ImageFormat::Jpeg}, {".jpeg", ImageFormat::Jpeg},
        {".png", ImageFormat::Png},
        {".webp", ImageFormat::Webp},
        {".tif", ImageFormat::Tiff}, {".tiff", ImageFormat::Tiff},
        {".gif", ImageFormat::Gif},
        {".avif", ImageFormat::Avif},
        {".heic", ImageFormat::Heic}
    };
    const std::string lower = lower_extension(ext);
    const auto it = ext_to_format.find(lower);
    return it == ext_to_format.end() ? ImageFormat::Unknown : it->second;
}

ImageFormat sniff_image_format(const std::vector<unsigned char>& head) {
    if (head.size() >= 3 && head[0] == 0xFF && head[1] == 0xD8 && head[2] == 0xFF) return ImageFormat::Jpeg;
    if (starts_with_bytes(head, 0, "\x89PNG\r\n\x1a\n")) return ImageFormat::Png;
    if (starts_with_bytes(head, 0, "RIFF") && starts_with_bytes(head, 8, "WEBP")) return ImageFormat::Webp;
    if (head.size() >= 4 && ((head[0] == 'I' && head[1] == 'I' && (head[2] == 42 || head[2] == 43) && head[3] == 0) ||
                             (head[0] == 'M' && head[1] == 'M' && head[2] == 0 && (head[3] == 42 || head[3] == 43)))) {
        return ImageFormat::Tiff;
    }
    if (starts_with_bytes(head, 0, "GIF87a") || starts_with_bytes(head, 0, "GIF89a")) return ImageFormat::Gif;
    if (starts_with_bytes(head, 4, "ftyp")) {
        if (starts_with_bytes(head, 8, "avif") || starts_with_bytes(head, 8, "avis")) return ImageFormat::Avif;
        for (const char* brand : {"heic", "heix", "hevc", "hevx", "heim", "heis", "mif1", "msf1"}) {
            if (starts_with_bytes(head, 8, brand)) return ImageFormat::Heic;
        }
    }
    return ImageFormat::Unknown;
}

bool ImageProbe::has_block(const std::string_view name) const {
    return std::ranges::find(metadata_blocks, name) != metadata_blocks.end();
}

ImageProbe NativeImageCodec::probe(const std::filesystem::path& path) {
    const ImageFormat format = sniff_image_format(read_head(path, 32));
    Logger::log(LogLevel::Debug, path.filename().string() + " sniffed as " + std::string(to_string(format)), codec_tag());

    switch (format) {
        case ImageFormat::Jpeg: return detail::probe_jpeg(path);
        case ImageFormat::Png:  return detail::probe_png(path);
        case ImageFormat::Webp: return detail::probe_webp(path);
        case ImageFormat::Tiff: return detail::probe_tiff(path);
        case ImageFormat::Gif:  return detail::probe_gif(path);
        case ImageFormat::Avif:
        case ImageFormat::Heic: return detail::probe_heif(path, format);
        default: {
            ImageProbe p;
            p.format = format;
            return p;
        }
    }
}

void NativeImageCodec::reencode(const std::filesystem::path& input,
                                const std::filesystem::path& output,
                                const ImageFormat target,
                                const std::optional<std::vector<unsigned char>>& icc_profile) {
    ImageFormat source = sniff_image_format(read_head(input, 32));
    if (source == ImageFormat::Unknown) {
        // let the target decoder produce the diagnostic
        source = target;
    }
    if (source != target) {
        convert(input, source, output, target, icc_profile);
        return;
    }

    switch (target) {
        case ImageFormat::Jpeg: detail::strip_jpeg(input, output, icc_profile); break;
        case ImageFormat::Png:  detail::strip_png(input, output, icc_profile); break;
        case ImageFormat::Webp: detail::strip_webp(input, output, icc_profile); break;
        case ImageFormat::Tiff: detail::strip_tiff(input, output, icc_profile); break;
        default:
            throw DecodeError("no encoder for " + std::string(to_string(target)) + " images");
    }
}

} // namespace unmark
