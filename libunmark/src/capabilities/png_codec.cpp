//
// Created on 21/10/26.
//

#include "image_formats.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <algorithm>
#include <cstring>

namespace {

const char* codec_tag() {
    return "libpng";
}

void png_error_fn(png_structp, const png_const_charp msg) {
    throw unmark::DecodeError(std::string("PNG decode failed: ") + msg);
}

void png_warning_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Warning, msg, codec_tag());
}

/**
 * @brief RAII wrapper for libpng read structs.
 */
struct PngRead {
    png_structp png = nullptr;
    png_infop info = nullptr;

    PngRead() = default;
    ~PngRead() {
        if (png || info) png_destroy_read_struct(&png, &info, nullptr);
    }
    PngRead(const PngRead&) = delete;
    PngRead& operator=(const PngRead&) = delete;
};

/**
 * @brief RAII wrapper for libpng write structs.
 */
struct PngWrite {
    png_structp png = nullptr;
    png_infop info = nullptr;

    PngWrite() = default;
    ~PngWrite() {
        if (png || info) png_destroy_write_struct(&png, &info);
    }
    PngWrite(const PngWrite&) = delete;
    PngWrite& operator=(const PngWrite&) = delete;
};

/**
 * @brief A PNG read in full, rows at native bit depth, all chunks retained.
 */
struct DecodedPng {
    PngRead rd;
    png_uint_32 width = 0;
    png_uint_32 height = 0;
    int bit_depth = 0;
    int color_type = 0;
    int interlace = PNG_INTERLACE_NONE;
    std::size_t rowbytes = 0;
    std::vector<unsigned char> pixels;
};

void decode_png(const std::filesystem::path& path, DecodedPng& out) {
    const unmark::unique_FILE fp(unmark::open_file(path, "rb"));
    if (!fp) {
        throw unmark::IoError("cannot open " + path.string());
    }

    out.rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!out.rd.png) throw unmark::DecodeError("png_create_read_struct failed");
    out.rd.info = png_create_info_struct(out.rd.png);
    if (!out.rd.info) throw unmark::DecodeError("png_create_info_struct failed");

    // keep unrecognized chunks so they can be reported (and animation detected)
    png_set_keep_unknown_chunks(out.rd.png, PNG_HANDLE_CHUNK_ALWAYS, nullptr, 0);

    png_init_io(out.rd.png, fp.get());
    png_read_info(out.rd.png, out.rd.info);
    png_get_IHDR(out.rd.png, out.rd.info, &out.width, &out.height, &out.bit_depth, &out.color_type,
                 &out.interlace, nullptr, nullptr);

    if (out.interlace != PNG_INTERLACE_NONE) {
        png_set_interlace_handling(out.rd.png);
    }
    png_read_update_info(out.rd.png, out.rd.info);

    out.rowbytes = png_get_rowbytes(out.rd.png, out.rd.info);
    out.pixels.resize(out.rowbytes * out.height);
    std::vector<png_bytep> rows(out.height);
    for (png_uint_32 y = 0; y < out.height; ++y) {
        rows[y] = out.pixels.data() + y * out.rowbytes;
    }
    png_read_image(out.rd.png, rows.data());
    // chunks after IDAT land in the same info struct
    png_read_end(out.rd.png, out.rd.info);
}

bool has_unknown_chunk(const DecodedPng& d, const char* name) {
    png_unknown_chunkp chunks = nullptr;
    const int n = png_get_unknown_chunks(d.rd.png, d.rd.info, &chunks);
    for (int i = 0; i < n; ++i) {
        if (std::memcmp(chunks[i].name, name, 4) == 0) return true;
    }
    return false;
}

void add_block(std::vector<std::string>& blocks, std::string name) {
    if (std::ranges::find(blocks, name) == blocks.end()) {
        blocks.push_back(std::move(name));
    }
}

} // namespace

namespace unmark::detail {

ImageProbe probe_png(const std::filesystem::path& path) {
    DecodedPng d;
    decode_png(path, d);
    png_structp png = d.rd.png;
    png_infop info = d.rd.info;

    ImageProbe probe;
    probe.format = ImageFormat::Png;
    probe.width = d.width;
    probe.height = d.height;

    if (png_get_valid(png, info, PNG_INFO_iCCP)) {
        png_charp name = nullptr;
        int comp_type = 0;
        png_bytep profile = nullptr;
        png_uint_32 profile_len = 0;
        if (png_get_iCCP(png, info, &name, &comp_type, &profile, &profile_len) && profile_len > 0) {
            probe.icc_profile = std::vector<unsigned char>(profile, profile + profile_len);
        }
    }

#ifdef PNG_eXIf_SUPPORTED
    if (png_get_valid(png, info, PNG_INFO_eXIf)) {
        add_block(probe.metadata_blocks, "EXIF");
    }
#endif

    png_textp text = nullptr;
    int num_text = 0;
    png_get_text(png, info, &text, &num_text);
    for (int i = 0; i < num_text; ++i) {
        if (text[i].key && std::strcmp(text[i].key, "XML:com.adobe.xmp") == 0) {
            add_block(probe.metadata_blocks, "XMP");
        } else if (text[i].key && std::strcmp(text[i].key, "Raw profile type exif") == 0) {
            add_block(probe.metadata_blocks, "EXIF");
        } else {
            add_block(probe.metadata_blocks, "text chunks");
        }
    }

    if (png_get_valid(png, info, PNG_INFO_tIME)) {
        add_block(probe.metadata_blocks, "timestamp");
    }

    png_sPLT_tp splt = nullptr;
    if (png_get_sPLT(png, info, &splt) > 0) {
        add_block(probe.metadata_blocks, "suggested palettes");
    }

    png_unknown_chunkp chunks = nullptr;
    const int n_unknown = png_get_unknown_chunks(png, info, &chunks);
    for (int i = 0; i < n_unknown; ++i) {
        if (std::memcmp(chunks[i].name, "eXIf", 4) == 0) {
            add_block(probe.metadata_blocks, "EXIF");
        } else if (std::memcmp(chunks[i].name, "acTL", 4) != 0 &&
                   std::memcmp(chunks[i].name, "fcTL", 4) != 0 &&
                   std::memcmp(chunks[i].name, "fdAT", 4) != 0) {
            add_block(probe.metadata_blocks, "private chunks");
        }
    }
    return probe;
}

void strip_png(const std::filesystem::path& input, const std::filesystem::path& output,
               const std::optional<std::vector<unsigned char>>& icc_profile) {
    Logger::log(LogLevel::Debug, "PNG row copy: " + input.string(), codec_tag());

    DecodedPng d;
    decode_png(input, d);
    if (has_unknown_chunk(d, "acTL")) {
        throw DecodeError("animated PNG is not supported");
    }
    png_structp in_png = d.rd.png;
    png_infop in_info = d.rd.info;

    unique_FILE fp(open_file(output, "wb"));
    if (!fp) {
        throw IoError("cannot create " + output.string());
    }

    {
        PngWrite wr;
        wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
        if (!wr.png) throw IoError("png_create_write_struct failed");
        wr.info = png_create_info_struct(wr.png);
        if (!wr.info) throw IoError("png_create_info_struct failed");

        png_init_io(wr.png, fp.get());
        png_set_IHDR(wr.png, wr.info, d.width, d.height, d.bit_depth, d.color_type,
                     d.interlace, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

        // pixel data and rendering chunks
        png_colorp palette = nullptr;
        int num_palette = 0;
        if (png_get_PLTE(in_png, in_info, &palette, &num_palette)) {
            png_set_PLTE(wr.png, wr.info, palette, num_palette);
        }
        png_bytep trans = nullptr;
        int num_trans = 0;
        png_color_16p trans_color = nullptr;
        if (png_get_tRNS(in_png, in_info, &trans, &num_trans, &trans_color)) {
            png_set_tRNS(wr.png, wr.info, trans, num_trans, trans_color);
        }
        if (icc_profile && !icc_profile->empty()) {
            png_set_iCCP(wr.png, wr.info, "ICC profile", PNG_COMPRESSION_TYPE_BASE,
                         icc_profile->data(), static_cast<png_uint_32>(icc_profile->size()));
        } else if (png_get_valid(in_png, in_info, PNG_INFO_sRGB)) {
            int intent = 0;
            if (png_get_sRGB(in_png, in_info, &intent)) png_set_sRGB(wr.png, wr.info, intent);
        }
        if (png_get_valid(in_png, in_info, PNG_INFO_gAMA)) {
            double gamma = 0.0;
            if (png_get_gAMA(in_png, in_info, &gamma)) png_set_gAMA(wr.png, wr.info, gamma);
        }
        if (png_get_valid(in_png, in_info, PNG_INFO_cHRM)) {
            double wx, wy, rx, ry, gx, gy, bx, by;
            if (png_get_cHRM(in_png, in_info, &wx, &wy, &rx, &ry, &gx, &gy, &bx, &by)) {
                png_set_cHRM(wr.png, wr.info, wx, wy, rx, ry, gx, gy, bx, by);
            }
        }
        if (png_get_valid(in_png, in_info, PNG_INFO_sBIT)) {
            png_color_8p sig_bit = nullptr;
            if (png_get_sBIT(in_png, in_info, &sig_bit)) png_set_sBIT(wr.png, wr.info, sig_bit);
        }
        if (png_get_valid(in_png, in_info, PNG_INFO_pHYs)) {
            png_uint_32 xppu = 0, yppu = 0;
            int unit = 0;
            if (png_get_pHYs(in_png, in_info, &xppu, &yppu, &unit)) png_set_pHYs(wr.png, wr.info, xppu, yppu, unit);
        }
        if (png_get_valid(in_png, in_info, PNG_INFO_bKGD)) {
            png_color_16p bkgd = nullptr;
            if (png_get_bKGD(in_png, in_info, &bkgd)) png_set_bKGD(wr.png, wr.info, bkgd);
        }

        png_write_info(wr.png, wr.info);
        if (d.interlace != PNG_INTERLACE_NONE) {
            png_set_interlace_handling(wr.png);
        }
        std::vector<png_bytep> rows(d.height);
        for (png_uint_32 y = 0; y < d.height; ++y) {
            rows[y] = d.pixels.data() + y * d.rowbytes;
        }
        png_write_image(wr.png, rows.data());
        png_write_end(wr.png, nullptr);
    }

    if (std::fclose(fp.release()) != 0) {
        throw IoError("cannot flush " + output.string());
    }
}

void write_png_rgba(const RgbaImage& image, const std::filesystem::path& output,
                    const std::optional<std::vector<unsigned char>>& icc_profile) {
    Logger::log(LogLevel::Debug, "PNG encode " + std::to_string(image.width) + "x" +
                std::to_string(image.height) + " -> " + output.string(), codec_tag());

    unique_FILE fp(open_file(output, "wb"));
    if (!fp) {
        throw IoError("cannot create " + output.string());
    }

    {
        PngWrite wr;
        wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
        if (!wr.png) throw IoError("png_create_write_struct failed");
        wr.info = png_create_info_struct(wr.png);
        if (!wr.info) throw IoError("png_create_info_struct failed");

        png_init_io(wr.png, fp.get());
        png_set_IHDR(wr.png, wr.info, image.width, image.height, 8, PNG_COLOR_TYPE_RGB_ALPHA,
                     PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
        if (icc_profile && !icc_profile->empty()) {
            png_set_iCCP(wr.png, wr.info, "ICC profile", PNG_COMPRESSION_TYPE_BASE,
                         icc_profile->data(), static_cast<png_uint_32>(icc_profile->size()));
        }
        png_write_info(wr.png, wr.info);

        const std::size_t stride = static_cast<std::size_t>(image.width) * 4;
        std::vector<png_bytep> rows(image.height);
        for (png_uint_32 y = 0; y < image.height; ++y) {
            rows[y] = const_cast<png_bytep>(image.pixels.data() + y * stride);
        }
        png_write_image(wr.png, rows.data());
        png_write_end(wr.png, nullptr);
    }

    if (std::fclose(fp.release()) != 0) {
        throw IoError("cannot flush " + output.string());
    }
}

} // namespace unmark::detail
