//
// Created on 25/10/26.
//

#ifndef UNMARK_TEST_SUPPORT_HPP
#define UNMARK_TEST_SUPPORT_HPP

#include "../libunmark/include/archive_codec.hpp"
#include "../libunmark/include/file_utils.hpp"
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <csetjmp>
#include <filesystem>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>
#include <jpeglib.h>
#include <png.h>
#include <tiffio.h>
#include <webp/decode.h>
#include <webp/encode.h>
#include <webp/mux.h>
#include <zlib.h>

namespace unmark::test {

namespace fs = std::filesystem;

/**
 * @brief Fresh directory under the system temp dir, removed with its content on destruction.
 */
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        const fs::path base = fs::temp_directory_path();
        do {
            dir_ = base / ("unmark-test-" + std::to_string(rd()));
        } while (!fs::create_directory(dir_));
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& dir() const { return dir_; }
    [[nodiscard]] fs::path operator/(const std::string& name) const { return dir_ / name; }

private:
    fs::path dir_;
};

inline void write_text(const fs::path& path, const std::string& text) {
    write_file_bytes(path, text.data(), text.size());
}

inline std::string read_text(const fs::path& path) {
    const std::vector<unsigned char> bytes = read_file_bytes(path);
    return {bytes.begin(), bytes.end()};
}

// ---------------------------------------------------------------------------
// zip
// ---------------------------------------------------------------------------

struct ZipFixtureEntry {
    std::string name;
    std::string content;
    bool directory = false;
};

struct ZipOptions {
    std::string comment;            ///< End-of-central-directory comment
    bool foreign_extra_field = false; ///< Add a private extra field to every central record
    std::string entry_comment;      ///< File comment on every central record
};

namespace detail {
inline void put16(std::vector<unsigned char>& out, const uint16_t v) {
    out.push_back(static_cast<unsigned char>(v & 0xFF));
    out.push_back(static_cast<unsigned char>(v >> 8));
}
inline void put32(std::vector<unsigned char>& out, const uint32_t v) {
    put16(out, static_cast<uint16_t>(v & 0xFFFF));
    put16(out, static_cast<uint16_t>(v >> 16));
}
inline void put(std::vector<unsigned char>& out, const std::string& s) {
    out.insert(out.end(), s.begin(), s.end());
}
} // namespace detail

/**
 * @brief Write a zip with stored entries, byte by byte.
 *
 * Hand-built so that tests control the archive comment and the extra fields
 * of the central directory, which zip writers normally decide themselves.
 */
inline void write_stored_zip(const fs::path& path, const std::vector<ZipFixtureEntry>& entries,
                             const ZipOptions& options = {}) {
    using detail::put16;
    using detail::put32;
    using detail::put;

    constexpr uint16_t dos_time = (3 << 11) | (4 << 5) | (6 / 2);            // 03:04:06
    constexpr uint16_t dos_date = ((2020 - 1980) << 9) | (1 << 5) | 2;       // 2020-01-02

    std::vector<unsigned char> out;
    std::vector<unsigned char> central;
    for (const auto& e : entries) {
        const std::string name = e.directory && !e.name.ends_with('/') ? e.name + "/" : e.name;
        const std::string& data = e.content;
        const auto crc = static_cast<uint32_t>(
            crc32(0L, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size())));
        const auto offset = static_cast<uint32_t>(out.size());

        put32(out, 0x04034b50);
        put16(out, 20);
        put16(out, 0);
        put16(out, 0);
        put16(out, dos_time);
        put16(out, dos_date);
        put32(out, crc);
        put32(out, static_cast<uint32_t>(data.size()));
        put32(out, static_cast<uint32_t>(data.size()));
        put16(out, static_cast<uint16_t>(name.size()));
        put16(out, 0);
        put(out, name);
        put(out, data);

        std::string extra;
        if (options.foreign_extra_field) {
            // id 0x4a4b, 4 bytes of payload
            extra = std::string("\x4b\x4a\x04\x00" "ABCD", 8);
        }
        put32(central, 0x02014b50);
        put16(central, 0x0314);
        put16(central, 20);
        put16(central, 0);
        put16(central, 0);
        put16(central, dos_time);
        put16(central, dos_date);
        put32(central, crc);
        put32(central, static_cast<uint32_t>(data.size()));
        put32(central, static_cast<uint32_t>(data.size()));
        put16(central, static_cast<uint16_t>(name.size()));
        put16(central, static_cast<uint16_t>(extra.size()));
        put16(central, static_cast<uint16_t>(options.entry_comment.size()));
        put16(central, 0);
        put16(central, 0);
        put32(central, e.directory ? (040755u << 16) | 0x10 : (0100644u << 16));
        put32(central, offset);
        put(central, name);
        put(central, extra);
        put(central, options.entry_comment);
    }

    const auto cd_offset = static_cast<uint32_t>(out.size());
    out.insert(out.end(), central.begin(), central.end());
    put32(out, 0x06054b50);
    put16(out, 0);
    put16(out, 0);
    put16(out, static_cast<uint16_t>(entries.size()));
    put16(out, static_cast<uint16_t>(entries.size()));
    put32(out, static_cast<uint32_t>(central.size()));
    put32(out, cd_offset);
    put16(out, static_cast<uint16_t>(options.comment.size()));
    put(out, options.comment);

    write_file_bytes(path, out);
}

// ---------------------------------------------------------------------------
// jpeg
// ---------------------------------------------------------------------------

struct JpegOptions {
    bool exif = false;
    bool comment = false;
    std::vector<unsigned char> icc; ///< Written as a single APP2 ICC_PROFILE chunk when not empty
};

inline void write_jpeg(const fs::path& path, const int width, const int height, const JpegOptions& options = {}) {
    const unique_FILE f(open_file(path, "wb"));
    if (!f) throw std::runtime_error("cannot create " + path.string());

    jpeg_compress_struct cinfo{};
    jpeg_error_mgr jerr{};
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_compress(&cinfo);
    jpeg_stdio_dest(&cinfo, f.get());

    cinfo.image_width = static_cast<JDIMENSION>(width);
    cinfo.image_height = static_cast<JDIMENSION>(height);
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, 90, TRUE);
    jpeg_start_compress(&cinfo, TRUE);

    if (options.exif) {
        // "Exif\0\0" + little-endian TIFF header with an empty IFD
        static const unsigned char exif[] = {
            'E', 'x', 'i', 'f', 0, 0,
            'I', 'I', 42, 0, 8, 0, 0, 0,
            0, 0,
            0, 0, 0, 0
        };
        jpeg_write_marker(&cinfo, JPEG_APP0 + 1, exif, sizeof(exif));
    }
    if (options.comment) {
        static const char comment[] = "shot by Alice, 45.4642N 9.1900E";
        jpeg_write_marker(&cinfo, JPEG_COM, reinterpret_cast<const JOCTET*>(comment), sizeof(comment) - 1);
    }
    if (!options.icc.empty()) {
        std::vector<unsigned char> app2 = {'I', 'C', 'C', '_', 'P', 'R', 'O', 'F', 'I', 'L', 'E', 0, 1, 1};
        app2.insert(app2.end(), options.icc.begin(), options.icc.end());
        jpeg_write_marker(&cinfo, JPEG_APP0 + 2, app2.data(), static_cast<unsigned>(app2.size()));
    }

    std::vector<JSAMPLE> row(static_cast<std::size_t>(width) * 3);
    while (cinfo.next_scanline < cinfo.image_height) {
        for (int x = 0; x < width; ++x) {
            row[x * 3 + 0] = static_cast<JSAMPLE>((x * 255) / std::max(1, width - 1));
            row[x * 3 + 1] = static_cast<JSAMPLE>((cinfo.next_scanline * 255) / std::max(1, height - 1));
            row[x * 3 + 2] = 128;
        }
        JSAMPROW ptr = row.data();
        jpeg_write_scanlines(&cinfo, &ptr, 1);
    }
    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);
}

/// @brief Decode a JPEG to interleaved samples.
inline std::vector<unsigned char> read_jpeg_pixels(const fs::path& path) {
    const unique_FILE f(open_file(path, "rb"));
    if (!f) throw std::runtime_error("cannot open " + path.string());

    jpeg_decompress_struct cinfo{};
    jpeg_error_mgr jerr{};
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_decompress(&cinfo);
    jpeg_stdio_src(&cinfo, f.get());
    jpeg_read_header(&cinfo, TRUE);
    jpeg_start_decompress(&cinfo);

    const std::size_t stride = static_cast<std::size_t>(cinfo.output_width) * cinfo.output_components;
    std::vector<unsigned char> pixels(stride * cinfo.output_height);
    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW ptr = pixels.data() + stride * cinfo.output_scanline;
        jpeg_read_scanlines(&cinfo, &ptr, 1);
    }
    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    return pixels;
}

// ---------------------------------------------------------------------------
// png
// ---------------------------------------------------------------------------

/// @brief Decode a PNG to 8-bit RGBA with the simplified libpng API.
inline std::vector<unsigned char> read_png_pixels(const fs::path& path) {
    png_image image{};
    image.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_file(&image, path.c_str())) {
        throw std::runtime_error("cannot read " + path.string() + ": " + image.message);
    }
    image.format = PNG_FORMAT_RGBA;
    std::vector<unsigned char> pixels(PNG_IMAGE_SIZE(image));
    if (!png_image_finish_read(&image, nullptr, pixels.data(), 0, nullptr)) {
        png_image_free(&image);
        throw std::runtime_error("cannot decode " + path.string() + ": " + image.message);
    }
    return pixels;
}

struct PngOptions {
    bool text = false;      ///< tEXt Author chunk
    bool timestamp = false; ///< tIME chunk
};

inline void write_png(const fs::path& path, const int width, const int height, const PngOptions& options = {}) {
    const unique_FILE f(open_file(path, "wb"));
    if (!f) throw std::runtime_error("cannot create " + path.string());

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png ? png_create_info_struct(png) : nullptr;
    if (!png || !info) {
        png_destroy_write_struct(&png, &info);
        throw std::runtime_error("libpng init failed");
    }
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        throw std::runtime_error("libpng write failed");
    }

    png_init_io(png, f.get());
    png_set_IHDR(png, info, static_cast<png_uint_32>(width), static_cast<png_uint_32>(height), 8,
                 PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

    png_text text{};
    char key[] = "Author";
    char value[] = "Alice";
    if (options.text) {
        text.compression = PNG_TEXT_COMPRESSION_NONE;
        text.key = key;
        text.text = value;
        png_set_text(png, info, &text, 1);
    }
    png_time mod_time{};
    if (options.timestamp) {
        mod_time.year = 2021;
        mod_time.month = 6;
        mod_time.day = 7;
        png_set_tIME(png, info, &mod_time);
    }

    png_write_info(png, info);
    std::vector<png_byte> row(static_cast<std::size_t>(width) * 3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            row[x * 3 + 0] = static_cast<png_byte>(x * 16);
            row[x * 3 + 1] = static_cast<png_byte>(y * 16);
            row[x * 3 + 2] = static_cast<png_byte>((x + y) * 8);
        }
        png_write_row(png, row.data());
    }
    png_write_end(png, info);
    png_destroy_write_struct(&png, &info);
}

// ---------------------------------------------------------------------------
// gif
// ---------------------------------------------------------------------------

/// Pixels of the 2x2 GIF fixture as decoded RGBA: red, green / blue, white.
inline const std::vector<unsigned char> kGifPixels = {
    255, 0, 0, 255,   0, 255, 0, 255,
    0, 0, 255, 255,   255, 255, 255, 255,
};

struct GifOptions {
    bool comment = false; ///< Comment extension before the image
    bool xmp = false;     ///< "XMP DataXMP" application extension
    int frames = 1;
};

/**
 * @brief Write a 2x2 GIF89a with a four-colour global palette.
 *
 * The LZW stream sends a clear code before every pixel, so the code width
 * stays at three bits and no dictionary is needed to build it.
 */
inline void write_gif(const fs::path& path, const GifOptions& options = {}) {
    using detail::put16;
    using detail::put;

    std::vector<unsigned char> out;
    put(out, "GIF89a");
    put16(out, 2);
    put16(out, 2);
    out.push_back(0xF1); // global table, 4 entries
    out.push_back(0);
    out.push_back(0);
    for (const unsigned char c : {255, 0, 0,  0, 255, 0,  0, 0, 255,  255, 255, 255}) out.push_back(c);

    if (options.comment) {
        const std::string text = "made by Alice on her laptop";
        out.push_back(0x21);
        out.push_back(0xFE);
        out.push_back(static_cast<unsigned char>(text.size()));
        put(out, text);
        out.push_back(0);
    }
    if (options.xmp) {
        const std::string packet = "<x:xmpmeta xmlns:x=\"adobe:ns:meta/\"/>";
        out.push_back(0x21);
        out.push_back(0xFF);
        out.push_back(11);
        put(out, "XMP DataXMP");
        out.push_back(static_cast<unsigned char>(packet.size()));
        put(out, packet);
        out.push_back(0);
    }

    std::vector<unsigned char> lzw;
    uint32_t bits = 0;
    int nbits = 0;
    for (const unsigned code : {4u, 0u, 4u, 1u, 4u, 2u, 4u, 3u, 5u}) {
        bits |= code << nbits;
        nbits += 3;
        while (nbits >= 8) {
            lzw.push_back(static_cast<unsigned char>(bits & 0xFF));
            bits >>= 8;
            nbits -= 8;
        }
    }
    if (nbits > 0) lzw.push_back(static_cast<unsigned char>(bits & 0xFF));

    for (int f = 0; f < std::max(1, options.frames); ++f) {
        out.push_back(0x2C);
        put16(out, 0);
        put16(out, 0);
        put16(out, 2);
        put16(out, 2);
        out.push_back(0);
        out.push_back(2); // lzw minimum code size
        out.push_back(static_cast<unsigned char>(lzw.size()));
        out.insert(out.end(), lzw.begin(), lzw.end());
        out.push_back(0);
    }
    out.push_back(0x3B);

    write_file_bytes(path, out);
}

// ---------------------------------------------------------------------------
// webp
// ---------------------------------------------------------------------------

struct WebpOptions {
    bool exif = false;
    bool xmp = false;
    std::vector<unsigned char> icc; ///< ICCP chunk when not empty
};

/// @brief Write a lossless WebP, adding the requested chunks through libwebpmux.
inline void write_webp(const fs::path& path, const int width, const int height, const WebpOptions& options = {}) {
    std::vector<uint8_t> rgba(static_cast<std::size_t>(width) * height * 4);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            uint8_t* px = &rgba[(static_cast<std::size_t>(y) * width + x) * 4];
            px[0] = static_cast<uint8_t>(x * 40);
            px[1] = static_cast<uint8_t>(y * 40);
            px[2] = 90;
            px[3] = 255;
        }
    }
    uint8_t* encoded = nullptr;
    const std::size_t size = WebPEncodeLosslessRGBA(rgba.data(), width, height, width * 4, &encoded);
    if (size == 0) throw std::runtime_error("WebP encode failed");

    const WebPData image{encoded, size};
    WebPMux* mux = WebPMuxCreate(&image, 1);
    WebPFree(encoded);
    if (!mux) throw std::runtime_error("WebPMuxCreate failed");

    static const unsigned char exif[] = {'I', 'I', 42, 0, 8, 0, 0, 0, 0, 0, 0, 0, 0, 0};
    const std::string xmp = "<x:xmpmeta xmlns:x=\"adobe:ns:meta/\"/>";
    bool ok = true;
    if (options.exif) {
        const WebPData chunk{exif, sizeof(exif)};
        ok = ok && WebPMuxSetChunk(mux, "EXIF", &chunk, 1) == WEBP_MUX_OK;
    }
    if (options.xmp) {
        const WebPData chunk{reinterpret_cast<const uint8_t*>(xmp.data()), xmp.size()};
        ok = ok && WebPMuxSetChunk(mux, "XMP ", &chunk, 1) == WEBP_MUX_OK;
    }
    if (!options.icc.empty()) {
        const WebPData chunk{options.icc.data(), options.icc.size()};
        ok = ok && WebPMuxSetChunk(mux, "ICCP", &chunk, 1) == WEBP_MUX_OK;
    }
    WebPData assembled;
    WebPDataInit(&assembled);
    ok = ok && WebPMuxAssemble(mux, &assembled) == WEBP_MUX_OK;
    WebPMuxDelete(mux);
    if (!ok) {
        WebPDataClear(&assembled);
        throw std::runtime_error("cannot build WebP fixture");
    }
    write_file_bytes(path, assembled.bytes, assembled.size);
    WebPDataClear(&assembled);
}

/// @brief Decode a WebP to 8-bit RGBA.
inline std::vector<unsigned char> read_webp_pixels(const fs::path& path) {
    const std::vector<unsigned char> bytes = read_file_bytes(path);
    int width = 0, height = 0;
    uint8_t* rgba = WebPDecodeRGBA(bytes.data(), bytes.size(), &width, &height);
    if (!rgba) throw std::runtime_error("cannot decode " + path.string());
    std::vector<unsigned char> pixels(rgba, rgba + static_cast<std::size_t>(width) * height * 4);
    WebPFree(rgba);
    return pixels;
}

// ---------------------------------------------------------------------------
// tiff
// ---------------------------------------------------------------------------

struct TiffOptions {
    bool xmp = false;              ///< XMLPACKET tag
    bool artist = false;           ///< Artist tag
    bool alpha = false;            ///< Unassociated alpha with half-transparent pixels
    std::vector<unsigned char> icc; ///< ICCPROFILE tag when not empty
};

/// @brief Write an 8-bit RGB(A) TIFF, one strip, no compression.
inline void write_tiff(const fs::path& path, const int width, const int height, const TiffOptions& options = {}) {
    TIFF* tif = TIFFOpen(path.c_str(), "w");
    if (!tif) throw std::runtime_error("cannot create " + path.string());

    const int spp = options.alpha ? 4 : 3;
    TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, static_cast<uint32_t>(width));
    TIFFSetField(tif, TIFFTAG_IMAGELENGTH, static_cast<uint32_t>(height));
    TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, spp);
    TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, 8);
    TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_RGB);
    TIFFSetField(tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    TIFFSetField(tif, TIFFTAG_COMPRESSION, COMPRESSION_NONE);
    TIFFSetField(tif, TIFFTAG_ROWSPERSTRIP, static_cast<uint32_t>(height));
    if (options.alpha) {
        uint16_t extra = EXTRASAMPLE_UNASSALPHA;
        TIFFSetField(tif, TIFFTAG_EXTRASAMPLES, 1, &extra);
    }

    const std::string xmp = "<x:xmpmeta xmlns:x=\"adobe:ns:meta/\"><rdf:RDF/></x:xmpmeta>";
    if (options.xmp) {
        TIFFSetField(tif, TIFFTAG_XMLPACKET, static_cast<uint32_t>(xmp.size()), xmp.data());
    }
    if (options.artist) {
        TIFFSetField(tif, TIFFTAG_ARTIST, "Alice Example");
    }
    if (!options.icc.empty()) {
        TIFFSetField(tif, TIFFTAG_ICCPROFILE, static_cast<uint32_t>(options.icc.size()), options.icc.data());
    }

    std::vector<unsigned char> row(static_cast<std::size_t>(width) * spp);
    bool ok = true;
    for (int y = 0; y < height && ok; ++y) {
        for (int x = 0; x < width; ++x) {
            unsigned char* px = &row[static_cast<std::size_t>(x) * spp];
            px[0] = static_cast<unsigned char>(x * 30);
            px[1] = static_cast<unsigned char>(y * 50);
            px[2] = 200;
            if (options.alpha) px[3] = static_cast<unsigned char>((x + y) % 2 ? 128 : 255);
        }
        ok = TIFFWriteScanline(tif, row.data(), static_cast<uint32_t>(y), 0) >= 0;
    }
    ok = ok && TIFFWriteDirectory(tif);
    TIFFClose(tif);
    if (!ok) throw std::runtime_error("cannot write " + path.string());
}

/// @brief Decode the first TIFF directory the way libtiff's RGBA reader presents it.
inline std::vector<uint32_t> read_tiff_pixels(const fs::path& path) {
    TIFF* tif = TIFFOpen(path.c_str(), "r");
    if (!tif) throw std::runtime_error("cannot open " + path.string());
    uint32_t width = 0, height = 0;
    TIFFGetField(tif, TIFFTAG_IMAGEWIDTH, &width);
    TIFFGetField(tif, TIFFTAG_IMAGELENGTH, &height);
    std::vector<uint32_t> raster(static_cast<std::size_t>(width) * height);
    const int ok = TIFFReadRGBAImageOriented(tif, width, height, raster.data(), ORIENTATION_TOPLEFT, 0);
    TIFFClose(tif);
    if (!ok) throw std::runtime_error("cannot decode " + path.string());
    return raster;
}

// ---------------------------------------------------------------------------
// pdf
// ---------------------------------------------------------------------------

struct PdfOptions {
    bool info = true;        ///< Info dictionary with Title/Author/Producer
    bool xmp = true;         ///< Catalog /Metadata stream
    bool annotations = true; ///< One text annotation on the first page
    std::string lang = "en-US"; ///< Catalog /Lang, omitted when empty
    int pages = 1;
};

/**
 * @brief Write a small, well-formed PDF with a correct cross-reference table.
 */
inline void write_pdf(const fs::path& path, const PdfOptions& options = {}) {
    std::vector<std::string> objects;
    const int pages = std::max(1, options.pages);

    // 1 catalog, 2 pages, 3 info, 4 xmp, 5 annotation, 6.. page objects
    const int first_page = 6;
    std::string kids;
    for (int i = 0; i < pages; ++i) {
        kids += std::to_string(first_page + i) + " 0 R ";
    }

    std::string catalog = "<< /Type /Catalog /Pages 2 0 R";
    if (!options.lang.empty()) catalog += " /Lang (" + options.lang + ")";
    if (options.xmp) catalog += " /Metadata 4 0 R";
    catalog += " >>";
    objects.push_back(catalog);
    objects.push_back("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(pages) + " >>");
    objects.push_back("<< /Title (Quarterly plan) /Author (Alice Example) /Producer (TestWriter 1.0) >>");
    const std::string xmp =
        "<?xpacket begin=\"\" id=\"W5M0MpCehiHzreSzNTczkc9d\"?><x:xmpmeta xmlns:x=\"adobe:ns:meta/\"/>"
        "<?xpacket end=\"w\"?>";
    objects.push_back("<< /Type /Metadata /Subtype /XML /Length " + std::to_string(xmp.size()) + " >>\nstream\n" +
                      xmp + "\nendstream");
    objects.push_back("<< /Type /Annot /Subtype /Text /Rect [10 10 30 30] /Contents (reviewer note) >>");
    for (int i = 0; i < pages; ++i) {
        std::string page = "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 200 200]";
        if (options.annotations && i == 0) page += " /Annots [5 0 R]";
        page += " >>";
        objects.push_back(page);
    }

    std::string out = "%PDF-1.4\n";
    std::vector<std::size_t> offsets;
    for (std::size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(out.size());
        out += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }
    const std::size_t xref_at = out.size();
    out += "xref\n0 " + std::to_string(objects.size() + 1) + "\n";
    out += "0000000000 65535 f \n";
    for (const auto off : offsets) {
        char line[32];
        std::snprintf(line, sizeof(line), "%010zu 00000 n \n", off);
        out += line;
    }
    out += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R";
    if (options.info) out += " /Info 3 0 R";
    out += " >>\nstartxref\n" + std::to_string(xref_at) + "\n%%EOF\n";

    write_text(path, out);
}

// ---------------------------------------------------------------------------
// docx
// ---------------------------------------------------------------------------

inline const std::string kWordNs = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

/**
 * @brief Entries of a small .docx with properties, a thumbnail, custom XML,
 * comments and revision tracking switched on.
 */
inline std::vector<ZipFixtureEntry> sample_docx_entries() {
    return {
        {"[Content_Types].xml",
         R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
         R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">)"
         R"(<Default Extension="rels" ContentType="application/vnd.openxmlformats-package.relationships+xml"/>)"
         R"(<Default Extension="xml" ContentType="application/xml"/>)"
         R"(<Default Extension="jpeg" ContentType="image/jpeg"/>)"
         R"(<Override PartName="/word/document.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml"/>)"
         R"(<Override PartName="/word/comments.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.comments+xml"/>)"
         R"(<Override PartName="/word/settings.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.settings+xml"/>)"
         R"(<Override PartName="/docProps/core.xml" ContentType="application/vnd.openxmlformats-package.core-properties+xml"/>)"
         R"(<Override PartName="/docProps/app.xml" ContentType="application/vnd.openxmlformats-officedocument.extended-properties+xml"/>)"
         R"(<Override PartName="/customXml/itemProps1.xml" ContentType="application/vnd.openxmlformats-officedocument.customXmlProperties+xml"/>)"
         R"(</Types>)"},
        {"_rels/.rels",
         R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
         R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
         R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument" Target="word/document.xml"/>)"
         R"(<Relationship Id="rId2" Type="http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties" Target="docProps/core.xml"/>)"
         R"(<Relationship Id="rId3" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/extended-properties" Target="docProps/app.xml"/>)"
         R"(<Relationship Id="rId4" Type="http://schemas.openxmlformats.org/package/2006/relationships/metadata/thumbnail" Target="docProps/thumbnail.jpeg"/>)"
         R"(</Relationships>)"},
        {"docProps/core.xml",
         R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
         R"(<cp:coreProperties xmlns:cp="http://schemas.openxmlformats.org/package/2006/metadata/core-properties" )"
         R"(xmlns:dc="http://purl.org/dc/elements/1.1/" xmlns:dcterms="http://purl.org/dc/terms/">)"
         R"(<dc:title>Budget</dc:title><dc:creator>Alice Example</dc:creator>)"
         R"(<cp:lastModifiedBy>Bob Example</cp:lastModifiedBy><dcterms:created>2024-01-02T03:04:05Z</dcterms:created>)"
         R"(</cp:coreProperties>)"},
        {"docProps/app.xml",
         R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?><Properties><Company>ACME</Company></Properties>)"},
        {"docProps/thumbnail.jpeg", "not really a jpeg"},
        {"word/document.xml",
         R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
         R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main"><w:body><w:p><w:r><w:t>Hello</w:t></w:r></w:p></w:body></w:document>)"},
        {"word/_rels/document.xml.rels",
         R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
         R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
         R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/comments" Target="comments.xml"/>)"
         R"(<Relationship Id="rId2" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/settings" Target="settings.xml"/>)"
         R"(<Relationship Id="rId3" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/customXml" Target="../customXml/item1.xml"/>)"
         R"(<Relationship Id="rId4" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink" Target="https://example.com/customXml/item1.xml" TargetMode="External"/>)"
         R"(</Relationships>)"},
        {"word/comments.xml",
         R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
         R"(<w:comments xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
         R"(<w:comment w:id="0" w:author="Alice Example" w:initials="AE"><w:p><w:r><w:t>Check this</w:t></w:r></w:p></w:comment>)"
         R"(</w:comments>)"},
        {"word/settings.xml",
         R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
         R"(<w:settings xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
         R"(<w:zoom w:percent="100"/><w:trackRevisions/><w:defaultTabStop w:val="720"/></w:settings>)"},
        {"customXml/item1.xml", R"(<?xml version="1.0"?><b:Sources xmlns:b="urn:example"/>)"},
        {"customXml/itemProps1.xml", R"(<?xml version="1.0"?><ds:datastoreItem xmlns:ds="urn:example-ds"/>)"},
        {"customXml/_rels/item1.xml.rels",
         R"(<?xml version="1.0"?><Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
         R"(<Relationship Id="rId1" Type="customXmlProps" Target="itemProps1.xml"/></Relationships>)"},
    };
}

} // namespace unmark::test

#endif // UNMARK_TEST_SUPPORT_HPP
