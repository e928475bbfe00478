//
// Created on 21/10/26.
//

#include "image_formats.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <tiffio.h>
#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <memory>

namespace {

const char* codec_tag() {
    return "libtiff";
}

struct TiffCloser {
    void operator()(TIFF* t) const { if (t) TIFFClose(t); }
};
using unique_TIFF = std::unique_ptr<TIFF, TiffCloser>;

void tiff_log_handler(const LogLevel level, const char* module, const char* fmt, va_list ap) {
    char buf[1024];
    std::vsnprintf(buf, sizeof(buf), fmt, ap);
    Logger::log(level, std::string(module ? module : "") + ": " + buf, codec_tag());
}

void tiff_warning(const char* module, const char* fmt, va_list ap) {
    tiff_log_handler(LogLevel::Warning, module, fmt, ap);
}

void tiff_error(const char* module, const char* fmt, va_list ap) {
    tiff_log_handler(LogLevel::Error, module, fmt, ap);
}

void install_handlers() {
    static const bool installed = [] {
        TIFFSetWarningHandler(tiff_warning);
        TIFFSetErrorHandler(tiff_error);
        return true;
    }();
    (void)installed;
}

unique_TIFF open_tiff(const std::filesystem::path& path, const char* mode) {
    install_handlers();
    unique_TIFF t(TIFFOpen(path.c_str(), mode));
    if (!t) {
        throw unmark::DecodeError("cannot open TIFF " + path.filename().string());
    }
    return t;
}

void add_block(std::vector<std::string>& blocks, std::string name) {
    if (std::ranges::find(blocks, name) == blocks.end()) {
        blocks.push_back(std::move(name));
    }
}

struct NamedTag {
    ttag_t tag;
    const char* name;
};

// ascii tags carrying authorship or provenance
constexpr NamedTag kTextTags[] = {
    {TIFFTAG_ARTIST, "Artist"},
    {TIFFTAG_COPYRIGHT, "Copyright"},
    {TIFFTAG_DATETIME, "DateTime"},
    {TIFFTAG_DOCUMENTNAME, "DocumentName"},
    {TIFFTAG_HOSTCOMPUTER, "HostComputer"},
    {TIFFTAG_IMAGEDESCRIPTION, "ImageDescription"},
    {TIFFTAG_MAKE, "Make"},
    {TIFFTAG_MODEL, "Model"},
    {TIFFTAG_SOFTWARE, "Software"},
};

void write_rgba_directory(TIFF* out, const uint32_t width, const uint32_t height, const unsigned char* pixels,
                          uint16_t extra_samples, const std::optional<std::vector<unsigned char>>& icc_profile,
                          const std::filesystem::path& output) {
    TIFFSetField(out, TIFFTAG_IMAGEWIDTH, width);
    TIFFSetField(out, TIFFTAG_IMAGELENGTH, height);
    TIFFSetField(out, TIFFTAG_SAMPLESPERPIXEL, 4);
    TIFFSetField(out, TIFFTAG_BITSPERSAMPLE, 8);
    TIFFSetField(out, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_RGB);
    TIFFSetField(out, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    TIFFSetField(out, TIFFTAG_ORIENTATION, ORIENTATION_TOPLEFT);
    TIFFSetField(out, TIFFTAG_COMPRESSION, COMPRESSION_ADOBE_DEFLATE);
    TIFFSetField(out, TIFFTAG_PREDICTOR, 2);
    TIFFSetField(out, TIFFTAG_ROWSPERSTRIP, TIFFDefaultStripSize(out, 0));
    TIFFSetField(out, TIFFTAG_EXTRASAMPLES, 1, &extra_samples);

    if (icc_profile && !icc_profile->empty()) {
        TIFFSetField(out, TIFFTAG_ICCPROFILE, static_cast<uint32_t>(icc_profile->size()), icc_profile->data());
    }

    // the horizontal predictor encodes the scanline buffer in place
    std::vector<unsigned char> row_buf(static_cast<size_t>(width) * 4);
    for (uint32_t row = 0; row < height; ++row) {
        const unsigned char* src = pixels + static_cast<size_t>(row) * width * 4;
        std::copy_n(src, row_buf.size(), row_buf.begin());
        if (TIFFWriteScanline(out, row_buf.data(), row, 0) < 0) {
            throw unmark::IoError("cannot write TIFF scanline to " + output.string());
        }
    }

    if (!TIFFWriteDirectory(out)) {
        throw unmark::IoError("cannot write TIFF directory to " + output.string());
    }
}

} // namespace

namespace unmark::detail {

ImageProbe probe_tiff(const std::filesystem::path& path) {
    const unique_TIFF in = open_tiff(path, "r");

    ImageProbe probe;
    probe.format = ImageFormat::Tiff;
    TIFFGetField(in.get(), TIFFTAG_IMAGEWIDTH, &probe.width);
    TIFFGetField(in.get(), TIFFTAG_IMAGELENGTH, &probe.height);

    uint32_t icc_len = 0;
    void* icc_data = nullptr;
    if (TIFFGetField(in.get(), TIFFTAG_ICCPROFILE, &icc_len, &icc_data) && icc_len > 0) {
        const auto* p = static_cast<const unsigned char*>(icc_data);
        probe.icc_profile = std::vector<unsigned char>(p, p + icc_len);
    }

    do {
        toff_t offset = 0;
        if (TIFFGetField(in.get(), TIFFTAG_EXIFIFD, &offset)) add_block(probe.metadata_blocks, "EXIF");
        if (TIFFGetField(in.get(), TIFFTAG_GPSIFD, &offset)) add_block(probe.metadata_blocks, "GPS");

        uint32_t len = 0;
        void* data = nullptr;
        if (TIFFGetField(in.get(), TIFFTAG_XMLPACKET, &len, &data)) add_block(probe.metadata_blocks, "XMP");
        if (TIFFGetField(in.get(), TIFFTAG_RICHTIFFIPTC, &len, &data)) add_block(probe.metadata_blocks, "IPTC");
        if (TIFFGetField(in.get(), TIFFTAG_PHOTOSHOP, &len, &data)) add_block(probe.metadata_blocks, "Photoshop resources");

        for (const auto& [tag, name] : kTextTags) {
            char* value = nullptr;
            if (TIFFGetField(in.get(), tag, &value) && value && *value) {
                add_block(probe.metadata_blocks, name);
            }
        }
    } while (TIFFReadDirectory(in.get()));

    return probe;
}

void strip_tiff(const std::filesystem::path& input, const std::filesystem::path& output,
                const std::optional<std::vector<unsigned char>>& icc_profile) {
    Logger::log(LogLevel::Debug, "TIFF re-encode: " + input.string(), codec_tag());

    const unique_TIFF in = open_tiff(input, "r");
    unique_TIFF out(TIFFOpen(output.c_str(), "w"));
    if (!out) {
        throw IoError("cannot create " + output.string());
    }

    do {
        uint32_t width = 0, height = 0;
        TIFFGetField(in.get(), TIFFTAG_IMAGEWIDTH, &width);
        TIFFGetField(in.get(), TIFFTAG_IMAGELENGTH, &height);

        std::vector<uint32_t> raster(static_cast<size_t>(width) * static_cast<size_t>(height));
        if (raster.empty()) {
            Logger::log(LogLevel::Debug, "Skipping empty TIFF directory", codec_tag());
            continue;
        }

        // read full image into rgba, handles every photometric/compression libtiff knows
        if (!TIFFReadRGBAImageOriented(in.get(), width, height, raster.data(), ORIENTATION_TOPLEFT, 0)) {
            throw DecodeError("cannot decode TIFF image data");
        }

        // the RGBA reader premultiplies unassociated alpha
        write_rgba_directory(out.get(), width, height, reinterpret_cast<const unsigned char*>(raster.data()),
                             EXTRASAMPLE_ASSOCALPHA, icc_profile, output);
    } while (TIFFReadDirectory(in.get()));
}

void write_tiff_rgba(const RgbaImage& image, const std::filesystem::path& output,
                     const std::optional<std::vector<unsigned char>>& icc_profile) {
    Logger::log(LogLevel::Debug, "TIFF encode -> " + output.string(), codec_tag());

    install_handlers();
    const unique_TIFF out(TIFFOpen(output.c_str(), "w"));
    if (!out) {
        throw IoError("cannot create " + output.string());
    }
    write_rgba_directory(out.get(), image.width, image.height, image.pixels.data(), EXTRASAMPLE_UNASSALPHA,
                         icc_profile, output);
}

} // namespace unmark::detail
