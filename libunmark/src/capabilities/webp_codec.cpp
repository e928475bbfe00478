//
// Created on 21/10/26.
//

#include "image_formats.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <webp/mux.h>
#include <memory>

namespace {

const char* codec_tag() {
    return "libwebp";
}

struct MuxDeleter {
    void operator()(WebPMux* m) const { if (m) WebPMuxDelete(m); }
};
using unique_mux = std::unique_ptr<WebPMux, MuxDeleter>;

struct WebPFreeDeleter {
    void operator()(uint8_t* p) const { WebPFree(p); }
};

unique_mux open_mux(const std::vector<unsigned char>& bytes, const bool copy) {
    const WebPData data{bytes.data(), bytes.size()};
    unique_mux mux(WebPMuxCreate(&data, copy ? 1 : 0));
    if (!mux) {
        throw unmark::DecodeError("WebP container could not be parsed");
    }
    return mux;
}

bool has_chunk(WebPMux* mux, const char* fourcc) {
    WebPData chunk;
    return WebPMuxGetChunk(mux, fourcc, &chunk) == WEBP_MUX_OK;
}

void set_icc(WebPMux* mux, const std::optional<std::vector<unsigned char>>& icc_profile) {
    if (icc_profile && !icc_profile->empty()) {
        const WebPData icc{icc_profile->data(), icc_profile->size()};
        if (WebPMuxSetChunk(mux, "ICCP", &icc, 1) != WEBP_MUX_OK) {
            throw unmark::DecodeError("cannot attach ICC profile to WebP");
        }
    }
}

void write_assembled(WebPMux* mux, const std::filesystem::path& output) {
    WebPData assembled;
    WebPDataInit(&assembled);
    const WebPMuxError err = WebPMuxAssemble(mux, &assembled);
    if (err != WEBP_MUX_OK) {
        Logger::log(LogLevel::Error, "WebPMuxAssemble failed: " + std::to_string(err), codec_tag());
        throw unmark::DecodeError("WebP reassembly failed");
    }
    try {
        unmark::write_file_bytes(output, assembled.bytes, assembled.size);
    } catch (...) {
        WebPDataClear(&assembled);
        throw;
    }
    WebPDataClear(&assembled);
}

} // namespace

namespace unmark::detail {

ImageProbe probe_webp(const std::filesystem::path& path) {
    const std::vector<unsigned char> bytes = read_file_bytes(path);

    WebPBitstreamFeatures features;
    if (WebPGetFeatures(bytes.data(), bytes.size(), &features) != VP8_STATUS_OK) {
        throw DecodeError("WebP feature detection failed");
    }

    ImageProbe probe;
    probe.format = ImageFormat::Webp;
    probe.width = static_cast<uint32_t>(features.width);
    probe.height = static_cast<uint32_t>(features.height);

    const unique_mux mux = open_mux(bytes, false);
    if (has_chunk(mux.get(), "EXIF")) probe.metadata_blocks.emplace_back("EXIF");
    if (has_chunk(mux.get(), "XMP ")) probe.metadata_blocks.emplace_back("XMP");

    WebPData icc;
    if (WebPMuxGetChunk(mux.get(), "ICCP", &icc) == WEBP_MUX_OK && icc.size > 0) {
        probe.icc_profile = std::vector<unsigned char>(icc.bytes, icc.bytes + icc.size);
    }
    return probe;
}

void strip_webp(const std::filesystem::path& input, const std::filesystem::path& output,
                const std::optional<std::vector<unsigned char>>& icc_profile) {
    Logger::log(LogLevel::Debug, "WebP chunk rewrite: " + input.string(), codec_tag());

    const std::vector<unsigned char> bytes = read_file_bytes(input);
    const unique_mux mux = open_mux(bytes, true);

    for (const char* fourcc : {"EXIF", "XMP ", "ICCP"}) {
        const WebPMuxError del = WebPMuxDeleteChunk(mux.get(), fourcc);
        if (del != WEBP_MUX_OK && del != WEBP_MUX_NOT_FOUND) {
            throw DecodeError(std::string("cannot remove WebP chunk ") + fourcc);
        }
    }

    set_icc(mux.get(), icc_profile);
    write_assembled(mux.get(), output);
}

void write_webp_rgba(const RgbaImage& image, const std::filesystem::path& output,
                     const std::optional<std::vector<unsigned char>>& icc_profile) {
    Logger::log(LogLevel::Debug, "WebP lossless encode -> " + output.string(), codec_tag());

    uint8_t* encoded = nullptr;
    const std::size_t size = WebPEncodeLosslessRGBA(image.pixels.data(), static_cast<int>(image.width),
                                                    static_cast<int>(image.height),
                                                    static_cast<int>(image.width) * 4, &encoded);
    const std::unique_ptr<uint8_t, WebPFreeDeleter> owned(encoded);
    if (size == 0 || !owned) {
        throw DecodeError("WebP lossless encoding failed");
    }

    const WebPData bitstream{owned.get(), size};
    const unique_mux mux(WebPMuxCreate(&bitstream, 1));
    if (!mux) {
        throw DecodeError("WebP container could not be built");
    }
    set_icc(mux.get(), icc_profile);
    write_assembled(mux.get(), output);
}

} // namespace unmark::detail
