//
// Created on 27/10/26.
//

#include "image_formats.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <memory>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_GIF
#include <stb/stb_image.h>

namespace {

const char* codec_tag() {
    return "gif";
}

constexpr std::size_t kAppIdLen = 11; // 8-byte identifier + 3-byte auth code

/**
 * @brief Block-level summary of a GIF stream.
 */
struct GifLayout {
    uint32_t width = 0;
    uint32_t height = 0;
    std::size_t frames = 0;
    std::vector<std::string> blocks;
    std::vector<unsigned char> icc_profile;
};

class GifReader {
public:
    explicit GifReader(const std::vector<unsigned char>& bytes) : b_(bytes) {}

    void need(const std::size_t n) const {
        if (pos_ + n > b_.size()) {
            throw unmark::DecodeError("truncated GIF stream");
        }
    }
    unsigned char byte() {
        need(1);
        return b_[pos_++];
    }
    uint16_t le16() {
        need(2);
        const auto v = static_cast<uint16_t>(b_[pos_] | (b_[pos_ + 1] << 8));
        pos_ += 2;
        return v;
    }
    void skip(const std::size_t n) {
        need(n);
        pos_ += n;
    }
    // data sub-blocks up to the zero terminator, appended to sink when given
    void sub_blocks(std::vector<unsigned char>* sink) {
        for (unsigned char len = byte(); len != 0; len = byte()) {
            need(len);
            if (sink) sink->insert(sink->end(), b_.begin() + static_cast<std::ptrdiff_t>(pos_),
                                   b_.begin() + static_cast<std::ptrdiff_t>(pos_ + len));
            pos_ += len;
        }
    }
    [[nodiscard]] std::string text(const std::size_t n) const {
        need(n);
        return {reinterpret_cast<const char*>(b_.data() + pos_), n};
    }

private:
    const std::vector<unsigned char>& b_;
    std::size_t pos_ = 0;
};

void add_block(std::vector<std::string>& blocks, std::string name) {
    if (std::ranges::find(blocks, name) == blocks.end()) {
        blocks.push_back(std::move(name));
    }
}

GifLayout scan_gif(const std::vector<unsigned char>& bytes) {
    GifReader r(bytes);
    const std::string signature = r.text(6);
    if (signature != "GIF87a" && signature != "GIF89a") {
        throw unmark::DecodeError("not a GIF stream");
    }
    r.skip(6);

    GifLayout layout;
    layout.width = r.le16();
    layout.height = r.le16();
    const unsigned char screen_flags = r.byte();
    r.skip(2); // background index, aspect ratio
    if (screen_flags & 0x80) {
        r.skip(3u << ((screen_flags & 0x07) + 1));
    }

    for (;;) {
        const unsigned char introducer = r.byte();
        if (introducer == 0x3B) break;

        if (introducer == 0x2C) {
            ++layout.frames;
            r.skip(8);
            const unsigned char image_flags = r.byte();
            if (image_flags & 0x80) {
                r.skip(3u << ((image_flags & 0x07) + 1));
            }
            r.skip(1); // lzw minimum code size
            r.sub_blocks(nullptr);
            continue;
        }
        if (introducer != 0x21) {
            throw unmark::DecodeError("malformed GIF block");
        }

        const unsigned char label = r.byte();
        if (label == 0xFE) {
            add_block(layout.blocks, "comment");
            r.sub_blocks(nullptr);
        } else if (label == 0x01) {
            add_block(layout.blocks, "plain text");
            r.sub_blocks(nullptr);
        } else if (label == 0xFF) {
            const unsigned char id_len = r.byte();
            const std::string id = r.text(id_len);
            r.skip(id_len);
            if (id_len == kAppIdLen && id == "ICCRGBG1012") {
                r.sub_blocks(&layout.icc_profile);
            } else {
                if (id == "XMP DataXMP") {
                    add_block(layout.blocks, "XMP");
                } else if (id != "NETSCAPE2.0" && id != "ANIMEXTS1.0") {
                    add_block(layout.blocks, "application extension");
                }
                r.sub_blocks(nullptr);
            }
        } else {
            // graphic control and unknown extensions carry no metadata
            r.sub_blocks(nullptr);
        }
    }
    return layout;
}

struct StbiFree {
    void operator()(stbi_uc* p) const { stbi_image_free(p); }
};

} // namespace

namespace unmark::detail {

ImageProbe probe_gif(const std::filesystem::path& path) {
    const GifLayout layout = scan_gif(read_file_bytes(path));

    ImageProbe probe;
    probe.format = ImageFormat::Gif;
    probe.width = layout.width;
    probe.height = layout.height;
    probe.metadata_blocks = layout.blocks;
    if (!layout.icc_profile.empty()) {
        probe.icc_profile = layout.icc_profile;
    }
    return probe;
}

RgbaImage decode_gif(const std::filesystem::path& path) {
    const std::vector<unsigned char> bytes = read_file_bytes(path);
    if (scan_gif(bytes).frames > 1) {
        throw DecodeError("animated GIF is not supported");
    }

    int width = 0, height = 0, channels = 0;
    const std::unique_ptr<stbi_uc, StbiFree> pixels(
        stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()), &width, &height, &channels, 4));
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        Logger::log(LogLevel::Error, path.string() + ": " + (reason ? reason : "unknown error"), codec_tag());
        throw DecodeError(std::string("GIF decode failed: ") + (reason ? reason : "unknown error"));
    }

    RgbaImage image;
    image.width = static_cast<uint32_t>(width);
    image.height = static_cast<uint32_t>(height);
    image.pixels.assign(pixels.get(), pixels.get() + static_cast<std::size_t>(width) * height * 4);
    Logger::log(LogLevel::Debug, "Decoded GIF " + std::to_string(width) + "x" + std::to_string(height), codec_tag());
    return image;
}

} // namespace unmark::detail
