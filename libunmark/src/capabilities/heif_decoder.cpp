//
// Created on 27/10/26.
//

#include "image_formats.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <memory>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libswscale/swscale.h>
}

namespace {

const char* decoder_tag() {
    return "HeifDecoder";
}

std::string av_error_string(const int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

[[noreturn]] void fail(const std::string& what, const int err) {
    const std::string msg = what + ": " + av_error_string(err);
    Logger::log(LogLevel::Error, msg, decoder_tag());
    throw unmark::DecodeError(msg);
}

struct InputCloser {
    void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
struct CodecCloser {
    void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct FrameDeleter {
    void operator()(AVFrame* f) const { av_frame_free(&f); }
};
struct PacketDeleter {
    void operator()(AVPacket* p) const { av_packet_free(&p); }
};
struct SwsDeleter {
    void operator()(SwsContext* s) const { sws_freeContext(s); }
};

/**
 * @brief An opened still-image container and the index of its picture stream.
 */
struct StillInput {
    std::unique_ptr<AVFormatContext, InputCloser> ctx;
    int stream = -1;
};

StillInput open_still(const std::filesystem::path& path) {
    AVFormatContext* raw = nullptr;
    int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        fail("cannot open " + path.filename().string(), ret);
    }
    StillInput in;
    in.ctx.reset(raw);
    ret = avformat_find_stream_info(in.ctx.get(), nullptr);
    if (ret < 0) {
        fail("cannot read stream info of " + path.filename().string(), ret);
    }

    unsigned pictures = 0;
    for (unsigned i = 0; i < in.ctx->nb_streams; ++i) {
        if (in.ctx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) ++pictures;
    }
    // grids and image sequences expose one stream per tile or item
    if (pictures > 1) {
        throw unmark::DecodeError("multi-image HEIF/AVIF files are not supported");
    }

    in.stream = av_find_best_stream(in.ctx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (in.stream < 0) {
        fail("no picture in " + path.filename().string(), in.stream);
    }
    return in;
}

} // namespace

namespace unmark::detail {

ImageProbe probe_heif(const std::filesystem::path& path, const ImageFormat format) {
    const StillInput in = open_still(path);
    const AVCodecParameters* par = in.ctx->streams[in.stream]->codecpar;

    ImageProbe probe;
    probe.format = format;
    probe.width = static_cast<uint32_t>(par->width);
    probe.height = static_cast<uint32_t>(par->height);

    const AVDictionaryEntry* tag = nullptr;
    while ((tag = av_dict_get(in.ctx->metadata, "", tag, AV_DICT_IGNORE_SUFFIX))) {
        const std::string_view key = tag->key;
        if (key != "major_brand" && key != "minor_version" && key != "compatible_brands") {
            probe.metadata_blocks.emplace_back("container metadata");
            break;
        }
    }
    return probe;
}

RgbaImage decode_heif(const std::filesystem::path& path) {
    const StillInput in = open_still(path);
    const AVStream* st = in.ctx->streams[in.stream];

    const AVCodec* codec = avcodec_find_decoder(st->codecpar->codec_id);
    if (!codec) {
        throw DecodeError(std::string("no decoder for ") + avcodec_get_name(st->codecpar->codec_id));
    }
    const std::unique_ptr<AVCodecContext, CodecCloser> dec(avcodec_alloc_context3(codec));
    if (!dec) {
        fail("cannot allocate decoder", AVERROR(ENOMEM));
    }
    int ret = avcodec_parameters_to_context(dec.get(), st->codecpar);
    if (ret < 0) {
        fail("cannot configure decoder", ret);
    }
    ret = avcodec_open2(dec.get(), codec, nullptr);
    if (ret < 0) {
        fail("cannot open decoder", ret);
    }

    const std::unique_ptr<AVPacket, PacketDeleter> pkt(av_packet_alloc());
    const std::unique_ptr<AVFrame, FrameDeleter> frame(av_frame_alloc());
    if (!pkt || !frame) {
        fail("cannot allocate frame", AVERROR(ENOMEM));
    }

    bool have_frame = false;
    bool flushing = false;
    while (!have_frame) {
        if (!flushing) {
            ret = av_read_frame(in.ctx.get(), pkt.get());
            if (ret == AVERROR_EOF) {
                flushing = true;
                ret = avcodec_send_packet(dec.get(), nullptr);
            } else if (ret < 0) {
                fail("cannot read picture data", ret);
            } else if (pkt->stream_index != in.stream) {
                av_packet_unref(pkt.get());
                continue;
            } else {
                ret = avcodec_send_packet(dec.get(), pkt.get());
                av_packet_unref(pkt.get());
            }
            if (ret < 0 && ret != AVERROR(EAGAIN)) {
                fail("cannot decode picture", ret);
            }
        }

        ret = avcodec_receive_frame(dec.get(), frame.get());
        if (ret == 0) {
            have_frame = true;
        } else if (ret == AVERROR_EOF) {
            throw DecodeError("no picture decoded from " + path.filename().string());
        } else if (ret != AVERROR(EAGAIN)) {
            fail("cannot decode picture", ret);
        } else if (flushing) {
            throw DecodeError("no picture decoded from " + path.filename().string());
        }
    }

    RgbaImage image;
    image.width = static_cast<uint32_t>(frame->width);
    image.height = static_cast<uint32_t>(frame->height);
    image.pixels.resize(static_cast<std::size_t>(frame->width) * frame->height * 4);

    const std::unique_ptr<SwsContext, SwsDeleter> sws(
        sws_getContext(frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
                       frame->width, frame->height, AV_PIX_FMT_RGBA, SWS_BICUBIC, nullptr, nullptr, nullptr));
    if (!sws) {
        throw DecodeError("no RGBA conversion for pixel format " +
                          std::to_string(frame->format));
    }
    uint8_t* dst[4] = {image.pixels.data(), nullptr, nullptr, nullptr};
    const int dst_stride[4] = {frame->width * 4, 0, 0, 0};
    if (sws_scale(sws.get(), frame->data, frame->linesize, 0, frame->height, dst, dst_stride) != frame->height) {
        throw DecodeError("RGBA conversion failed");
    }

    Logger::log(LogLevel::Debug, "Decoded " + std::string(codec->name) + " still " +
                std::to_string(image.width) + "x" + std::to_string(image.height), decoder_tag());
    return image;
}

} // namespace unmark::detail
