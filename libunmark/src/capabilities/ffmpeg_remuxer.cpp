//
// Created on 22/10/26.
//

#include "../../include/media_remuxer.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <memory>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
}

namespace {

const char* remuxer_tag() {
    return "FfmpegRemuxer";
}

std::string av_error_string(const int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

[[noreturn]] void fail(const std::string& what, const int err) {
    const std::string msg = what + ": " + av_error_string(err);
    Logger::log(LogLevel::Error, msg, remuxer_tag());
    throw unmark::ToolError(msg);
}

// helper: convert an AVDictionary into an ordered tag list
unmark::TagList dict_to_list(const AVDictionary* dict) {
    unmark::TagList result;
    const AVDictionaryEntry* tag = nullptr;
    while ((tag = av_dict_get(dict, "", tag, AV_DICT_IGNORE_SUFFIX))) {
        result.emplace_back(tag->key, tag->value ? tag->value : "");
    }
    return result;
}

struct InputCloser {
    void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
using unique_input = std::unique_ptr<AVFormatContext, InputCloser>;

struct OutputCloser {
    void operator()(AVFormatContext* ctx) const {
        if (!ctx) return;
        if (ctx->pb && !(ctx->oformat->flags & AVFMT_NOFILE)) {
            avio_closep(&ctx->pb);
        }
        avformat_free_context(ctx);
    }
};
using unique_output = std::unique_ptr<AVFormatContext, OutputCloser>;

struct PacketDeleter {
    void operator()(AVPacket* p) const { av_packet_free(&p); }
};
using unique_packet = std::unique_ptr<AVPacket, PacketDeleter>;

unique_input open_input(const std::filesystem::path& path) {
    AVFormatContext* raw = nullptr;
    int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        fail("cannot open " + path.filename().string(), ret);
    }
    unique_input ctx(raw);
    ret = avformat_find_stream_info(ctx.get(), nullptr);
    if (ret < 0) {
        fail("cannot read stream info of " + path.filename().string(), ret);
    }
    return ctx;
}

bool is_attached_picture(const AVStream* st) {
    return (st->disposition & AV_DISPOSITION_ATTACHED_PIC) != 0;
}

void copy_chapters(const AVFormatContext* in, AVFormatContext* out) {
    if (in->nb_chapters == 0) return;
    out->chapters = static_cast<AVChapter**>(av_calloc(in->nb_chapters, sizeof(AVChapter*)));
    if (!out->chapters) {
        throw unmark::ToolError("out of memory copying chapters");
    }
    for (unsigned i = 0; i < in->nb_chapters; ++i) {
        const AVChapter* src = in->chapters[i];
        auto* dst = static_cast<AVChapter*>(av_mallocz(sizeof(AVChapter)));
        if (!dst) {
            throw unmark::ToolError("out of memory copying chapters");
        }
        dst->id = src->id;
        dst->time_base = src->time_base;
        dst->start = src->start;
        dst->end = src->end;
        av_dict_copy(&dst->metadata, src->metadata, 0);
        out->chapters[out->nb_chapters++] = dst;
    }
}

} // namespace

namespace unmark {

std::string MediaProbe::format_tag(const std::string_view key) const {
    const auto iequals = [](const std::string_view a, const std::string_view b) {
        return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](const char x, const char y) {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
    };
    const auto it = std::ranges::find_if(format_tags, [&](const auto& kv) { return iequals(kv.first, key); });
    return it == format_tags.end() ? std::string() : it->second;
}

MediaProbe FfmpegRemuxer::probe(const std::filesystem::path& path) {
    const unique_input in = open_input(path);

    MediaProbe probe;
    probe.format_name = in->iformat->name;
    probe.duration_seconds = in->duration > 0 ? static_cast<double>(in->duration) / AV_TIME_BASE : 0.0;
    probe.bit_rate = in->bit_rate;
    probe.format_tags = dict_to_list(in->metadata);
    probe.chapter_count = in->nb_chapters;

    for (unsigned i = 0; i < in->nb_streams; ++i) {
        const AVStream* st = in->streams[i];
        MediaStreamInfo info;
        info.index = static_cast<int>(i);
        const char* kind = av_get_media_type_string(st->codecpar->codec_type);
        info.kind = kind ? kind : "unknown";
        info.codec = avcodec_get_name(st->codecpar->codec_id);
        info.attached_picture = is_attached_picture(st);
        info.tags = dict_to_list(st->metadata);
        probe.streams.push_back(std::move(info));
    }
    return probe;
}

void FfmpegRemuxer::remux(const std::filesystem::path& input,
                          const std::filesystem::path& output,
                          const RemuxOptions& options) {
    Logger::log(LogLevel::Debug, "Remuxing " + input.string() + " -> " + output.string(), remuxer_tag());

    const unique_input in = open_input(input);

    AVFormatContext* raw_out = nullptr;
    int ret = avformat_alloc_output_context2(&raw_out, nullptr, nullptr, output.c_str());
    if (ret < 0 || !raw_out) {
        fail("cannot create output context for " + output.filename().string(), ret < 0 ? ret : AVERROR_MUXER_NOT_FOUND);
    }
    const unique_output out(raw_out);

    // input stream index -> output stream index, -1 when dropped
    std::vector<int> mapping(in->nb_streams, -1);
    int next_index = 0;
    for (unsigned i = 0; i < in->nb_streams; ++i) {
        const AVStream* in_st = in->streams[i];
        const AVMediaType type = in_st->codecpar->codec_type;
        if (type != AVMEDIA_TYPE_VIDEO && type != AVMEDIA_TYPE_AUDIO && type != AVMEDIA_TYPE_SUBTITLE) {
            continue;
        }
        if (options.drop_attached_pictures && is_attached_picture(in_st)) {
            continue;
        }

        AVStream* out_st = avformat_new_stream(out.get(), nullptr);
        if (!out_st) {
            fail("cannot allocate output stream", AVERROR(ENOMEM));
        }
        ret = avcodec_parameters_copy(out_st->codecpar, in_st->codecpar);
        if (ret < 0) {
            fail("cannot copy codec parameters of stream " + std::to_string(i), ret);
        }
        out_st->codecpar->codec_tag = 0;
        out_st->time_base = in_st->time_base;
        out_st->disposition = in_st->disposition;
        if (!options.drop_stream_metadata) {
            av_dict_copy(&out_st->metadata, in_st->metadata, 0);
        }
        if (options.bitexact) {
            // stream copy has no codec context; the per-stream fingerprint is the encoder tag
            av_dict_set(&out_st->metadata, "encoder", nullptr, 0);
        }
        mapping[i] = next_index++;
    }

    if (next_index == 0) {
        const std::string msg = "no audio, video or subtitle streams in " + input.filename().string();
        Logger::log(LogLevel::Error, msg, remuxer_tag());
        throw ToolError(msg);
    }

    if (!options.drop_global_metadata) {
        av_dict_copy(&out->metadata, in->metadata, 0);
    }
    if (options.clear_encoder_tag) {
        av_dict_set(&out->metadata, "encoder", nullptr, 0);
    }
    if (!options.drop_chapters) {
        copy_chapters(in.get(), out.get());
    }
    if (options.bitexact) {
        out->flags |= AVFMT_FLAG_BITEXACT;
    }

    if (!(out->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&out->pb, output.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            fail("cannot open " + output.string() + " for writing", ret);
        }
    }

    ret = avformat_write_header(out.get(), nullptr);
    if (ret < 0) {
        fail("cannot write header", ret);
    }

    const unique_packet pkt(av_packet_alloc());
    if (!pkt) {
        fail("cannot allocate packet", AVERROR(ENOMEM));
    }
    while ((ret = av_read_frame(in.get(), pkt.get())) >= 0) {
        const int idx = pkt->stream_index;
        if (idx < 0 || static_cast<unsigned>(idx) >= in->nb_streams || mapping[idx] < 0) {
            av_packet_unref(pkt.get());
            continue;
        }
        const AVStream* in_st = in->streams[idx];
        const AVStream* out_st = out->streams[mapping[idx]];
        pkt->stream_index = mapping[idx];
        av_packet_rescale_ts(pkt.get(), in_st->time_base, out_st->time_base);
        pkt->pos = -1;

        ret = av_interleaved_write_frame(out.get(), pkt.get());
        av_packet_unref(pkt.get());
        if (ret < 0) {
            fail("cannot write packet", ret);
        }
    }
    if (ret != AVERROR_EOF) {
        fail("cannot read packet", ret);
    }

    ret = av_write_trailer(out.get());
    if (ret < 0) {
        fail("cannot write trailer", ret);
    }
}

} // namespace unmark
