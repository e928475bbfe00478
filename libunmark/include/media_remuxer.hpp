//
// Created on 22/10/26.
//

/**
 * @file media_remuxer.hpp
 * @brief Audio/video container probe and stream-copy remux capability.
 */

#ifndef UNMARK_MEDIA_REMUXER_HPP
#define UNMARK_MEDIA_REMUXER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace unmark {

using TagList = std::vector<std::pair<std::string, std::string>>;

struct MediaStreamInfo {
    int index = 0;
    std::string kind;   ///< "video", "audio", "subtitle", "data", "attachment"
    std::string codec;  ///< Codec name as reported by the demuxer
    bool attached_picture = false; ///< Cover art carried as a single-frame video stream
    TagList tags;
};

/**
 * @brief Container-level facts about a media file.
 */
struct MediaProbe {
    std::string format_name;
    double duration_seconds = 0.0;
    int64_t bit_rate = 0;
    TagList format_tags;
    std::vector<MediaStreamInfo> streams;
    std::size_t chapter_count = 0;

    /// @return Value of the first format tag named @p key (case-insensitive), or "".
    [[nodiscard]] std::string format_tag(std::string_view key) const;
};

/**
 * @brief What a remux leaves out.
 */
struct RemuxOptions {
    bool drop_global_metadata = true;
    bool drop_stream_metadata = true;
    bool drop_chapters = true;
    bool drop_attached_pictures = true;
    bool clear_encoder_tag = true;
    bool bitexact = true;
};

class IMediaRemuxer {
public:
    virtual ~IMediaRemuxer() = default;

    /**
     * @brief Read container, stream and chapter information.
     * @throws ToolError with the demuxer's message if the file cannot be opened.
     */
    virtual MediaProbe probe(const std::filesystem::path& path) = 0;

    /**
     * @brief Copy audio, video and subtitle packets into a new container,
     * without re-encoding. The output format follows the output extension.
     * @throws ToolError with the muxer's message verbatim on any failure.
     */
    virtual void remux(const std::filesystem::path& input,
                       const std::filesystem::path& output,
                       const RemuxOptions& options) = 0;
};

/**
 * @brief IMediaRemuxer bound to FFmpeg's libavformat.
 */
class FfmpegRemuxer final : public IMediaRemuxer {
public:
    MediaProbe probe(const std::filesystem::path& path) override;
    void remux(const std::filesystem::path& input,
               const std::filesystem::path& output,
               const RemuxOptions& options) override;
};

} // namespace unmark

#endif // UNMARK_MEDIA_REMUXER_HPP
