//
// Created on 22/10/26.
//

/**
 * @file media_sanitizer.hpp
 * @brief Defines the ISanitizer implementation for audio and video containers.
 */

#ifndef UNMARK_MEDIA_SANITIZER_HPP
#define UNMARK_MEDIA_SANITIZER_HPP

#include "media_remuxer.hpp"
#include "sanitizer.hpp"

namespace unmark {

/**
 * @brief Implements ISanitizer for media containers by stream-copy remux.
 *
 * @details Global tags, per-stream tags, chapters, cover art and the
 * encoder tag are left out; packets are copied without re-encoding and
 * the muxer runs in bit-exact mode.
 */
class MediaSanitizer final : public ISanitizer {
public:
    explicit MediaSanitizer(IMediaRemuxer& remuxer) : remuxer_(remuxer) {}

    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "MediaSanitizer";
    }

    [[nodiscard]] FileCategory get_category() const noexcept override {
        return FileCategory::Video;
    }

    /**
     * @throws ToolError carrying the remuxer's message.
     */
    SanitizeReport sanitize(const std::filesystem::path& input,
                            const std::filesystem::path& output) override;

private:
    IMediaRemuxer& remuxer_;
};

} // namespace unmark

#endif // UNMARK_MEDIA_SANITIZER_HPP
