//
// Created on 22/10/26.
//

#include "../../include/image_sanitizer.hpp"
#include "../../include/logger.hpp"

namespace unmark {

static const char* sanitizer_tag() {
    return "ImageSanitizer";
}

ImageFormat ImageSanitizer::select_target(const ImageFormat probed, const std::filesystem::path& input) {
    if (is_writable(probed)) {
        return probed;
    }
    if (const ImageFormat from_ext = image_format_from_extension(input.extension().string()); is_writable(from_ext)) {
        return from_ext;
    }
    return ImageFormat::Png;
}

SanitizeReport ImageSanitizer::sanitize(const std::filesystem::path& input,
                                        const std::filesystem::path& output) {
    const ImageProbe probe = codec_.probe(input);
    const ImageFormat target = select_target(probe.format, input);

    Logger::log(LogLevel::Debug,
                input.filename().string() + ": " + std::string(to_string(probe.format)) + " " +
                std::to_string(probe.width) + "x" + std::to_string(probe.height) + " -> " +
                std::string(to_string(target)) + (probe.icc_profile ? ", keeping ICC profile" : ""),
                sanitizer_tag());

    codec_.reencode(input, output, target, probe.icc_profile);

    return {probe.metadata_blocks, std::string(to_string(FileCategory::Image))};
}

} // namespace unmark
