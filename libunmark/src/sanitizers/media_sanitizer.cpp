//
// Created on 22/10/26.
//

#include "../../include/media_sanitizer.hpp"
#include "../../include/logger.hpp"
#include <algorithm>

namespace unmark {

static const char* sanitizer_tag() {
    return "MediaSanitizer";
}

// synthesized by the mov demuxer from the ftyp box, which every output carries
static bool is_structural_tag(const std::string& key) {
    return key == "major_brand" || key == "minor_version" || key == "compatible_brands";
}

/**
 * @brief Describe, from a probe of the source, what the remux leaves out.
 */
static std::vector<std::string> describe_removals(const MediaProbe& probe) {
    std::vector<std::string> removed;

    std::string keys;
    for (const auto& [key, value] : probe.format_tags) {
        if (key == "encoder" || is_structural_tag(key)) continue;
        if (!keys.empty()) keys += ", ";
        keys += key;
    }
    if (!keys.empty()) {
        removed.push_back("container metadata (" + keys + ")");
    }

    if (std::ranges::any_of(probe.streams, [](const MediaStreamInfo& s) { return !s.tags.empty(); })) {
        removed.emplace_back("stream metadata");
    }
    if (probe.chapter_count > 0) {
        removed.push_back("chapters (" + std::to_string(probe.chapter_count) + ")");
    }
    if (const auto pictures = std::ranges::count_if(probe.streams,
                                                    [](const MediaStreamInfo& s) { return s.attached_picture; });
        pictures > 0) {
        removed.push_back("attached pictures (" + std::to_string(pictures) + ")");
    }
    if (!probe.format_tag("encoder").empty()) {
        removed.emplace_back("encoder tag");
    }
    return removed;
}

SanitizeReport MediaSanitizer::sanitize(const std::filesystem::path& input,
                                        const std::filesystem::path& output) {
    const MediaProbe probe = remuxer_.probe(input);
    Logger::log(LogLevel::Debug,
                input.filename().string() + ": " + probe.format_name + ", " + std::to_string(probe.streams.size()) +
                " stream(s)", sanitizer_tag());

    std::vector<std::string> removed = describe_removals(probe);

    remuxer_.remux(input, output, RemuxOptions{});

    Logger::log(LogLevel::Info, input.filename().string() + ": remuxed without metadata", sanitizer_tag());
    return {std::move(removed), std::string(to_string(FileCategory::Video))};
}

} // namespace unmark
