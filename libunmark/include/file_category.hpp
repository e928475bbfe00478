//
// Created on 19/10/26.
//

/**
 * @file file_category.hpp
 * @brief The FileCategory enumeration and the extension/MIME tables behind it.
 */

#ifndef UNMARK_FILE_CATEGORY_HPP
#define UNMARK_FILE_CATEGORY_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace unmark {

/**
 * @brief Broad family of a file; selects the sanitizer that handles it.
 *
 * Video also covers audio-only media containers: both go through the same
 * stream-copy remux.
 */
enum class FileCategory {
    Image,
    Office,
    Pdf,
    Zip,
    Video,
    Other
};

/// @return Lower-case tag used in results and reports ("image", "office", ...).
constexpr std::string_view to_string(const FileCategory category) noexcept {
    switch (category) {
        case FileCategory::Image:  return "image";
        case FileCategory::Office: return "office";
        case FileCategory::Pdf:    return "pdf";
        case FileCategory::Zip:    return "zip";
        case FileCategory::Video:  return "video";
        case FileCategory::Other:  return "other";
    }
    return "other";
}

/// @return Category for a tag produced by to_string(), if any.
inline std::optional<FileCategory> parse_file_category(const std::string_view tag) {
    for (const auto c : {FileCategory::Image, FileCategory::Office, FileCategory::Pdf,
                         FileCategory::Zip, FileCategory::Video, FileCategory::Other}) {
        if (to_string(c) == tag) return c;
    }
    return std::nullopt;
}

///< Extensions recognized per category (lower case, leading dot).
inline constexpr std::array<std::string_view, 9> image_extensions = {
    ".jpg", ".jpeg", ".png", ".webp", ".tif", ".tiff", ".gif", ".avif", ".heic"
};
inline constexpr std::array<std::string_view, 6> office_extensions = {
    ".docx", ".xlsx", ".pptx", ".doc", ".xls", ".ppt"
};
inline constexpr std::array<std::string_view, 3> legacy_office_extensions = {
    ".doc", ".xls", ".ppt"
};
inline constexpr std::array<std::string_view, 1> pdf_extensions = { ".pdf" };
inline constexpr std::array<std::string_view, 1> zip_extensions = { ".zip" };
inline constexpr std::array<std::string_view, 12> video_extensions = {
    ".mp4", ".mkv", ".mov", ".avi", ".wmv", ".flv", ".webm",
    ".m4a", ".mp3", ".flac", ".ogg", ".wav"
};

///< MIME types sniffed for office packages, modern and legacy.
inline constexpr std::array<std::string_view, 6> office_mime_types = {
    "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
    "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
    "application/vnd.openxmlformats-officedocument.presentationml.presentation",
    "application/msword",
    "application/vnd.ms-excel",
    "application/vnd.ms-powerpoint"
};

inline constexpr std::array<std::string_view, 3> zip_mime_types = {
    "application/zip", "application/x-zip-compressed", "application/x-zip"
};

/// @return The extension of a path, lower-cased, with its leading dot ("" if none).
inline std::string lower_extension(const std::string_view filename) {
    const auto dot = filename.find_last_of('.');
    const auto slash = filename.find_last_of("/\\");
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
        return {};
    }
    std::string ext(filename.substr(dot));
    std::ranges::transform(ext, ext.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

/// @return True if @p value is one of @p set (exact match).
template <std::size_t N>
constexpr bool contains(const std::array<std::string_view, N>& set, const std::string_view value) {
    return std::ranges::find(set, value) != set.end();
}

} // namespace unmark

#endif // UNMARK_FILE_CATEGORY_HPP
