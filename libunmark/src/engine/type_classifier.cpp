//
// Created on 23/10/26.
//

#include "../../include/type_classifier.hpp"
#include "../../include/archive_codec.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/office_sanitizer.hpp"
#include <algorithm>

namespace unmark {

static const char* classifier_tag() {
    return "TypeClassifier";
}

TypeClassifier::TypeClassifier() : sniffer_(&MimeDetector::detect) {}

TypeClassifier::TypeClassifier(MimeSniffer sniffer) : sniffer_(std::move(sniffer)) {}

bool zip_lacks_part(const std::filesystem::path& path, const std::string_view part_name) {
    std::vector<unsigned char> bytes;
    try {
        bytes = read_file_bytes(path);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Debug, std::string("zip probe skipped: ") + e.what(), classifier_tag());
        return false;
    }
    const bool is_zip = bytes.size() >= 4 && bytes[0] == 'P' && bytes[1] == 'K' &&
                        ((bytes[2] == 3 && bytes[3] == 4) || (bytes[2] == 5 && bytes[3] == 6));
    if (!is_zip) return false;
    const std::vector<std::string> names = zip_entry_names(bytes);
    return std::ranges::find(names, part_name) == names.end();
}

FileCategory TypeClassifier::classify(const std::filesystem::path& path) const {
    const std::string ext = lower_extension(path.filename().string());
    const std::string mime = sniffer_ ? sniffer_(path) : std::string();
    Logger::log(LogLevel::Debug, path.filename().string() + ": ext='" + ext + "' mime='" + mime + "'",
                classifier_tag());

    if (contains(image_extensions, ext) || mime.starts_with("image/")) {
        return FileCategory::Image;
    }
    if (contains(pdf_extensions, ext) || mime == "application/pdf") {
        return FileCategory::Pdf;
    }
    if (contains(office_extensions, ext) || contains(office_mime_types, mime)) {
        // structure wins over a misleading extension, OLE2 stays office to be rejected there
        if (contains(office_extensions, ext) && !has_ole2_signature(path) &&
            zip_lacks_part(path, "[Content_Types].xml")) {
            Logger::log(LogLevel::Warning,
                        path.filename().string() + " has an office extension but no [Content_Types].xml; "
                        "treating it as a plain zip archive", classifier_tag());
            return FileCategory::Zip;
        }
        return FileCategory::Office;
    }
    if (contains(zip_extensions, ext) || contains(zip_mime_types, mime)) {
        return FileCategory::Zip;
    }
    if (contains(video_extensions, ext) || mime.starts_with("video/") || mime.starts_with("audio/")) {
        return FileCategory::Video;
    }
    return FileCategory::Other;
}

} // namespace unmark
