//
// Created on 22/10/26.
//

#include "../../include/archive_sanitizer.hpp"
#include "../../include/logger.hpp"

namespace unmark {

static const char* sanitizer_tag() {
    return "ArchiveSanitizer";
}

SanitizeReport ArchiveSanitizer::sanitize(const std::filesystem::path& input,
                                          const std::filesystem::path& output) {
    const ArchiveContents contents = codec_.load(input);

    std::vector<std::string> removed;
    if (!contents.trailer.comment.empty()) {
        Logger::log(LogLevel::Debug, "Dropping archive comment (" + std::to_string(contents.trailer.comment.size()) +
                    " bytes)", sanitizer_tag());
        removed.emplace_back("archive comment");
    }
    if (contents.trailer.has_extra_fields || contents.trailer.has_entry_comments) {
        removed.emplace_back("entry extra fields");
    }

    codec_.save(contents, output, WriteCompression::PreserveMethod);

    Logger::log(LogLevel::Info, input.filename().string() + ": " + std::to_string(contents.entries.size()) +
                " entries rewritten", sanitizer_tag());
    return {std::move(removed), std::string(to_string(FileCategory::Zip))};
}

} // namespace unmark
