//
// Created on 22/10/26.
//

#include "../../include/pdf_sanitizer.hpp"
#include "../../include/logger.hpp"

namespace unmark {

static const char* sanitizer_tag() {
    return "PdfSanitizer";
}

SanitizeReport PdfSanitizer::sanitize(const std::filesystem::path& input,
                                      const std::filesystem::path& output) {
    const std::unique_ptr<IPdfDocument> doc = engine_.open(input);

    std::vector<std::string> removed;
    for (const auto field : kInfoFields) {
        const std::optional<std::string> value = doc->info_field(field);
        if (value && !value->empty()) {
            removed.push_back("Info/" + std::string(field));
        }
        doc->set_info_field(field, "");
    }
    if (const std::optional<std::string> lang = doc->language(); lang && !lang->empty()) {
        removed.emplace_back("Lang");
    }
    doc->set_language("");

    if (doc->has_xmp_metadata()) {
        doc->remove_xmp_metadata();
        removed.emplace_back("XMP metadata");
    }

    std::size_t annotated_pages = 0;
    for (std::size_t i = 0; i < doc->page_count(); ++i) {
        if (doc->annotation_count(i) > 0) {
            ++annotated_pages;
        }
        doc->remove_annotations(i);
    }
    if (annotated_pages > 0) {
        removed.push_back("annotations (" + std::to_string(annotated_pages) + " pages)");
    }

    doc->save(output);

    Logger::log(LogLevel::Info, input.filename().string() + ": " + std::to_string(doc->page_count()) +
                " page(s), " + std::to_string(removed.size()) + " item(s) removed", sanitizer_tag());
    return {std::move(removed), std::string(to_string(FileCategory::Pdf))};
}

} // namespace unmark
