//
// Created on 23/10/26.
//

#include "../../include/sanitizer_registry.hpp"
#include "../../include/archive_sanitizer.hpp"
#include "../../include/image_sanitizer.hpp"
#include "../../include/logger.hpp"
#include "../../include/media_sanitizer.hpp"
#include "../../include/office_sanitizer.hpp"
#include "../../include/pdf_sanitizer.hpp"
#include <algorithm>

namespace unmark {

SanitizerRegistry::SanitizerRegistry()
    : archive_codec_(std::make_unique<LibarchiveCodec>()),
      pdf_engine_(std::make_unique<QpdfEngine>()),
      image_codec_(std::make_unique<NativeImageCodec>()),
      media_remuxer_(std::make_unique<FfmpegRemuxer>()) {
    sanitizers_.push_back(std::make_unique<ImageSanitizer>(*image_codec_));
    sanitizers_.push_back(std::make_unique<PdfSanitizer>(*pdf_engine_));
    sanitizers_.push_back(std::make_unique<OfficeSanitizer>(*archive_codec_));
    sanitizers_.push_back(std::make_unique<ArchiveSanitizer>(*archive_codec_));
    sanitizers_.push_back(std::make_unique<MediaSanitizer>(*media_remuxer_));
}

void SanitizerRegistry::add(std::unique_ptr<ISanitizer> sanitizer) {
    const FileCategory category = sanitizer->get_category();
    const auto it = std::ranges::find_if(sanitizers_, [category](const auto& s) {
        return s->get_category() == category;
    });
    if (it != sanitizers_.end()) {
        Logger::log(LogLevel::Debug, "Replacing " + std::string((*it)->get_name()) + " with " +
                    std::string(sanitizer->get_name()), "SanitizerRegistry");
        *it = std::move(sanitizer);
    } else {
        sanitizers_.push_back(std::move(sanitizer));
    }
}

ISanitizer* SanitizerRegistry::find(const FileCategory category) const {
    for (const auto& s : sanitizers_) {
        if (s->get_category() == category) {
            return s.get();
        }
    }
    return nullptr;
}

} // namespace unmark
