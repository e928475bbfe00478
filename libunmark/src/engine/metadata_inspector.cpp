//
// Created on 24/10/26.
//

#include "../../include/metadata_inspector.hpp"
#include "../../include/logger.hpp"
#include <pugixml.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <sys/stat.h>

namespace unmark {

namespace {

const char* inspector_tag() {
    return "MetadataInspector";
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += ", ";
        out += p;
    }
    return out;
}

void put(FileDetails& details, std::string key, std::string value) {
    details.metadata.emplace_back(std::move(key), std::move(value));
}

// docProps/core.xml element local name -> reported key
constexpr std::pair<std::string_view, std::string_view> kCoreProperties[] = {
    {"title", "title"},
    {"creator", "creator"},
    {"lastModifiedBy", "last_modified_by"},
    {"created", "created"},
};

} // namespace

std::string FileDetails::value(const std::string_view key) const {
    const auto it = std::ranges::find_if(metadata, [key](const auto& kv) { return kv.first == key; });
    return it == metadata.end() ? std::string() : it->second;
}

MetadataInspector::MetadataInspector(IImageCodec& images, IArchiveCodec& archives, IPdfEngine& pdfs,
                                     IMediaRemuxer& media, TypeClassifier classifier)
    : images_(images), archives_(archives), pdfs_(pdfs), media_(media), classifier_(std::move(classifier)) {}

FileDetails MetadataInspector::inspect(const std::filesystem::path& path) const {
    FileDetails details;
    details.name = path.filename().string();
    details.path = path;

    struct stat st{};
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        put(details, "error", "file not found");
        return details;
    }
    details.exists = true;
    details.size = static_cast<std::uintmax_t>(st.st_size);
    details.mtime = st.st_mtime;

    try {
        details.category = classifier_.classify(path);
        switch (details.category) {
            case FileCategory::Image:  inspect_image(path, details); break;
            case FileCategory::Office: inspect_office(path, details); break;
            case FileCategory::Pdf:    inspect_pdf(path, details); break;
            case FileCategory::Zip:    inspect_zip(path, details); break;
            case FileCategory::Video:  inspect_media(path, details); break;
            case FileCategory::Other:  break;
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, path.string() + ": " + e.what(), inspector_tag());
        put(details, "error", e.what());
    }
    return details;
}

void MetadataInspector::inspect_image(const std::filesystem::path& path, FileDetails& details) const {
    const ImageProbe probe = images_.probe(path);
    put(details, "format", std::string(to_string(probe.format)));
    put(details, "width", std::to_string(probe.width));
    put(details, "height", std::to_string(probe.height));
    put(details, "has_exif", probe.has_block("EXIF") ? "true" : "false");
    put(details, "blocks", join(probe.metadata_blocks));
}

void MetadataInspector::inspect_office(const std::filesystem::path& path, FileDetails& details) const {
    const ArchiveContents contents = archives_.load(path);
    put(details, "entries", std::to_string(contents.entries.size()));

    const ArchiveEntry* core = contents.find("docProps/core.xml");
    if (!core) return;

    pugi::xml_document doc;
    const std::string_view xml = core->text();
    if (!doc.load_buffer(xml.data(), xml.size())) {
        Logger::log(LogLevel::Warning, path.string() + ": docProps/core.xml does not parse", inspector_tag());
        return;
    }
    for (const auto& [element, key] : kCoreProperties) {
        for (const pugi::xml_node child : doc.document_element().children()) {
            std::string_view name = child.name();
            if (const auto colon = name.find(':'); colon != std::string_view::npos) {
                name.remove_prefix(colon + 1);
            }
            if (name == element) {
                put(details, std::string(key), child.child_value());
                break;
            }
        }
    }
}

void MetadataInspector::inspect_pdf(const std::filesystem::path& path, FileDetails& details) const {
    const std::unique_ptr<IPdfDocument> doc = pdfs_.open(path);
    put(details, "title", doc->info_field("Title").value_or(""));
    put(details, "author", doc->info_field("Author").value_or(""));
    put(details, "creator", doc->info_field("Creator").value_or(""));
    put(details, "pages", std::to_string(doc->page_count()));
}

void MetadataInspector::inspect_zip(const std::filesystem::path& path, FileDetails& details) const {
    const ArchiveContents contents = archives_.load(path);
    const auto files = std::ranges::count_if(contents.entries, [](const ArchiveEntry& e) { return !e.is_directory; });
    put(details, "files", std::to_string(files));
    put(details, "comment", contents.trailer.comment);
}

void MetadataInspector::inspect_media(const std::filesystem::path& path, FileDetails& details) const {
    const MediaProbe probe = media_.probe(path);

    std::ostringstream duration;
    duration << std::fixed << std::setprecision(2) << probe.duration_seconds;

    const auto codec_of = [&probe](const std::string_view kind) {
        const auto it = std::ranges::find_if(probe.streams, [kind](const MediaStreamInfo& s) {
            return s.kind == kind && !s.attached_picture;
        });
        return it == probe.streams.end() ? std::string() : it->codec;
    };

    put(details, "format", probe.format_name);
    put(details, "duration", duration.str());
    put(details, "bit_rate", std::to_string(probe.bit_rate));
    put(details, "video_codec", codec_of("video"));
    put(details, "audio_codec", codec_of("audio"));
    put(details, "encoder", probe.format_tag("encoder"));
}

} // namespace unmark
