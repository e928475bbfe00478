//
// Created on 22/10/26.
//

#include "../../include/office_sanitizer.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/ooxml_xml.hpp"
#include <algorithm>
#include <array>
#include <unordered_set>

namespace unmark {

namespace {

const char* sanitizer_tag() {
    return "OfficeSanitizer";
}

constexpr std::string_view kLegacyMessage =
    "legacy binary Office format (.doc/.xls/.ppt) is not supported; save it as .docx/.xlsx/.pptx first";
constexpr std::string_view kDecodeMessage =
    "cannot parse document — possibly corrupt or unsupported binary format";

constexpr std::string_view kContentTypes = "[Content_Types].xml";
constexpr std::string_view kCustomXmlPrefix = "customXml/";

// document properties and thumbnails, removed outright
constexpr std::array<std::string_view, 7> kPropertyParts = {
    "docProps/core.xml",
    "docProps/app.xml",
    "docProps/custom.xml",
    "docProps/thumbnail.emf",
    "docProps/thumbnail.jpeg",
    "docProps/thumbnail.wmf",
    "docProps/thumbnail.png"
};

constexpr std::array<unsigned char, 8> kOle2Signature = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1};

/**
 * @brief Tracks what one sanitize() call changed in the package.
 */
struct Edit {
    std::vector<std::string> removed;         ///< Report lines
    std::unordered_set<std::string> dropped;  ///< Archive names no longer in the package
};

void drop_part(ArchiveContents& contents, const std::string_view name, Edit& edit) {
    if (contents.remove(name)) {
        edit.removed.emplace_back(name);
        edit.dropped.emplace(name);
    }
}

void clear_part(ArchiveEntry& entry, const std::string_view replacement, Edit& edit) {
    if (entry.text() == replacement) return;
    Logger::log(LogLevel::Debug, "Clearing " + entry.name, sanitizer_tag());
    entry.set_text(replacement);
    edit.removed.push_back(entry.name + " cleared");
}

void clear_if_exists(ArchiveContents& contents, const std::string_view name,
                     const std::string_view replacement, Edit& edit) {
    if (ArchiveEntry* entry = contents.find(name); entry && !entry->is_directory) {
        clear_part(*entry, replacement, edit);
    }
}

// replacement picked per entry name, nullopt leaves the entry alone;
// relationship parts under a matched folder keep their own content
template <typename Pick>
void clear_matching(ArchiveContents& contents, Pick pick, Edit& edit) {
    for (auto& entry : contents.entries) {
        if (entry.is_directory || entry.name.ends_with(".rels")) continue;
        if (const std::optional<std::string_view> replacement = pick(entry.name)) {
            clear_part(entry, *replacement, edit);
        }
    }
}

void sanitize_word(ArchiveContents& contents, Edit& edit) {
    clear_if_exists(contents, "word/comments.xml", ooxml::kEmptyWordComments, edit);
    clear_if_exists(contents, "word/commentsExtended.xml", ooxml::kEmptyWordCommentsEx, edit);
    clear_if_exists(contents, "word/commentsIds.xml", ooxml::kEmptyWordCommentsIds, edit);
    clear_if_exists(contents, "word/commentsExtensible.xml", ooxml::kEmptyWordCommentsExtensible, edit);
    clear_if_exists(contents, "word/people.xml", ooxml::kEmptyWordPeople, edit);

    if (ArchiveEntry* settings = contents.find("word/settings.xml"); settings && !settings->is_directory) {
        std::string xml(settings->text());
        if (ooxml::remove_track_revisions(xml)) {
            settings->set_text(xml);
            edit.removed.emplace_back("word/settings.xml trackRevisions");
        }
    }
}

void sanitize_spreadsheet(ArchiveContents& contents, Edit& edit) {
    clear_matching(contents, [](const std::string& name) -> std::optional<std::string_view> {
        if (name.starts_with("xl/comments")) return ooxml::kEmptySheetComments;
        if (name.starts_with("xl/threadedComments/")) return ooxml::kEmptySheetThreadedComments;
        if (name.starts_with("xl/persons/") && name.ends_with(".xml")) return ooxml::kEmptySheetPersons;
        return std::nullopt;
    }, edit);
}

void sanitize_presentation(ArchiveContents& contents, Edit& edit) {
    clear_matching(contents, [](const std::string& name) -> std::optional<std::string_view> {
        if (!name.starts_with("ppt/comments")) return std::nullopt;
        if (name.find("modernComment") != std::string::npos) return ooxml::kEmptySlideModernComments;
        return ooxml::kEmptySlideComments;
    }, edit);
    clear_if_exists(contents, "ppt/commentAuthors.xml", ooxml::kEmptySlideCommentAuthors, edit);
    clear_if_exists(contents, "ppt/authors.xml", ooxml::kEmptySlideAuthors, edit);
}

// prune references to dropped parts so the package has no dangling relationships
void prune_references(ArchiveContents& contents, const Edit& edit) {
    if (edit.dropped.empty()) return;

    for (const auto& name : edit.dropped) {
        if (contents.remove(ooxml::rels_name_for(name))) {
            Logger::log(LogLevel::Debug, "Removed relationships of " + name, sanitizer_tag());
        }
    }

    for (auto& entry : contents.entries) {
        if (entry.is_directory) continue;
        if (entry.name == kContentTypes) {
            std::string xml(entry.text());
            if (ooxml::prune_content_types(xml, edit.dropped)) entry.set_text(xml);
        } else if (entry.name.ends_with(".rels")) {
            std::string xml(entry.text());
            if (ooxml::prune_relationships(xml, entry.name, edit.dropped)) entry.set_text(xml);
        }
    }
}

} // namespace

bool has_ole2_signature(const std::filesystem::path& path) {
    const unique_FILE f(open_file(path, "rb"));
    if (!f) return false;
    std::array<unsigned char, kOle2Signature.size()> head{};
    if (std::fread(head.data(), 1, head.size(), f.get()) != head.size()) return false;
    return head == kOle2Signature;
}

OfficeKind detect_office_kind(const std::filesystem::path& path, const ArchiveContents& contents) {
    const std::string ext = lower_extension(path.filename().string());
    if (ext == ".docx") return OfficeKind::Word;
    if (ext == ".xlsx") return OfficeKind::Spreadsheet;
    if (ext == ".pptx") return OfficeKind::Presentation;

    if (contents.find("word/document.xml")) return OfficeKind::Word;
    if (contents.find("xl/workbook.xml")) return OfficeKind::Spreadsheet;
    if (contents.find("ppt/presentation.xml")) return OfficeKind::Presentation;
    return OfficeKind::Unknown;
}

SanitizeReport OfficeSanitizer::sanitize(const std::filesystem::path& input,
                                         const std::filesystem::path& output) {
    const std::string ext = lower_extension(input.filename().string());
    if (contains(legacy_office_extensions, ext) || has_ole2_signature(input)) {
        Logger::log(LogLevel::Warning, "Legacy binary document rejected: " + input.string(), sanitizer_tag());
        throw UnsupportedLegacyFormatError(std::string(kLegacyMessage));
    }

    ArchiveContents contents;
    try {
        contents = codec_.load(input);
    } catch (const DecodeError& e) {
        Logger::log(LogLevel::Error, input.string() + ": " + e.what(), sanitizer_tag());
        throw DecodeError(std::string(kDecodeMessage));
    }
    if (!contents.find(kContentTypes)) {
        Logger::log(LogLevel::Error, input.string() + ": no [Content_Types].xml part", sanitizer_tag());
        throw DecodeError(std::string(kDecodeMessage));
    }

    Edit edit;
    for (const auto part : kPropertyParts) {
        drop_part(contents, part, edit);
    }

    const std::vector<std::string> custom = contents.remove_prefix(kCustomXmlPrefix);
    if (!custom.empty()) {
        edit.removed.emplace_back(kCustomXmlPrefix);
        edit.dropped.insert(custom.begin(), custom.end());
    }

    switch (detect_office_kind(input, contents)) {
        case OfficeKind::Word:         sanitize_word(contents, edit); break;
        case OfficeKind::Spreadsheet:  sanitize_spreadsheet(contents, edit); break;
        case OfficeKind::Presentation: sanitize_presentation(contents, edit); break;
        case OfficeKind::Unknown:
            Logger::log(LogLevel::Warning, "Unknown package flavour, only common parts handled: " + input.string(),
                        sanitizer_tag());
            break;
    }

    prune_references(contents, edit);

    std::ranges::stable_partition(contents.entries,
                                  [](const ArchiveEntry& e) { return e.name == kContentTypes; });

    codec_.save(contents, output, WriteCompression::Deflate);

    Logger::log(LogLevel::Info, input.filename().string() + ": " + std::to_string(edit.removed.size()) +
                " item(s) removed", sanitizer_tag());
    return {std::move(edit.removed), std::string(to_string(FileCategory::Office))};
}

} // namespace unmark
