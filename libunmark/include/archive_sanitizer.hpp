//
// Created on 22/10/26.
//

/**
 * @file archive_sanitizer.hpp
 * @brief Defines the ISanitizer implementation for generic zip archives.
 */

#ifndef UNMARK_ARCHIVE_SANITIZER_HPP
#define UNMARK_ARCHIVE_SANITIZER_HPP

#include "archive_codec.hpp"
#include "sanitizer.hpp"

namespace unmark {

/**
 * @brief Implements ISanitizer for .zip archives.
 *
 * @details Rebuilds the archive entry by entry. File entries keep their
 * bytes, modification time and compression method; directories stay
 * directories. The archive comment, per-entry comments and foreign extra
 * fields (owner ids, NTFS times, platform attributes) are left out.
 */
class ArchiveSanitizer final : public ISanitizer {
public:
    explicit ArchiveSanitizer(IArchiveCodec& codec) : codec_(codec) {}

    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "ArchiveSanitizer";
    }

    [[nodiscard]] FileCategory get_category() const noexcept override {
        return FileCategory::Zip;
    }

    SanitizeReport sanitize(const std::filesystem::path& input,
                            const std::filesystem::path& output) override;

private:
    IArchiveCodec& codec_;
};

} // namespace unmark

#endif // UNMARK_ARCHIVE_SANITIZER_HPP
