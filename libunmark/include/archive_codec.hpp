//
// Created on 19/10/26.
//

/**
 * @file archive_codec.hpp
 * @brief Zip archive capability used by the office and generic archive sanitizers.
 */

#ifndef UNMARK_ARCHIVE_CODEC_HPP
#define UNMARK_ARCHIVE_CODEC_HPP

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unmark {

/**
 * @brief Compression method of a zip entry.
 */
enum class EntryMethod {
    Stored,
    Deflated
};

/**
 * @brief A zip entry fully loaded in memory.
 */
struct ArchiveEntry {
    std::string name;
    bool is_directory = false;
    std::vector<unsigned char> data;
    std::time_t mtime = 0;
    EntryMethod method = EntryMethod::Deflated;

    [[nodiscard]] std::string_view text() const noexcept {
        return {reinterpret_cast<const char*>(data.data()), data.size()};
    }
    void set_text(const std::string_view s) { data.assign(s.begin(), s.end()); }
};

/**
 * @brief Central-directory facts that the entry list does not carry.
 *
 * These only describe the source archive; they are never written back.
 */
struct ArchiveTrailerInfo {
    std::string comment;              ///< End-of-central-directory comment
    bool has_extra_fields = false;    ///< Any central record carries extra fields
    bool has_entry_comments = false;  ///< Any central record carries a file comment
};

/**
 * @brief Mutable, ordered view of an archive.
 */
struct ArchiveContents {
    std::vector<ArchiveEntry> entries;
    ArchiveTrailerInfo trailer;

    /// @return The entry named @p name, or nullptr.
    ArchiveEntry* find(std::string_view name);
    [[nodiscard]] const ArchiveEntry* find(std::string_view name) const;

    /// @brief Remove the entry named @p name. @return True if it existed.
    bool remove(std::string_view name);

    /**
     * @brief Remove every entry whose name starts with @p prefix.
     * @return Names of the removed entries, in archive order.
     */
    std::vector<std::string> remove_prefix(std::string_view prefix);
};

/**
 * @brief How entries are compressed when serializing.
 */
enum class WriteCompression {
    Deflate,        ///< Every file entry is deflated
    PreserveMethod  ///< Every file entry keeps ArchiveEntry::method
};

/**
 * @brief Zip load/serialize capability.
 */
class IArchiveCodec {
public:
    virtual ~IArchiveCodec() = default;

    /**
     * @brief Load every entry of a zip archive.
     * @throws DecodeError if the file is not a readable zip.
     */
    virtual ArchiveContents load(const std::filesystem::path& path) = 0;

    /**
     * @brief Write @p contents as a new zip archive.
     *
     * Entries are written in list order, with their mtime, without extra
     * fields, entry comments or an archive comment.
     * @throws IoError on write failure.
     */
    virtual void save(const ArchiveContents& contents,
                      const std::filesystem::path& path,
                      WriteCompression compression) = 0;
};

/**
 * @brief IArchiveCodec bound to libarchive.
 */
class LibarchiveCodec final : public IArchiveCodec {
public:
    ArchiveContents load(const std::filesystem::path& path) override;
    void save(const ArchiveContents& contents,
              const std::filesystem::path& path,
              WriteCompression compression) override;
};

/**
 * @brief Scan the raw bytes of a zip for its central-directory facts.
 *
 * Locates the end-of-central-directory record from the end of the file and
 * walks the central directory. Missing or malformed structures yield a
 * default ArchiveTrailerInfo.
 */
ArchiveTrailerInfo scan_zip_trailer(const std::vector<unsigned char>& bytes);

/// @return Entry names in central-directory order, empty when no directory is found.
std::vector<std::string> zip_entry_names(const std::vector<unsigned char>& bytes);

} // namespace unmark

#endif // UNMARK_ARCHIVE_CODEC_HPP
