//
// Created on 20/10/26.
//

#include "../../include/archive_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cstdint>
#include <memory>
#include <unordered_map>

namespace {

const char* codec_tag() {
    return "LibarchiveCodec";
}

struct ArchiveReadDeleter {
    void operator()(archive* a) const { if (a) archive_read_free(a); }
};
struct ArchiveWriteDeleter {
    void operator()(archive* a) const { if (a) archive_write_free(a); }
};
struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const { if (e) archive_entry_free(e); }
};
using unique_archive_read = std::unique_ptr<archive, ArchiveReadDeleter>;
using unique_archive_write = std::unique_ptr<archive, ArchiveWriteDeleter>;
using unique_archive_entry = std::unique_ptr<archive_entry, ArchiveEntryDeleter>;

std::string error_of(archive* a) {
    const char* s = archive_error_string(a);
    return s ? s : "unknown libarchive error";
}

// valid between entries, unlike the "compression" format option which only applies before open
void set_compression(archive* a, const unmark::EntryMethod method) {
    const int r = method == unmark::EntryMethod::Stored ? archive_write_zip_set_compression_store(a)
                                                        : archive_write_zip_set_compression_deflate(a);
    if (r != ARCHIVE_OK) {
        throw unmark::IoError(std::string("cannot select zip compression: ") + error_of(a));
    }
}

constexpr uint32_t kEocdSignature = 0x06054b50;
constexpr uint32_t kCentralSignature = 0x02014b50;
constexpr std::size_t kEocdSize = 22;
constexpr std::size_t kCentralHeaderSize = 46;

// extra field ids libarchive itself writes: zip64, extended timestamp, unix uid/gid
constexpr uint16_t kOwnExtraIds[] = { 0x0001, 0x5455, 0x7875 };

uint16_t le16(const std::vector<unsigned char>& b, const std::size_t off) {
    return static_cast<uint16_t>(b[off] | (b[off + 1] << 8));
}

uint32_t le32(const std::vector<unsigned char>& b, const std::size_t off) {
    return static_cast<uint32_t>(b[off]) |
           (static_cast<uint32_t>(b[off + 1]) << 8) |
           (static_cast<uint32_t>(b[off + 2]) << 16) |
           (static_cast<uint32_t>(b[off + 3]) << 24);
}

/**
 * @brief Walk the central directory collecting trailer facts, per-entry methods and entry names.
 */
unmark::ArchiveTrailerInfo scan_central_directory(const std::vector<unsigned char>& bytes,
                                                  std::unordered_map<std::string, unmark::EntryMethod>* methods,
                                                  std::vector<std::string>* names = nullptr) {
    unmark::ArchiveTrailerInfo info;
    if (bytes.size() < kEocdSize) return info;

    // the eocd record sits in the last 22 + 65535 bytes
    const std::size_t min_pos = bytes.size() > kEocdSize + 0xFFFF ? bytes.size() - kEocdSize - 0xFFFF : 0;
    std::size_t eocd = bytes.size() - kEocdSize;
    bool found = false;
    for (;;) {
        if (le32(bytes, eocd) == kEocdSignature &&
            eocd + kEocdSize + le16(bytes, eocd + 20) <= bytes.size()) {
            found = true;
            break;
        }
        if (eocd == min_pos) break;
        --eocd;
    }
    if (!found) return info;

    const uint16_t comment_len = le16(bytes, eocd + 20);
    info.comment.assign(reinterpret_cast<const char*>(bytes.data() + eocd + kEocdSize), comment_len);

    const uint16_t count = le16(bytes, eocd + 10);
    std::size_t pos = le32(bytes, eocd + 16);
    for (uint16_t i = 0; i < count; ++i) {
        if (pos + kCentralHeaderSize > bytes.size() || le32(bytes, pos) != kCentralSignature) {
            Logger::log(LogLevel::Debug, "Central directory truncated at record " + std::to_string(i), codec_tag());
            break;
        }
        const uint16_t method = le16(bytes, pos + 10);
        const uint16_t name_len = le16(bytes, pos + 28);
        const uint16_t extra_len = le16(bytes, pos + 30);
        const uint16_t file_comment_len = le16(bytes, pos + 32);
        const std::size_t name_pos = pos + kCentralHeaderSize;
        if (name_pos + name_len + extra_len + file_comment_len > bytes.size()) break;

        if (methods || names) {
            std::string name(reinterpret_cast<const char*>(bytes.data() + name_pos), name_len);
            if (names) names->push_back(name);
            if (methods) {
                (*methods)[std::move(name)] =
                    method == 0 ? unmark::EntryMethod::Stored : unmark::EntryMethod::Deflated;
            }
        }

        std::size_t x = name_pos + name_len;
        const std::size_t x_end = x + extra_len;
        while (x + 4 <= x_end) {
            const uint16_t id = le16(bytes, x);
            const uint16_t len = le16(bytes, x + 2);
            if (std::ranges::find(kOwnExtraIds, id) == std::end(kOwnExtraIds)) {
                info.has_extra_fields = true;
            }
            x += 4u + len;
        }
        if (file_comment_len > 0) info.has_entry_comments = true;

        pos = name_pos + name_len + extra_len + file_comment_len;
    }
    return info;
}

} // namespace

namespace unmark {

ArchiveEntry* ArchiveContents::find(const std::string_view name) {
    const auto it = std::ranges::find_if(entries, [&](const ArchiveEntry& e) { return e.name == name; });
    return it == entries.end() ? nullptr : &*it;
}

const ArchiveEntry* ArchiveContents::find(const std::string_view name) const {
    const auto it = std::ranges::find_if(entries, [&](const ArchiveEntry& e) { return e.name == name; });
    return it == entries.end() ? nullptr : &*it;
}

bool ArchiveContents::remove(const std::string_view name) {
    const auto n = std::erase_if(entries, [&](const ArchiveEntry& e) { return e.name == name; });
    return n > 0;
}

std::vector<std::string> ArchiveContents::remove_prefix(const std::string_view prefix) {
    std::vector<std::string> removed;
    std::erase_if(entries, [&](const ArchiveEntry& e) {
        if (!e.name.starts_with(prefix)) return false;
        removed.push_back(e.name);
        return true;
    });
    return removed;
}

ArchiveTrailerInfo scan_zip_trailer(const std::vector<unsigned char>& bytes) {
    return scan_central_directory(bytes, nullptr);
}

std::vector<std::string> zip_entry_names(const std::vector<unsigned char>& bytes) {
    std::vector<std::string> names;
    scan_central_directory(bytes, nullptr, &names);
    return names;
}

ArchiveContents LibarchiveCodec::load(const std::filesystem::path& path) {
    const std::vector<unsigned char> bytes = read_file_bytes(path);

    ArchiveContents contents;
    std::unordered_map<std::string, EntryMethod> methods;
    contents.trailer = scan_central_directory(bytes, &methods);

    const unique_archive_read in(archive_read_new());
    if (!in) {
        throw DecodeError("archive_read_new failed");
    }
    archive_read_support_format_zip(in.get());

    const int open_r = archive_read_open_memory(in.get(), bytes.data(), bytes.size());
    if (open_r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_of(in.get()), codec_tag());
    } else if (open_r != ARCHIVE_OK) {
        Logger::log(LogLevel::Error, "Failed to open archive: " + error_of(in.get()), codec_tag());
        throw DecodeError("cannot open archive " + path.filename().string() + ": " + error_of(in.get()));
    }

    archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(in.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        if (r == ARCHIVE_WARN) {
            Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_of(in.get()), codec_tag());
        }
        const char* ename = archive_entry_pathname(entry);
        if (!ename) {
            Logger::log(LogLevel::Warning, "Entry with null name skipped", codec_tag());
            archive_read_data_skip(in.get());
            continue;
        }

        ArchiveEntry e;
        e.name = ename;
        e.is_directory = archive_entry_filetype(entry) == AE_IFDIR || e.name.ends_with('/');
        e.mtime = archive_entry_mtime(entry);

        if (const auto it = methods.find(e.name); it != methods.end()) {
            e.method = it->second;
        } else {
            const char* fmt = archive_format_name(in.get());
            e.method = fmt && std::string_view(fmt).find("uncompressed") != std::string_view::npos
                           ? EntryMethod::Stored : EntryMethod::Deflated;
        }

        if (!e.is_directory) {
            const void* buff = nullptr;
            size_t size = 0;
            la_int64_t offset = 0;
            while (true) {
                const int rb = archive_read_data_block(in.get(), &buff, &size, &offset);
                if (rb == ARCHIVE_EOF) break;
                if (rb != ARCHIVE_OK && rb != ARCHIVE_WARN) {
                    Logger::log(LogLevel::Error, "Error reading " + e.name + ": " + error_of(in.get()), codec_tag());
                    throw DecodeError("cannot read entry " + e.name + ": " + error_of(in.get()));
                }
                const auto* p = static_cast<const unsigned char*>(buff);
                if (static_cast<std::size_t>(offset) > e.data.size()) {
                    e.data.resize(static_cast<std::size_t>(offset), 0);
                }
                e.data.insert(e.data.end(), p, p + size);
            }
        } else {
            archive_read_data_skip(in.get());
        }

        contents.entries.push_back(std::move(e));
    }

    if (r != ARCHIVE_EOF) {
        Logger::log(LogLevel::Error, "Iteration error: " + error_of(in.get()), codec_tag());
        throw DecodeError("corrupt archive " + path.filename().string() + ": " + error_of(in.get()));
    }

    Logger::log(LogLevel::Debug,
                "Loaded " + std::to_string(contents.entries.size()) + " entries from " + path.filename().string(),
                codec_tag());
    return contents;
}

void LibarchiveCodec::save(const ArchiveContents& contents,
                           const std::filesystem::path& path,
                           const WriteCompression compression) {
    const unique_archive_write out(archive_write_new());
    if (!out) {
        throw IoError("archive_write_new failed");
    }
    if (archive_write_set_format_zip(out.get()) != ARCHIVE_OK) {
        throw IoError("cannot select zip format: " + error_of(out.get()));
    }
    if (archive_write_open_filename(out.get(), path.c_str()) != ARCHIVE_OK) {
        Logger::log(LogLevel::Error, "Failed to open archive for writing: " + error_of(out.get()), codec_tag());
        throw IoError("cannot create " + path.string() + ": " + error_of(out.get()));
    }

    for (const auto& e : contents.entries) {
        set_compression(out.get(), compression == WriteCompression::PreserveMethod ? e.method
                                                                                   : EntryMethod::Deflated);

        const unique_archive_entry ae(archive_entry_new());
        archive_entry_set_pathname(ae.get(), e.name.c_str());
        archive_entry_set_mtime(ae.get(), e.mtime, 0);
        archive_entry_set_uid(ae.get(), 0);
        archive_entry_set_gid(ae.get(), 0);
        if (e.is_directory) {
            archive_entry_set_filetype(ae.get(), AE_IFDIR);
            archive_entry_set_perm(ae.get(), 0755);
            archive_entry_set_size(ae.get(), 0);
        } else {
            archive_entry_set_filetype(ae.get(), AE_IFREG);
            archive_entry_set_perm(ae.get(), 0644);
            archive_entry_set_size(ae.get(), static_cast<la_int64_t>(e.data.size()));
        }

        if (archive_write_header(out.get(), ae.get()) != ARCHIVE_OK) {
            Logger::log(LogLevel::Error, "Header write failed for " + e.name + ": " + error_of(out.get()), codec_tag());
            throw IoError("cannot write entry " + e.name + ": " + error_of(out.get()));
        }
        if (!e.is_directory && !e.data.empty()) {
            const la_ssize_t written = archive_write_data(out.get(), e.data.data(), e.data.size());
            if (written < 0 || static_cast<std::size_t>(written) != e.data.size()) {
                throw IoError("cannot write data of " + e.name + ": " + error_of(out.get()));
            }
        }
    }

    if (archive_write_close(out.get()) != ARCHIVE_OK) {
        throw IoError("cannot finalize " + path.string() + ": " + error_of(out.get()));
    }
    Logger::log(LogLevel::Debug,
                "Wrote " + std::to_string(contents.entries.size()) + " entries to " + path.filename().string(),
                codec_tag());
}

} // namespace unmark
