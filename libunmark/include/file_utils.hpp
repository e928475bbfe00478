//
// Created on 19/10/26.
//

#ifndef UNMARK_FILE_UTILS_HPP
#define UNMARK_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string_view>
#include <system_error>
#include <vector>

namespace unmark {

    /**
     * @brief RAII wrapper closing a C FILE handle.
     */
    struct FileCloser {
        void operator()(FILE* f) const { if (f) std::fclose(f); }
    };
    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief fopen() taking a filesystem path.
     * @return FILE* or nullptr if the open failed.
     */
    FILE* open_file(const std::filesystem::path& path, const char* mode);

    /**
     * @brief Read a whole file into memory.
     * @throws IoError if the file cannot be opened or read.
     */
    std::vector<unsigned char> read_file_bytes(const std::filesystem::path& path);

    /**
     * @brief Write (truncate) a file with the given content.
     * @throws IoError if the file cannot be written.
     */
    void write_file_bytes(const std::filesystem::path& path, const void* data, std::size_t size);

    inline void write_file_bytes(const std::filesystem::path& path, const std::vector<unsigned char>& data) {
        write_file_bytes(path, data.data(), data.size());
    }

    /**
     * @brief Copy access and modification times of @p from onto @p to.
     * @throws IoError if either stat or the timestamp update fails.
     */
    void copy_file_times(const std::filesystem::path& from, const std::filesystem::path& to);

    /**
     * @brief Rename @p from over @p to, retrying while the target is busy.
     *
     * Transient lock/sharing failures are retried up to 10 times with a short
     * sleep; any other error is returned immediately.
     * @return The last error (empty on success).
     */
    std::error_code rename_with_retry(const std::filesystem::path& from,
                                      const std::filesystem::path& to,
                                      std::string_view tag = "file_utils");

    /**
     * @brief Remove a file if it exists, logging (not throwing) on failure.
     * @return True if nothing is left at @p path afterwards.
     */
    bool remove_if_exists(const std::filesystem::path& path, std::string_view tag = "file_utils");

} // namespace unmark

#endif // UNMARK_FILE_UTILS_HPP
