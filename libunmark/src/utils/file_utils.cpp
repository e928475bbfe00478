//
// Created on 19/10/26.
//

#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <system_error>
#include <thread>

namespace unmark {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
        return std::fopen(path.c_str(), mode);
    }

    std::vector<unsigned char> read_file_bytes(const std::filesystem::path& path) {
        const unique_FILE f(open_file(path, "rb"));
        if (!f) {
            throw IoError("cannot open " + path.string() + ": " + std::strerror(errno));
        }
        std::vector<unsigned char> data;
        unsigned char buf[64 * 1024];
        size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), f.get())) > 0) {
            data.insert(data.end(), buf, buf + n);
        }
        if (std::ferror(f.get())) {
            throw IoError("read error on " + path.string());
        }
        return data;
    }

    void write_file_bytes(const std::filesystem::path& path, const void* data, const std::size_t size) {
        unique_FILE f(open_file(path, "wb"));
        if (!f) {
            throw IoError("cannot create " + path.string() + ": " + std::strerror(errno));
        }
        if (size > 0 && std::fwrite(data, 1, size, f.get()) != size) {
            throw IoError("short write on " + path.string());
        }
        if (std::fclose(f.release()) != 0) {
            throw IoError("cannot flush " + path.string());
        }
    }

    void copy_file_times(const std::filesystem::path& from, const std::filesystem::path& to) {
        struct stat st{};
        if (::stat(from.c_str(), &st) != 0) {
            throw IoError("cannot stat " + from.string() + ": " + std::strerror(errno));
        }
        const timespec times[2] = { st.st_atim, st.st_mtim };
        if (::utimensat(AT_FDCWD, to.c_str(), times, 0) != 0) {
            throw IoError("cannot set timestamps on " + to.string() + ": " + std::strerror(errno));
        }
    }

    std::error_code rename_with_retry(const std::filesystem::path& from,
                                      const std::filesystem::path& to,
                                      const std::string_view tag) {
        std::error_code ec;
        int retries = 10;
        while (retries > 0) {
            std::filesystem::rename(from, to, ec);
            if (!ec) break;

            if (ec != std::errc::device_or_resource_busy &&
                ec != std::errc::text_file_busy &&
                ec != std::errc::permission_denied) break;

            Logger::log(LogLevel::Debug, "Rename busy (" + ec.message() + "), retrying in 250ms...", tag);
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
            --retries;
        }
        return ec;
    }

    bool remove_if_exists(const std::filesystem::path& path, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove " + path.string() + " (" + ec.message() + ")", tag);
            return false;
        }
        return true;
    }

} // namespace unmark
