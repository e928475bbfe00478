//
// Created on 19/10/26.
//

/**
 * @file process_types.hpp
 * @brief Value types exchanged between the batch engine and its callers.
 */

#ifndef UNMARK_PROCESS_TYPES_HPP
#define UNMARK_PROCESS_TYPES_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unmark {

/**
 * @brief One input of a batch.
 */
struct ProcessItem {
    std::filesystem::path path;
};

/**
 * @brief Batch-wide output options, passed per call.
 *
 * overwrite_source takes precedence over output_dir. backup_original only
 * has an effect in overwrite mode.
 */
struct ProcessOptions {
    std::filesystem::path output_dir;
    std::string copy_suffix = "-clean";
    bool overwrite_source = false;
    bool backup_original = false;
};

/**
 * @brief Where a sanitized item (and its optional backup) will be written.
 */
struct ResolvedPath {
    std::filesystem::path output_path;
    std::optional<std::filesystem::path> backup_path;
};

enum class ProcessStatus {
    Success,
    Skipped,
    Error
};

constexpr std::string_view to_string(const ProcessStatus status) noexcept {
    switch (status) {
        case ProcessStatus::Success: return "success";
        case ProcessStatus::Skipped: return "skipped";
        case ProcessStatus::Error:   return "error";
    }
    return "error";
}

/**
 * @brief Outcome of one item, in the same order as the batch input.
 */
struct ProcessResult {
    std::filesystem::path input_path;
    std::optional<std::filesystem::path> output_path;
    ProcessStatus status = ProcessStatus::Error;
    std::vector<std::string> removed; ///< Human-readable descriptions, in removal order
    std::optional<std::string> type;  ///< Category tag, set on success
    std::optional<std::string> message; ///< Error or skip reason

    [[nodiscard]] bool ok() const noexcept { return status == ProcessStatus::Success; }
};

/**
 * @brief What a sanitizer stripped from one file.
 */
struct SanitizeReport {
    std::vector<std::string> removed;
    std::string type;
};

} // namespace unmark

#endif // UNMARK_PROCESS_TYPES_HPP
