//
// Created on 19/10/26.
//

#ifndef UNMARK_EVENTS_HPP
#define UNMARK_EVENTS_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace unmark {

/**
 * @brief Progress notifications published by BatchOrchestrator on an EventBus.
 *
 * Plain data carriers; the authoritative outcome of a batch is still the
 * ProcessResult list returned by BatchOrchestrator::run.
 */

/**
 * @brief Emitted before an item is resolved and dispatched.
 */
struct ItemStartEvent {
    std::filesystem::path path; ///< Input path as given
    std::size_t index = 0;      ///< Zero-based position in the batch
    std::size_t total = 0;      ///< Batch size
};

/**
 * @brief Emitted when an item was sanitized and finalized.
 */
struct ItemCompleteEvent {
    std::filesystem::path path;            ///< Input path
    std::filesystem::path output_path;     ///< Final artifact (the input path in overwrite mode)
    std::string category;                  ///< Category tag ("image", "pdf", ...)
    std::vector<std::string> removed;      ///< What was stripped
    std::chrono::milliseconds duration{0}; ///< Wall time spent on the item
};

/**
 * @brief Emitted when an item ended in an error result.
 */
struct ItemErrorEvent {
    std::filesystem::path path; ///< Input path
    std::string error_message;  ///< Same text as ProcessResult::message
};

/**
 * @brief Emitted for items left untouched because a stop was requested.
 */
struct ItemSkippedEvent {
    std::filesystem::path path; ///< Input path
    std::string reason;         ///< Why the item was skipped
};

/**
 * @brief Emitted once after the last item.
 */
struct BatchCompleteEvent {
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::chrono::milliseconds duration{0};
};

} // namespace unmark

#endif // UNMARK_EVENTS_HPP
