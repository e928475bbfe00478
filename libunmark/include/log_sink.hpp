//
// Created on 19/10/26.
//

#ifndef UNMARK_LOG_SINK_HPP
#define UNMARK_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity of a log record.
 *
 * Sinks use it to filter what they deliver.
 */
enum class LogLevel {
    Debug,   ///< Per-entry and per-stream details of a sanitization pass
    Info,    ///< One line per processed file
    Warning, ///< Recoverable oddities (reclassification, codec warnings)
    Error    ///< A file could not be sanitized
};

/**
 * @brief Destination for log records.
 *
 * The Logger facade forwards every record to each registered sink.
 * Implementations decide where records end up (terminal, file, test capture).
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Deliver one record.
     * @param level Severity of the record.
     * @param message Record text.
     * @param tag Component that emitted the record (e.g. "OfficeSanitizer").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // UNMARK_LOG_SINK_HPP
