//
// Created on 19/10/26.
//

/**
 * @file logger.hpp
 * @brief Process-wide logging facade shared by libunmark and its front-ends.
 *
 * Library code never writes to stdout/stderr directly: it calls Logger::log
 * and the hosting application decides, by registering sinks, where records go.
 */

#ifndef UNMARK_LOGGER_HPP
#define UNMARK_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Static, thread-safe logging facade.
 *
 * Records are fanned out to every registered ILogSink. With no sink
 * registered, records are dropped.
 */
class Logger {
public:
    /**
     * @brief Register a sink. The Logger takes ownership.
     * @param sink Sink implementation; null pointers are ignored.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /// @brief Drop all registered sinks.
    static void clear_sinks();

    /**
     * @brief Forward a record to all sinks.
     * @param level Severity.
     * @param msg Record text.
     * @param tag Emitting component (default: "unmark").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "unmark");

    /// @return Upper-case name of a level ("DEBUG", "INFO", "WARN", "ERROR").
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parse a level name as accepted on the command line.
     *
     * Accepts DEBUG, INFO, WARNING (or WARN) and ERROR, ignoring case.
     * "NONE" and unknown names yield std::nullopt, which callers treat as
     * "do not install a console sink".
     */
    static std::optional<LogLevel> string_to_level(std::string level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

#endif // UNMARK_LOGGER_HPP
